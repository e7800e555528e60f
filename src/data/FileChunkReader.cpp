// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include "data/FileChunkReader.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"

namespace XF {

namespace Data {

using boost::to_string;
using XF::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
FileChunkReader::FileChunkReader(const string &filePath, uint64_t start,
                                 uint64_t size,
                                 const ProgressCallback &callback)
    : m_filePath(filePath),
      m_start(start),
      m_length(size),
      m_position(0),
      m_bad(false),
      m_callback(callback) {}

// --------------------------------------------------------------------------
FileChunkReader::~FileChunkReader() {
  if (m_file.is_open()) {
    m_file.close();
  }
}

// --------------------------------------------------------------------------
pair<bool, string> FileChunkReader::Open() {
  pair<uint64_t, string> fileSize = XF::Utils::GetFileSize(m_filePath);
  if (!fileSize.second.empty()) {
    return make_pair(false, fileSize.second);
  }

  uint64_t fullSize = fileSize.first;
  m_length = m_start >= fullSize ? 0 : std::min(m_length, fullSize - m_start);
  m_position = 0;

  m_file.open(m_filePath.c_str(), std::ios_base::in | std::ios_base::binary);
  if (!m_file.is_open()) {
    return make_pair(false, string("Unable to open file: ") + strerror(errno) +
                                " " + FormatPath(m_filePath));
  }
  m_file.seekg(m_start, std::ios_base::beg);
  if (!m_file) {
    return make_pair(false, "Unable to seek to " + to_string(m_start) + " " +
                                FormatPath(m_filePath));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
size_t FileChunkReader::Read(char *buf, size_t size) {
  if (!m_file.is_open() || buf == NULL || size == 0) {
    return 0;
  }
  uint64_t toRead = std::min(static_cast<uint64_t>(size), GetRemaining());
  if (toRead == 0) {
    return 0;
  }

  m_file.read(buf, static_cast<std::streamsize>(toRead));
  size_t readSize = static_cast<size_t>(m_file.gcount());
  if (m_file.bad()) {
    m_bad = true;
    DebugError("Fail to read file " << FormatPath(m_filePath));
  }
  // a short read means the file shrank under us, clear eof for later seeks
  m_file.clear(m_file.rdstate() & std::ios_base::badbit);

  m_position += readSize;
  if (readSize > 0 && m_callback) {
    m_callback(readSize);
  }
  return readSize;
}

// --------------------------------------------------------------------------
bool FileChunkReader::Seek(uint64_t where) {
  if (!m_file.is_open()) {
    return false;
  }
  m_position = std::min(where, m_length);
  m_file.clear();
  m_file.seekg(m_start + m_position, std::ios_base::beg);
  return !m_file.fail();
}

}  // namespace Data
}  // namespace XF

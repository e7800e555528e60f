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

#include "data/ConcurrentFileWriter.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <fstream>
#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace XF {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using XF::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
ConcurrentFileWriter::ConcurrentFileWriter(const string &filePath)
    : m_filePath(filePath) {}

// --------------------------------------------------------------------------
ConcurrentFileWriter::~ConcurrentFileWriter() {
  pair<bool, string> outcome = Close();
  DebugErrorIf(!outcome.first, outcome.second);
}

// --------------------------------------------------------------------------
pair<bool, string> ConcurrentFileWriter::Open() {
  lock_guard<mutex> lock(m_fileLock);
  if (m_file.is_open()) {
    return make_pair(true, string());
  }
  m_file.open(m_filePath.c_str(), std::ios_base::out | std::ios_base::binary |
                                      std::ios_base::trunc);
  if (!m_file.is_open()) {
    return make_pair(false, string("Unable to open file for writing: ") +
                                strerror(errno) + " " + FormatPath(m_filePath));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<bool, string> ConcurrentFileWriter::WriteAt(const char *data, size_t size,
                                                 uint64_t offset) {
  lock_guard<mutex> lock(m_fileLock);
  if (!m_file.is_open()) {
    return make_pair(false, "File not opened " + FormatPath(m_filePath));
  }
  if (size == 0) {
    return make_pair(true, string());
  }

  m_file.seekp(offset, std::ios_base::beg);
  m_file.write(data, static_cast<std::streamsize>(size));
  if (!m_file) {
    string msg = "Fail to write " + to_string(size) + " bytes at offset " +
                 to_string(offset) + ": " + strerror(errno) + " " +
                 FormatPath(m_filePath);
    m_file.clear();
    return make_pair(false, msg);
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<bool, string> ConcurrentFileWriter::Close() {
  lock_guard<mutex> lock(m_fileLock);
  if (!m_file.is_open()) {
    return make_pair(true, string());
  }
  m_file.flush();
  bool flushed = m_file.good();
  m_file.close();
  if (!flushed || m_file.fail()) {
    return make_pair(false, string("Fail to flush file: ") + strerror(errno) +
                                " " + FormatPath(m_filePath));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool ConcurrentFileWriter::IsOpen() const {
  lock_guard<mutex> lock(m_fileLock);
  return m_file.is_open();
}

}  // namespace Data
}  // namespace XF

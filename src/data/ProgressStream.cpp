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

#include "data/ProgressStream.h"

#include <istream>

#include "boost/shared_ptr.hpp"

namespace XF {

namespace Data {

using boost::shared_ptr;
using std::istream;

// --------------------------------------------------------------------------
ProgressStream::ProgressStream(const shared_ptr<istream> &stream,
                               const ProgressCallback &callback)
    : m_stream(stream), m_callback(callback), m_bytesRead(0) {}

// --------------------------------------------------------------------------
size_t ProgressStream::Read(char *buf, size_t size) {
  if (!m_stream || buf == NULL || size == 0 || !m_stream->good()) {
    return 0;
  }
  m_stream->read(buf, static_cast<std::streamsize>(size));
  size_t readSize = static_cast<size_t>(m_stream->gcount());
  if (readSize > 0) {
    m_bytesRead += readSize;
    if (m_callback) {
      m_callback(readSize);
    }
  }
  return readSize;
}

}  // namespace Data
}  // namespace XF

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

#ifndef XFER_DATA_PROGRESSSTREAM_H_
#define XFER_DATA_PROGRESSSTREAM_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <istream>

#include "boost/shared_ptr.hpp"

#include "data/ProgressCallback.h"

namespace XF {

namespace Data {

//
// ProgressStream
//
// Read only view of an inbound body which reports each chunk it hands out.
//
class ProgressStream {
 public:
  ProgressStream(const boost::shared_ptr<std::istream> &stream,
                 const ProgressCallback &callback);

 public:
  // Read from the wrapped stream
  //
  // @param  : buffer, max count of bytes to read
  // @return : count of bytes read, 0 at end of stream
  //
  // The callback sees the count before the caller does.
  size_t Read(char *buf, size_t size);

  // Whether the wrapped stream failed rather than ended
  bool Bad() const { return !m_stream || m_stream->bad(); }

  uint64_t GetBytesRead() const { return m_bytesRead; }

 private:
  boost::shared_ptr<std::istream> m_stream;
  ProgressCallback m_callback;
  uint64_t m_bytesRead;
};

}  // namespace Data
}  // namespace XF

#endif  // XFER_DATA_PROGRESSSTREAM_H_

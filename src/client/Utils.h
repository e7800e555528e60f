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

#ifndef XFER_CLIENT_UTILS_H_
#define XFER_CLIENT_UTILS_H_

#include <stdint.h>

#include <string>

#include "boost/tuple/tuple.hpp"

namespace XF {

namespace Client {

namespace Utils {

// Count of parts needed to cover an object
//
// @param  : object size, part size
// @return : ceil(objectSize / partSize), 0 if either is 0
uint64_t CalculatePartCount(uint64_t objectSize, uint64_t partSize);

// Size of one part
//
// @param  : object size, part size, part number starting from 1
// @return : partSize for all but the last part, the remainder for the last,
//           0 for a part number out of range
uint64_t CalculatePartSize(uint64_t objectSize, uint64_t partSize,
                           uint64_t partNumber);

// Build request header of 'Range'
//
// @param  : start, size
// @return : string with format of "bytes=start_offset-stop_offset"
std::string BuildRequestRange(uint64_t start, uint64_t size);

// Build request header of 'Range'
//
// @param  : start
// @return : string with format of "bytes=start_offset-"
std::string BuildRequestRangeStart(uint64_t start);

// Parse request header of 'Range'
//
// @param  : "bytes=start_offset-stop_offset" or "bytes=start_offset-"
// @return : {valid, start, stop}, stop is -1 for an open ended range
boost::tuple<bool, int64_t, int64_t> ParseRequestRange(
    const std::string &requestRange);

}  // namespace Utils
}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_UTILS_H_

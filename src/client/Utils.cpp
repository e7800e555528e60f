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

#include "client/Utils.h"

#include <stdint.h>

#include <sstream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace XF {

namespace Client {

namespace Utils {

using boost::make_tuple;
using boost::to_string;
using boost::tuple;
using std::string;

// --------------------------------------------------------------------------
uint64_t CalculatePartCount(uint64_t objectSize, uint64_t partSize) {
  if (partSize == 0) {
    return 0;
  }
  return objectSize / partSize + (objectSize % partSize == 0 ? 0 : 1);
}

// --------------------------------------------------------------------------
uint64_t CalculatePartSize(uint64_t objectSize, uint64_t partSize,
                           uint64_t partNumber) {
  uint64_t partCount = CalculatePartCount(objectSize, partSize);
  if (partNumber == 0 || partNumber > partCount) {
    return 0;
  }
  return partNumber < partCount ? partSize
                                : objectSize - (partCount - 1) * partSize;
}

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t size) {
  DebugWarningIf(size == 0, "Invalid input with zero range size");
  // e.g. bytes=0-0 return the first byte
  return "bytes=" + to_string(start) + "-" +
         to_string(size == 0 ? start : start + size - 1);
}

// --------------------------------------------------------------------------
string BuildRequestRangeStart(uint64_t start) {
  return "bytes=" + to_string(start) + "-";
}

// --------------------------------------------------------------------------
tuple<bool, int64_t, int64_t> ParseRequestRange(const string &requestRange) {
  string cpy(XF::StringUtils::Trim(requestRange, ' '));
  static const string prefix = "bytes=";
  if (cpy.compare(0, prefix.size(), prefix) != 0) {
    return make_tuple(false, 0, 0);
  }
  cpy = cpy.substr(prefix.size());
  string::size_type dash = cpy.find('-');
  if (dash == string::npos || dash == 0) {
    return make_tuple(false, 0, 0);
  }

  int64_t start = 0;
  std::istringstream startIn(cpy.substr(0, dash));
  if (!(startIn >> start) || !startIn.eof() || start < 0) {
    return make_tuple(false, 0, 0);
  }

  string stopStr = cpy.substr(dash + 1);
  if (stopStr.empty()) {
    return make_tuple(true, start, static_cast<int64_t>(-1));
  }
  int64_t stop = 0;
  std::istringstream stopIn(stopStr);
  if (!(stopIn >> stop) || !stopIn.eof() || stop < start) {
    return make_tuple(false, 0, 0);
  }
  return make_tuple(true, start, stop);
}

}  // namespace Utils
}  // namespace Client
}  // namespace XF

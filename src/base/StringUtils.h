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

#ifndef XFER_BASE_STRINGUTILS_H_
#define XFER_BASE_STRINGUTILS_H_

#include <stdint.h>

#include <string>

namespace XF {

namespace StringUtils {

std::string ToLower(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Format path
//
// @param  : path
// @return : formatted string, e.g. "[path=/tmp/a]"
std::string FormatPath(const std::string &path);

// Format remote object location
//
// @param  : bucket, object key
// @return : formatted string, e.g. "[bucket=b key=k]"
std::string FormatObject(const std::string &bucket, const std::string &key);

// Human readable size, e.g. "512 B", "7.6 MiB"
std::string FormatByteSize(uint64_t bytes);

}  // namespace StringUtils
}  // namespace XF

#endif  // XFER_BASE_STRINGUTILS_H_

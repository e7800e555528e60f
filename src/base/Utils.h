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

#ifndef XFER_BASE_UTILS_H_
#define XFER_BASE_UTILS_H_

#include <stdint.h>

#include <string>
#include <utility>

namespace XF {

namespace Utils {

// Create directory recursively if it doesn't exists
//
// @param  : dir path
// @return : bool
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file if it exists
//
// @param  : file path
// @return : bool
bool RemoveFileIfExists(const std::string &path);

// Check if file exists
bool FileExists(const std::string &path);

// Check if file is a directory
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if process is able to create files under the dir
//
// @param  : dir path
// @return : a pair of {true, ""} or {false, message}
std::pair<bool, std::string> IsDirectoryWritable(const std::string &path);

// Get size of a regular file
//
// @param  : file path
// @return : a pair of {size, ""} or {0, message}
std::pair<uint64_t, std::string> GetFileSize(const std::string &path);

// Get dir name where the file belongs to
//
// @param  : file path
// @return : dir name ending with "/"
//
// If path is root or cannot find dir, return null string
std::string GetDirName(const std::string &path);

}  // namespace Utils
}  // namespace XF

#endif  // XFER_BASE_UTILS_H_

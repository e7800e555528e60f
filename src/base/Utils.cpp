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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>  // for strerror

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>

#include "base/StringUtils.h"

namespace XF {

namespace Utils {

using XF::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';
static const mode_t DIR_MODE = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (path == string(1, PATH_DELIM)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }
  // create parent first
  string parent = GetDirName(path);
  if (!parent.empty() && !CreateDirectoryIfNotExists(parent)) {
    return false;
  }
  int errorCode = mkdir(path.c_str(), DIR_MODE);
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return (errorCode == 0 || errno == ENOENT);
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  return access(path.c_str(), F_OK) == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    return make_pair(false, "Unable to access path" + PostErrMsg(path));
  }
  return make_pair(S_ISDIR(stBuf.st_mode), string());
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectoryWritable(const string &path) {
  pair<bool, string> isDir = IsDirectory(path);
  if (!isDir.first) {
    return isDir.second.empty()
               ? make_pair(false, "Not a directory " + FormatPath(path))
               : isDir;
  }
  if (access(path.c_str(), W_OK | X_OK) != 0) {
    return make_pair(false, "No write permission" + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
pair<uint64_t, string> GetFileSize(const string &path) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    return make_pair(0, "Unable to stat file" + PostErrMsg(path));
  }
  if (!S_ISREG(stBuf.st_mode)) {
    return make_pair(0, "Not a regular file " + FormatPath(path));
  }
  return make_pair(static_cast<uint64_t>(stBuf.st_size), string());
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  string copy(XF::StringUtils::RTrim(path, PATH_DELIM));
  string::size_type pos = copy.find_last_of(PATH_DELIM);
  if (pos == string::npos) {
    return string();
  }
  return copy.substr(0, pos + 1);
}

}  // namespace Utils
}  // namespace XF

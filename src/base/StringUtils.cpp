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

#include "base/StringUtils.h"

#include <stdint.h>
#include <stdio.h>

#include <algorithm>
#include <cctype>
#include <string>

#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

#include "base/Size.h"

namespace XF {

namespace StringUtils {

using boost::lambda::_1;
using std::string;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string lower(str);
  BOOST_FOREACH(char &ch, lower) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return lower;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  string::const_iterator first = std::find_if(str.begin(), str.end(), _1 != ch);
  return string(first, str.end());
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  string::const_reverse_iterator last =
      std::find_if(str.rbegin(), str.rend(), _1 != ch);
  return string(str.begin(), last.base());
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return RTrim(LTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
string FormatPath(const string &path) { return "[path=" + path + "]"; }

// --------------------------------------------------------------------------
string FormatObject(const string &bucket, const string &key) {
  return "[bucket=" + bucket + " key=" + key + "]";
}

// --------------------------------------------------------------------------
string FormatByteSize(uint64_t bytes) {
  static const char *units[] = {"KiB", "MiB", "GiB", "TiB"};
  if (bytes < XF::Size::KB1) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%llu B",
             static_cast<unsigned long long>(bytes));
    return buf;
  }
  double value = static_cast<double>(bytes) / XF::Size::KB1;
  size_t unit = 0;
  while (value >= 1024 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024;
    ++unit;
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
  return buf;
}

}  // namespace StringUtils
}  // namespace XF

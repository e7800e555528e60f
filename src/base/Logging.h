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

#ifndef XFER_BASE_LOGGING_H_
#define XFER_BASE_LOGGING_H_

#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace XF {

namespace Logging {

//
// Log
//
// Wraps glog. Initialize is one-time, later calls are ignored.
// With a directory given messages go to files under it, otherwise
// they go to stderr.
//
class Log : public Singleton<Log> {
 public:
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_isDebug; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  // Initialize
  //
  // @param  : log dir, empty to log to console
  // @return : none
  //
  // Throws XFException if the log dir cannot be created or written.
  void Initialize(const std::string &logdir = std::string());

  void SetLogLevel(LogLevel::Value level);
  // Debug* macros only write when debug is on
  void SetDebug(bool debug) { m_isDebug = debug; }

 private:
  void DoInitialize(const std::string &logdir);

 private:
  Log() : m_logLevel(LogLevel::Info), m_isDebug(false) {}

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // empty when logging to console
  bool m_isDebug;

  friend class Singleton<Log>;
};

}  // namespace Logging
}  // namespace XF

#endif  // XFER_BASE_LOGGING_H_

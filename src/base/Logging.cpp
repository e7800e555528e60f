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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace XF {

namespace Logging {

using XF::Exception::XFException;
using std::pair;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir) {
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this, logdir));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
  } else {
    if (!XF::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw XFException("Unable to create log directory " + logdir + " : " +
                        strerror(errno));
    }
    pair<bool, string> writable = XF::Utils::IsDirectoryWritable(logdir);
    if (!writable.first) {
      throw XFException("Could not create logging file at " + logdir + " : " +
                        writable.second);
    }

    m_logDirectory = logdir;
    // glog reads the destination flags only once, in InitGoogleLogging
    FLAGS_log_dir = logdir;
    FLAGS_max_log_size = XF::Configure::Default::GetMaxLogSizeInMB();
    FLAGS_stop_logging_if_full_disk = true;
  }

  google::InitGoogleLogging(XF::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
  SetLogLevel(
      GetLogLevelByName(XF::Configure::Default::GetDefaultLogLevelName()));
}

}  // namespace Logging
}  // namespace XF

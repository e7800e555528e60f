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

#include "configure/Default.h"

#include <string>

#include "base/Size.h"

namespace XF {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "xfer";
static const char* const XFER_DEFAULT_LOGLEVEL_NAME = "INFO";
static const int32_t XFER_MAX_LOG_SIZE_MB = 100;
static const uint16_t XFER_DEFAULT_TRANSFER_RETRIES = 3;
static const uint16_t XFER_DEFAULT_RETRY_SCALE_FACTOR = 25;

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogLevelName() { return XFER_DEFAULT_LOGLEVEL_NAME; }
int32_t GetMaxLogSizeInMB() { return XFER_MAX_LOG_SIZE_MB; }

uint64_t GetDefaultMultipartThreshold() { return XF::Size::MB8; }
uint64_t GetDefaultMultipartChunkSize() { return XF::Size::MB8; }
size_t GetDefaultMaxConcurrency() { return 10; }

uint16_t GetDefaultTransferRetries() { return XFER_DEFAULT_TRANSFER_RETRIES; }
uint16_t GetDefaultRetryScaleFactor() {
  return XFER_DEFAULT_RETRY_SCALE_FACTOR;
}

// most stores, s3 included, accept at most 10000 parts in one session
uint32_t GetMaxPartCount() { return 10000; }

size_t GetRangeDownloadBufferSize() { return XF::Size::KB16; }
size_t GetSingleDownloadBufferSize() { return XF::Size::KB8; }

}  // namespace Default
}  // namespace Configure
}  // namespace XF

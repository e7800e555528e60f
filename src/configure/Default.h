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

#ifndef XFER_CONFIGURE_DEFAULT_H_
#define XFER_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <string>

namespace XF {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultLogLevelName();
int32_t GetMaxLogSizeInMB();

// Transfer policy defaults
uint64_t GetDefaultMultipartThreshold();  // in bytes
uint64_t GetDefaultMultipartChunkSize();  // in bytes
size_t GetDefaultMaxConcurrency();
uint16_t GetDefaultTransferRetries();  // per part or range
uint16_t GetDefaultRetryScaleFactor();  // in milliseconds

// Store limits, partitions breaking them are rejected before any request
uint32_t GetMaxPartCount();

// Read buffer sizes used when streaming a response body into a local file
size_t GetRangeDownloadBufferSize();
size_t GetSingleDownloadBufferSize();

}  // namespace Default
}  // namespace Configure
}  // namespace XF

#endif  // XFER_CONFIGURE_DEFAULT_H_

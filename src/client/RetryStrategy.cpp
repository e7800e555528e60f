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

#include "client/RetryStrategy.h"

#include <stdint.h>

#include <exception>

#include "boost/shared_ptr.hpp"

#include "base/LogMacros.h"
#include "client/TransferHandle.h"

namespace XF {

namespace Client {

using boost::shared_ptr;

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldRetry(const ClientError<TransferError::Value> &error,
                                uint16_t attemptedRetryTimes) const {
  if (attemptedRetryTimes >= m_maxRetryTimes) {
    return false;
  }
  return GetTransferErrorCategory(error.GetError()) ==
             TransferErrorCategory::Store &&
         error.ShouldRetry();
}

// --------------------------------------------------------------------------
uint32_t RetryStrategy::CalculateDelayBeforeNextRetry(
    uint16_t attemptedRetryTimes) const {
  // 2^16 * max scale factor still fits in 32 bits
  uint16_t shift = attemptedRetryTimes > 16 ? 16 : attemptedRetryTimes;
  return attemptedRetryTimes == 0
             ? 0
             : (static_cast<uint32_t>(1) << shift) * m_scaleFactor;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> RetryStrategy::Run(
    const RetryableCall &call, const shared_ptr<TransferHandle> &handle) const {
  uint16_t attempted = 0;
  while (true) {
    if (!handle->ShouldContinue()) {
      return ClientError<TransferError::Value>(
          TransferError::CANCELLED, "RetryStrategy", "transfer cancelled",
          false);
    }
    ClientError<TransferError::Value> err;
    try {
      err = call();
    } catch (const std::exception &e) {
      err = ClientError<TransferError::Value>(
          TransferError::UNKNOWN, "RetryStrategy", e.what(), false);
    }
    if (IsGoodTransferError(err) || !ShouldRetry(err, attempted)) {
      return err;
    }
    ++attempted;
    uint32_t delay = CalculateDelayBeforeNextRetry(attempted);
    Warning("Retry " << attempted << "/" << m_maxRetryTimes << " in " << delay
                     << "ms after " << GetMessageForTransferError(err));
    if (!handle->WaitForRetry(delay)) {
      return ClientError<TransferError::Value>(
          TransferError::CANCELLED, "RetryStrategy",
          "transfer cancelled while waiting to retry", false);
    }
  }
}

}  // namespace Client
}  // namespace XF

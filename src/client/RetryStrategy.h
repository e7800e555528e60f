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

#ifndef XFER_CLIENT_RETRYSTRATEGY_H_
#define XFER_CLIENT_RETRYSTRATEGY_H_

#include <stdint.h>

#include "boost/function.hpp"
#include "boost/shared_ptr.hpp"

#include "client/TransferError.h"

namespace XF {

namespace Client {

class TransferHandle;

typedef boost::function<ClientError<TransferError::Value>()> RetryableCall;

// Bounded retries with exponential backoff, applied to one part or range
class RetryStrategy {
 public:
  RetryStrategy(uint16_t maxRetryTimes, uint16_t scaleFactor)
      : m_maxRetryTimes(maxRetryTimes), m_scaleFactor(scaleFactor) {}

  // Only errors the store flagged as retryable are retried
  bool ShouldRetry(const ClientError<TransferError::Value> &error,
                   uint16_t attemptedRetryTimes) const;

  // @return : delay in milliseconds, scaleFactor * 2^attemptedRetryTimes
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  uint16_t GetMaxRetryTimes() const { return m_maxRetryTimes; }

  // Run a call until it succeeds, fails with an error not worth retrying,
  // or the transfer is cancelled
  //
  // @param  : call, handle of the transfer the call belongs to
  // @return : error of the last attempt, CANCELLED if stopped in between
  //
  // An exception escaping the call ends the run with UNKNOWN.
  ClientError<TransferError::Value> Run(
      const RetryableCall &call,
      const boost::shared_ptr<TransferHandle> &handle) const;

 private:
  uint16_t m_maxRetryTimes;
  uint16_t m_scaleFactor;
};

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_RETRYSTRATEGY_H_

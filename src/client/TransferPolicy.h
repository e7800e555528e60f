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

#ifndef XFER_CLIENT_TRANSFERPOLICY_H_
#define XFER_CLIENT_TRANSFERPOLICY_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "client/RetryStrategy.h"

namespace XF {

namespace Client {

//
// TransferPolicy
//
// Immutable settings shared read only by every worker of a transfer.
// Constructing a policy with zero part size or zero concurrency throws
// XF::Exception::XFException.
//
class TransferPolicy {
 public:
  // Build with all defaults
  TransferPolicy();

  TransferPolicy(uint64_t multipartThreshold, uint64_t partSize,
                 size_t maxConcurrency);

  TransferPolicy(uint64_t multipartThreshold, uint64_t partSize,
                 size_t maxConcurrency, uint16_t maxRetries,
                 uint16_t retryScaleFactor);

 public:
  // Objects with size >= threshold are transferred in parts
  uint64_t GetMultipartThreshold() const { return m_multipartThreshold; }
  uint64_t GetPartSize() const { return m_partSize; }
  size_t GetMaxConcurrency() const { return m_maxConcurrency; }
  uint16_t GetMaxRetries() const { return m_maxRetries; }
  uint16_t GetRetryScaleFactor() const { return m_retryScaleFactor; }

  bool UseMultipart(uint64_t objectSize) const {
    return objectSize >= m_multipartThreshold;
  }
  RetryStrategy GetRetryStrategy() const {
    return RetryStrategy(m_maxRetries, m_retryScaleFactor);
  }

  std::string ToString() const;

 private:
  void Validate() const;

 private:
  uint64_t m_multipartThreshold;  // in bytes
  uint64_t m_partSize;            // in bytes
  size_t m_maxConcurrency;        // worker count
  uint16_t m_maxRetries;          // per part or range
  uint16_t m_retryScaleFactor;    // in milliseconds
};

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_TRANSFERPOLICY_H_

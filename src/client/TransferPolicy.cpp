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

#include "client/TransferPolicy.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "configure/Default.h"

namespace XF {

namespace Client {

using boost::to_string;
using XF::Exception::XFException;
using std::string;

namespace Default = XF::Configure::Default;

// --------------------------------------------------------------------------
TransferPolicy::TransferPolicy()
    : m_multipartThreshold(Default::GetDefaultMultipartThreshold()),
      m_partSize(Default::GetDefaultMultipartChunkSize()),
      m_maxConcurrency(Default::GetDefaultMaxConcurrency()),
      m_maxRetries(Default::GetDefaultTransferRetries()),
      m_retryScaleFactor(Default::GetDefaultRetryScaleFactor()) {
  Validate();
}

// --------------------------------------------------------------------------
TransferPolicy::TransferPolicy(uint64_t multipartThreshold, uint64_t partSize,
                               size_t maxConcurrency)
    : m_multipartThreshold(multipartThreshold),
      m_partSize(partSize),
      m_maxConcurrency(maxConcurrency),
      m_maxRetries(Default::GetDefaultTransferRetries()),
      m_retryScaleFactor(Default::GetDefaultRetryScaleFactor()) {
  Validate();
}

// --------------------------------------------------------------------------
TransferPolicy::TransferPolicy(uint64_t multipartThreshold, uint64_t partSize,
                               size_t maxConcurrency, uint16_t maxRetries,
                               uint16_t retryScaleFactor)
    : m_multipartThreshold(multipartThreshold),
      m_partSize(partSize),
      m_maxConcurrency(maxConcurrency),
      m_maxRetries(maxRetries),
      m_retryScaleFactor(retryScaleFactor) {
  Validate();
}

// --------------------------------------------------------------------------
string TransferPolicy::ToString() const {
  return "[multipart threshold: " + to_string(m_multipartThreshold) +
         ", part size: " + to_string(m_partSize) +
         ", max concurrency: " + to_string(m_maxConcurrency) +
         ", max retries: " + to_string(m_maxRetries) +
         ", retry scale factor(ms): " + to_string(m_retryScaleFactor) + "]";
}

// --------------------------------------------------------------------------
void TransferPolicy::Validate() const {
  if (m_partSize == 0) {
    throw XFException("Invalid transfer policy, part size must be positive " +
                      ToString());
  }
  if (m_maxConcurrency == 0) {
    throw XFException(
        "Invalid transfer policy, max concurrency must be at least 1 " +
        ToString());
  }
}

}  // namespace Client
}  // namespace XF

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

#include "data/ProgressTracker.h"

#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace XF {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using std::string;

namespace {

// log every this many reports
const uint64_t kLogInterval = 10;

double Percentage(uint64_t seen, uint64_t total) {
  return total == 0 ? 0.0 : static_cast<double>(seen) * 100 / total;
}

}  // namespace

// --------------------------------------------------------------------------
ProgressTracker::ProgressTracker(const string &name, uint64_t totalSize)
    : m_name(name), m_totalSize(totalSize), m_bytesSeen(0), m_callCount(0) {}

// --------------------------------------------------------------------------
void ProgressTracker::OnProgress(size_t amount) {
  uint64_t seen = 0;
  uint64_t count = 0;
  {
    lock_guard<mutex> locker(m_lock);
    m_bytesSeen += amount;
    ++m_callCount;
    seen = m_bytesSeen;
    count = m_callCount;
  }
  DebugInfoIf(count % kLogInterval == 0 || seen == m_totalSize,
              m_name << " " << seen << " / " << m_totalSize << " ("
                     << Percentage(seen, m_totalSize) << "%)");
}

// --------------------------------------------------------------------------
uint64_t ProgressTracker::GetBytesSeen() const {
  lock_guard<mutex> locker(m_lock);
  return m_bytesSeen;
}

// --------------------------------------------------------------------------
uint64_t ProgressTracker::GetCallCount() const {
  lock_guard<mutex> locker(m_lock);
  return m_callCount;
}

// --------------------------------------------------------------------------
double ProgressTracker::GetPercentage() const {
  return Percentage(GetBytesSeen(), m_totalSize);
}

// --------------------------------------------------------------------------
string ProgressTracker::ToString() const {
  lock_guard<mutex> locker(m_lock);
  return "[name: " + m_name + ", seen(bytes): " + to_string(m_bytesSeen) +
         ", total(bytes): " + to_string(m_totalSize) +
         ", reports: " + to_string(m_callCount) + "]";
}

}  // namespace Data
}  // namespace XF

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

#ifndef XFER_DATA_PROGRESSTRACKER_H_
#define XFER_DATA_PROGRESSTRACKER_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"

namespace XF {

namespace Data {

//
// ProgressTracker
//
// Running total of the amounts a transfer reports, safe to be fed from
// several workers at once. Bind OnProgress to a ProgressCallback with a
// shared_ptr to the tracker.
//
class ProgressTracker : private boost::noncopyable {
 public:
  // @param  : name shown in log, expected total size, 0 if unknown
  explicit ProgressTracker(const std::string &name, uint64_t totalSize = 0);

 public:
  void OnProgress(size_t amount);

  uint64_t GetBytesSeen() const;
  uint64_t GetCallCount() const;
  // @return : percentage of total size seen so far, 0 if total is unknown
  double GetPercentage() const;
  uint64_t GetTotalSize() const { return m_totalSize; }
  std::string ToString() const;

 private:
  std::string m_name;
  uint64_t m_totalSize;
  uint64_t m_bytesSeen;
  uint64_t m_callCount;
  mutable boost::mutex m_lock;
};

}  // namespace Data
}  // namespace XF

#endif  // XFER_DATA_PROGRESSTRACKER_H_

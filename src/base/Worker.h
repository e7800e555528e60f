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

#ifndef XFER_BASE_WORKER_H_
#define XFER_BASE_WORKER_H_

#include <stddef.h>  // for size_t

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"

namespace XF {

namespace Threading {

class ThreadPool;

//
// Worker
//
// Thread of a ThreadPool. It sleeps on the pool's condition variable and
// takes one task off the queue each time it wakes up with work queued.
//
class Worker : private boost::noncopyable {
 public:
  Worker(ThreadPool *pool, size_t index);

  // Join the thread, RequestStop must have been called first
  ~Worker();

 public:
  size_t GetIndex() const { return m_index; }
  size_t GetTasksRun() const;

 private:
  void RequestStop();
  bool IsStopRequested() const;

  void Run();
  bool HasWorkOrStop() const;

 private:
  ThreadPool *m_pool;
  size_t m_index;

  mutable boost::mutex m_stateLock;
  bool m_stopRequested;
  size_t m_tasksRun;

  boost::thread m_thread;  // started last

  friend class ThreadPool;
};

}  // namespace Threading
}  // namespace XF

#endif  // XFER_BASE_WORKER_H_

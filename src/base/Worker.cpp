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

#include "base/Worker.h"

#include <stddef.h>

#include <exception>

#include "boost/bind.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/ThreadPool.h"

namespace XF {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::scoped_ptr;
using boost::unique_lock;

// --------------------------------------------------------------------------
Worker::Worker(ThreadPool *pool, size_t index)
    : m_pool(pool),
      m_index(index),
      m_stopRequested(false),
      m_tasksRun(0),
      m_thread(boost::bind(boost::type<void>(), &Worker::Run, this)) {}

// --------------------------------------------------------------------------
Worker::~Worker() {
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

// --------------------------------------------------------------------------
size_t Worker::GetTasksRun() const {
  lock_guard<mutex> locker(m_stateLock);
  return m_tasksRun;
}

// --------------------------------------------------------------------------
void Worker::RequestStop() {
  lock_guard<mutex> locker(m_stateLock);
  m_stopRequested = true;
}

// --------------------------------------------------------------------------
bool Worker::IsStopRequested() const {
  lock_guard<mutex> locker(m_stateLock);
  return m_stopRequested;
}

// --------------------------------------------------------------------------
bool Worker::HasWorkOrStop() const {
  return IsStopRequested() || m_pool->HasTasks();
}

// --------------------------------------------------------------------------
void Worker::Run() {
  while (true) {
    {
      unique_lock<mutex> lock(m_pool->m_syncLock);
      m_pool->m_syncConditionVar.wait(
          lock,
          boost::bind(boost::type<bool>(), &Worker::HasWorkOrStop, this));
    }
    if (IsStopRequested()) {
      break;
    }

    // another worker may have been quicker
    scoped_ptr<Task> task(m_pool->PopTask());
    if (!task) {
      continue;
    }
    try {
      (*task)();
    } catch (const std::exception &err) {
      Error("Worker " << m_index << " caught exception from task: "
                      << err.what());
    }
    lock_guard<mutex> locker(m_stateLock);
    ++m_tasksRun;
  }
  DebugInfo("Worker " << m_index << " stopped after " << GetTasksRun()
                      << " tasks");
}

}  // namespace Threading
}  // namespace XF

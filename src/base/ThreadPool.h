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

#ifndef XFER_BASE_THREADPOOL_H_
#define XFER_BASE_THREADPOOL_H_

#include <stddef.h>

#include <list>
#include <vector>

#include "boost/bind.hpp"
#include "boost/function.hpp"
#include "boost/move/move.hpp"
#include "boost/noncopyable.hpp"
#include "boost/preprocessor.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/utility/result_of.hpp"

//
// Macros for emulating Variadic Template in C++03
//
#define XFER_POOL_MAX_ARITY 3
#define XFER_POOL_PARAMETERS(Z, N, D) \
  BOOST_PP_COMMA_IF(N)                \
  BOOST_FWD_REF(BOOST_PP_CAT(A, N)) BOOST_PP_CAT(a, N)
#define XFER_POOL_FORWARD(Z, N, D) \
  BOOST_PP_COMMA_IF(N)             \
  boost::forward<BOOST_PP_CAT(A, N)>(BOOST_PP_CAT(a, N))
#define XFER_POOL_ARGUMENTS(Z, N, D) BOOST_PP_COMMA_IF(N) BOOST_PP_CAT(a, N)

namespace XF {

namespace Threading {

class Worker;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// Fixed set of workers draining one FIFO task queue. Every multipart
// transfer of a TransferManager shares its pool, so a task must never
// block on another task of the same pool.
//
// Workers start in the constructor and are joined in the destructor.
// Tasks still queued then are dropped without running.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  size_t GetPoolSize() const { return m_poolSize; }
  size_t GetQueuedTaskCount();

  // Queue a task and wake one idle worker
  void SubmitToThread(const Task &task);

//
// Submit(f, a0, ...)           run f(a0, ...) on a worker
// SubmitAsync(h, f, a0, ...)   run h(f(a0, ...), a0, ...) on a worker
//
#define EXPAND(N)                                                          \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>               \
  void Submit(F f, BOOST_PP_REPEAT(N, XFER_POOL_PARAMETERS, ~)) {          \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ReturnType;                                                        \
    SubmitToThread(boost::bind(boost::type<ReturnType>(), f,               \
                               BOOST_PP_REPEAT(N, XFER_POOL_FORWARD, ~))); \
  }                                                                        \
                                                                           \
  template <typename ReceivedHandler, typename F,                          \
            BOOST_PP_ENUM_PARAMS(N, typename A)>                           \
  void SubmitAsync(ReceivedHandler handler, F f,                           \
                   BOOST_PP_REPEAT(N, XFER_POOL_PARAMETERS, ~)) {          \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ResultType;                                                        \
    SubmitToThread(boost::bind(                                            \
        boost::type<void>(), handler,                                      \
        boost::bind(boost::type<ResultType>(), f,                          \
                    BOOST_PP_REPEAT(N, XFER_POOL_ARGUMENTS, ~)),           \
        BOOST_PP_REPEAT(N, XFER_POOL_ARGUMENTS, ~)));                      \
  }

#define BOOST_PP_LOCAL_MACRO(N) EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, XFER_POOL_MAX_ARITY)
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef EXPAND

 private:
  Task *PopTask();
  bool HasTasks();

  // Ask every worker to quit after its current task. Queued tasks are
  // never handled after this has been called.
  void StopProcessing();

 private:
  size_t m_poolSize;
  std::list<Task *> m_tasks;
  boost::mutex m_queueLock;
  std::vector<Worker *> m_workers;
  boost::mutex m_syncLock;
  boost::condition_variable m_syncConditionVar;

  friend class Worker;
  friend class ThreadPoolTest;
};

}  // namespace Threading
}  // namespace XF

#undef XFER_POOL_ARGUMENTS
#undef XFER_POOL_FORWARD
#undef XFER_POOL_PARAMETERS
#undef XFER_POOL_MAX_ARITY

#endif  // XFER_BASE_THREADPOOL_H_

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace orrery {
namespace base {
namespace internal_thread_pool {

// A pool of threads able to execute functions returning T.  T must be
// default-constructible.  Calls are executed in FIFO order, but may complete
// in any order.
template<typename T>
class ThreadPool final {
 public:
  // Constructs a thread pool with the given number of threads.
  explicit ThreadPool(std::int64_t pool_size);

  ~ThreadPool();

  // Adds a function to be executed by the pool.  Returns a future that may be
  // used to wait for the completion of the call and obtain its result.
  std::future<T> Add(std::function<T()> function);

  std::int64_t size() const;

 private:
  // Returns false if the pool has been shut down.
  bool DequeueCallAndExecute();

  absl::Mutex lock_;
  bool shutdown_ ABSL_GUARDED_BY(lock_) = false;
  std::list<std::packaged_task<T()>> calls_ ABSL_GUARDED_BY(lock_);

  std::vector<std::thread> threads_;
};

// Applies |function| to every element of |elements|, in parallel on |pool| if
// it is not null, sequentially in the calling thread otherwise.  Blocks until
// all the calls have completed.  |function| must not have side effects on
// elements other than its argument.
template<typename Element, typename Function>
void ParallelForEach(ThreadPool<void>* pool,
                     std::vector<Element>& elements,
                     Function const& function);

}  // namespace internal_thread_pool

using internal_thread_pool::ParallelForEach;
using internal_thread_pool::ThreadPool;

}  // namespace base
}  // namespace orrery

#include "base/thread_pool_body.hpp"

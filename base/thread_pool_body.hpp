#pragma once

#include "base/thread_pool.hpp"

#include <algorithm>
#include <utility>

#include "glog/logging.h"

namespace orrery {
namespace base {
namespace internal_thread_pool {

template<typename T>
ThreadPool<T>::ThreadPool(std::int64_t const pool_size) {
  CHECK_LT(0, pool_size);
  for (std::int64_t i = 0; i < pool_size; ++i) {
    threads_.emplace_back([this]() {
      while (DequeueCallAndExecute()) {}
    });
  }
}

template<typename T>
ThreadPool<T>::~ThreadPool() {
  {
    absl::MutexLock l(&lock_);
    shutdown_ = true;
  }
  for (auto& thread : threads_) {
    thread.join();
  }
}

template<typename T>
std::future<T> ThreadPool<T>::Add(std::function<T()> function) {
  std::future<T> result;
  {
    absl::MutexLock l(&lock_);
    calls_.emplace_back(std::move(function));
    result = calls_.back().get_future();
  }
  return result;
}

template<typename T>
std::int64_t ThreadPool<T>::size() const {
  return threads_.size();
}

template<typename T>
bool ThreadPool<T>::DequeueCallAndExecute() {
  std::packaged_task<T()> this_call;
  {
    absl::MutexLock l(&lock_);
    auto const wake_up = [this]() ABSL_SHARED_LOCKS_REQUIRED(lock_) {
      return shutdown_ || !calls_.empty();
    };
    lock_.Await(absl::Condition(&wake_up));
    // Pending calls are drained before shutdown completes.
    if (calls_.empty()) {
      return false;
    }
    this_call = std::move(calls_.front());
    calls_.pop_front();
  }
  this_call();
  return true;
}

template<typename Element, typename Function>
void ParallelForEach(ThreadPool<void>* const pool,
                     std::vector<Element>& elements,
                     Function const& function) {
  if (pool == nullptr || elements.size() < 2) {
    for (auto& element : elements) {
      function(element);
    }
    return;
  }
  // One contiguous chunk per thread; the elements are cheap to process and
  // one task per element would be dominated by the queueing overhead.
  std::int64_t const size = elements.size();
  std::int64_t const chunks = std::min<std::int64_t>(pool->size(), size);
  std::vector<std::future<void>> futures;
  futures.reserve(chunks);
  for (std::int64_t chunk = 0; chunk < chunks; ++chunk) {
    std::int64_t const begin = chunk * size / chunks;
    std::int64_t const end = (chunk + 1) * size / chunks;
    futures.push_back(pool->Add([&elements, &function, begin, end]() {
      for (std::int64_t i = begin; i < end; ++i) {
        function(elements[i]);
      }
    }));
  }
  for (auto& future : futures) {
    future.wait();
  }
}

}  // namespace internal_thread_pool
}  // namespace base
}  // namespace orrery

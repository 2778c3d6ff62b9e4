#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

#include "internal/concurrency/blocking_queue.hpp"

namespace curator::concurrency {

/*
  Fixed-size pool of worker threads draining one task queue.

  Pool size is the only concurrency knob. Tasks must not throw: a
  std::exception that escapes a task is logged and dropped, anything else is
  logged and rethrown, which terminates the process. Callers waiting on task
  results catch everything inside the task. Destruction waits for every
  submitted task to finish.
*/
class WorkerPool {
 public:
  static constexpr size_t kMaxWorkers = 64;

  explicit WorkerPool(size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Submit(std::function<void()> task);

  // Stop accepting work, finish what is queued, join.
  void Shutdown();

  size_t size() const {
    return threads_.size();
  }

  // Clamp a requested worker count to [1, kMaxWorkers].
  static size_t ClampWorkers(long long requested);

 private:
  void Run();

  BlockingQueue<std::function<void()>> tasks_;
  std::vector<std::thread>             threads_;
  bool                                 shut_down_ = false;
};

} // namespace curator::concurrency

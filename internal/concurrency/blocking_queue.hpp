#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace curator::concurrency {

/*
  Thread-safe blocking queue.

  Used both as the worker pool's task queue and as the channel results flow
  back on. After Shutdown() the queue drains: Dequeue keeps returning queued
  items and only returns nullopt once it is empty.
*/
template <typename T>
class BlockingQueue {
 public:
  void Enqueue(T item) {
    {
      std::lock_guard lock(mutex_);
      queue_.push(std::move(item));
    }
    cv_.notify_one();
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace curator::concurrency

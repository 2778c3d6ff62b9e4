#include "worker_pool.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace curator::concurrency {

size_t WorkerPool::ClampWorkers(long long requested) {
  if (requested < 1) return 1;
  if (static_cast<unsigned long long>(requested) > kMaxWorkers) return kMaxWorkers;
  return static_cast<size_t>(requested);
}

WorkerPool::WorkerPool(size_t workers) {
  const auto count = ClampWorkers(static_cast<long long>(workers));
  threads_.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

void WorkerPool::Submit(std::function<void()> task) {
  if (shut_down_) {
    throw std::logic_error("task submitted to a stopped worker pool");
  }
  tasks_.Enqueue(std::move(task));
}

void WorkerPool::Shutdown() {
  if (shut_down_) return;
  shut_down_ = true;

  tasks_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void WorkerPool::Run() {
  while (auto task = tasks_.Dequeue()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      CURATOR_LOG_ERROR("worker task failed", {observability::StringField("error", e.what())});
    } catch (...) {
      CURATOR_LOG_ERROR("worker task threw a non-standard exception");
      throw;
    }
  }
}

} // namespace curator::concurrency

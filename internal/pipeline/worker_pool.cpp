#include "worker_pool.hpp"

#include <algorithm>

namespace resolver::pipeline {

WorkerPool::WorkerPool(std::size_t threads) : size_(threads == 0 ? std::max(1u, std::thread::hardware_concurrency()) : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  std::lock_guard lock(mutex_);
  if (started_ || stopping_) return;
  started_ = true;
  threads_.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) threads_.emplace_back(&WorkerPool::Run, this);
}

void WorkerPool::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Push(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) throw std::runtime_error("worker pool is stopped");
    jobs_.push_back(std::move(job));
  }
  wake_.notify_one();
}

void WorkerPool::Run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock(mutex_);
      wake_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    // packaged_task stores any exception in its future
    job();
  }
}

} // namespace resolver::pipeline

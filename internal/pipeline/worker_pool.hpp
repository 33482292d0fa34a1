#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace resolver::pipeline {

/*
  Fixed-size pool used by the normalize and score stages.

  Every submitted task hands its result (or exception) back through a
  future. The pool never merges results itself; the caller owns ordering,
  which is what keeps a run deterministic for any thread count.
*/
class WorkerPool {
 public:
  // threads == 0 uses the hardware concurrency
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Runs everything already submitted, then joins the workers.
  // Submit() throws std::runtime_error afterwards.
  void Stop();

  std::size_t Size() const {
    return size_;
  }

  template <typename F>
  std::future<std::invoke_result_t<F>> Submit(F&& fn) {
    using R   = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto out  = task->get_future();
    Push([task] { (*task)(); });
    return out;
  }

 private:
  void Push(std::function<void()> job);
  void Run();

  const std::size_t size_;

  std::mutex                        mutex_;
  std::condition_variable           wake_;
  std::deque<std::function<void()>> jobs_;
  bool                              stopping_ = false;
  bool                              started_  = false;
  std::vector<std::thread>          threads_;
};

} // namespace resolver::pipeline

#include "internal/pipeline/worker_pool.hpp"

#include <assert.h>

#include <atomic>
#include <future>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

using resolver::pipeline::WorkerPool;

void TestResultsComeBackThroughFutures() {
  WorkerPool pool(4);
  pool.Start();
  assert(pool.Size() == 4);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 64; ++i) {
    futures.push_back(pool.Submit([i] { return i * i; }));
  }
  for (int i = 0; i < 64; ++i) {
    assert(futures[i].get() == i * i);
  }
}

void TestExceptionsPropagateToCaller() {
  WorkerPool pool(2);
  pool.Start();

  auto failing = pool.Submit([]() -> int { throw std::logic_error("boom"); });
  auto fine    = pool.Submit([] { return 7; });

  bool threw = false;
  try {
    (void)failing.get();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(fine.get() == 7);
}

void TestStopDrainsQueuedWork() {
  std::atomic<int> done{0};
  {
    WorkerPool pool(1);
    pool.Start();
    for (int i = 0; i < 32; ++i) {
      (void)pool.Submit([&done] { done.fetch_add(1); });
    }
    pool.Stop();
    assert(done.load() == 32);
  }
  assert(done.load() == 32);
}

void TestSubmitAfterStopThrows() {
  WorkerPool pool(1);
  pool.Start();
  pool.Stop();

  bool threw = false;
  try {
    (void)pool.Submit([] { return 1; });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroThreadsUsesHardware() {
  WorkerPool pool(0);
  assert(pool.Size() >= 1);
  pool.Start();
  assert(pool.Submit([] { return 3; }).get() == 3);
}

} // namespace

int main() {
  TestResultsComeBackThroughFutures();
  TestExceptionsPropagateToCaller();
  TestStopDrainsQueuedWork();
  TestSubmitAfterStopThrows();
  TestZeroThreadsUsesHardware();

  std::cout << "resolver_unit_worker_pool: pass\n";
  return 0;
}

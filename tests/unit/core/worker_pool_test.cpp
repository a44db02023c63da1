#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "rag_core/async/worker_pool.hpp"

namespace rag_tests {

using namespace rag_core::async;

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, StopWithoutJobsIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
    pool.stop();
    // Second stop is harmless; destructor joins nothing
    pool.stop();
  });
}

TEST(WorkerPoolTest, SubmitReturnsResultsThroughFutures) {
  WorkerPool pool(3, "TestPool");

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 10; ++i) {
    futures.push_back(pool.submit([i] { return i * i; }));
  }

  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(WorkerPoolTest, JobExceptionsArriveThroughTheFuture) {
  WorkerPool pool(1);

  auto failing = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
  auto healthy = pool.submit([] { return 7; });

  EXPECT_THROW(failing.get(), std::runtime_error);
  EXPECT_EQ(healthy.get(), 7);
}

TEST(WorkerPoolTest, ConcurrencyNeverExceedsThreadCount) {
  WorkerPool pool(2);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  std::vector<std::future<void>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(pool.submit([&running, &peak] {
      int now = ++running;
      int expected = peak.load();
      while (now > expected && !peak.compare_exchange_weak(expected, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --running;
    }));
  }
  for (auto& future : futures) {
    future.get();
  }

  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, StopDrainsQueueThenRejectsNewJobs) {
  WorkerPool pool(1);
  std::atomic<int> completed{0};
  for (int i = 0; i < 5; ++i) {
    pool.submit([&completed] {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      ++completed;
    });
  }

  pool.stop();

  EXPECT_EQ(completed.load(), 5);
  EXPECT_THROW(pool.submit([] { return 1; }), std::runtime_error);
}

}  // namespace rag_tests

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "rag_core/async/worker_pool.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using rag_core::async::WorkerPool;

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(1);
    pool.stop();
  });
}

TEST(WorkerPoolTest, StartThenStopLifecycle_NoTasks) {
  EXPECT_NO_THROW({
    WorkerPool pool(2);
    pool.start();
    EXPECT_TRUE(pool.is_running());
    // Give the worker threads a brief moment to enter their loops
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
    pool.stop();
    EXPECT_FALSE(pool.is_running());
  });
}

TEST(WorkerPoolTest, StartTwiceShowsWarningAndNoThrow) {
  EXPECT_NO_THROW({
    WorkerPool pool(1);
    pool.start();
    // Second call should be a no-op with a warning, not an exception
    pool.start();
    pool.stop();
  });
}

TEST(WorkerPoolTest, SubmitReturnsResultThroughFuture) {
  WorkerPool pool(2);
  pool.start();
  auto future = pool.submit([] { return 6 * 7; }, "answer");
  EXPECT_EQ(future.get(), 42);
  pool.stop();
}

TEST(WorkerPoolTest, TaskExceptionPropagatesThroughFuture) {
  WorkerPool pool(1);
  pool.start();
  auto future = pool.submit([]() -> int { throw rag_core::VectorIndexError("query", "boom"); });
  EXPECT_THROW(future.get(), rag_core::VectorIndexError);
  pool.stop();
}

TEST(WorkerPoolTest, TasksRunConcurrently) {
  WorkerPool pool(2);
  pool.start();
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  auto task = [&] {
    int now = ++running;
    int expected = peak.load();
    while (now > expected && !peak.compare_exchange_weak(expected, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    --running;
  };
  auto a = pool.submit(task);
  auto b = pool.submit(task);
  a.get();
  b.get();
  EXPECT_EQ(peak.load(), 2);
  pool.stop();
}

TEST(WorkerPoolTest, TasksQueuedBeforeStartRunAfterStart) {
  WorkerPool pool(1);
  auto future = pool.submit([] { return std::string("queued"); });
  EXPECT_EQ(pool.pending(), 1u);
  pool.start();
  EXPECT_EQ(future.get(), "queued");
  pool.stop();
}

TEST(WorkerPoolTest, SubmitAfterStopThrows) {
  WorkerPool pool(1);
  pool.start();
  pool.stop();
  EXPECT_THROW(pool.submit([] { return 1; }), rag_core::RagError);
}

TEST(WorkerPoolTest, CanRestartAfterStop) {
  WorkerPool pool(1);
  pool.start();
  pool.stop();
  pool.start();
  EXPECT_EQ(pool.submit([] { return 3; }).get(), 3);
  pool.stop();
}

}  // namespace rag_tests

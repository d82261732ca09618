#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include "codelens_core/search/signal_worker_pool.hpp"

namespace codelens_core {

TEST(SignalWorkerPoolTest, RejectsZeroThreads) {
  EXPECT_THROW(SignalWorkerPool pool(0), std::invalid_argument);
}

TEST(SignalWorkerPoolTest, RunsTasksAndReportsResults) {
  SignalWorkerPool pool(2);

  auto first = pool.submit<int>([]() { return 21 * 2; });
  auto second = pool.submit<int>([]() -> int { throw std::runtime_error("signal failed"); });

  EXPECT_EQ(first.get(), 42);
  EXPECT_THROW(second.get(), std::runtime_error);
  EXPECT_EQ(pool.size(), 2u);
}

TEST(SignalWorkerPoolTest, DestructorJoinsRunningTaskAndDropsQueuedOnes) {
  // Arrange: one worker, busy with a task that waits for release
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::atomic<bool> running_finished{false};
  std::atomic<bool> queued_ran{false};
  std::promise<void> started;
  std::future<void> started_future = started.get_future();

  std::future<int> queued;
  {
    SignalWorkerPool pool(1);
    auto running = pool.submit<int>([&]() {
      started.set_value();
      released.wait();
      running_finished = true;
      return 1;
    });
    queued = pool.submit<int>([&]() {
      queued_ran = true;
      return 2;
    });
    started_future.wait();
    EXPECT_EQ(pool.pending(), 2u);

    // Act
    release.set_value();
  }

  // Assert
  EXPECT_TRUE(running_finished);
  if (!queued_ran) {
    EXPECT_THROW(queued.get(), std::future_error);
  }
}

}  // namespace codelens_core

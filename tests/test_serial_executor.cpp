// Repository: MediaHub
// Component: SerialExecutor unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mediahub/util/SerialExecutor.hpp"

namespace mediahub::util {
namespace {

TEST(SerialExecutorTest, RunsTasksInSubmissionOrder) {
  SerialExecutor executor("order");
  std::vector<int> seen;
  for (int i = 0; i < 50; ++i) {
    executor.Post([&seen, i] { seen.push_back(i); });
  }
  executor.Submit([] {}).get();
  ASSERT_EQ(seen.size(), 50u);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(seen[static_cast<size_t>(i)], i);
  }
}

TEST(SerialExecutorTest, SubmitReturnsResult) {
  SerialExecutor executor("result");
  EXPECT_EQ(executor.Submit([] { return 42; }).get(), 42);
}

TEST(SerialExecutorTest, TasksNeverOverlap) {
  SerialExecutor executor("overlap");
  std::atomic<int> running{0};
  std::atomic<bool> overlapped{false};
  std::vector<std::thread> submitters;
  for (int t = 0; t < 4; ++t) {
    submitters.emplace_back([&] {
      for (int i = 0; i < 20; ++i) {
        executor.Submit([&] {
          if (running.fetch_add(1) != 0) overlapped = true;
          std::this_thread::sleep_for(std::chrono::microseconds(200));
          running.fetch_sub(1);
        }).get();
      }
    });
  }
  for (auto& t : submitters) t.join();
  EXPECT_FALSE(overlapped.load());
}

TEST(SerialExecutorTest, IsWorkerThreadOnlyInsideTasks) {
  SerialExecutor executor("worker");
  EXPECT_FALSE(executor.IsWorkerThread());
  EXPECT_TRUE(executor.Submit([&executor] { return executor.IsWorkerThread(); }).get());
}

TEST(SerialExecutorTest, ExceptionPropagatesThroughFuture) {
  SerialExecutor executor("throws");
  auto future = executor.Submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(future.get(), std::runtime_error);
  // The worker survives a throwing task.
  EXPECT_EQ(executor.Submit([] { return 7; }).get(), 7);
}

TEST(SerialExecutorTest, ShutdownDrainsQueueAndRejectsNewWork) {
  SerialExecutor executor("shutdown");
  std::atomic<int> ran{0};
  for (int i = 0; i < 10; ++i) {
    executor.Post([&ran] { ran++; });
  }
  executor.Shutdown();
  EXPECT_EQ(ran.load(), 10);
  EXPECT_FALSE(executor.Post([] {}));
  auto rejected = executor.Submit([] { return 1; });
  EXPECT_THROW(rejected.get(), std::runtime_error);
}

}  // namespace
}  // namespace mediahub::util

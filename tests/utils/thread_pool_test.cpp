/**
 * @file thread_pool_test.cpp
 * @brief Unit tests for ThreadPool
 */

#include "utils/thread_pool.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace semcache::utils {

class ThreadPoolTest : public ::testing::Test {};

TEST_F(ThreadPoolTest, Construction) {
  ThreadPool default_pool;
  EXPECT_GT(default_pool.GetThreadCount(), 0U);
  EXPECT_FALSE(default_pool.IsShutdown());

  ThreadPool sized(3, 16, "sized");
  EXPECT_EQ(sized.GetThreadCount(), 3U);
}

TEST_F(ThreadPoolTest, WaitIdleObservesAllTasks) {
  ThreadPool pool(4);
  std::atomic<int> counter{0};
  constexpr int kTasks = 200;

  for (int i = 0; i < kTasks; ++i) {
    ASSERT_TRUE(pool.Submit([&counter]() { counter.fetch_add(1); }));
  }
  pool.WaitIdle();
  EXPECT_EQ(counter.load(), kTasks);
  EXPECT_EQ(pool.GetQueueSize(), 0U);
}

TEST_F(ThreadPoolTest, SingleWorkerPreservesSubmissionOrder) {
  ThreadPool pool(1);
  std::mutex mutex;
  std::vector<int> order;

  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(pool.Submit([&, i]() {
      std::lock_guard<std::mutex> lock(mutex);
      order.push_back(i);
    }));
  }
  pool.WaitIdle();

  ASSERT_EQ(order.size(), 50U);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

TEST_F(ThreadPoolTest, BoundedQueueRejectsWhenFull) {
  ThreadPool pool(1, 2);
  std::atomic<bool> release{false};
  std::atomic<bool> started{false};

  // Occupy the only worker
  ASSERT_TRUE(pool.Submit([&]() {
    started = true;
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }));
  while (!started.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  EXPECT_TRUE(pool.Submit([]() {}));
  EXPECT_TRUE(pool.Submit([]() {}));
  EXPECT_FALSE(pool.Submit([]() {}));

  release = true;
  pool.WaitIdle();
  EXPECT_TRUE(pool.Submit([]() {}));
}

TEST_F(ThreadPoolTest, TaskExceptionDoesNotKillWorker) {
  ThreadPool pool(1);
  std::atomic<int> counter{0};

  ASSERT_TRUE(pool.Submit([]() { throw std::runtime_error("task failure"); }));
  ASSERT_TRUE(pool.Submit([&counter]() { counter++; }));
  pool.WaitIdle();
  EXPECT_EQ(counter.load(), 1);
}

TEST_F(ThreadPoolTest, GracefulShutdownDrainsQueue) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(2);
    for (int i = 0; i < 20; ++i) {
      pool.Submit([&counter]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        counter++;
      });
    }
    pool.Shutdown();
    EXPECT_TRUE(pool.IsShutdown());
  }
  EXPECT_EQ(counter.load(), 20);
}

TEST_F(ThreadPoolTest, WaitIdleTimesOutOnLongTask) {
  ThreadPool pool(1, 0, "slow");
  std::atomic<bool> release{false};
  pool.Submit([&release]() {
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  EXPECT_FALSE(pool.WaitIdle(30));
  release = true;
  EXPECT_TRUE(pool.WaitIdle());
}

TEST_F(ThreadPoolTest, ShutdownDeadlineDropsQueuedTasks) {
  std::atomic<int> ran{0};
  std::atomic<bool> started{false};
  std::atomic<bool> release{false};
  ThreadPool pool(1, 0, "drain");
  pool.Submit([&started, &release, &ran]() {
    started = true;
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ran++;
  });
  for (int i = 0; i < 5; ++i) {
    pool.Submit([&ran]() { ran++; });
  }

  while (!started.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  std::thread releaser([&release]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    release = true;
  });
  pool.Shutdown(true, 20);
  releaser.join();

  // The running task finished; the queued ones were dropped at the deadline
  EXPECT_TRUE(pool.IsShutdown());
  EXPECT_EQ(ran.load(), 1);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownFails) {
  ThreadPool pool(2);
  pool.Shutdown();
  EXPECT_FALSE(pool.Submit([]() {}));
  // Second shutdown is a no-op
  pool.Shutdown();
}

}  // namespace semcache::utils

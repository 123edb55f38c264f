/**
 * @file thread_pool.h
 * @brief Fixed-size worker pool with a bounded task queue
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace semcache::utils {

/**
 * @brief Thread pool for executing tasks off the caller's thread
 *
 * Features:
 * - Fixed number of worker threads
 * - Bounded task queue with backpressure
 * - WaitIdle() to drain queued work
 * - Graceful shutdown with an optional drain deadline
 *
 * With a single worker, tasks run in submission order.
 */
class ThreadPool {
 public:
  using Task = std::function<void()>;

  /**
   * @brief Construct thread pool
   * @param num_threads Number of worker threads (0 = CPU count)
   * @param queue_size Maximum queue size (0 = unbounded)
   * @param name Pool name used in logs
   */
  explicit ThreadPool(size_t num_threads = 0, size_t queue_size = 0, std::string name = "pool");

  /**
   * @brief Destructor - waits for all queued tasks to complete
   */
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * @brief Submit task to pool
   * @param task Task to execute
   * @return true if submitted, false if queue is full or pool is shut down
   */
  bool Submit(Task task);

  /**
   * @brief Block until the queue is empty and no worker is executing a task
   * @param timeout_ms Maximum wait (0 = no limit)
   * @return true if the pool went idle, false on timeout
   */
  bool WaitIdle(uint32_t timeout_ms = 0);

  size_t GetThreadCount() const { return workers_.size(); }

  /**
   * @brief Get number of pending (not yet started) tasks
   */
  size_t GetQueueSize() const;

  bool IsShutdown() const { return shutdown_; }

  /**
   * @brief Shutdown pool and join workers
   * @param graceful If true, run pending tasks first. If false, drop them.
   * @param timeout_ms Graceful drain limit (0 = no limit). Tasks still queued
   *        at the deadline are dropped; a task already running is joined.
   */
  void Shutdown(bool graceful = true, uint32_t timeout_ms = 0);

 private:
  std::string name_;
  std::vector<std::thread> workers_;
  std::queue<Task> tasks_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::condition_variable idle_condition_;
  std::atomic<bool> shutdown_{false};
  size_t active_workers_ = 0;  // Guarded by queue_mutex_

  size_t max_queue_size_;

  void WorkerThread();
};

}  // namespace semcache::utils

/**
 * @file mirror_writer.h
 * @brief Asynchronous write-through of cache entries to a DocumentStore
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "storage/document_store.h"
#include "utils/error.h"
#include "utils/thread_pool.h"

namespace semcache::cache {

/**
 * @brief Mirror tuning
 */
struct MirrorOptions {
  uint32_t timeout_ms = 500;                ///< Store calls slower than this count as failures
  size_t queue_size = 10000;                ///< Pending operations before submissions are rejected
  uint32_t degraded_failure_threshold = 3;  ///< Consecutive failures that mark the instance degraded
  uint32_t drain_timeout_ms = 5000;         ///< Flush()/shutdown wait limit for queued operations
};

/**
 * @brief Mirror accounting snapshot
 */
struct MirrorStats {
  uint64_t successes = 0;
  uint64_t failures = 0;
  uint64_t consecutive_failures = 0;
  bool degraded = false;
};

/**
 * @brief Queues durable store operations on a single worker thread
 *
 * Operations run in submission order, so the last put or delete submitted
 * for a key is the one left in the store. The caller never waits for the
 * store; failures (errors, timeouts, a full queue) are logged and counted.
 *
 * A store call still running past timeout_ms is counted as a timeout as soon
 * as Submit(), Flush() or GetStats() observe it, and its eventual result is
 * ignored. While the worker is stalled that way, new submissions are rejected
 * as timeouts instead of queued.
 *
 * Constructed without a store, every submission is a no-op.
 */
class MirrorWriter {
 public:
  /**
   * @param cache_name Owning cache (used in logs)
   * @param store Durable store, may be nullptr
   * @param options Mirror tuning
   */
  MirrorWriter(std::string cache_name, std::shared_ptr<storage::DocumentStore> store, MirrorOptions options);

  /**
   * @brief Drains pending operations for up to drain_timeout_ms
   */
  ~MirrorWriter();

  MirrorWriter(const MirrorWriter&) = delete;
  MirrorWriter& operator=(const MirrorWriter&) = delete;
  MirrorWriter(MirrorWriter&&) = delete;
  MirrorWriter& operator=(MirrorWriter&&) = delete;

  /**
   * @brief Queue a store Put
   */
  void SubmitPut(const std::string& key, storage::Document document);

  /**
   * @brief Queue a store Delete
   */
  void SubmitDelete(const std::string& key);

  /**
   * @brief Block until every queued operation has run, or drain_timeout_ms passes
   * @return true if the queue drained
   */
  bool Flush();

  [[nodiscard]] MirrorStats GetStats() const;

  [[nodiscard]] bool IsDegraded() const;

  [[nodiscard]] bool HasStore() const { return store_ != nullptr; }

  /**
   * @brief Underlying store (nullptr when mirroring is disabled)
   */
  [[nodiscard]] storage::DocumentStore* Store() const { return store_.get(); }

 private:
  using StoreCall = std::function<utils::Expected<void, utils::Error>()>;

  void Submit(const std::string& operation, const std::string& key, StoreCall call);
  void Execute(const std::string& operation, const std::string& key, const StoreCall& call);
  void RecordSuccess();
  void RecordFailure(const std::string& operation, const std::string& key, const utils::Error& error) const;

  /**
   * @brief Count the in-flight call as a timeout once it passes timeout_ms
   * @return true while the worker is stuck in a call already counted as timed out
   */
  bool CheckStalled() const;

  std::string cache_name_;
  std::shared_ptr<storage::DocumentStore> store_;
  MirrorOptions options_;

  // Stats and in-flight call (protected by stats_mutex_); stall detection
  // runs from const observers
  mutable std::mutex stats_mutex_;
  mutable MirrorStats stats_;
  bool in_flight_ = false;
  mutable bool in_flight_timed_out_ = false;
  std::chrono::steady_clock::time_point in_flight_started_;
  std::string in_flight_operation_;
  std::string in_flight_key_;

  std::unique_ptr<utils::ThreadPool> pool_;  ///< Declared last so workers stop before members above
};

}  // namespace semcache::cache

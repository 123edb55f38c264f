/**
 * @file mirror_writer.cpp
 * @brief Asynchronous durable mirror implementation
 */

#include "cache/mirror_writer.h"

#include <spdlog/spdlog.h>

#include <utility>

#include "utils/structured_log.h"

namespace semcache::cache {

using utils::ErrorCode;
using utils::MakeError;

MirrorWriter::MirrorWriter(std::string cache_name, std::shared_ptr<storage::DocumentStore> store,
                           MirrorOptions options)
    : cache_name_(std::move(cache_name)), store_(std::move(store)), options_(options) {
  if (store_ != nullptr) {
    pool_ = std::make_unique<utils::ThreadPool>(1, options_.queue_size, "mirror-" + cache_name_);
  }
}

MirrorWriter::~MirrorWriter() {
  if (pool_ != nullptr) {
    CheckStalled();
    pool_->Shutdown(true, options_.drain_timeout_ms);
  }
}

void MirrorWriter::SubmitPut(const std::string& key, storage::Document document) {
  if (store_ == nullptr) {
    return;
  }
  auto store = store_;
  Submit("put", key, [store, key, document = std::move(document)]() { return store->Put(key, document); });
}

void MirrorWriter::SubmitDelete(const std::string& key) {
  if (store_ == nullptr) {
    return;
  }
  auto store = store_;
  Submit("delete", key, [store, key]() { return store->Delete(key); });
}

bool MirrorWriter::Flush() {
  if (pool_ == nullptr) {
    return true;
  }
  if (pool_->WaitIdle(options_.drain_timeout_ms)) {
    return true;
  }
  CheckStalled();
  utils::StructuredLog()
      .Event("cache_mirror_flush_timeout")
      .Field("cache", cache_name_)
      .Field("pending", static_cast<uint64_t>(pool_->GetQueueSize()))
      .Field("timeout_ms", static_cast<uint64_t>(options_.drain_timeout_ms))
      .Warn();
  return false;
}

MirrorStats MirrorWriter::GetStats() const {
  CheckStalled();
  std::scoped_lock lock(stats_mutex_);
  return stats_;
}

bool MirrorWriter::IsDegraded() const {
  CheckStalled();
  std::scoped_lock lock(stats_mutex_);
  return stats_.degraded;
}

bool MirrorWriter::CheckStalled() const {
  std::string operation;
  std::string key;
  uint64_t elapsed_ms = 0;
  {
    std::scoped_lock lock(stats_mutex_);
    if (!in_flight_) {
      return false;
    }
    if (in_flight_timed_out_) {
      return true;
    }
    elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - in_flight_started_)
                                           .count());
    if (elapsed_ms <= options_.timeout_ms) {
      return false;
    }
    in_flight_timed_out_ = true;
    operation = in_flight_operation_;
    key = in_flight_key_;
  }

  RecordFailure(operation, key,
                MakeError(ErrorCode::kStorageTimeout, "Mirror " + operation + " still running after " +
                                                          std::to_string(elapsed_ms) + "ms (limit " +
                                                          std::to_string(options_.timeout_ms) + "ms)"));
  return true;
}

void MirrorWriter::Submit(const std::string& operation, const std::string& key, StoreCall call) {
  if (CheckStalled()) {
    RecordFailure(operation, key, MakeError(ErrorCode::kStorageTimeout, "Mirror worker is stalled in a store call"));
    return;
  }
  const bool submitted = pool_->Submit(
      [this, operation, key, call = std::move(call)]() { Execute(operation, key, call); });
  if (!submitted) {
    RecordFailure(operation, key, MakeError(ErrorCode::kStorageQueueFull, "Mirror queue is full"));
  }
}

void MirrorWriter::Execute(const std::string& operation, const std::string& key, const StoreCall& call) {
  const auto start = std::chrono::steady_clock::now();
  {
    std::scoped_lock lock(stats_mutex_);
    in_flight_ = true;
    in_flight_timed_out_ = false;
    in_flight_started_ = start;
    in_flight_operation_ = operation;
    in_flight_key_ = key;
  }

  auto result = call();
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  bool already_counted = false;
  {
    std::scoped_lock lock(stats_mutex_);
    already_counted = in_flight_timed_out_;
    in_flight_ = false;
    in_flight_timed_out_ = false;
  }
  if (already_counted) {
    spdlog::debug("Cache '{}' mirror {} finished after {}ms, already counted as timed out", cache_name_, operation,
                  elapsed_ms);
    return;
  }

  if (!result) {
    RecordFailure(operation, key, result.error());
    return;
  }
  // A write that completes after the deadline is still a failure
  if (elapsed_ms > static_cast<int64_t>(options_.timeout_ms)) {
    RecordFailure(operation, key,
                  MakeError(ErrorCode::kStorageTimeout, "Mirror " + operation + " took " +
                                                            std::to_string(elapsed_ms) + "ms (limit " +
                                                            std::to_string(options_.timeout_ms) + "ms)"));
    return;
  }
  RecordSuccess();
}

void MirrorWriter::RecordSuccess() {
  bool recovered = false;
  {
    std::scoped_lock lock(stats_mutex_);
    ++stats_.successes;
    stats_.consecutive_failures = 0;
    if (stats_.degraded) {
      stats_.degraded = false;
      recovered = true;
    }
  }
  if (recovered) {
    utils::LogCacheHealthTransition(cache_name_, "healthy", "durable mirror write succeeded");
  }
}

void MirrorWriter::RecordFailure(const std::string& operation, const std::string& key,
                                 const utils::Error& error) const {
  uint64_t consecutive = 0;
  bool became_degraded = false;
  {
    std::scoped_lock lock(stats_mutex_);
    ++stats_.failures;
    consecutive = ++stats_.consecutive_failures;
    if (!stats_.degraded && consecutive >= options_.degraded_failure_threshold) {
      stats_.degraded = true;
      became_degraded = true;
    }
  }

  utils::LogMirrorFailure(cache_name_, operation, key, consecutive, error.to_string());
  if (became_degraded) {
    utils::LogCacheHealthTransition(cache_name_, "degraded",
                                    std::to_string(consecutive) + " consecutive durable mirror failures");
  }
}

}  // namespace semcache::cache

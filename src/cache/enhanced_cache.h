/**
 * @file enhanced_cache.h
 * @brief Bounded, popularity-evicted cache with similarity fallback
 */

#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "cache/cache_entry.h"
#include "cache/cache_key.h"
#include "cache/cache_statistics.h"
#include "cache/eviction_policy.h"
#include "cache/mirror_writer.h"
#include "cache/similarity_index.h"
#include "storage/document_store.h"
#include "utils/clock.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/ring_buffer.h"

namespace semcache::cache {

/**
 * @brief Per-instance configuration
 */
struct EnhancedCacheOptions {
  std::string name;                           ///< Domain name ("query", "financial", ...)
  size_t max_size = 1000;                     ///< Maximum number of entries
  double default_similarity_threshold = 0.9;  ///< Used when Get() is given an embedding but no threshold
  PopularityParams popularity;                ///< Eviction scoring
  size_t analytics_top_n = 10;                ///< Entries listed in CacheAnalytics::top_entries
  size_t trend_window = 24;                   ///< Hit rate samples kept
  MirrorOptions mirror;                       ///< Durable mirror tuning
};

/**
 * @brief How a hit was found
 */
enum class MatchKind : std::uint8_t {
  kExact,       ///< Canonical key equality
  kSimilarity,  ///< Cosine similarity fallback
};

const char* MatchKindToString(MatchKind kind);

/**
 * @brief Result of a successful Get()
 */
struct CacheHit {
  nlohmann::json value;     ///< Copy of the cached payload
  MatchKind match = MatchKind::kExact;
  double similarity = 1.0;  ///< Cosine score (1.0 for exact hits)
  std::string matched_key;  ///< Canonical key of the entry served
};

/**
 * @brief Cache engine for one domain
 *
 * Lookup order: canonical key, then (only when an embedding is supplied)
 * the best cosine match at or above the threshold. Every hit bumps the
 * entry's access statistics and popularity score.
 *
 * Capacity: Put() evicts synchronously, lowest popularity first, so the
 * instance never holds more than max_size entries after a put returns.
 *
 * Durability: inserts, updates and removals are queued to a MirrorWriter
 * while the entry lock is held (so per-key order is preserved) and executed
 * on its worker thread. Mirror failures never fail Get/Put.
 *
 * Thread-safety: all public methods are thread-safe. Structural changes and
 * hits take the exclusive lock; inspection methods take the shared lock.
 * Counters live behind a separate mutex.
 */
class EnhancedCache {
 public:
  /**
   * @param options Instance configuration
   * @param store Durable store (nullptr disables mirroring and recovery)
   * @param clock Time source (must outlive this object)
   * @param index Similarity index (nullptr selects LinearScanIndex)
   */
  EnhancedCache(EnhancedCacheOptions options, std::shared_ptr<storage::DocumentStore> store,
                const utils::Clock& clock, std::unique_ptr<SimilarityIndex> index = nullptr);

  ~EnhancedCache() = default;

  EnhancedCache(const EnhancedCache&) = delete;
  EnhancedCache& operator=(const EnhancedCache&) = delete;
  EnhancedCache(EnhancedCache&&) = delete;
  EnhancedCache& operator=(EnhancedCache&&) = delete;

  /**
   * @brief Look up a value
   *
   * @param fields Structured lookup
   * @param embedding Query embedding enabling the similarity fallback
   * @param threshold Similarity threshold in (0, 1] (default from options)
   * @return Hit, std::nullopt on miss, or a caller error
   *         (kCacheInvalidLookup, kCacheInvalidThreshold, kCacheInvalidEmbedding)
   *         raised before any counter moves
   */
  utils::Expected<std::optional<CacheHit>, utils::Error> Get(
      const LookupFields& fields, const std::optional<std::vector<float>>& embedding = std::nullopt,
      std::optional<double> threshold = std::nullopt);

  /**
   * @brief Insert or replace a value
   *
   * An existing entry keeps created_at; its value and embedding are replaced
   * and the put counts as an access.
   *
   * @return kCacheCapacityViolation once the instance is failed
   */
  utils::Expected<void, utils::Error> Put(const LookupFields& fields, nlohmann::json value,
                                          std::optional<std::vector<float>> embedding = std::nullopt);

  /**
   * @brief Remove an entry and its durable copy
   * @return true if the entry existed
   */
  utils::Expected<bool, utils::Error> Remove(const LookupFields& fields);

  /**
   * @brief Check presence without touching statistics
   */
  utils::Expected<bool, utils::Error> Contains(const LookupFields& fields) const;

  /**
   * @brief Copy of an entry without touching statistics
   */
  utils::Expected<std::optional<CacheEntry>, utils::Error> Peek(const LookupFields& fields) const;

  /**
   * @brief Evict lowest-popularity entries until size <= target_size
   * @return Number of entries evicted
   */
  size_t Evict(size_t target_size);

  /**
   * @brief Remove entries not accessed within max_age, regardless of popularity
   * @return Number of entries removed
   */
  size_t ClearExpired(std::chrono::milliseconds max_age);

  /**
   * @brief Load the durable collection into memory
   *
   * Malformed documents are logged, skipped and deleted from the store. If
   * more than max_size documents load, the surplus is evicted without
   * counting as request evictions.
   *
   * @return Number of entries loaded
   */
  utils::Expected<size_t, utils::Error> Recover();

  /**
   * @brief Health probe: write, read back, compare, delete
   *
   * Does not move request counters, never evicts and is not mirrored. The
   * probe entry is removed on every path.
   *
   * @return kCacheProbeMismatch if the value read back differs, kTimeout if the
   *         round trip exceeded timeout, or the error of the failing step
   */
  utils::Expected<void, utils::Error> RunProbe(const LookupFields& fields, const nlohmann::json& value,
                                               std::chrono::milliseconds timeout);

  [[nodiscard]] CacheMetrics GetMetrics() const;

  [[nodiscard]] CacheAnalytics GetAnalytics() const;

  /**
   * @brief Append the current hit rate to the trend window
   */
  void RecordTrendSample();

  /**
   * @brief Wait for queued durable writes (bounded by the mirror drain timeout)
   * @return true if the mirror queue drained
   */
  bool FlushMirror() { return mirror_.Flush(); }

  /**
   * @brief Fence the instance after an invariant violation
   *
   * A failed instance keeps serving reads, refuses writes and reports unhealthy.
   */
  void MarkFailed(const std::string& reason);

  [[nodiscard]] bool IsFailed() const { return failed_.load(); }
  [[nodiscard]] bool IsDegraded() const { return mirror_.IsDegraded(); }

  [[nodiscard]] size_t Size() const { return size_.load(); }
  [[nodiscard]] size_t MaxSize() const { return options_.max_size; }
  [[nodiscard]] const std::string& Name() const { return options_.name; }
  [[nodiscard]] const EnhancedCacheOptions& Options() const { return options_; }

 private:
  /// Similarity matches within this distance of the best score are tied
  static constexpr double kSimilarityTieEpsilon = 1e-6;

  std::optional<CacheHit> LookupLocked(const std::string& key, const std::optional<std::vector<float>>& embedding,
                                       double threshold, utils::TimePoint now);
  void TouchLocked(CacheEntry& entry, utils::TimePoint now);
  void InsertLocked(CacheEntry entry);
  bool EraseLocked(const std::string& key);
  void RescoreLocked(utils::TimePoint now);
  size_t EvictLocked(size_t target_size, utils::TimePoint now, bool count_as_eviction);
  bool VerifyCapacityLocked();
  void RecordRequest(const std::optional<CacheHit>& hit, double elapsed_ms);

  EnhancedCacheOptions options_;
  const utils::Clock& clock_;
  PopularityPolicy policy_;

  // Entries (protected by mutex_)
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, CacheEntry> entries_;
  std::unique_ptr<SimilarityIndex> index_;
  uint64_t access_seq_ = 0;
  std::atomic<size_t> size_{0};  ///< Tracked size used for capacity checks
  std::atomic<bool> failed_{false};

  // Counters and trend (protected by metrics_mutex_)
  mutable std::mutex metrics_mutex_;
  CacheCounters counters_;
  utils::RingBuffer<TrendSample> trend_;

  MirrorWriter mirror_;
};

}  // namespace semcache::cache

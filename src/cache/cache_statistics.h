/**
 * @file cache_statistics.h
 * @brief Metrics and analytics snapshots of an EnhancedCache
 */

#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/clock.h"

namespace semcache::cache {

/**
 * @brief Request counters of one cache instance
 *
 * Guarded by a single mutex in EnhancedCache, so every snapshot satisfies
 * hits + misses == total_requests.
 */
struct CacheCounters {
  uint64_t hits = 0;
  uint64_t exact_hits = 0;
  uint64_t similarity_hits = 0;
  uint64_t misses = 0;
  uint64_t total_requests = 0;
  uint64_t puts = 0;
  uint64_t evictions = 0;
  uint64_t expirations = 0;
  double total_hit_time_ms = 0.0;
  double total_miss_time_ms = 0.0;
};

/**
 * @brief Point-in-time metrics of one cache instance
 */
struct CacheMetrics {
  // Request statistics
  uint64_t hits = 0;
  uint64_t exact_hits = 0;
  uint64_t similarity_hits = 0;
  uint64_t misses = 0;
  uint64_t total_requests = 0;
  uint64_t puts = 0;

  // Capacity statistics
  uint64_t evictions = 0;
  uint64_t expirations = 0;
  uint64_t cache_size = 0;
  uint64_t max_size = 0;

  // Durable mirror
  uint64_t mirror_successes = 0;
  uint64_t mirror_failures = 0;
  uint64_t consecutive_mirror_failures = 0;
  bool degraded = false;
  bool failed = false;

  // Timing statistics
  double total_hit_time_ms = 0.0;
  double total_miss_time_ms = 0.0;

  /**
   * @brief hits / max(1, total_requests)
   */
  [[nodiscard]] double HitRate() const {
    return static_cast<double>(hits) / static_cast<double>(std::max<uint64_t>(1, total_requests));
  }

  /**
   * @brief evictions / max(1, total_requests)
   */
  [[nodiscard]] double EvictionRate() const {
    return static_cast<double>(evictions) / static_cast<double>(std::max<uint64_t>(1, total_requests));
  }

  [[nodiscard]] double AverageHitLatencyMs() const {
    return hits > 0 ? total_hit_time_ms / static_cast<double>(hits) : 0.0;
  }

  [[nodiscard]] double AverageMissLatencyMs() const {
    return misses > 0 ? total_miss_time_ms / static_cast<double>(misses) : 0.0;
  }

  [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Entry summary used in analytics rankings
 */
struct EntrySummary {
  std::string key;
  uint64_t access_count = 0;
  double popularity_score = 0.0;
};

/**
 * @brief Hit rate sample recorded on each optimize run
 */
struct TrendSample {
  utils::TimePoint timestamp;
  double hit_rate = 0.0;
  uint64_t total_requests = 0;
  uint64_t cache_size = 0;
};

/**
 * @brief Efficiency summary of one cache instance
 */
struct CacheAnalytics {
  std::string name;
  uint64_t cache_size = 0;
  uint64_t max_size = 0;
  double fill_ratio = 0.0;
  double hit_rate = 0.0;
  double eviction_rate = 0.0;
  double average_popularity = 0.0;
  uint64_t entries_with_embedding = 0;
  double average_hit_latency_ms = 0.0;
  double average_miss_latency_ms = 0.0;
  std::vector<EntrySummary> top_entries;  ///< Highest access_count first
  std::vector<TrendSample> hit_rate_trend;  ///< Oldest first

  [[nodiscard]] nlohmann::json ToJson() const;
};

}  // namespace semcache::cache

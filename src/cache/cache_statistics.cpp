/**
 * @file cache_statistics.cpp
 * @brief JSON rendering of cache metrics and analytics
 */

#include "cache/cache_statistics.h"

namespace semcache::cache {

nlohmann::json CacheMetrics::ToJson() const {
  nlohmann::json json;
  json["hits"] = hits;
  json["exact_hits"] = exact_hits;
  json["similarity_hits"] = similarity_hits;
  json["misses"] = misses;
  json["total_requests"] = total_requests;
  json["puts"] = puts;
  json["evictions"] = evictions;
  json["expirations"] = expirations;
  json["cache_size"] = cache_size;
  json["max_size"] = max_size;
  json["hit_rate"] = HitRate();
  json["eviction_rate"] = EvictionRate();
  json["avg_hit_latency_ms"] = AverageHitLatencyMs();
  json["avg_miss_latency_ms"] = AverageMissLatencyMs();
  json["mirror"] = {{"successes", mirror_successes},
                    {"failures", mirror_failures},
                    {"consecutive_failures", consecutive_mirror_failures},
                    {"degraded", degraded}};
  json["failed"] = failed;
  return json;
}

nlohmann::json CacheAnalytics::ToJson() const {
  nlohmann::json top = nlohmann::json::array();
  for (const auto& entry : top_entries) {
    top.push_back(
        {{"key", entry.key}, {"access_count", entry.access_count}, {"popularity_score", entry.popularity_score}});
  }

  nlohmann::json trend = nlohmann::json::array();
  for (const auto& sample : hit_rate_trend) {
    trend.push_back({{"timestamp", utils::FormatIso8601(sample.timestamp)},
                     {"hit_rate", sample.hit_rate},
                     {"total_requests", sample.total_requests},
                     {"cache_size", sample.cache_size}});
  }

  nlohmann::json json;
  json["name"] = name;
  json["cache_size"] = cache_size;
  json["max_size"] = max_size;
  json["fill_ratio"] = fill_ratio;
  json["hit_rate"] = hit_rate;
  json["eviction_rate"] = eviction_rate;
  json["average_popularity"] = average_popularity;
  json["entries_with_embedding"] = entries_with_embedding;
  json["avg_hit_latency_ms"] = average_hit_latency_ms;
  json["avg_miss_latency_ms"] = average_miss_latency_ms;
  json["top_entries"] = std::move(top);
  json["hit_rate_trend"] = std::move(trend);
  return json;
}

}  // namespace semcache::cache

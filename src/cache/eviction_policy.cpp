/**
 * @file eviction_policy.cpp
 * @brief Popularity scoring implementation
 */

#include "cache/eviction_policy.h"

#include <algorithm>
#include <cmath>

namespace semcache::cache {

namespace {

// Scores closer than this are treated as tied
constexpr double kScoreEpsilon = 1e-12;

}  // namespace

double PopularityPolicy::Score(uint64_t access_count, utils::TimePoint last_accessed_at, utils::TimePoint now) const {
  double frequency = 0.0;
  if (params_.frequency_saturation > 0.0) {
    frequency = std::min(1.0, std::log1p(static_cast<double>(access_count)) / std::log1p(params_.frequency_saturation));
  }

  const double age_hours =
      std::max(0.0, std::chrono::duration<double, std::ratio<3600>>(now - last_accessed_at).count());
  double recency = 1.0;
  if (params_.half_life_hours > 0.0) {
    recency = std::pow(0.5, age_hours / params_.half_life_hours);
  }

  return params_.frequency_weight * frequency + params_.recency_weight * recency;
}

bool PopularityPolicy::IsBetterVictim(const CacheEntry& a, const CacheEntry& b) {
  if (std::abs(a.popularity_score - b.popularity_score) > kScoreEpsilon) {
    return a.popularity_score < b.popularity_score;
  }
  if (a.last_accessed_at != b.last_accessed_at) {
    return a.last_accessed_at < b.last_accessed_at;
  }
  return a.last_access_seq < b.last_access_seq;
}

}  // namespace semcache::cache

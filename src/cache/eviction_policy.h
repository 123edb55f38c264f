/**
 * @file eviction_policy.h
 * @brief Popularity scoring used to rank eviction victims
 *
 * popularity = w_freq * normalize(access_count) + w_recency * recency_decay(age)
 *
 *   normalize(n)       = min(1, log1p(n) / log1p(frequency_saturation))
 *   recency_decay(age) = 0.5 ^ (age / half_life)
 *
 * Both terms lie in [0, 1] and the weights sum to 1, so scores lie in [0, 1].
 */

#pragma once

#include <chrono>
#include <cstdint>

#include "cache/cache_entry.h"
#include "utils/clock.h"

namespace semcache::cache {

/**
 * @brief Tunable popularity parameters
 */
struct PopularityParams {
  double frequency_weight = 0.6;       ///< w_freq
  double recency_weight = 0.4;         ///< w_recency
  double half_life_hours = 72.0;       ///< Age at which the recency term halves
  double frequency_saturation = 100.0;  ///< Access count at which the frequency term reaches 1
};

/**
 * @brief Pure popularity scoring function
 */
class PopularityPolicy {
 public:
  explicit PopularityPolicy(PopularityParams params = {}) : params_(params) {}

  /**
   * @brief Score from raw statistics
   * @param access_count Accesses so far
   * @param last_accessed_at Time of the most recent access
   * @param now Scoring time; a last_accessed_at in the future counts as age 0
   */
  [[nodiscard]] double Score(uint64_t access_count, utils::TimePoint last_accessed_at, utils::TimePoint now) const;

  /**
   * @brief Score an entry
   */
  [[nodiscard]] double Score(const CacheEntry& entry, utils::TimePoint now) const {
    return Score(entry.access_count, entry.last_accessed_at, now);
  }

  /**
   * @brief Strict ordering of eviction victims
   *
   * @return true if a should be evicted before b: lower popularity_score
   *         first, then older last_accessed_at, then older access sequence
   */
  [[nodiscard]] static bool IsBetterVictim(const CacheEntry& a, const CacheEntry& b);

  [[nodiscard]] const PopularityParams& Params() const { return params_; }

 private:
  PopularityParams params_;
};

}  // namespace semcache::cache

/**
 * @file eviction_policy_test.cpp
 * @brief Unit tests for PopularityPolicy
 */

#include "cache/eviction_policy.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>

namespace semcache::cache {

class PopularityPolicyTest : public ::testing::Test {
 protected:
  utils::TimePoint now_ = utils::FromUnixMillis(1700000000000);
  PopularityPolicy policy_;
};

TEST_F(PopularityPolicyTest, FreshSingleAccess) {
  // frequency log1p(1)/log1p(100), recency 1
  const double expected = 0.6 * (std::log1p(1.0) / std::log1p(100.0)) + 0.4;
  EXPECT_NEAR(policy_.Score(1, now_, now_), expected, 1e-12);
}

TEST_F(PopularityPolicyTest, FrequencySaturates) {
  EXPECT_NEAR(policy_.Score(100, now_, now_), 1.0, 1e-12);
  EXPECT_NEAR(policy_.Score(10000, now_, now_), 1.0, 1e-12);
}

TEST_F(PopularityPolicyTest, RecencyHalvesEveryHalfLife) {
  const double fresh = policy_.Score(100, now_, now_);
  const double one_half_life = policy_.Score(100, now_ - std::chrono::hours(72), now_);
  const double two_half_lives = policy_.Score(100, now_ - std::chrono::hours(144), now_);

  EXPECT_NEAR(fresh, 0.6 + 0.4, 1e-12);
  EXPECT_NEAR(one_half_life, 0.6 + 0.2, 1e-12);
  EXPECT_NEAR(two_half_lives, 0.6 + 0.1, 1e-12);
}

TEST_F(PopularityPolicyTest, FutureAccessCountsAsAgeZero) {
  EXPECT_DOUBLE_EQ(policy_.Score(3, now_ + std::chrono::hours(5), now_), policy_.Score(3, now_, now_));
}

TEST_F(PopularityPolicyTest, MonotoneInCountAndRecency) {
  EXPECT_LT(policy_.Score(1, now_, now_), policy_.Score(2, now_, now_));
  EXPECT_LT(policy_.Score(5, now_ - std::chrono::hours(1), now_), policy_.Score(5, now_, now_));
}

TEST_F(PopularityPolicyTest, CustomWeights) {
  PopularityParams params;
  params.frequency_weight = 1.0;
  params.recency_weight = 0.0;
  params.frequency_saturation = 9.0;
  PopularityPolicy frequency_only(params);

  EXPECT_NEAR(frequency_only.Score(9, now_ - std::chrono::hours(1000), now_), 1.0, 1e-12);
  EXPECT_NEAR(frequency_only.Score(0, now_, now_), 0.0, 1e-12);
}

TEST_F(PopularityPolicyTest, VictimOrdering) {
  CacheEntry a;
  a.popularity_score = 0.3;
  a.last_accessed_at = now_;
  a.last_access_seq = 10;

  CacheEntry b = a;
  b.popularity_score = 0.5;
  EXPECT_TRUE(PopularityPolicy::IsBetterVictim(a, b));
  EXPECT_FALSE(PopularityPolicy::IsBetterVictim(b, a));

  // Equal scores: older access first
  b.popularity_score = a.popularity_score;
  b.last_accessed_at = now_ - std::chrono::seconds(1);
  EXPECT_TRUE(PopularityPolicy::IsBetterVictim(b, a));

  // Equal scores and times: lower sequence first
  b.last_accessed_at = now_;
  b.last_access_seq = 4;
  EXPECT_TRUE(PopularityPolicy::IsBetterVictim(b, a));
  EXPECT_FALSE(PopularityPolicy::IsBetterVictim(a, b));
  EXPECT_FALSE(PopularityPolicy::IsBetterVictim(a, a));
}

}  // namespace semcache::cache

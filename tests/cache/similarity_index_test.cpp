/**
 * @file similarity_index_test.cpp
 * @brief Unit tests for LinearScanIndex
 */

#include "cache/similarity_index.h"

#include <gtest/gtest.h>

#include <vector>

namespace semcache::cache {

class LinearScanIndexTest : public ::testing::Test {
 protected:
  LinearScanIndex index_;
};

TEST_F(LinearScanIndexTest, ReturnsMatchesAboveThresholdSortedDescending) {
  index_.Upsert("exact", {1.0F, 0.0F});
  index_.Upsert("close", {0.99F, 0.14F});
  index_.Upsert("far", {0.0F, 1.0F});
  EXPECT_EQ(index_.Size(), 3U);

  auto matches = index_.Search({1.0F, 0.0F}, 0.9);
  ASSERT_EQ(matches.size(), 2U);
  EXPECT_EQ(matches[0].key, "exact");
  EXPECT_NEAR(matches[0].score, 1.0, 1e-9);
  EXPECT_EQ(matches[1].key, "close");
  EXPECT_GT(matches[0].score, matches[1].score);
}

TEST_F(LinearScanIndexTest, ThresholdIsInclusive) {
  index_.Upsert("same", {0.6F, 0.8F});
  auto matches = index_.Search({0.6F, 0.8F}, 1.0 - 1e-9);
  ASSERT_EQ(matches.size(), 1U);
}

TEST_F(LinearScanIndexTest, IdenticalVectorsMatchAtThresholdOne) {
  // Norm products round differently per vector; none of these may miss
  for (int i = 1; i <= 500; ++i) {
    const std::vector<float> embedding{0.001F * static_cast<float>(i), 0.3F, 0.7F / static_cast<float>(i), 1e-3F};
    index_.Clear();
    index_.Upsert("self", embedding);

    auto matches = index_.Search(embedding, 1.0);
    ASSERT_EQ(matches.size(), 1U) << "i=" << i;
    EXPECT_LE(matches[0].score, 1.0);
    EXPECT_GE(matches[0].score, 1.0 - 1e-9);
  }
}

TEST_F(LinearScanIndexTest, DimensionMismatchNeverMatches) {
  index_.Upsert("three_d", {1.0F, 0.0F, 0.0F});
  EXPECT_TRUE(index_.Search({1.0F, 0.0F}, 0.1).empty());
}

TEST_F(LinearScanIndexTest, ZeroQueryMatchesNothing) {
  index_.Upsert("a", {1.0F, 0.0F});
  EXPECT_TRUE(index_.Search({0.0F, 0.0F}, 0.1).empty());
  EXPECT_TRUE(index_.Search({}, 0.1).empty());
}

TEST_F(LinearScanIndexTest, UpsertReplacesAndRemoveDeletes) {
  index_.Upsert("a", {1.0F, 0.0F});
  index_.Upsert("a", {0.0F, 1.0F});
  EXPECT_EQ(index_.Size(), 1U);
  EXPECT_TRUE(index_.Search({1.0F, 0.0F}, 0.9).empty());
  EXPECT_EQ(index_.Search({0.0F, 1.0F}, 0.9).size(), 1U);

  index_.Remove("a");
  index_.Remove("missing");
  EXPECT_EQ(index_.Size(), 0U);

  index_.Upsert("b", {1.0F});
  index_.Clear();
  EXPECT_EQ(index_.Size(), 0U);
}

}  // namespace semcache::cache

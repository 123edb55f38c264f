/**
 * @file cache_entry_test.cpp
 * @brief Unit tests for the cache entry document codec
 */

#include "cache/cache_entry.h"

#include <gtest/gtest.h>

namespace semcache::cache {

using utils::ErrorCode;

class CacheEntryDocumentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    entry_.canonical_key = "query/v1|query=5:hello|is_first_message=5:false";
    entry_.value = {{"answer", "world"}, {"sources", {1, 2}}};
    entry_.embedding = std::vector<float>{0.25F, -0.5F, 1.0F};
    entry_.created_at = utils::FromUnixMillis(1700000000000);
    entry_.last_accessed_at = utils::FromUnixMillis(1700000360000);
    entry_.access_count = 7;
    entry_.popularity_score = 0.42;
  }

  CacheEntry entry_;
};

TEST_F(CacheEntryDocumentTest, DocumentCarriesAllPersistentFields) {
  auto document = EntryToDocument(entry_);
  EXPECT_EQ(document["doc_version"], kEntryDocumentVersion);
  EXPECT_EQ(document["key"], entry_.canonical_key);
  EXPECT_EQ(document["created_at"], 1700000000000);
  EXPECT_EQ(document["last_accessed_at"], 1700000360000);
  EXPECT_EQ(document["access_count"], 7);
  EXPECT_EQ(document["embedding"].size(), 3U);
}

TEST_F(CacheEntryDocumentTest, DecodeRestoresEntry) {
  // Through text, as the journal stores it
  auto text = EntryToDocument(entry_).dump();
  auto decoded = EntryFromDocument(storage::Document::parse(text));
  ASSERT_TRUE(decoded) << decoded.error().to_string();

  EXPECT_EQ(decoded->canonical_key, entry_.canonical_key);
  EXPECT_EQ(decoded->value, entry_.value);
  ASSERT_TRUE(decoded->embedding.has_value());
  EXPECT_EQ(*decoded->embedding, *entry_.embedding);
  EXPECT_EQ(decoded->created_at, entry_.created_at);
  EXPECT_EQ(decoded->last_accessed_at, entry_.last_accessed_at);
  EXPECT_EQ(decoded->access_count, 7U);
  EXPECT_DOUBLE_EQ(decoded->popularity_score, 0.42);
}

TEST_F(CacheEntryDocumentTest, NullEmbeddingDecodesAsAbsent) {
  entry_.embedding.reset();
  auto document = EntryToDocument(entry_);
  EXPECT_TRUE(document["embedding"].is_null());

  auto decoded = EntryFromDocument(document);
  ASSERT_TRUE(decoded);
  EXPECT_FALSE(decoded->embedding.has_value());
}

TEST_F(CacheEntryDocumentTest, RejectsMalformedDocuments) {
  auto expect_corrupted = [](const storage::Document& document) {
    auto decoded = EntryFromDocument(document);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code(), ErrorCode::kStorageCorrupted);
  };

  expect_corrupted(storage::Document::array());

  auto wrong_version = EntryToDocument(entry_);
  wrong_version["doc_version"] = 99;
  expect_corrupted(wrong_version);

  auto no_key = EntryToDocument(entry_);
  no_key.erase("key");
  expect_corrupted(no_key);

  auto no_value = EntryToDocument(entry_);
  no_value.erase("value");
  expect_corrupted(no_value);

  auto bad_embedding = EntryToDocument(entry_);
  bad_embedding["embedding"] = {1.0, "x"};
  expect_corrupted(bad_embedding);

  auto time_travel = EntryToDocument(entry_);
  time_travel["last_accessed_at"] = 1600000000000;
  expect_corrupted(time_travel);

  auto zero_count = EntryToDocument(entry_);
  zero_count["access_count"] = 0;
  expect_corrupted(zero_count);
}

}  // namespace semcache::cache

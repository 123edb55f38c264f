/**
 * @file memory_document_store_test.cpp
 * @brief Unit tests for MemoryDocumentStore
 */

#include "storage/memory_document_store.h"

#include <gtest/gtest.h>

namespace semcache::storage {

class MemoryDocumentStoreTest : public ::testing::Test {
 protected:
  MemoryDocumentStore store_;
};

TEST_F(MemoryDocumentStoreTest, PutGetDelete) {
  ASSERT_TRUE(store_.Put("k1", Document{{"value", 1}}));
  EXPECT_EQ(store_.Count(), 1U);

  auto doc = store_.Get("k1");
  ASSERT_TRUE(doc);
  ASSERT_TRUE(doc->has_value());
  EXPECT_EQ((**doc)["value"], 1);

  ASSERT_TRUE(store_.Delete("k1"));
  auto gone = store_.Get("k1");
  ASSERT_TRUE(gone);
  EXPECT_FALSE(gone->has_value());
  EXPECT_EQ(store_.Count(), 0U);
}

TEST_F(MemoryDocumentStoreTest, DeleteMissingKeyIsNotAnError) {
  EXPECT_TRUE(store_.Delete("absent"));
}

TEST_F(MemoryDocumentStoreTest, PutReplacesAndCopies) {
  Document original{{"answer", "first"}};
  ASSERT_TRUE(store_.Put("k", original));
  original["answer"] = "mutated after put";

  auto stored = store_.Get("k");
  ASSERT_TRUE(stored && stored->has_value());
  EXPECT_EQ((**stored)["answer"], "first");

  ASSERT_TRUE(store_.Put("k", Document{{"answer", "second"}}));
  EXPECT_EQ(store_.Count(), 1U);
  auto replaced = store_.Get("k");
  EXPECT_EQ((**replaced)["answer"], "second");
}

TEST_F(MemoryDocumentStoreTest, LoadAllReturnsEveryDocument) {
  ASSERT_TRUE(store_.Put("a", Document{{"n", 1}}));
  ASSERT_TRUE(store_.Put("b", Document{{"n", 2}}));

  auto all = store_.LoadAll();
  ASSERT_TRUE(all);
  ASSERT_EQ(all->size(), 2U);
  EXPECT_EQ((*all)[0].first, "a");
  EXPECT_EQ((*all)[1].second["n"], 2);
}

}  // namespace semcache::storage

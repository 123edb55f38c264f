/**
 * @file file_document_store_test.cpp
 * @brief Unit tests for the journal-backed FileDocumentStore
 */

#include "storage/file_document_store.h"

#include <gtest/gtest.h>
#include <sys/resource.h>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace semcache::storage {

class FileDocumentStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir_ = fs::temp_directory_path() / (std::string("semcache_journal_") + info->name());
    fs::remove_all(test_dir_);
  }

  void TearDown() override { fs::remove_all(test_dir_); }

  std::unique_ptr<FileDocumentStore> OpenStore(size_t compact_min_records = 1024) {
    auto store = FileDocumentStore::Open(test_dir_.string(), "query", compact_min_records);
    EXPECT_TRUE(store) << store.error().to_string();
    return store ? std::move(*store) : nullptr;
  }

  std::string JournalPath() const { return (test_dir_ / "query.journal").string(); }

  fs::path test_dir_;
};

TEST_F(FileDocumentStoreTest, CreatesJournalWithHeader) {
  auto store = OpenStore();
  ASSERT_NE(store, nullptr);
  EXPECT_EQ(store->Path(), JournalPath());
  EXPECT_TRUE(fs::exists(JournalPath()));
  EXPECT_EQ(fs::file_size(JournalPath()), journal_format::kFixedHeaderSize);
  EXPECT_EQ(store->Count(), 0U);
}

TEST_F(FileDocumentStoreTest, RejectsInvalidCollectionName) {
  auto empty = FileDocumentStore::Open(test_dir_.string(), "");
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code(), utils::ErrorCode::kInvalidArgument);

  auto nested = FileDocumentStore::Open(test_dir_.string(), "a/b");
  ASSERT_FALSE(nested);
  EXPECT_EQ(nested.error().code(), utils::ErrorCode::kInvalidArgument);
}

TEST_F(FileDocumentStoreTest, ReplayRestoresLatestState) {
  {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);
    ASSERT_TRUE(store->Put("query/v1|query=5:hello", Document{{"answer", "v1"}}));
    ASSERT_TRUE(store->Put("query/v1|query=5:hello", Document{{"answer", "v2"}}));
    ASSERT_TRUE(store->Put("query/v1|query=3:bye", Document{{"answer", "gone"}}));
    ASSERT_TRUE(store->Delete("query/v1|query=3:bye"));
  }

  auto reopened = OpenStore();
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->Count(), 1U);
  // One overwrite (1) plus a delete of a live key (2)
  EXPECT_EQ(reopened->DeadRecords(), 3U);

  auto doc = reopened->Get("query/v1|query=5:hello");
  ASSERT_TRUE(doc);
  ASSERT_TRUE(doc->has_value());
  EXPECT_EQ((**doc)["answer"], "v2");

  auto deleted = reopened->Get("query/v1|query=3:bye");
  ASSERT_TRUE(deleted);
  EXPECT_FALSE(deleted->has_value());
}

TEST_F(FileDocumentStoreTest, TornTailIsTruncated) {
  uintmax_t good_size = 0;
  {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);
    ASSERT_TRUE(store->Put("a", Document{{"n", 1}}));
    good_size = fs::file_size(JournalPath());
    ASSERT_TRUE(store->Put("b", Document{{"n", 2}}));
  }

  // Simulate a crash in the middle of the second record
  fs::resize_file(JournalPath(), good_size + 5);

  auto reopened = OpenStore();
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->Count(), 1U);
  EXPECT_EQ(fs::file_size(JournalPath()), good_size);

  // Appends continue cleanly after truncation
  ASSERT_TRUE(reopened->Put("c", Document{{"n", 3}}));
  reopened.reset();
  auto again = OpenStore();
  ASSERT_NE(again, nullptr);
  EXPECT_EQ(again->Count(), 2U);
}

TEST_F(FileDocumentStoreTest, CrcMismatchStopsReplay) {
  uintmax_t first_record_end = 0;
  {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);
    ASSERT_TRUE(store->Put("a", Document{{"n", 1}}));
    first_record_end = fs::file_size(JournalPath());
    ASSERT_TRUE(store->Put("b", Document{{"payload", "xxxxxxxx"}}));
  }

  // Flip a byte inside the second record's document
  {
    std::fstream file(JournalPath(), std::ios::in | std::ios::out | std::ios::binary);
    ASSERT_TRUE(file);
    file.seekp(static_cast<std::streamoff>(first_record_end + 12));
    file.put('#');
  }

  auto reopened = OpenStore();
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->Count(), 1U);
  EXPECT_EQ(fs::file_size(JournalPath()), first_record_end);
  auto doc = reopened->Get("a");
  ASSERT_TRUE(doc && doc->has_value());
}

TEST_F(FileDocumentStoreTest, FailedAppendIsRolledBackBeforeLaterRecords) {
  auto store = OpenStore();
  ASSERT_NE(store, nullptr);
  ASSERT_TRUE(store->Put("k1", Document{{"v", 1}}));
  const auto good_size = fs::file_size(JournalPath());

  // Cap file growth so the next append is cut short mid-record
  struct rlimit original {};
  ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &original), 0);
  struct rlimit capped = original;
  capped.rlim_cur = static_cast<rlim_t>(good_size + 16);
  auto previous_handler = std::signal(SIGXFSZ, SIG_IGN);
  const bool capped_ok = setrlimit(RLIMIT_FSIZE, &capped) == 0;
  auto failed = store->Put("k2", Document{{"blob", std::string(4096, 'x')}});
  setrlimit(RLIMIT_FSIZE, &original);
  std::signal(SIGXFSZ, previous_handler);

  ASSERT_TRUE(capped_ok);
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().code(), utils::ErrorCode::kStorageWriteError);
  EXPECT_EQ(fs::file_size(JournalPath()), good_size);
  EXPECT_EQ(store->Count(), 1U);

  // Later writes land on a clean record boundary and survive replay
  ASSERT_TRUE(store->Put("k3", Document{{"v", 3}}));
  ASSERT_TRUE(store->Delete("k1"));
  ASSERT_TRUE(store->Put("k4", Document{{"v", 4}}));
  store.reset();

  auto reopened = OpenStore();
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->Count(), 2U);
  auto k3 = reopened->Get("k3");
  ASSERT_TRUE(k3 && k3->has_value());
  EXPECT_EQ((**k3)["v"], 3);
  auto k4 = reopened->Get("k4");
  ASSERT_TRUE(k4 && k4->has_value());
  auto k2 = reopened->Get("k2");
  ASSERT_TRUE(k2);
  EXPECT_FALSE(k2->has_value());
  auto k1 = reopened->Get("k1");
  ASSERT_TRUE(k1);
  EXPECT_FALSE(k1->has_value());
}

TEST_F(FileDocumentStoreTest, BadMagicIsCorruption) {
  fs::create_directories(test_dir_);
  {
    std::ofstream file(JournalPath(), std::ios::binary);
    file << "NOPE0000";
  }
  auto store = FileDocumentStore::Open(test_dir_.string(), "query");
  ASSERT_FALSE(store);
  EXPECT_EQ(store.error().code(), utils::ErrorCode::kStorageCorrupted);
}

TEST_F(FileDocumentStoreTest, CompactDropsDeadRecords) {
  auto store = OpenStore();
  ASSERT_NE(store, nullptr);
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(store->Put("key", Document{{"version", i}}));
  }
  ASSERT_TRUE(store->Put("other", Document{{"version", 0}}));
  EXPECT_EQ(store->DeadRecords(), 19U);
  const auto before = fs::file_size(JournalPath());

  ASSERT_TRUE(store->Compact());
  EXPECT_EQ(store->DeadRecords(), 0U);
  EXPECT_LT(fs::file_size(JournalPath()), before);
  EXPECT_FALSE(fs::exists(JournalPath() + ".tmp"));

  // Store stays writable and the compacted journal replays
  ASSERT_TRUE(store->Put("third", Document{{"version", 1}}));
  store.reset();
  auto reopened = OpenStore();
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->Count(), 3U);
  auto doc = reopened->Get("key");
  ASSERT_TRUE(doc && doc->has_value());
  EXPECT_EQ((**doc)["version"], 19);
}

TEST_F(FileDocumentStoreTest, AutomaticCompactionWhenDeadOutnumberLive) {
  auto store = OpenStore(4);
  ASSERT_NE(store, nullptr);
  ASSERT_TRUE(store->Put("k", Document{{"v", 0}}));
  for (int i = 1; i <= 4; ++i) {
    ASSERT_TRUE(store->Put("k", Document{{"v", i}}));
  }
  // Fourth overwrite reaches the threshold and triggers compaction
  EXPECT_EQ(store->DeadRecords(), 0U);
  EXPECT_EQ(store->Count(), 1U);
}

TEST_F(FileDocumentStoreTest, LoadAllReturnsLiveDocuments) {
  auto store = OpenStore();
  ASSERT_NE(store, nullptr);
  ASSERT_TRUE(store->Put("a", Document{{"n", 1}}));
  ASSERT_TRUE(store->Put("b", Document{{"n", 2}}));
  ASSERT_TRUE(store->Delete("a"));

  auto all = store->LoadAll();
  ASSERT_TRUE(all);
  ASSERT_EQ(all->size(), 1U);
  EXPECT_EQ((*all)[0].first, "b");
  EXPECT_EQ((*all)[0].second["n"], 2);
}

}  // namespace semcache::storage

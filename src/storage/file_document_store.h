/**
 * @file file_document_store.h
 * @brief DocumentStore backed by an append-only journal file
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "storage/document_log_format.h"
#include "storage/document_store.h"

namespace semcache::storage {

/**
 * @brief Journal-backed document store (one file per collection)
 *
 * Each Put/Delete appends a CRC-protected record to `<dir>/<collection>.journal`
 * and flushes it. The live set is kept in memory as serialized JSON so Get()
 * never touches the disk.
 *
 * Open() replays the journal. A torn or corrupted tail (crash during append)
 * is logged and truncated away; everything before it is kept.
 *
 * A failed append (short write, ENOSPC) is rolled back by truncating the
 * journal to the end of the last good record, so later records never land
 * behind a partial one. If the rollback itself fails the store refuses
 * further writes.
 *
 * Superseded records are counted. Once they outnumber live documents and
 * reach compact_min_records, the journal is rewritten through a temporary
 * file and an atomic rename.
 */
class FileDocumentStore : public DocumentStore {
 public:
  /**
   * @brief Open (or create) a collection journal
   * @param dir Directory holding journal files (created if missing)
   * @param collection Collection name, used as the file stem
   * @param compact_min_records Minimum dead records before automatic compaction
   */
  static utils::Expected<std::unique_ptr<FileDocumentStore>, utils::Error> Open(const std::string& dir,
                                                                              const std::string& collection,
                                                                              size_t compact_min_records = 1024);

  ~FileDocumentStore() override;

  FileDocumentStore(const FileDocumentStore&) = delete;
  FileDocumentStore& operator=(const FileDocumentStore&) = delete;
  FileDocumentStore(FileDocumentStore&&) = delete;
  FileDocumentStore& operator=(FileDocumentStore&&) = delete;

  utils::Expected<void, utils::Error> Put(const std::string& key, const Document& document) override;
  utils::Expected<std::optional<Document>, utils::Error> Get(const std::string& key) override;
  utils::Expected<void, utils::Error> Delete(const std::string& key) override;
  utils::Expected<std::vector<KeyedDocument>, utils::Error> LoadAll() override;
  [[nodiscard]] size_t Count() const override;

  /**
   * @brief Rewrite the journal with live documents only
   */
  utils::Expected<void, utils::Error> Compact();

  /**
   * @brief Number of superseded records in the journal
   */
  [[nodiscard]] size_t DeadRecords() const;

  [[nodiscard]] const std::string& Path() const { return path_; }

 private:
  FileDocumentStore(std::string path, size_t compact_min_records);

  utils::Expected<void, utils::Error> Replay();
  utils::Expected<void, utils::Error> OpenForAppend();
  utils::Expected<void, utils::Error> AppendRecord(journal_format::RecordOp op, const std::string& key,
                                                   const std::string& payload);
  utils::Expected<void, utils::Error> CompactLocked();
  void MaybeCompactLocked();
  void RollBackAppendLocked();

  std::string path_;
  size_t compact_min_records_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> live_;  ///< key -> serialized document
  size_t dead_records_ = 0;
  std::ofstream output_stream_;
  uint64_t append_offset_ = 0;  ///< End of the last complete record
  bool write_fenced_ = false;   ///< Set when a failed append could not be rolled back
};

}  // namespace semcache::storage

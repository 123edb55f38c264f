/**
 * @file file_document_store.cpp
 * @brief Journal-backed DocumentStore implementation
 */

#include "storage/file_document_store.h"

#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>

#include "utils/structured_log.h"

namespace semcache::storage {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Write binary data to stream
 */
template <typename T>
bool WriteBinary(std::ostream& output_stream, const T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  output_stream.write(reinterpret_cast<const char*>(&value), sizeof(T));
  return output_stream.good();
}

/**
 * @brief Read binary data from stream
 */
template <typename T>
bool ReadBinary(std::istream& input_stream, T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(&value), sizeof(T));
  return input_stream.good();
}

/**
 * @brief Write string to stream (length-prefixed)
 */
bool WriteString(std::ostream& output_stream, const std::string& str) {
  auto len = static_cast<uint32_t>(str.size());
  if (!WriteBinary(output_stream, len)) {
    return false;
  }
  if (len > 0) {
    output_stream.write(str.data(), len);
  }
  return output_stream.good();
}

/**
 * @brief Read string from stream (length-prefixed, bounded)
 */
bool ReadString(std::istream& input_stream, std::string& str, uint32_t max_length) {
  uint32_t len = 0;
  if (!ReadBinary(input_stream, len)) {
    return false;
  }
  if (len > max_length) {
    return false;
  }
  if (len > 0) {
    str.resize(len);
    input_stream.read(str.data(), len);
  } else {
    str.clear();
  }
  return input_stream.good();
}

uint32_t CalculateCRC32(const std::string& str) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(str.data()), str.size()));
}

/**
 * @brief Serialize a record without its trailing CRC
 */
std::string EncodeRecordBody(journal_format::RecordOp op, const std::string& key, const std::string& payload) {
  std::ostringstream body;
  WriteBinary(body, static_cast<uint8_t>(op));
  WriteString(body, key);
  WriteString(body, payload);
  return body.str();
}

bool WriteFileHeader(std::ostream& output_stream) {
  output_stream.write(journal_format::kMagicNumber.data(), journal_format::kMagicNumber.size());
  return WriteBinary(output_stream, journal_format::kCurrentVersion);
}

}  // namespace

// ============================================================================
// Open / Replay
// ============================================================================

FileDocumentStore::FileDocumentStore(std::string path, size_t compact_min_records)
    : path_(std::move(path)), compact_min_records_(compact_min_records) {}

FileDocumentStore::~FileDocumentStore() {
  if (output_stream_.is_open()) {
    output_stream_.close();
  }
}

Expected<std::unique_ptr<FileDocumentStore>, Error> FileDocumentStore::Open(const std::string& dir,
                                                                            const std::string& collection,
                                                                            size_t compact_min_records) {
  if (collection.empty() || collection.find('/') != std::string::npos) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid collection name", collection));
  }

  std::error_code error_code;
  std::filesystem::create_directories(dir, error_code);
  if (error_code) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError,
                                    "Failed to create journal directory: " + error_code.message(), dir));
  }

  const std::string path = (std::filesystem::path(dir) / (collection + journal_format::kFileExtension)).string();
  std::unique_ptr<FileDocumentStore> store(new FileDocumentStore(path, compact_min_records));

  auto replay_result = store->Replay();
  if (!replay_result) {
    return MakeUnexpected(replay_result.error());
  }
  auto open_result = store->OpenForAppend();
  if (!open_result) {
    return MakeUnexpected(open_result.error());
  }

  utils::LogStorageInfo("journal_open", "Opened " + path + " with " + std::to_string(store->live_.size()) +
                                            " documents (" + std::to_string(store->dead_records_) + " dead records)");
  return store;
}

Expected<void, Error> FileDocumentStore::Replay() {
  std::error_code error_code;
  if (!std::filesystem::exists(path_, error_code)) {
    std::ofstream create_stream(path_, std::ios::binary | std::ios::trunc);
    if (!create_stream || !WriteFileHeader(create_stream)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError,
                                      "Failed to create journal: " + std::string(std::strerror(errno)), path_));
    }
    return {};
  }

  std::ifstream input_stream(path_, std::ios::binary);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageReadError,
                                    "Failed to open journal for reading: " + std::string(std::strerror(errno)),
                                    path_));
  }

  std::array<char, 4> magic{};
  input_stream.read(magic.data(), magic.size());
  if (!input_stream.good() || magic != journal_format::kMagicNumber) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageCorrupted, "Not a journal file (bad magic)", path_));
  }
  uint32_t version = 0;
  if (!ReadBinary(input_stream, version) || version != journal_format::kCurrentVersion) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageCorrupted, "Unsupported journal version " + std::to_string(version), path_));
  }

  auto valid_end = static_cast<uint64_t>(journal_format::kFixedHeaderSize);
  uint64_t records = 0;
  std::string torn_reason;

  while (input_stream.peek() != std::char_traits<char>::eof()) {
    uint8_t op_byte = 0;
    std::string key;
    std::string payload;
    uint32_t stored_crc = 0;

    if (!ReadBinary(input_stream, op_byte) ||
        !ReadString(input_stream, key, journal_format::kMaxKeyLength) ||
        !ReadString(input_stream, payload, journal_format::kMaxDocumentLength) ||
        !ReadBinary(input_stream, stored_crc)) {
      torn_reason = "truncated record";
      break;
    }

    const auto op = static_cast<journal_format::RecordOp>(op_byte);
    if (op != journal_format::RecordOp::kPut && op != journal_format::RecordOp::kDelete) {
      torn_reason = "unknown record op " + std::to_string(op_byte);
      break;
    }

    const std::string body = EncodeRecordBody(op, key, payload);
    if (CalculateCRC32(body) != stored_crc) {
      torn_reason = "CRC mismatch";
      break;
    }

    if (op == journal_format::RecordOp::kPut) {
      if (!live_.insert_or_assign(key, std::move(payload)).second) {
        ++dead_records_;
      }
    } else {
      // A delete kills the record it removes as well as itself
      dead_records_ += live_.erase(key) > 0 ? 2 : 1;
    }

    valid_end += body.size() + sizeof(uint32_t);
    ++records;
  }

  input_stream.close();

  if (!torn_reason.empty()) {
    utils::StructuredLog()
        .Event("journal_tail_truncated")
        .Field("filepath", path_)
        .Field("reason", torn_reason)
        .Field("valid_records", records)
        .Field("valid_bytes", valid_end)
        .Warn();

    std::filesystem::resize_file(path_, valid_end, error_code);
    if (error_code) {
      return MakeUnexpected(
          MakeError(ErrorCode::kStorageWriteError, "Failed to truncate journal: " + error_code.message(), path_));
    }
  }

  return {};
}

Expected<void, Error> FileDocumentStore::OpenForAppend() {
  output_stream_.open(path_, std::ios::binary | std::ios::app);
  if (!output_stream_) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError,
                                    "Failed to open journal for append: " + std::string(std::strerror(errno)),
                                    path_));
  }
  std::error_code error_code;
  const auto size = std::filesystem::file_size(path_, error_code);
  if (error_code) {
    output_stream_.close();
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageReadError, "Failed to stat journal: " + error_code.message(), path_));
  }
  append_offset_ = size;
  return {};
}

void FileDocumentStore::RollBackAppendLocked() {
  output_stream_.close();

  std::error_code error_code;
  std::filesystem::resize_file(path_, append_offset_, error_code);
  if (error_code) {
    write_fenced_ = true;
    utils::LogStorageError("journal_rollback", path_, "Failed to truncate partial record: " + error_code.message());
    return;
  }

  auto reopen_result = OpenForAppend();
  if (!reopen_result) {
    write_fenced_ = true;
    utils::LogStorageError("journal_rollback", path_, reopen_result.error().message());
    return;
  }
  utils::LogStorageWarning("journal_rollback",
                           "Rolled back partial record in " + path_ + " to offset " + std::to_string(append_offset_));
}

// ============================================================================
// DocumentStore interface
// ============================================================================

Expected<void, Error> FileDocumentStore::AppendRecord(journal_format::RecordOp op, const std::string& key,
                                                      const std::string& payload) {
  if (key.size() > journal_format::kMaxKeyLength) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Key too long for journal", path_));
  }
  if (payload.size() > journal_format::kMaxDocumentLength) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Document too large for journal", path_));
  }

  if (write_fenced_ || !output_stream_.is_open()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageWriteError, "Journal refuses writes after an unrecoverable append failure", path_));
  }

  const std::string body = EncodeRecordBody(op, key, payload);
  const uint32_t crc = CalculateCRC32(body);

  output_stream_.write(body.data(), static_cast<std::streamsize>(body.size()));
  WriteBinary(output_stream_, crc);
  output_stream_.flush();
  if (!output_stream_.good()) {
    const std::string reason = std::strerror(errno);
    RollBackAppendLocked();
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageWriteError, "Failed to append journal record: " + reason, path_));
  }
  append_offset_ += body.size() + sizeof(uint32_t);
  return {};
}

Expected<void, Error> FileDocumentStore::Put(const std::string& key, const Document& document) {
  std::string payload = document.dump();

  std::scoped_lock lock(mutex_);
  auto append_result = AppendRecord(journal_format::RecordOp::kPut, key, payload);
  if (!append_result) {
    return append_result;
  }

  if (!live_.insert_or_assign(key, std::move(payload)).second) {
    ++dead_records_;
    MaybeCompactLocked();
  }
  return {};
}

Expected<std::optional<Document>, Error> FileDocumentStore::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto iter = live_.find(key);
  if (iter == live_.end()) {
    return std::optional<Document>{};
  }

  Document document = Document::parse(iter->second, nullptr, false);
  if (document.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageCorrupted, "Stored document is not valid JSON", key));
  }
  return std::optional<Document>(std::move(document));
}

Expected<void, Error> FileDocumentStore::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);
  if (live_.find(key) == live_.end()) {
    return {};
  }

  auto append_result = AppendRecord(journal_format::RecordOp::kDelete, key, "");
  if (!append_result) {
    return append_result;
  }

  live_.erase(key);
  dead_records_ += 2;
  MaybeCompactLocked();
  return {};
}

Expected<std::vector<KeyedDocument>, Error> FileDocumentStore::LoadAll() {
  std::scoped_lock lock(mutex_);
  std::vector<KeyedDocument> result;
  result.reserve(live_.size());
  for (const auto& [key, payload] : live_) {
    Document document = Document::parse(payload, nullptr, false);
    if (document.is_discarded()) {
      utils::LogStorageWarning("journal_load", "Skipping non-JSON document for key " + key.substr(0, 120));
      continue;
    }
    result.emplace_back(key, std::move(document));
  }
  return result;
}

size_t FileDocumentStore::Count() const {
  std::scoped_lock lock(mutex_);
  return live_.size();
}

size_t FileDocumentStore::DeadRecords() const {
  std::scoped_lock lock(mutex_);
  return dead_records_;
}

// ============================================================================
// Compaction
// ============================================================================

Expected<void, Error> FileDocumentStore::Compact() {
  std::scoped_lock lock(mutex_);
  return CompactLocked();
}

void FileDocumentStore::MaybeCompactLocked() {
  if (dead_records_ < compact_min_records_ || dead_records_ <= live_.size()) {
    return;
  }
  auto result = CompactLocked();
  if (!result) {
    utils::LogStorageError("journal_compact", path_, result.error().message());
  }
}

Expected<void, Error> FileDocumentStore::CompactLocked() {
  const std::string temp_filepath = path_ + ".tmp";
  std::error_code error_code;

  {
    std::ofstream temp_stream(temp_filepath, std::ios::binary | std::ios::trunc);
    if (!temp_stream || !WriteFileHeader(temp_stream)) {
      std::filesystem::remove(temp_filepath, error_code);
      return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError,
                                      "Failed to open file for writing: " + temp_filepath + " (" +
                                          std::strerror(errno) + ")"));
    }

    for (const auto& [key, payload] : live_) {
      const std::string body = EncodeRecordBody(journal_format::RecordOp::kPut, key, payload);
      temp_stream.write(body.data(), static_cast<std::streamsize>(body.size()));
      WriteBinary(temp_stream, CalculateCRC32(body));
    }

    temp_stream.flush();
    if (!temp_stream.good()) {
      temp_stream.close();
      std::filesystem::remove(temp_filepath, error_code);
      return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError, "Failed to write compacted journal",
                                      temp_filepath));
    }
  }

  output_stream_.close();

  // Atomic rename
  std::filesystem::rename(temp_filepath, path_, error_code);
  if (error_code) {
    const std::string rename_error = error_code.message();
    std::filesystem::remove(temp_filepath, error_code);
    auto reopen_result = OpenForAppend();
    if (!reopen_result) {
      return reopen_result;
    }
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageWriteError, "Failed to replace journal: " + rename_error, path_));
  }

  const size_t reclaimed = dead_records_;
  dead_records_ = 0;

  auto reopen_result = OpenForAppend();
  if (!reopen_result) {
    return reopen_result;
  }

  utils::LogStorageInfo("journal_compact", "Compacted " + path_ + ": " + std::to_string(live_.size()) +
                                               " live documents, " + std::to_string(reclaimed) +
                                               " dead records reclaimed");
  return {};
}

}  // namespace semcache::storage

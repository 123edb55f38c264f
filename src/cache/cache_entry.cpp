/**
 * @file cache_entry.cpp
 * @brief Cache entry document codec
 */

#include "cache/cache_entry.h"

#include <cmath>

namespace semcache::cache {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

utils::Unexpected<utils::Error> Corrupted(const std::string& message, const std::string& key = "") {
  return MakeUnexpected(MakeError(ErrorCode::kStorageCorrupted, message, key));
}

}  // namespace

storage::Document EntryToDocument(const CacheEntry& entry) {
  storage::Document document;
  document["doc_version"] = kEntryDocumentVersion;
  document["key"] = entry.canonical_key;
  document["value"] = entry.value;
  if (entry.embedding.has_value()) {
    document["embedding"] = *entry.embedding;
  } else {
    document["embedding"] = nullptr;
  }
  document["created_at"] = utils::ToUnixMillis(entry.created_at);
  document["last_accessed_at"] = utils::ToUnixMillis(entry.last_accessed_at);
  document["access_count"] = entry.access_count;
  document["popularity_score"] = entry.popularity_score;
  return document;
}

utils::Expected<CacheEntry, utils::Error> EntryFromDocument(const storage::Document& document) {
  if (!document.is_object()) {
    return Corrupted("Cache document is not an object");
  }

  auto version_iter = document.find("doc_version");
  if (version_iter == document.end() || !version_iter->is_number_integer() ||
      version_iter->get<int>() != kEntryDocumentVersion) {
    return Corrupted("Unsupported cache document version");
  }

  auto key_iter = document.find("key");
  if (key_iter == document.end() || !key_iter->is_string() || key_iter->get<std::string>().empty()) {
    return Corrupted("Cache document has no key");
  }

  CacheEntry entry;
  entry.canonical_key = key_iter->get<std::string>();

  auto value_iter = document.find("value");
  if (value_iter == document.end()) {
    return Corrupted("Cache document has no value", entry.canonical_key);
  }
  entry.value = *value_iter;

  auto embedding_iter = document.find("embedding");
  if (embedding_iter != document.end() && !embedding_iter->is_null()) {
    if (!embedding_iter->is_array() || embedding_iter->empty()) {
      return Corrupted("Cache document embedding must be a non-empty array", entry.canonical_key);
    }
    std::vector<float> embedding;
    embedding.reserve(embedding_iter->size());
    for (const auto& component : *embedding_iter) {
      if (!component.is_number() || !std::isfinite(component.get<double>())) {
        return Corrupted("Cache document embedding has a non-numeric component", entry.canonical_key);
      }
      embedding.push_back(component.get<float>());
    }
    entry.embedding = std::move(embedding);
  }

  auto created_iter = document.find("created_at");
  auto accessed_iter = document.find("last_accessed_at");
  if (created_iter == document.end() || accessed_iter == document.end() || !created_iter->is_number_integer() ||
      !accessed_iter->is_number_integer()) {
    return Corrupted("Cache document timestamps are missing", entry.canonical_key);
  }
  entry.created_at = utils::FromUnixMillis(created_iter->get<int64_t>());
  entry.last_accessed_at = utils::FromUnixMillis(accessed_iter->get<int64_t>());
  if (entry.last_accessed_at < entry.created_at) {
    return Corrupted("Cache document last_accessed_at precedes created_at", entry.canonical_key);
  }

  auto count_iter = document.find("access_count");
  if (count_iter == document.end() || !count_iter->is_number_unsigned() || count_iter->get<uint64_t>() == 0) {
    return Corrupted("Cache document access_count must be a positive integer", entry.canonical_key);
  }
  entry.access_count = count_iter->get<uint64_t>();

  auto score_iter = document.find("popularity_score");
  if (score_iter != document.end() && score_iter->is_number()) {
    entry.popularity_score = score_iter->get<double>();
  }

  return entry;
}

}  // namespace semcache::cache

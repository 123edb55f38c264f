/**
 * @file cache_entry.h
 * @brief Cache entry and its durable document form
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "storage/document_store.h"
#include "utils/clock.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace semcache::cache {

/// Version of the durable document layout written by EntryToDocument()
constexpr int kEntryDocumentVersion = 1;

/**
 * @brief Stored unit of an EnhancedCache
 *
 * Invariants (maintained by EnhancedCache):
 * - canonical_key is unique within one cache instance
 * - last_accessed_at >= created_at
 * - access_count >= 1 once inserted
 */
struct CacheEntry {
  std::string canonical_key;                    ///< Identity from KeyCanonicalizer
  nlohmann::json value;                         ///< Cached payload (owned, handed out as copies)
  std::optional<std::vector<float>> embedding;  ///< Present only when supplied at put time
  utils::TimePoint created_at;                  ///< First insertion (UTC)
  utils::TimePoint last_accessed_at;            ///< Last get hit or put (UTC)
  uint64_t access_count = 0;                    ///< Hits + puts
  double popularity_score = 0.0;                ///< Last computed PopularityPolicy score
  uint64_t last_access_seq = 0;                 ///< Per-instance access sequence (not persisted)
};

/**
 * @brief Serialize an entry for the durable store
 *
 * Timestamps are written as milliseconds since the Unix epoch.
 */
storage::Document EntryToDocument(const CacheEntry& entry);

/**
 * @brief Rebuild an entry from a durable document
 * @return kStorageCorrupted if a field is missing, mistyped or violates an entry invariant
 */
utils::Expected<CacheEntry, utils::Error> EntryFromDocument(const storage::Document& document);

}  // namespace semcache::cache

/**
 * @file cache_key.h
 * @brief Structured lookup fields and their canonical cache key
 *
 * Every cache domain declares a fixed, versioned field schema. A lookup is an
 * ordered list of (name, value) pairs under that schema, and its identity is a
 * deterministic string built from the schema, the version and the fields in
 * declared order:
 *
 *   query/v1|query=11:hello world|is_first_message=5:false
 *
 * Each value is prefixed with its byte length, so no choice of field values
 * can make two different lookups produce the same key. Embeddings are never
 * part of the key.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace semcache::cache {

/**
 * @brief One named lookup field
 */
struct LookupField {
  std::string name;
  std::string value;
};

/**
 * @brief Structured lookup request (embedding excluded)
 */
struct LookupFields {
  std::string schema;               ///< Domain schema name ("query", "financial", ...)
  uint32_t version = 1;             ///< Schema version, bumped when the field set changes
  std::vector<LookupField> fields;  ///< Fields in declared order

  /**
   * @brief Append a field (builder style)
   */
  LookupFields& Add(std::string name, std::string value) {
    fields.push_back({std::move(name), std::move(value)});
    return *this;
  }

  /**
   * @brief Serialize as {"schema": ..., "version": ..., "fields": [{"name": ..., "value": ...}]}
   */
  [[nodiscard]] nlohmann::json ToJson() const;

  /**
   * @brief Parse the ToJson() representation
   * @return kCacheInvalidLookup if the document has the wrong shape
   */
  static utils::Expected<LookupFields, utils::Error> FromJson(const nlohmann::json& json);
};

// ============================================================================
// Per-domain lookups
// ============================================================================

/// Schema "query/v1": analysis answer for a user query
struct QueryLookup {
  std::string query;
  bool is_first_message = false;

  [[nodiscard]] LookupFields ToFields() const;
};

/// Schema "financial/v1": financial data snapshot for a ticker
struct FinancialLookup {
  std::string ticker;
  std::string data_type = "llm_data";

  [[nodiscard]] LookupFields ToFields() const;
};

/// Schema "ticker/v1": ticker resolution for a company name
struct TickerLookup {
  std::string company_name;

  [[nodiscard]] LookupFields ToFields() const;
};

/// Schema "probe/v1": health check round trip
struct ProbeLookup {
  std::string probe_id;

  [[nodiscard]] LookupFields ToFields() const;
};

/**
 * @brief Deterministic mapping from LookupFields to a canonical key
 */
class KeyCanonicalizer {
 public:
  /**
   * @brief Build the canonical key
   *
   * Rejects (kCacheInvalidLookup): empty schema or schema containing '|',
   * version 0, no fields, empty or duplicate field names, field names
   * containing '|', '=' or ':'.
   */
  static utils::Expected<std::string, utils::Error> Canonicalize(const LookupFields& lookup);
};

}  // namespace semcache::cache

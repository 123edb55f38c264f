/**
 * @file document_store.h
 * @brief Durable key-value document store interface
 *
 * The cache mirrors every entry to a DocumentStore so that state survives a
 * restart. The store is never read on the serving path; it is only loaded by
 * EnhancedCache::Recover().
 *
 * No transactional guarantee is made across keys. Implementations must be
 * thread-safe.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace semcache::storage {

using Document = nlohmann::json;

/// Key and document pair returned by LoadAll()
using KeyedDocument = std::pair<std::string, Document>;

/**
 * @brief Document store interface (one collection per instance)
 */
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  /**
   * @brief Insert or replace the document stored under key
   */
  virtual utils::Expected<void, utils::Error> Put(const std::string& key, const Document& document) = 0;

  /**
   * @brief Fetch the document stored under key
   * @return std::nullopt if the key is absent
   */
  virtual utils::Expected<std::optional<Document>, utils::Error> Get(const std::string& key) = 0;

  /**
   * @brief Delete key (absent keys are not an error)
   */
  virtual utils::Expected<void, utils::Error> Delete(const std::string& key) = 0;

  /**
   * @brief Load every live document of the collection
   */
  virtual utils::Expected<std::vector<KeyedDocument>, utils::Error> LoadAll() = 0;

  /**
   * @brief Number of live documents
   */
  [[nodiscard]] virtual size_t Count() const = 0;
};

}  // namespace semcache::storage

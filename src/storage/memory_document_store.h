/**
 * @file memory_document_store.h
 * @brief In-process DocumentStore (tests and ephemeral deployments)
 */

#pragma once

#include <map>
#include <mutex>
#include <string>

#include "storage/document_store.h"

namespace semcache::storage {

/**
 * @brief DocumentStore kept in an ordered map
 *
 * Documents are deep-copied on the way in and out.
 */
class MemoryDocumentStore : public DocumentStore {
 public:
  MemoryDocumentStore() = default;
  ~MemoryDocumentStore() override = default;

  MemoryDocumentStore(const MemoryDocumentStore&) = delete;
  MemoryDocumentStore& operator=(const MemoryDocumentStore&) = delete;
  MemoryDocumentStore(MemoryDocumentStore&&) = delete;
  MemoryDocumentStore& operator=(MemoryDocumentStore&&) = delete;

  utils::Expected<void, utils::Error> Put(const std::string& key, const Document& document) override;
  utils::Expected<std::optional<Document>, utils::Error> Get(const std::string& key) override;
  utils::Expected<void, utils::Error> Delete(const std::string& key) override;
  utils::Expected<std::vector<KeyedDocument>, utils::Error> LoadAll() override;
  [[nodiscard]] size_t Count() const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Document> documents_;
};

}  // namespace semcache::storage

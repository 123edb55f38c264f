/**
 * @file memory_document_store.cpp
 * @brief In-process DocumentStore implementation
 */

#include "storage/memory_document_store.h"

namespace semcache::storage {

utils::Expected<void, utils::Error> MemoryDocumentStore::Put(const std::string& key, const Document& document) {
  std::scoped_lock lock(mutex_);
  documents_[key] = document;
  return {};
}

utils::Expected<std::optional<Document>, utils::Error> MemoryDocumentStore::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto iter = documents_.find(key);
  if (iter == documents_.end()) {
    return std::optional<Document>{};
  }
  return std::optional<Document>(iter->second);
}

utils::Expected<void, utils::Error> MemoryDocumentStore::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);
  documents_.erase(key);
  return {};
}

utils::Expected<std::vector<KeyedDocument>, utils::Error> MemoryDocumentStore::LoadAll() {
  std::scoped_lock lock(mutex_);
  std::vector<KeyedDocument> result;
  result.reserve(documents_.size());
  for (const auto& [key, document] : documents_) {
    result.emplace_back(key, document);
  }
  return result;
}

size_t MemoryDocumentStore::Count() const {
  std::scoped_lock lock(mutex_);
  return documents_.size();
}

}  // namespace semcache::storage

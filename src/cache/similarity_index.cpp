/**
 * @file similarity_index.cpp
 * @brief Linear scan similarity index
 */

#include "cache/similarity_index.h"

#include <algorithm>

#include "vectors/distance.h"

namespace semcache::cache {

void LinearScanIndex::Upsert(const std::string& key, const std::vector<float>& embedding) {
  vectors_[key] = IndexedVector{embedding, vectors::L2Norm(embedding)};
}

void LinearScanIndex::Remove(const std::string& key) {
  vectors_.erase(key);
}

std::vector<SimilarityMatch> LinearScanIndex::Search(const std::vector<float>& query, double threshold) const {
  std::vector<SimilarityMatch> matches;

  const double query_norm = vectors::L2Norm(query);
  if (query.empty() || query_norm == 0.0) {
    return matches;
  }

  for (const auto& [key, indexed] : vectors_) {
    if (indexed.values.size() != query.size() || indexed.norm == 0.0) {
      continue;
    }
    const double score =
        std::clamp(vectors::DotProduct(query, indexed.values) / (query_norm * indexed.norm), -1.0, 1.0);
    if (score >= threshold - kScoreTolerance) {
      matches.emplace_back(key, score);
    }
  }

  std::sort(matches.begin(), matches.end());
  return matches;
}

}  // namespace semcache::cache

/**
 * @file similarity_index.h
 * @brief Embedding index behind the similarity fallback of EnhancedCache
 */

#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace semcache::cache {

/**
 * @brief Similarity search result
 */
struct SimilarityMatch {
  std::string key;     ///< Canonical key of the stored entry
  double score = 0.0;  ///< Cosine similarity with the query

  SimilarityMatch() = default;
  SimilarityMatch(std::string key_, double score_) : key(std::move(key_)), score(score_) {}

  /**
   * @brief Compare for sorting (descending by score)
   */
  bool operator<(const SimilarityMatch& other) const { return score > other.score; }
};

/**
 * @brief Pluggable embedding index
 *
 * Contract: Search() returns every stored key whose cosine similarity with the
 * query is >= threshold (within kScoreTolerance, so a threshold of 1.0 still
 * matches identical vectors), sorted by score descending. Scores are clamped
 * to [-1, 1]. A vector whose dimension
 * differs from the query never matches. An approximate implementation may
 * replace the linear scan as long as results for thresholds >= 0.9 agree up
 * to floating-point tolerance.
 *
 * Thread-safety: not synchronized; the owning cache serializes access.
 */
class SimilarityIndex {
 public:
  /// Rounding slack applied to the threshold comparison
  static constexpr double kScoreTolerance = 1e-9;

  virtual ~SimilarityIndex() = default;

  /**
   * @brief Insert or replace the embedding stored under key
   */
  virtual void Upsert(const std::string& key, const std::vector<float>& embedding) = 0;

  /**
   * @brief Remove key (no-op if absent)
   */
  virtual void Remove(const std::string& key) = 0;

  virtual void Clear() = 0;

  [[nodiscard]] virtual size_t Size() const = 0;

  /**
   * @brief Find all stored embeddings with similarity >= threshold
   */
  [[nodiscard]] virtual std::vector<SimilarityMatch> Search(const std::vector<float>& query,
                                                            double threshold) const = 0;
};

/**
 * @brief Exhaustive cosine scan (default index)
 *
 * Norms are computed once at Upsert() time. Search cost is proportional to
 * the number of indexed embeddings.
 */
class LinearScanIndex : public SimilarityIndex {
 public:
  void Upsert(const std::string& key, const std::vector<float>& embedding) override;
  void Remove(const std::string& key) override;
  void Clear() override { vectors_.clear(); }
  [[nodiscard]] size_t Size() const override { return vectors_.size(); }
  [[nodiscard]] std::vector<SimilarityMatch> Search(const std::vector<float>& query, double threshold) const override;

 private:
  struct IndexedVector {
    std::vector<float> values;
    double norm = 0.0;
  };

  std::unordered_map<std::string, IndexedVector> vectors_;
};

}  // namespace semcache::cache

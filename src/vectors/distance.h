/**
 * @file distance.h
 * @brief Vector similarity functions used by the similarity fallback
 *
 * - Dot Product (inner product)
 * - L2 norm
 * - Cosine Similarity (normalized dot product)
 *
 * Embeddings are small (hundreds to low thousands of dimensions) and scanned
 * over at most a few thousand entries, so a scalar loop is used. Sums are
 * accumulated in double to keep cosine stable near the 0.9+ thresholds.
 */

#pragma once

#include <cmath>
#include <vector>

namespace semcache::vectors {

/**
 * @brief Calculate dot product between two vectors
 *
 * @param a First vector
 * @param b Second vector
 * @return Dot product value, or 0.0 if dimensions mismatch
 */
inline double DotProduct(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }

  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

/**
 * @brief Calculate L2 norm (magnitude) of a vector
 */
inline double L2Norm(const std::vector<float>& v) {
  double sum_sq = 0.0;
  for (float val : v) {
    sum_sq += static_cast<double>(val) * static_cast<double>(val);
  }
  return std::sqrt(sum_sq);
}

/**
 * @brief Calculate cosine similarity between two vectors
 *
 * Cosine similarity: dot(a, b) / (||a|| * ||b||)
 * Returns value in [-1, 1], where 1 means identical direction.
 *
 * @return Cosine similarity, or 0.0 if dimensions mismatch or either vector is zero
 */
inline double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }

  const double norm_a = L2Norm(a);
  const double norm_b = L2Norm(b);
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;  // Undefined for zero vectors
  }

  return DotProduct(a, b) / (norm_a * norm_b);
}

/**
 * @brief Check that a vector can take part in a cosine comparison
 *
 * @return true if non-empty, every component is finite and the norm is non-zero
 */
inline bool IsUsableEmbedding(const std::vector<float>& v) {
  if (v.empty()) {
    return false;
  }
  for (float val : v) {
    if (!std::isfinite(val)) {
      return false;
    }
  }
  return L2Norm(v) > 0.0;
}

}  // namespace semcache::vectors

/**
 * @file enhanced_cache.cpp
 * @brief Cache engine implementation
 */

#include "cache/enhanced_cache.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include "utils/structured_log.h"
#include "vectors/distance.h"

namespace semcache::cache {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

bool IsValidThreshold(double threshold) {
  return std::isfinite(threshold) && threshold > 0.0 && threshold <= 1.0;
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

const char* MatchKindToString(MatchKind kind) {
  switch (kind) {
    case MatchKind::kExact:
      return "exact";
    case MatchKind::kSimilarity:
      return "similarity";
  }
  return "unknown";
}

EnhancedCache::EnhancedCache(EnhancedCacheOptions options, std::shared_ptr<storage::DocumentStore> store,
                             const utils::Clock& clock, std::unique_ptr<SimilarityIndex> index)
    : options_(std::move(options)),
      clock_(clock),
      policy_(options_.popularity),
      index_(index != nullptr ? std::move(index) : std::make_unique<LinearScanIndex>()),
      trend_(options_.trend_window),
      mirror_(options_.name, std::move(store), options_.mirror) {}

// ============================================================================
// Get / Put / Remove
// ============================================================================

Expected<std::optional<CacheHit>, Error> EnhancedCache::Get(const LookupFields& fields,
                                                            const std::optional<std::vector<float>>& embedding,
                                                            std::optional<double> threshold) {
  if (threshold.has_value() && !IsValidThreshold(*threshold)) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidThreshold,
                                    "Similarity threshold must be in (0, 1], got " + std::to_string(*threshold),
                                    options_.name));
  }
  if (embedding.has_value() && !vectors::IsUsableEmbedding(*embedding)) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidEmbedding,
                                    "Query embedding must be non-empty, finite and non-zero", options_.name));
  }
  auto key = KeyCanonicalizer::Canonicalize(fields);
  if (!key) {
    return MakeUnexpected(key.error());
  }

  const auto start = std::chrono::steady_clock::now();
  std::optional<CacheHit> hit;
  {
    std::unique_lock lock(mutex_);
    hit = LookupLocked(*key, embedding, threshold.value_or(options_.default_similarity_threshold), clock_.Now());
  }
  RecordRequest(hit, ElapsedMs(start));
  return hit;
}

std::optional<CacheHit> EnhancedCache::LookupLocked(const std::string& key,
                                                    const std::optional<std::vector<float>>& embedding,
                                                    double threshold, utils::TimePoint now) {
  // Exact match never consults embeddings
  auto iter = entries_.find(key);
  if (iter != entries_.end()) {
    TouchLocked(iter->second, now);
    return CacheHit{iter->second.value, MatchKind::kExact, 1.0, key};
  }

  if (!embedding.has_value()) {
    return std::nullopt;
  }

  auto matches = index_->Search(*embedding, threshold);
  if (matches.empty()) {
    return std::nullopt;
  }

  // Among near-equal scores prefer higher popularity, then more recent access
  const double best_score = matches.front().score;
  CacheEntry* best = nullptr;
  double best_similarity = 0.0;
  for (const auto& match : matches) {
    if (match.score < best_score - kSimilarityTieEpsilon) {
      break;
    }
    auto match_iter = entries_.find(match.key);
    if (match_iter == entries_.end()) {
      continue;
    }
    CacheEntry& candidate = match_iter->second;
    const bool better =
        best == nullptr || candidate.popularity_score > best->popularity_score ||
        (candidate.popularity_score == best->popularity_score &&
         (candidate.last_accessed_at > best->last_accessed_at ||
          (candidate.last_accessed_at == best->last_accessed_at && candidate.last_access_seq > best->last_access_seq)));
    if (better) {
      best = &candidate;
      best_similarity = match.score;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }

  TouchLocked(*best, now);
  return CacheHit{best->value, MatchKind::kSimilarity, best_similarity, best->canonical_key};
}

void EnhancedCache::TouchLocked(CacheEntry& entry, utils::TimePoint now) {
  entry.last_accessed_at = std::max(entry.last_accessed_at, now);
  ++entry.access_count;
  entry.last_access_seq = ++access_seq_;
  entry.popularity_score = policy_.Score(entry, now);
  mirror_.SubmitPut(entry.canonical_key, EntryToDocument(entry));
}

Expected<void, Error> EnhancedCache::Put(const LookupFields& fields, nlohmann::json value,
                                         std::optional<std::vector<float>> embedding) {
  if (failed_.load()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kCacheCapacityViolation, "Cache instance is failed and refuses writes", options_.name));
  }
  if (embedding.has_value() && !vectors::IsUsableEmbedding(*embedding)) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheInvalidEmbedding,
                                    "Embedding must be non-empty, finite and non-zero", options_.name));
  }
  auto key = KeyCanonicalizer::Canonicalize(fields);
  if (!key) {
    return MakeUnexpected(key.error());
  }

  {
    std::unique_lock lock(mutex_);
    const auto now = clock_.Now();

    auto iter = entries_.find(*key);
    if (iter != entries_.end()) {
      CacheEntry& entry = iter->second;
      entry.value = std::move(value);
      entry.embedding = std::move(embedding);
      if (entry.embedding.has_value()) {
        index_->Upsert(entry.canonical_key, *entry.embedding);
      } else {
        index_->Remove(entry.canonical_key);
      }
      TouchLocked(entry, now);
    } else {
      CacheEntry entry;
      entry.canonical_key = *key;
      entry.value = std::move(value);
      entry.embedding = std::move(embedding);
      entry.created_at = now;
      entry.last_accessed_at = now;
      entry.access_count = 1;
      entry.last_access_seq = ++access_seq_;
      entry.popularity_score = policy_.Score(entry, now);
      mirror_.SubmitPut(entry.canonical_key, EntryToDocument(entry));
      InsertLocked(std::move(entry));
    }

    if (entries_.size() > options_.max_size) {
      EvictLocked(options_.max_size, now, true);
    }
    if (!VerifyCapacityLocked()) {
      return MakeUnexpected(MakeError(ErrorCode::kCacheCapacityViolation,
                                      "Cache size invariant violated after put", options_.name));
    }
  }

  {
    std::scoped_lock lock(metrics_mutex_);
    ++counters_.puts;
  }
  return {};
}

Expected<bool, Error> EnhancedCache::Remove(const LookupFields& fields) {
  auto key = KeyCanonicalizer::Canonicalize(fields);
  if (!key) {
    return MakeUnexpected(key.error());
  }

  std::unique_lock lock(mutex_);
  if (!EraseLocked(*key)) {
    return false;
  }
  mirror_.SubmitDelete(*key);
  return true;
}

Expected<bool, Error> EnhancedCache::Contains(const LookupFields& fields) const {
  auto key = KeyCanonicalizer::Canonicalize(fields);
  if (!key) {
    return MakeUnexpected(key.error());
  }

  std::shared_lock lock(mutex_);
  return entries_.find(*key) != entries_.end();
}

Expected<std::optional<CacheEntry>, Error> EnhancedCache::Peek(const LookupFields& fields) const {
  auto key = KeyCanonicalizer::Canonicalize(fields);
  if (!key) {
    return MakeUnexpected(key.error());
  }

  std::shared_lock lock(mutex_);
  auto iter = entries_.find(*key);
  if (iter == entries_.end()) {
    return std::optional<CacheEntry>{};
  }
  return std::optional<CacheEntry>(iter->second);
}

// ============================================================================
// Structural helpers (mutex_ held exclusively)
// ============================================================================

void EnhancedCache::InsertLocked(CacheEntry entry) {
  if (entry.embedding.has_value()) {
    index_->Upsert(entry.canonical_key, *entry.embedding);
  }
  std::string key = entry.canonical_key;
  if (entries_.insert_or_assign(std::move(key), std::move(entry)).second) {
    size_.fetch_add(1);
  }
}

bool EnhancedCache::EraseLocked(const std::string& key) {
  if (entries_.erase(key) == 0) {
    return false;
  }
  index_->Remove(key);
  size_.fetch_sub(1);
  return true;
}

void EnhancedCache::RescoreLocked(utils::TimePoint now) {
  for (auto& [key, entry] : entries_) {
    entry.popularity_score = policy_.Score(entry, now);
  }
}

bool EnhancedCache::VerifyCapacityLocked() {
  const size_t tracked = size_.load();
  if (tracked != entries_.size()) {
    MarkFailed("tracked size " + std::to_string(tracked) + " != collection size " +
               std::to_string(entries_.size()));
    return false;
  }
  return !failed_.load();
}

// ============================================================================
// Eviction and expiry
// ============================================================================

size_t EnhancedCache::Evict(size_t target_size) {
  std::unique_lock lock(mutex_);
  const size_t evicted = EvictLocked(target_size, clock_.Now(), true);
  VerifyCapacityLocked();
  return evicted;
}

size_t EnhancedCache::EvictLocked(size_t target_size, utils::TimePoint now, bool count_as_eviction) {
  if (entries_.size() <= target_size) {
    return 0;
  }

  // Scores age between accesses; refresh so the ranking reflects "now"
  RescoreLocked(now);

  std::vector<const CacheEntry*> candidates;
  candidates.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    candidates.push_back(&entry);
  }

  const size_t to_remove = entries_.size() - target_size;
  std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(to_remove),
                    candidates.end(),
                    [](const CacheEntry* a, const CacheEntry* b) { return PopularityPolicy::IsBetterVictim(*a, *b); });

  std::vector<std::string> victims;
  victims.reserve(to_remove);
  for (size_t i = 0; i < to_remove; ++i) {
    victims.push_back(candidates[i]->canonical_key);
  }

  for (const auto& key : victims) {
    EraseLocked(key);
    mirror_.SubmitDelete(key);
  }

  if (count_as_eviction) {
    std::scoped_lock lock(metrics_mutex_);
    counters_.evictions += victims.size();
  }

  utils::LogEviction(options_.name, victims.size(), entries_.size(), target_size);

  if (entries_.size() > target_size) {
    MarkFailed("eviction left " + std::to_string(entries_.size()) + " entries, target " +
               std::to_string(target_size));
  }
  return victims.size();
}

size_t EnhancedCache::ClearExpired(std::chrono::milliseconds max_age) {
  size_t removed = 0;
  {
    std::unique_lock lock(mutex_);
    const auto now = clock_.Now();

    // Compare in milliseconds; widening max_age to the clock's period can overflow
    std::vector<std::string> expired;
    for (const auto& [key, entry] : entries_) {
      if (std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.last_accessed_at) > max_age) {
        expired.push_back(key);
      }
    }
    for (const auto& key : expired) {
      EraseLocked(key);
      mirror_.SubmitDelete(key);
    }
    removed = expired.size();
    VerifyCapacityLocked();
  }

  {
    std::scoped_lock lock(metrics_mutex_);
    counters_.expirations += removed;
  }

  utils::LogExpirySweep(options_.name, removed, std::chrono::duration<double, std::ratio<3600>>(max_age).count());
  return removed;
}

// ============================================================================
// Recovery and health probe
// ============================================================================

Expected<size_t, Error> EnhancedCache::Recover() {
  storage::DocumentStore* store = mirror_.Store();
  if (store == nullptr) {
    return static_cast<size_t>(0);
  }

  auto documents = store->LoadAll();
  if (!documents) {
    return MakeUnexpected(documents.error());
  }

  std::vector<CacheEntry> recovered;
  recovered.reserve(documents->size());
  for (const auto& [store_key, document] : *documents) {
    auto entry = EntryFromDocument(document);
    if (entry && entry->canonical_key == store_key) {
      recovered.push_back(std::move(*entry));
      continue;
    }

    const std::string reason = entry ? "document key does not match store key" : entry.error().message();
    utils::StructuredLog()
        .Event("cache_recover_skipped")
        .Field("cache", options_.name)
        .Field("key", store_key.substr(0, 120))
        .Field("reason", reason)
        .Warn();
    auto delete_result = store->Delete(store_key);
    if (!delete_result) {
      utils::LogStorageError("recover_delete", store_key.substr(0, 120), delete_result.error().message());
    }
  }

  // Replay access order so ties between recovered entries break by recency
  std::sort(recovered.begin(), recovered.end(), [](const CacheEntry& a, const CacheEntry& b) {
    return a.last_accessed_at < b.last_accessed_at;
  });

  size_t loaded = 0;
  {
    std::unique_lock lock(mutex_);
    const auto now = clock_.Now();
    for (auto& entry : recovered) {
      if (entries_.find(entry.canonical_key) != entries_.end()) {
        continue;  // In-memory state is authoritative
      }
      entry.last_access_seq = ++access_seq_;
      entry.popularity_score = policy_.Score(entry, now);
      InsertLocked(std::move(entry));
      ++loaded;
    }
    if (entries_.size() > options_.max_size) {
      EvictLocked(options_.max_size, now, false);
    }
    VerifyCapacityLocked();
  }

  spdlog::info("Cache '{}' recovered {} entries from durable store ({} in memory)", options_.name, loaded,
               size_.load());
  return loaded;
}

Expected<void, Error> EnhancedCache::RunProbe(const LookupFields& fields, const nlohmann::json& value,
                                              std::chrono::milliseconds timeout) {
  if (failed_.load()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kCacheCapacityViolation, "Cache instance is failed and refuses writes", options_.name));
  }
  auto key = KeyCanonicalizer::Canonicalize(fields);
  if (!key) {
    return MakeUnexpected(key.error());
  }

  const auto start = std::chrono::steady_clock::now();

  // Write, read back and delete in one exclusive section; other callers never
  // observe the probe entry
  std::optional<nlohmann::json> read_back;
  bool verified = false;
  {
    std::unique_lock lock(mutex_);
    const auto now = clock_.Now();
    CacheEntry entry;
    entry.canonical_key = *key;
    entry.value = value;
    entry.created_at = now;
    entry.last_accessed_at = now;
    entry.access_count = 1;
    InsertLocked(std::move(entry));

    auto iter = entries_.find(*key);
    if (iter != entries_.end()) {
      read_back = iter->second.value;
    }

    EraseLocked(*key);
    verified = VerifyCapacityLocked();
  }

  if (!verified) {
    return MakeUnexpected(
        MakeError(ErrorCode::kCacheCapacityViolation, "Cache size invariant violated during probe", options_.name));
  }
  if (!read_back.has_value() || *read_back != value) {
    return MakeUnexpected(
        MakeError(ErrorCode::kCacheProbeMismatch, "Probe value read back does not match", options_.name));
  }
  const double elapsed_ms = ElapsedMs(start);
  if (elapsed_ms > static_cast<double>(timeout.count())) {
    return MakeUnexpected(MakeError(ErrorCode::kTimeout,
                                    "Probe round trip took " + std::to_string(elapsed_ms) + "ms", options_.name));
  }
  return {};
}

// ============================================================================
// Metrics and analytics
// ============================================================================

void EnhancedCache::RecordRequest(const std::optional<CacheHit>& hit, double elapsed_ms) {
  std::scoped_lock lock(metrics_mutex_);
  ++counters_.total_requests;
  if (hit.has_value()) {
    ++counters_.hits;
    if (hit->match == MatchKind::kExact) {
      ++counters_.exact_hits;
    } else {
      ++counters_.similarity_hits;
    }
    counters_.total_hit_time_ms += elapsed_ms;
  } else {
    ++counters_.misses;
    counters_.total_miss_time_ms += elapsed_ms;
  }
}

CacheMetrics EnhancedCache::GetMetrics() const {
  CacheMetrics metrics;
  {
    std::scoped_lock lock(metrics_mutex_);
    metrics.hits = counters_.hits;
    metrics.exact_hits = counters_.exact_hits;
    metrics.similarity_hits = counters_.similarity_hits;
    metrics.misses = counters_.misses;
    metrics.total_requests = counters_.total_requests;
    metrics.puts = counters_.puts;
    metrics.evictions = counters_.evictions;
    metrics.expirations = counters_.expirations;
    metrics.total_hit_time_ms = counters_.total_hit_time_ms;
    metrics.total_miss_time_ms = counters_.total_miss_time_ms;
  }
  metrics.cache_size = size_.load();
  metrics.max_size = options_.max_size;

  const MirrorStats mirror_stats = mirror_.GetStats();
  metrics.mirror_successes = mirror_stats.successes;
  metrics.mirror_failures = mirror_stats.failures;
  metrics.consecutive_mirror_failures = mirror_stats.consecutive_failures;
  metrics.degraded = mirror_stats.degraded;
  metrics.failed = failed_.load();
  return metrics;
}

CacheAnalytics EnhancedCache::GetAnalytics() const {
  CacheAnalytics analytics;
  analytics.name = options_.name;
  analytics.max_size = options_.max_size;

  {
    std::shared_lock lock(mutex_);
    const auto now = clock_.Now();
    analytics.cache_size = entries_.size();

    double popularity_sum = 0.0;
    std::vector<EntrySummary> summaries;
    summaries.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
      const double score = policy_.Score(entry, now);
      popularity_sum += score;
      if (entry.embedding.has_value()) {
        ++analytics.entries_with_embedding;
      }
      summaries.push_back({key, entry.access_count, score});
    }
    if (!entries_.empty()) {
      analytics.average_popularity = popularity_sum / static_cast<double>(entries_.size());
    }

    const size_t top_n = std::min(options_.analytics_top_n, summaries.size());
    std::partial_sort(summaries.begin(), summaries.begin() + static_cast<std::ptrdiff_t>(top_n), summaries.end(),
                      [](const EntrySummary& a, const EntrySummary& b) {
                        if (a.access_count != b.access_count) {
                          return a.access_count > b.access_count;
                        }
                        return a.key < b.key;
                      });
    summaries.resize(top_n);
    analytics.top_entries = std::move(summaries);
  }

  analytics.fill_ratio = options_.max_size > 0 ? static_cast<double>(analytics.cache_size) /
                                                     static_cast<double>(options_.max_size)
                                               : 0.0;

  const CacheMetrics metrics = GetMetrics();
  analytics.hit_rate = metrics.HitRate();
  analytics.eviction_rate = metrics.EvictionRate();
  analytics.average_hit_latency_ms = metrics.AverageHitLatencyMs();
  analytics.average_miss_latency_ms = metrics.AverageMissLatencyMs();
  {
    std::scoped_lock lock(metrics_mutex_);
    analytics.hit_rate_trend = trend_.GetAll();
  }
  return analytics;
}

void EnhancedCache::RecordTrendSample() {
  const auto now = clock_.Now();
  const uint64_t size = size_.load();
  std::scoped_lock lock(metrics_mutex_);
  TrendSample sample;
  sample.timestamp = now;
  sample.hit_rate = static_cast<double>(counters_.hits) /
                    static_cast<double>(std::max<uint64_t>(1, counters_.total_requests));
  sample.total_requests = counters_.total_requests;
  sample.cache_size = size;
  trend_.Push(sample);
}

void EnhancedCache::MarkFailed(const std::string& reason) {
  if (!failed_.exchange(true)) {
    utils::LogCacheHealthTransition(options_.name, "failed", reason);
  }
}

}  // namespace semcache::cache

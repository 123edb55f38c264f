/**
 * @file cache_manager.cpp
 * @brief Per-domain cache ownership, routing and maintenance
 */

#include "cache/cache_manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>

#include "utils/structured_log.h"

namespace semcache::cache {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kQueryDomain = "query";
constexpr const char* kFinancialDomain = "financial";
constexpr const char* kTickerDomain = "ticker";

/// Lookup subjects are truncated to this many characters in logs
constexpr size_t kLogSubjectLength = 50;

constexpr int64_t kHoursPerDay = 24;

std::string TruncateForLog(const std::string& subject) {
  if (subject.size() <= kLogSubjectLength) {
    return subject;
  }
  return subject.substr(0, kLogSubjectLength) + "...";
}

EnhancedCacheOptions MakeCacheOptions(const std::string& domain, const config::Config& config) {
  EnhancedCacheOptions options;
  options.name = domain;
  options.max_size = config.cache.max_size;
  options.default_similarity_threshold = config.cache.similarity_threshold;
  options.popularity.frequency_weight = config.cache.popularity.frequency_weight;
  options.popularity.recency_weight = config.cache.popularity.recency_weight;
  options.popularity.half_life_hours = config.cache.popularity.half_life_hours;
  options.popularity.frequency_saturation = config.cache.popularity.frequency_saturation;
  options.analytics_top_n = config.cache.analytics_top_n;
  options.trend_window = config.cache.trend_window;
  options.mirror.timeout_ms = config.storage.mirror_timeout_ms;
  options.mirror.queue_size = config.storage.mirror_queue_size;
  options.mirror.degraded_failure_threshold = config.cache.degraded_failure_threshold;
  return options;
}

}  // namespace

const char* HealthStatusToString(HealthStatus status) {
  switch (status) {
    case HealthStatus::kHealthy:
      return "healthy";
    case HealthStatus::kDegraded:
      return "degraded";
    case HealthStatus::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

nlohmann::json ManagerMetrics::ToJson() const {
  nlohmann::json domains = nlohmann::json::object();
  for (const auto& [name, metrics] : per_domain) {
    domains[name] = metrics.ToJson();
  }

  nlohmann::json json;
  json["domains"] = domains;
  json["overall"] = {{"total_hits", overall.total_hits},
                     {"total_misses", overall.total_misses},
                     {"total_requests", overall.total_requests},
                     {"total_evictions", overall.total_evictions},
                     {"total_cache_size", overall.total_cache_size},
                     {"overall_hit_rate", overall.overall_hit_rate},
                     {"overall_eviction_rate", overall.overall_eviction_rate}};
  return json;
}

nlohmann::json HealthReport::ToJson() const {
  nlohmann::json caches = nlohmann::json::object();
  for (const auto& [name, health] : domains) {
    nlohmann::json entry;
    entry["status"] = HealthStatusToString(health.status);
    if (!health.error.empty()) {
      entry["error"] = health.error;
    }
    entry["metrics"] = health.metrics.ToJson();
    caches[name] = entry;
  }

  nlohmann::json json;
  json["timestamp"] = timestamp;
  json["overall_status"] = HealthStatusToString(overall_status);
  json["caches"] = caches;
  return json;
}

// ============================================================================
// Warm-up seed file
// ============================================================================

Expected<std::vector<WarmUpSeed>, Error> LoadWarmUpSeeds(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Cannot open warm-up seed file", path));
  }

  auto document = nlohmann::json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Warm-up seed file is not valid JSON", path));
  }
  if (!document.is_array()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Warm-up seed file must contain a JSON array", path));
  }

  std::vector<WarmUpSeed> seeds;
  seeds.reserve(document.size());
  for (size_t i = 0; i < document.size(); ++i) {
    const auto& item = document[i];
    const std::string where = path + "[" + std::to_string(i) + "]";
    if (!item.is_object() || !item.contains("domain") || !item["domain"].is_string() || !item.contains("fields") ||
        !item.contains("value")) {
      return MakeUnexpected(
          MakeError(ErrorCode::kInvalidArgument, "Seed needs string 'domain', 'fields' and 'value'", where));
    }

    auto fields = LookupFields::FromJson(item["fields"]);
    if (!fields) {
      return MakeUnexpected(MakeError(fields.error().code(), fields.error().message(), where));
    }

    WarmUpSeed seed;
    seed.domain = item["domain"].get<std::string>();
    seed.fields = std::move(*fields);
    seed.value = item["value"];

    if (item.contains("embedding") && !item["embedding"].is_null()) {
      const auto& embedding = item["embedding"];
      if (!embedding.is_array()) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Seed 'embedding' must be an array", where));
      }
      std::vector<float> values;
      values.reserve(embedding.size());
      for (const auto& component : embedding) {
        if (!component.is_number()) {
          return MakeUnexpected(
              MakeError(ErrorCode::kInvalidArgument, "Seed 'embedding' must contain only numbers", where));
        }
        values.push_back(component.get<float>());
      }
      seed.embedding = std::move(values);
    }
    seeds.push_back(std::move(seed));
  }
  return seeds;
}

// ============================================================================
// Construction and routing
// ============================================================================

CacheManager::CacheManager(const config::Config& config, const StoreFactory& store_factory,
                           const utils::Clock& clock)
    : config_(config.cache), probe_timeout_(config.health.probe_timeout_ms), clock_(clock) {
  for (const auto& domain : config.cache.domains) {
    std::shared_ptr<storage::DocumentStore> store;
    if (store_factory) {
      store = store_factory(domain);
    }
    if (store == nullptr) {
      spdlog::info("Cache '{}' created without durable store", domain);
    }
    caches_.emplace(domain, std::make_unique<EnhancedCache>(MakeCacheOptions(domain, config), std::move(store), clock_));
  }
  spdlog::info("Cache manager initialized: {} domains, max_size={} per domain", caches_.size(), config_.max_size);
}

Expected<EnhancedCache*, Error> CacheManager::Route(const std::string& domain) const {
  auto iter = caches_.find(domain);
  if (iter == caches_.end()) {
    return MakeUnexpected(MakeError(ErrorCode::kCacheUnknownDomain, "Unknown cache domain", domain));
  }
  return iter->second.get();
}

EnhancedCache* CacheManager::GetCache(const std::string& domain) const {
  auto iter = caches_.find(domain);
  return iter != caches_.end() ? iter->second.get() : nullptr;
}

std::vector<std::string> CacheManager::Domains() const {
  std::vector<std::string> names;
  names.reserve(caches_.size());
  for (const auto& [name, cache] : caches_) {
    names.push_back(name);
  }
  return names;
}

// ============================================================================
// Generic access
// ============================================================================

Expected<std::optional<CacheHit>, Error> CacheManager::Get(const std::string& domain, const LookupFields& fields,
                                                           const std::optional<std::vector<float>>& embedding,
                                                           std::optional<double> threshold) {
  auto cache = Route(domain);
  if (!cache) {
    return MakeUnexpected(cache.error());
  }
  return (*cache)->Get(fields, embedding, threshold);
}

Expected<void, Error> CacheManager::Put(const std::string& domain, const LookupFields& fields, nlohmann::json value,
                                        std::optional<std::vector<float>> embedding) {
  auto cache = Route(domain);
  if (!cache) {
    return MakeUnexpected(cache.error());
  }
  return (*cache)->Put(fields, std::move(value), std::move(embedding));
}

void CacheManager::LogLookup(const std::string& domain, const std::string& subject,
                             const Expected<std::optional<CacheHit>, Error>& result) const {
  if (!result) {
    utils::StructuredLog()
        .Event("cache_lookup_error")
        .Field("cache", domain)
        .Field("subject", TruncateForLog(subject))
        .Field("error", result.error().to_string())
        .Warn();
    return;
  }
  if (result->has_value()) {
    const auto& hit = **result;
    spdlog::info("Cache hit [{}] ({}, similarity={:.3f}): {}", domain, MatchKindToString(hit.match), hit.similarity,
                 TruncateForLog(subject));
  } else {
    spdlog::debug("Cache miss [{}]: {}", domain, TruncateForLog(subject));
  }
}

// ============================================================================
// Typed domain wrappers
// ============================================================================

Expected<std::optional<CacheHit>, Error> CacheManager::GetQuery(const std::string& query, bool is_first_message,
                                                                const std::optional<std::vector<float>>& embedding,
                                                                std::optional<double> threshold) {
  auto result = Get(kQueryDomain, QueryLookup{query, is_first_message}.ToFields(), embedding, threshold);
  LogLookup(kQueryDomain, query, result);
  return result;
}

Expected<void, Error> CacheManager::PutQuery(const std::string& query, nlohmann::json result, bool is_first_message,
                                             std::optional<std::vector<float>> embedding) {
  return Put(kQueryDomain, QueryLookup{query, is_first_message}.ToFields(), std::move(result), std::move(embedding));
}

Expected<std::optional<CacheHit>, Error> CacheManager::GetFinancial(const std::string& ticker,
                                                                    const std::string& data_type) {
  auto result = Get(kFinancialDomain, FinancialLookup{ticker, data_type}.ToFields());
  LogLookup(kFinancialDomain, ticker, result);
  return result;
}

Expected<void, Error> CacheManager::PutFinancial(const std::string& ticker, nlohmann::json data,
                                                 const std::string& data_type) {
  return Put(kFinancialDomain, FinancialLookup{ticker, data_type}.ToFields(), std::move(data));
}

Expected<std::optional<CacheHit>, Error> CacheManager::GetTicker(const std::string& company_name) {
  auto result = Get(kTickerDomain, TickerLookup{company_name}.ToFields());
  LogLookup(kTickerDomain, company_name, result);
  return result;
}

Expected<void, Error> CacheManager::PutTicker(const std::string& company_name, nlohmann::json ticker_data) {
  return Put(kTickerDomain, TickerLookup{company_name}.ToFields(), std::move(ticker_data));
}

// ============================================================================
// Maintenance
// ============================================================================

std::map<std::string, size_t> CacheManager::ClearExpired(uint32_t max_age_days) {
  const auto max_age = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::hours(kHoursPerDay * static_cast<int64_t>(max_age_days)));
  std::map<std::string, size_t> removed;
  for (const auto& [name, cache] : caches_) {
    removed[name] = cache->ClearExpired(max_age);
  }
  return removed;
}

std::map<std::string, OptimizeReport> CacheManager::Optimize() {
  const auto target = static_cast<size_t>(
      std::floor(static_cast<double>(config_.max_size) * config_.optimize_fill_ratio));
  const auto max_age = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::hours(kHoursPerDay * static_cast<int64_t>(config_.expiry_max_age_days)));

  std::map<std::string, OptimizeReport> reports;
  for (const auto& [name, cache] : caches_) {
    OptimizeReport report;
    report.size_before = cache->Size();
    if (report.size_before > target) {
      report.evicted = cache->Evict(target);
    }
    report.expired = cache->ClearExpired(max_age);
    cache->RecordTrendSample();
    report.size_after = cache->Size();

    utils::StructuredLog()
        .Event("cache_optimized")
        .Field("cache", name)
        .Field("size_before", report.size_before)
        .Field("evicted", report.evicted)
        .Field("expired", report.expired)
        .Field("size_after", report.size_after)
        .Info();
    reports[name] = report;
  }
  return reports;
}

HealthReport CacheManager::HealthCheck() {
  HealthReport report;
  report.timestamp = utils::FormatIso8601(clock_.Now());

  for (const auto& [name, cache] : caches_) {
    DomainHealth health;

    const std::string probe_id = "health-" + std::to_string(utils::ToUnixMillis(clock_.Now())) + "-" +
                                 std::to_string(probe_counter_.fetch_add(1) + 1);
    const nlohmann::json probe_value = {{"probe_id", probe_id}, {"ok", true}};
    auto probe = cache->RunProbe(ProbeLookup{probe_id}.ToFields(), probe_value, probe_timeout_);

    if (!probe) {
      const auto code = probe.error().code();
      health.error = probe.error().to_string();
      health.status = (code == ErrorCode::kCacheProbeMismatch || code == ErrorCode::kTimeout)
                          ? HealthStatus::kDegraded
                          : HealthStatus::kUnhealthy;
    } else if (cache->IsDegraded()) {
      health.status = HealthStatus::kDegraded;
      health.error = "Durable mirror is degraded";
    }
    if (cache->IsFailed()) {
      health.status = HealthStatus::kUnhealthy;
      if (health.error.empty()) {
        health.error = "Cache instance is failed";
      }
    }
    health.metrics = cache->GetMetrics();

    if (health.status != HealthStatus::kHealthy) {
      utils::StructuredLog()
          .Event("cache_health_check_failed")
          .Field("cache", name)
          .Field("status", HealthStatusToString(health.status))
          .Field("error", health.error)
          .Error();
    }

    report.overall_status = std::max(report.overall_status, health.status);
    report.domains[name] = std::move(health);
  }
  return report;
}

WarmUpReport CacheManager::WarmUp(const std::vector<WarmUpSeed>& seeds) {
  WarmUpReport report;
  for (const auto& seed : seeds) {
    auto result = Put(seed.domain, seed.fields, seed.value, seed.embedding);
    if (!result) {
      ++report.skipped;
      utils::StructuredLog()
          .Event("cache_warmup_seed_failed")
          .Field("cache", seed.domain)
          .Field("error", result.error().to_string())
          .Warn();
      continue;
    }
    ++report.loaded;
  }
  spdlog::info("Cache warm-up complete: {} loaded, {} skipped", report.loaded, report.skipped);
  return report;
}

std::map<std::string, size_t> CacheManager::RecoverAll() {
  std::map<std::string, size_t> loaded;
  for (const auto& [name, cache] : caches_) {
    auto result = cache->Recover();
    if (!result) {
      utils::StructuredLog()
          .Event("cache_recover_failed")
          .Field("cache", name)
          .Field("error", result.error().to_string())
          .Error();
      continue;
    }
    loaded[name] = *result;
    spdlog::info("Cache '{}' recovered {} entries", name, *result);
  }
  return loaded;
}

bool CacheManager::FlushMirrors() {
  bool drained = true;
  for (const auto& [name, cache] : caches_) {
    drained = cache->FlushMirror() && drained;
  }
  return drained;
}

// ============================================================================
// Observability
// ============================================================================

ManagerMetrics CacheManager::GetMetrics() const {
  ManagerMetrics result;
  for (const auto& [name, cache] : caches_) {
    auto metrics = cache->GetMetrics();
    result.overall.total_hits += metrics.hits;
    result.overall.total_misses += metrics.misses;
    result.overall.total_requests += metrics.total_requests;
    result.overall.total_evictions += metrics.evictions;
    result.overall.total_cache_size += metrics.cache_size;
    result.per_domain[name] = metrics;
  }
  const auto denominator = static_cast<double>(std::max<uint64_t>(1, result.overall.total_requests));
  result.overall.overall_hit_rate = static_cast<double>(result.overall.total_hits) / denominator;
  result.overall.overall_eviction_rate = static_cast<double>(result.overall.total_evictions) / denominator;
  return result;
}

std::map<std::string, CacheAnalytics> CacheManager::GetAnalytics() const {
  std::map<std::string, CacheAnalytics> result;
  for (const auto& [name, cache] : caches_) {
    result[name] = cache->GetAnalytics();
  }
  return result;
}

}  // namespace semcache::cache

/**
 * @file cache_manager.h
 * @brief Owner of the per-domain cache instances
 */

#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cache/cache_key.h"
#include "cache/cache_statistics.h"
#include "cache/enhanced_cache.h"
#include "config/config.h"
#include "storage/document_store.h"
#include "utils/clock.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace semcache::cache {

/**
 * @brief Creates the durable store of a domain (nullptr = no durability)
 */
using StoreFactory = std::function<std::shared_ptr<storage::DocumentStore>(const std::string& domain)>;

/**
 * @brief Totals across every domain
 */
struct OverallMetrics {
  uint64_t total_hits = 0;
  uint64_t total_misses = 0;
  uint64_t total_requests = 0;
  uint64_t total_evictions = 0;
  uint64_t total_cache_size = 0;
  double overall_hit_rate = 0.0;       ///< total_hits / max(1, total_requests)
  double overall_eviction_rate = 0.0;  ///< total_evictions / max(1, total_requests)
};

/**
 * @brief Per-domain and aggregate metrics
 */
struct ManagerMetrics {
  std::map<std::string, CacheMetrics> per_domain;
  OverallMetrics overall;

  [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Outcome of Optimize() for one domain
 */
struct OptimizeReport {
  uint64_t size_before = 0;
  uint64_t evicted = 0;
  uint64_t expired = 0;
  uint64_t size_after = 0;
};

/**
 * @brief Health status, ordered from best to worst
 */
enum class HealthStatus : std::uint8_t {
  kHealthy = 0,
  kDegraded = 1,
  kUnhealthy = 2,
};

const char* HealthStatusToString(HealthStatus status);

/**
 * @brief Health of one domain
 */
struct DomainHealth {
  HealthStatus status = HealthStatus::kHealthy;
  std::string error;     ///< Why the domain is not healthy
  CacheMetrics metrics;  ///< Snapshot taken after the probe
};

/**
 * @brief Result of HealthCheck()
 */
struct HealthReport {
  std::string timestamp;  ///< ISO-8601 UTC
  HealthStatus overall_status = HealthStatus::kHealthy;
  std::map<std::string, DomainHealth> domains;

  [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief One warm-up request
 */
struct WarmUpSeed {
  std::string domain;
  LookupFields fields;
  nlohmann::json value;
  std::optional<std::vector<float>> embedding;
};

/**
 * @brief Result of WarmUp()
 */
struct WarmUpReport {
  size_t loaded = 0;
  size_t skipped = 0;
};

/**
 * @brief Parse a warm-up seed file
 *
 * Format: a JSON array of {"domain", "fields", "value", "embedding"?}, where
 * "fields" uses the LookupFields::ToJson() form.
 */
utils::Expected<std::vector<WarmUpSeed>, utils::Error> LoadWarmUpSeeds(const std::string& path);

/**
 * @brief Owns one EnhancedCache per configured domain
 *
 * Constructed once at process start and handed to consumers by reference.
 * The set of domains is fixed for the lifetime of the manager.
 *
 * Example:
 * @code
 * utils::SystemClock clock;
 * CacheManager manager(config, [](const std::string&) { return std::make_shared<MemoryDocumentStore>(); }, clock);
 * manager.PutTicker("Apple Inc", {{"ticker", "AAPL"}});
 * auto hit = manager.GetTicker("Apple Inc");
 * @endcode
 */
class CacheManager {
 public:
  /**
   * @param config Daemon configuration (cache, storage and health sections are used)
   * @param store_factory Creates the durable store of each domain
   * @param clock Time source (must outlive this object)
   */
  CacheManager(const config::Config& config, const StoreFactory& store_factory, const utils::Clock& clock);

  ~CacheManager() = default;

  CacheManager(const CacheManager&) = delete;
  CacheManager& operator=(const CacheManager&) = delete;
  CacheManager(CacheManager&&) = delete;
  CacheManager& operator=(CacheManager&&) = delete;

  // --------------------------------------------------------------------------
  // Generic access
  // --------------------------------------------------------------------------

  /**
   * @brief Look up a value in a domain
   * @return kCacheUnknownDomain for an unconfigured domain, otherwise as EnhancedCache::Get()
   */
  utils::Expected<std::optional<CacheHit>, utils::Error> Get(
      const std::string& domain, const LookupFields& fields,
      const std::optional<std::vector<float>>& embedding = std::nullopt,
      std::optional<double> threshold = std::nullopt);

  /**
   * @brief Store a value in a domain
   */
  utils::Expected<void, utils::Error> Put(const std::string& domain, const LookupFields& fields,
                                          nlohmann::json value,
                                          std::optional<std::vector<float>> embedding = std::nullopt);

  // --------------------------------------------------------------------------
  // Typed domain wrappers
  // --------------------------------------------------------------------------

  utils::Expected<std::optional<CacheHit>, utils::Error> GetQuery(
      const std::string& query, bool is_first_message = false,
      const std::optional<std::vector<float>>& embedding = std::nullopt,
      std::optional<double> threshold = std::nullopt);

  utils::Expected<void, utils::Error> PutQuery(const std::string& query, nlohmann::json result,
                                               bool is_first_message = false,
                                               std::optional<std::vector<float>> embedding = std::nullopt);

  utils::Expected<std::optional<CacheHit>, utils::Error> GetFinancial(const std::string& ticker,
                                                                      const std::string& data_type = "llm_data");

  utils::Expected<void, utils::Error> PutFinancial(const std::string& ticker, nlohmann::json data,
                                                   const std::string& data_type = "llm_data");

  utils::Expected<std::optional<CacheHit>, utils::Error> GetTicker(const std::string& company_name);

  utils::Expected<void, utils::Error> PutTicker(const std::string& company_name, nlohmann::json ticker_data);

  // --------------------------------------------------------------------------
  // Maintenance
  // --------------------------------------------------------------------------

  /**
   * @brief Expiry sweep on every domain
   * @return Entries removed per domain
   */
  std::map<std::string, size_t> ClearExpired(uint32_t max_age_days);

  /**
   * @brief Early eviction for domains above optimize_fill_ratio, then an
   *        expiry sweep at expiry_max_age_days, then a hit-rate trend sample
   */
  std::map<std::string, OptimizeReport> Optimize();

  /**
   * @brief Probe every domain
   *
   * Per domain: unhealthy if the probe errors or the instance is failed;
   * degraded on a value mismatch, a slow probe or a degraded mirror;
   * otherwise healthy. The overall status is the worst domain status.
   */
  HealthReport HealthCheck();

  /**
   * @brief Best-effort pre-population (failed seeds are logged and skipped)
   */
  WarmUpReport WarmUp(const std::vector<WarmUpSeed>& seeds);

  /**
   * @brief Recover every domain from its durable store
   * @return Entries loaded per domain (failed domains are logged and omitted)
   */
  std::map<std::string, size_t> RecoverAll();

  /**
   * @brief Wait for queued durable writes of every domain
   * @return false if any domain's mirror did not drain in time
   */
  bool FlushMirrors();

  // --------------------------------------------------------------------------
  // Observability
  // --------------------------------------------------------------------------

  [[nodiscard]] ManagerMetrics GetMetrics() const;

  [[nodiscard]] std::map<std::string, CacheAnalytics> GetAnalytics() const;

  /**
   * @brief Domain instance, or nullptr if not configured
   */
  [[nodiscard]] EnhancedCache* GetCache(const std::string& domain) const;

  [[nodiscard]] std::vector<std::string> Domains() const;

  [[nodiscard]] size_t MaxSize() const { return config_.max_size; }

 private:
  utils::Expected<EnhancedCache*, utils::Error> Route(const std::string& domain) const;

  void LogLookup(const std::string& domain, const std::string& subject,
                 const utils::Expected<std::optional<CacheHit>, utils::Error>& result) const;

  config::CacheConfig config_;
  std::chrono::milliseconds probe_timeout_;
  const utils::Clock& clock_;
  std::map<std::string, std::unique_ptr<EnhancedCache>> caches_;
  std::atomic<uint64_t> probe_counter_{0};
};

}  // namespace semcache::cache

/**
 * @file config.h
 * @brief Configuration structures and YAML loader for semcache
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace semcache::config {

// Default values for configuration
namespace defaults {

// Cache defaults
constexpr size_t kMaxSize = 1000;
constexpr double kSimilarityThreshold = 0.9;
constexpr double kFrequencyWeight = 0.6;
constexpr double kRecencyWeight = 0.4;
constexpr double kHalfLifeHours = 72.0;
constexpr double kFrequencySaturation = 100.0;
constexpr double kOptimizeFillRatio = 0.8;
constexpr uint32_t kExpiryMaxAgeDays = 30;
constexpr uint32_t kExpiryMaxAgeDaysLimit = 36500;
constexpr uint32_t kDegradedFailureThreshold = 3;
constexpr size_t kAnalyticsTopN = 10;
constexpr size_t kTrendWindow = 24;

// Storage defaults
constexpr const char* kStorageDir = "./data";
constexpr uint32_t kMirrorTimeoutMs = 500;
constexpr size_t kMirrorQueueSize = 10000;
constexpr size_t kCompactMinRecords = 1024;

// Maintenance defaults
constexpr uint32_t kOptimizeIntervalSec = 3600;
constexpr uint32_t kExpiryIntervalSec = 86400;
constexpr uint32_t kPollIntervalMs = 1000;

// Health defaults
constexpr uint32_t kProbeTimeoutMs = 1000;

}  // namespace defaults

/**
 * @brief Popularity scoring weights
 */
struct PopularityConfig {
  double frequency_weight = defaults::kFrequencyWeight;          ///< Weight of normalized access count
  double recency_weight = defaults::kRecencyWeight;              ///< Weight of recency decay
  double half_life_hours = defaults::kHalfLifeHours;             ///< Recency half-life
  double frequency_saturation = defaults::kFrequencySaturation;  ///< Access count at which frequency term is 1
};

/**
 * @brief Cache configuration (shared by every domain instance)
 */
struct CacheConfig {
  size_t max_size = defaults::kMaxSize;                                        ///< Entries per domain
  std::vector<std::string> domains = {"query", "financial", "ticker"};         ///< Domain instances created
  double similarity_threshold = defaults::kSimilarityThreshold;                ///< Default similarity threshold
  PopularityConfig popularity;                                                 ///< Eviction scoring
  double optimize_fill_ratio = defaults::kOptimizeFillRatio;                   ///< Optimize evicts above this fill
  uint32_t expiry_max_age_days = defaults::kExpiryMaxAgeDays;                  ///< Age for optimize/scheduled sweeps
  uint32_t degraded_failure_threshold = defaults::kDegradedFailureThreshold;  ///< Consecutive mirror failures
  size_t analytics_top_n = defaults::kAnalyticsTopN;                           ///< Entries in analytics ranking
  size_t trend_window = defaults::kTrendWindow;                                ///< Hit rate samples kept
};

/**
 * @brief Durable store configuration
 */
struct StorageConfig {
  std::string dir = defaults::kStorageDir;                   ///< Journal directory (empty = no durability)
  uint32_t mirror_timeout_ms = defaults::kMirrorTimeoutMs;   ///< Slower store calls count as failures
  size_t mirror_queue_size = defaults::kMirrorQueueSize;     ///< Pending mirror operations per domain
  size_t compact_min_records = defaults::kCompactMinRecords;  ///< Dead records before journal compaction
};

/**
 * @brief Background maintenance configuration
 */
struct MaintenanceConfig {
  bool enabled = true;
  uint32_t optimize_interval_sec = defaults::kOptimizeIntervalSec;
  uint32_t expiry_interval_sec = defaults::kExpiryIntervalSec;
  uint32_t poll_interval_ms = defaults::kPollIntervalMs;
};

/**
 * @brief Health check configuration
 */
struct HealthConfig {
  uint32_t probe_timeout_ms = defaults::kProbeTimeoutMs;  ///< Probe round trip limit
};

/**
 * @brief Warm-up configuration
 */
struct WarmUpConfig {
  std::string seed_file;  ///< JSON file of seed requests (empty = none)
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< trace, debug, info, warn, error
  bool json = true;            ///< Structured events as JSON (false = key=value text)
  std::string file;            ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  CacheConfig cache;
  StorageConfig storage;
  MaintenanceConfig maintenance;
  HealthConfig health;
  WarmUpConfig warmup;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML file
 *
 * The document is converted to JSON and checked against the embedded JSON
 * Schema before it is parsed, then validated semantically.
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with loaded configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration values
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace semcache::config

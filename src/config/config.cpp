/**
 * @file config.cpp
 * @brief Configuration parser implementation for semcache
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace semcache::config {

namespace {

// Allowed drift of frequency_weight + recency_weight from 1
constexpr double kWeightSumTolerance = 1e-6;

/**
 * @brief Convert a YAML scalar to the narrowest matching JSON type
 */
nlohmann::json ScalarToJson(const YAML::Node& yaml_node) {
  int64_t int_value = 0;
  if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
    return int_value;
  }
  double double_value = 0.0;
  if (YAML::convert<double>::decode(yaml_node, double_value)) {
    return double_value;
  }
  bool bool_value = false;
  if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
    return bool_value;
  }
  return yaml_node.as<std::string>();
}

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * @param yaml_node YAML node to convert
 * @return nlohmann::json JSON representation
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    return ScalarToJson(yaml_node);
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      json_object[pair.first.as<std::string>()] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Parse popularity weights
 */
PopularityConfig ParsePopularityConfig(const YAML::Node& node) {
  PopularityConfig config;

  if (node["frequency_weight"]) {
    config.frequency_weight = node["frequency_weight"].as<double>();
  }
  if (node["recency_weight"]) {
    config.recency_weight = node["recency_weight"].as<double>();
  }
  if (node["half_life_hours"]) {
    config.half_life_hours = node["half_life_hours"].as<double>();
  }
  if (node["frequency_saturation"]) {
    config.frequency_saturation = node["frequency_saturation"].as<double>();
  }

  return config;
}

/**
 * @brief Parse cache configuration
 */
CacheConfig ParseCacheConfig(const YAML::Node& node) {
  CacheConfig config;

  if (node["max_size"]) {
    config.max_size = node["max_size"].as<size_t>();
  }
  if (node["domains"]) {
    config.domains = node["domains"].as<std::vector<std::string>>();
  }
  if (node["similarity_threshold"]) {
    config.similarity_threshold = node["similarity_threshold"].as<double>();
  }
  if (node["popularity"]) {
    config.popularity = ParsePopularityConfig(node["popularity"]);
  }
  if (node["optimize_fill_ratio"]) {
    config.optimize_fill_ratio = node["optimize_fill_ratio"].as<double>();
  }
  if (node["expiry_max_age_days"]) {
    config.expiry_max_age_days = node["expiry_max_age_days"].as<uint32_t>();
  }
  if (node["degraded_failure_threshold"]) {
    config.degraded_failure_threshold = node["degraded_failure_threshold"].as<uint32_t>();
  }
  if (node["analytics_top_n"]) {
    config.analytics_top_n = node["analytics_top_n"].as<size_t>();
  }
  if (node["trend_window"]) {
    config.trend_window = node["trend_window"].as<size_t>();
  }

  return config;
}

/**
 * @brief Parse storage configuration
 */
StorageConfig ParseStorageConfig(const YAML::Node& node) {
  StorageConfig config;

  if (node["dir"]) {
    config.dir = node["dir"].as<std::string>();
  }
  if (node["mirror_timeout_ms"]) {
    config.mirror_timeout_ms = node["mirror_timeout_ms"].as<uint32_t>();
  }
  if (node["mirror_queue_size"]) {
    config.mirror_queue_size = node["mirror_queue_size"].as<size_t>();
  }
  if (node["compact_min_records"]) {
    config.compact_min_records = node["compact_min_records"].as<size_t>();
  }

  return config;
}

/**
 * @brief Parse maintenance configuration
 */
MaintenanceConfig ParseMaintenanceConfig(const YAML::Node& node) {
  MaintenanceConfig config;

  if (node["enabled"]) {
    config.enabled = node["enabled"].as<bool>();
  }
  if (node["optimize_interval_sec"]) {
    config.optimize_interval_sec = node["optimize_interval_sec"].as<uint32_t>();
  }
  if (node["expiry_interval_sec"]) {
    config.expiry_interval_sec = node["expiry_interval_sec"].as<uint32_t>();
  }
  if (node["poll_interval_ms"]) {
    config.poll_interval_ms = node["poll_interval_ms"].as<uint32_t>();
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["json"]) {
    config.json = node["json"].as<bool>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  json schema_json = json::parse(kConfigSchemaJson, nullptr, false);
  if (schema_json.is_discarded()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Embedded configuration schema is not valid JSON"));
  }

  try {
    json_validator validator;
    validator.set_root_schema(schema_json);
    validator.validate(config_json);
  } catch (const std::exception& e) {
    std::stringstream err_msg;
    err_msg << "Configuration validation failed: " << e.what() << "\n";
    err_msg << "  Check for unknown keys, wrong value types and out of range values.";
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
  }

  utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    // Load YAML file
    YAML::Node root = YAML::LoadFile(path);

    // An empty file is a valid configuration with every default
    nlohmann::json config_json = root.IsNull() ? nlohmann::json::object() : YamlToJson(root);

    // Validate against JSON Schema
    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    // Parse each section
    if (root["cache"]) {
      config.cache = ParseCacheConfig(root["cache"]);
    }
    if (root["storage"]) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root["maintenance"]) {
      config.maintenance = ParseMaintenanceConfig(root["maintenance"]);
    }
    if (root["health"] && root["health"]["probe_timeout_ms"]) {
      config.health.probe_timeout_ms = root["health"]["probe_timeout_ms"].as<uint32_t>();
    }
    if (root["warmup"] && root["warmup"]["seed_file"]) {
      config.warmup.seed_file = root["warmup"]["seed_file"].as<std::string>();
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    // Validate configuration (semantic validation)
    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what()),
                         path));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what()), path));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what()), path));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate cache configuration
  if (config.cache.max_size == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.max_size must be greater than 0"));
  }
  if (config.cache.domains.empty()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.domains must list at least one domain"));
  }
  for (size_t i = 0; i < config.cache.domains.size(); ++i) {
    const auto& domain = config.cache.domains[i];
    if (domain.empty() || domain.find_first_of("/|") != std::string::npos) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.domains contains an invalid name: " + domain));
    }
    for (size_t j = 0; j < i; ++j) {
      if (config.cache.domains[j] == domain) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.domains contains duplicate: " + domain));
      }
    }
  }
  if (!(config.cache.similarity_threshold > 0.0 && config.cache.similarity_threshold <= 1.0)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.similarity_threshold must be in (0, 1]"));
  }

  const auto& popularity = config.cache.popularity;
  if (popularity.frequency_weight < 0.0 || popularity.recency_weight < 0.0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.popularity weights must be >= 0"));
  }
  if (std::abs(popularity.frequency_weight + popularity.recency_weight - 1.0) > kWeightSumTolerance) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue, "cache.popularity.frequency_weight + recency_weight must equal 1"));
  }
  if (popularity.half_life_hours <= 0.0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.popularity.half_life_hours must be > 0"));
  }
  if (popularity.frequency_saturation <= 0.0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.popularity.frequency_saturation must be > 0"));
  }
  if (!(config.cache.optimize_fill_ratio > 0.0 && config.cache.optimize_fill_ratio <= 1.0)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.optimize_fill_ratio must be in (0, 1]"));
  }
  if (config.cache.expiry_max_age_days == 0 || config.cache.expiry_max_age_days > defaults::kExpiryMaxAgeDaysLimit) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "cache.expiry_max_age_days must be in [1, " + std::to_string(defaults::kExpiryMaxAgeDaysLimit) + "]"));
  }
  if (config.cache.degraded_failure_threshold == 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "cache.degraded_failure_threshold must be greater than 0"));
  }
  if (config.cache.trend_window == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.trend_window must be greater than 0"));
  }

  // Validate storage configuration
  if (config.storage.mirror_timeout_ms == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "storage.mirror_timeout_ms must be greater than 0"));
  }
  if (config.storage.mirror_queue_size == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "storage.mirror_queue_size must be greater than 0"));
  }

  // Validate maintenance configuration
  if (config.maintenance.optimize_interval_sec == 0 || config.maintenance.expiry_interval_sec == 0 ||
      config.maintenance.poll_interval_ms == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "maintenance intervals must be greater than 0"));
  }

  // Validate health configuration
  if (config.health.probe_timeout_ms == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "health.probe_timeout_ms must be greater than 0"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

}  // namespace semcache::config

/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON-formatted logs
 *
 * Provides a builder for logging events in structured JSON (or key=value text)
 * format, plus helpers for the cache, mirror and storage events emitted by
 * semcache, so logs can be parsed programmatically for monitoring.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace semcache::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief One-line structured event, rendered as JSON or key=value text
 *
 * @code
 * StructuredLog()
 *   .Event("cache_put_rejected")
 *   .Field("cache", name)
 *   .Field("size", size)
 *   .Warn();
 * @endcode
 *
 * Fields keep insertion order in both formats. Numbers and booleans are
 * emitted unquoted.
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Parse "json" / "text" (anything else is JSON)
   */
  static LogFormat ParseFormat(const std::string& format_str) {
    return format_str == "text" ? LogFormat::TEXT : LogFormat::JSON;
  }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) {
    fields_[key] = value != nullptr ? value : "";
    return *this;
  }

  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_[key] = std::string(value);
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_[key] = value;
    return *this;
  }

  template <typename T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
  StructuredLog& Field(const std::string& key, T value) {
    fields_[key] = value;
    return *this;
  }

  void Error() const { spdlog::error("{}", Build()); }
  void Warn() const { spdlog::warn("{}", Build()); }
  void Info() const { spdlog::info("{}", Build()); }
  void Debug() const { spdlog::debug("{}", Build()); }
  void Critical() const { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the event in the current global format
   */
  [[nodiscard]] std::string Build() const {
    return GetFormat() == LogFormat::TEXT ? BuildText() : BuildJSON();
  }

 private:
  std::string event_;
  std::string message_;
  nlohmann::ordered_json fields_ = nlohmann::ordered_json::object();
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};

  std::string BuildJSON() const {
    nlohmann::ordered_json line = nlohmann::ordered_json::object();
    if (!event_.empty()) {
      line["event"] = event_;
    }
    if (!message_.empty()) {
      line["message"] = message_;
    }
    for (const auto& [key, value] : fields_.items()) {
      line[key] = value;
    }
    // Invalid UTF-8 in user text is replaced rather than thrown
    return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  }

  std::string BuildText() const {
    std::string text;
    auto append = [&text](const std::string& key, const std::string& value) {
      if (!text.empty()) {
        text += ' ';
      }
      text += key;
      text += '=';
      text += value;
    };

    if (!event_.empty()) {
      append("event", QuoteIfNeeded(event_));
    }
    if (!message_.empty()) {
      append("message", Quote(message_));
    }
    for (const auto& [key, value] : fields_.items()) {
      append(key, value.is_string() ? QuoteIfNeeded(value.get<std::string>())
                                    : value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
    }
    return text;
  }

  static std::string QuoteIfNeeded(const std::string& value) {
    if (value.empty() || value.find_first_of(" \"\n\r\t=") != std::string::npos) {
      return Quote(value);
    }
    return value;
  }

  /// JSON string quoting doubles as text-format quoting
  static std::string Quote(const std::string& value) {
    return nlohmann::ordered_json(value).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  }
};

/**
 * @brief Log durable mirror failure in structured format
 */
inline void LogMirrorFailure(const std::string& cache_name, const std::string& operation, const std::string& key,
                             uint64_t consecutive_failures, const std::string& error_msg) {
  // Canonical keys embed user queries; cap what reaches the log
  constexpr size_t kMaxKeyLogLength = 120;

  StructuredLog()
      .Event("cache_mirror_failure")
      .Field("cache", cache_name)
      .Field("operation", operation)
      .Field("key", key.substr(0, kMaxKeyLogLength))
      .Field("consecutive_failures", consecutive_failures)
      .Field("error", error_msg)
      .Warn();
}

/**
 * @brief Log cache health transition (degraded / recovered / failed)
 */
inline void LogCacheHealthTransition(const std::string& cache_name, const std::string& state,
                                     const std::string& reason) {
  auto log = StructuredLog().Event("cache_health_transition").Field("cache", cache_name).Field("state", state);
  log.Field("reason", reason);
  if (state == "failed") {
    log.Critical();
  } else if (state == "degraded") {
    log.Warn();
  } else {
    log.Info();
  }
}

/**
 * @brief Log eviction batch
 */
inline void LogEviction(const std::string& cache_name, uint64_t evicted, uint64_t size_after, uint64_t target_size) {
  StructuredLog()
      .Event("cache_eviction")
      .Field("cache", cache_name)
      .Field("evicted", evicted)
      .Field("size_after", size_after)
      .Field("target_size", target_size)
      .Debug();
}

/**
 * @brief Log expiry sweep
 */
inline void LogExpirySweep(const std::string& cache_name, uint64_t removed, double max_age_hours) {
  auto log = StructuredLog()
                 .Event("cache_expiry_sweep")
                 .Field("cache", cache_name)
                 .Field("removed", removed)
                 .Field("max_age_hours", max_age_hours);
  if (removed > 0) {
    log.Info();
  } else {
    log.Debug();
  }
}

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage info in structured format
 */
inline void LogStorageInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_info").Field("operation", operation).Field("message", message).Info();
}

/**
 * @brief Log storage warning in structured format
 */
inline void LogStorageWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_warning").Field("operation", operation).Field("message", message).Warn();
}

}  // namespace semcache::utils

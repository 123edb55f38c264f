/**
 * @file error.h
 * @brief Error codes and error value used with Expected<T, Error>
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace semcache::utils {

/**
 * @brief Error codes
 *
 * Grouped by subsystem. Values are stable and may appear in logs.
 */
enum class ErrorCode : std::uint16_t {
  kSuccess = 0,

  // General
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,
  kTimeout = 4,
  kInternalError = 5,
  kOutOfRange = 6,

  // Configuration (100-199)
  kConfigFileNotFound = 100,
  kConfigYamlError = 101,
  kConfigParseError = 102,
  kConfigValidationError = 103,
  kConfigInvalidValue = 104,

  // Cache (200-299)
  kCacheInvalidLookup = 200,
  kCacheInvalidThreshold = 201,
  kCacheInvalidEmbedding = 202,
  kCacheUnknownDomain = 203,
  kCacheCapacityViolation = 204,
  kCacheProbeMismatch = 205,

  // Storage (300-399)
  kStorageWriteError = 300,
  kStorageReadError = 301,
  kStorageCorrupted = 302,
  kStorageTimeout = 303,
  kStorageQueueFull = 304,
};

/**
 * @brief Get symbolic name of an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kCacheInvalidLookup:
      return "CacheInvalidLookup";
    case ErrorCode::kCacheInvalidThreshold:
      return "CacheInvalidThreshold";
    case ErrorCode::kCacheInvalidEmbedding:
      return "CacheInvalidEmbedding";
    case ErrorCode::kCacheUnknownDomain:
      return "CacheUnknownDomain";
    case ErrorCode::kCacheCapacityViolation:
      return "CacheCapacityViolation";
    case ErrorCode::kCacheProbeMismatch:
      return "CacheProbeMismatch";
    case ErrorCode::kStorageWriteError:
      return "StorageWriteError";
    case ErrorCode::kStorageReadError:
      return "StorageReadError";
    case ErrorCode::kStorageCorrupted:
      return "StorageCorrupted";
    case ErrorCode::kStorageTimeout:
      return "StorageTimeout";
    case ErrorCode::kStorageQueueFull:
      return "StorageQueueFull";
  }
  return "Unknown";
}

/**
 * @brief Error value: code, human-readable message and optional context
 */
class Error {
 public:
  Error() = default;

  Error(ErrorCode code, std::string message, std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Render as "[Code] message (context)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "]";
    if (!message_.empty()) {
      result += " " + message_;
    }
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an error
 * @param code Error code
 * @param message Human-readable message
 * @param context Additional context (operation, key, path)
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return {code, std::move(message), std::move(context)};
}

}  // namespace semcache::utils

/**
 * @file clock.h
 * @brief Injectable wall clock
 *
 * Cache timestamps (created_at, last_accessed_at) and the maintenance schedule
 * read time through a Clock so tests can advance time deterministically.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

namespace semcache::utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Clock interface (UTC instants)
 */
class Clock {
 public:
  virtual ~Clock() = default;

  /**
   * @brief Current UTC instant
   */
  [[nodiscard]] virtual TimePoint Now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public Clock {
 public:
  [[nodiscard]] TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Manually driven clock for tests
 *
 * Thread-safe: Now() may be read while another thread advances the clock.
 */
class ManualClock : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50))) : now_(start) {}

  [[nodiscard]] TimePoint Now() const override {
    std::scoped_lock lock(mutex_);
    return now_;
  }

  void Set(TimePoint time_point) {
    std::scoped_lock lock(mutex_);
    now_ = time_point;
  }

  template <typename Rep, typename Period>
  void Advance(std::chrono::duration<Rep, Period> delta) {
    std::scoped_lock lock(mutex_);
    now_ += std::chrono::duration_cast<TimePoint::duration>(delta);
  }

 private:
  mutable std::mutex mutex_;
  TimePoint now_;
};

/**
 * @brief Milliseconds since Unix epoch
 */
inline int64_t ToUnixMillis(TimePoint time_point) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

/**
 * @brief Inverse of ToUnixMillis()
 */
inline TimePoint FromUnixMillis(int64_t millis) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

/**
 * @brief Format as ISO-8601 UTC ("2024-01-01T12:00:00.000Z")
 */
inline std::string FormatIso8601(TimePoint time_point) {
  constexpr int64_t kMillisPerSecond = 1000;
  const int64_t millis = ToUnixMillis(time_point);
  const std::time_t seconds = static_cast<std::time_t>(millis / kMillisPerSecond);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis % kMillisPerSecond) << 'Z';
  return oss.str();
}

}  // namespace semcache::utils

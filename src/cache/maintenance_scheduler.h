/**
 * @file maintenance_scheduler.h
 * @brief Periodic optimize and expiry runs over a CacheManager
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include "cache/cache_manager.h"
#include "config/config.h"
#include "utils/clock.h"

namespace semcache::cache {

/**
 * @brief What a Tick() call ran
 */
struct TickResult {
  bool optimized = false;
  bool expired = false;
};

/**
 * @brief Drives CacheManager::Optimize() and CacheManager::ClearExpired()
 *
 * Due times are measured on the injected clock, so tests can call Tick()
 * directly with a ManualClock. Start() polls Tick() from a background thread
 * every poll_interval_ms of real time.
 */
class MaintenanceScheduler {
 public:
  /**
   * @param manager Cache manager (must outlive this object)
   * @param maintenance Intervals and poll period
   * @param expiry_max_age_days Age used by the scheduled expiry sweep
   * @param clock Time source (must outlive this object)
   */
  MaintenanceScheduler(CacheManager& manager, const config::MaintenanceConfig& maintenance,
                       uint32_t expiry_max_age_days, const utils::Clock& clock);

  ~MaintenanceScheduler();

  MaintenanceScheduler(const MaintenanceScheduler&) = delete;
  MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;
  MaintenanceScheduler(MaintenanceScheduler&&) = delete;
  MaintenanceScheduler& operator=(MaintenanceScheduler&&) = delete;

  /**
   * @brief Run whatever is due
   *
   * The first call only records the start time. A task runs when at least
   * its interval has elapsed since it last ran.
   */
  TickResult Tick();

  /**
   * @brief Start the background thread (no-op if already running)
   */
  void Start();

  /**
   * @brief Stop and join the background thread
   */
  void Stop();

  [[nodiscard]] bool IsRunning() const;

 private:
  void Run();

  CacheManager& manager_;
  config::MaintenanceConfig config_;
  uint32_t expiry_max_age_days_;
  const utils::Clock& clock_;

  std::optional<utils::TimePoint> last_optimize_;
  std::optional<utils::TimePoint> last_expiry_;

  mutable std::mutex mutex_;
  std::condition_variable stop_condition_;
  bool running_ = false;
  bool stop_requested_ = false;
  std::thread worker_;
};

}  // namespace semcache::cache

/**
 * @file maintenance_scheduler.cpp
 * @brief Periodic maintenance implementation
 */

#include "cache/maintenance_scheduler.h"

#include <spdlog/spdlog.h>

#include "utils/structured_log.h"

namespace semcache::cache {

MaintenanceScheduler::MaintenanceScheduler(CacheManager& manager, const config::MaintenanceConfig& maintenance,
                                           uint32_t expiry_max_age_days, const utils::Clock& clock)
    : manager_(manager), config_(maintenance), expiry_max_age_days_(expiry_max_age_days), clock_(clock) {}

MaintenanceScheduler::~MaintenanceScheduler() {
  Stop();
}

TickResult MaintenanceScheduler::Tick() {
  TickResult result;
  const auto now = clock_.Now();
  if (!last_optimize_.has_value()) {
    last_optimize_ = now;
    last_expiry_ = now;
    return result;
  }

  const auto optimize_interval = std::chrono::seconds(config_.optimize_interval_sec);
  const auto expiry_interval = std::chrono::seconds(config_.expiry_interval_sec);

  if (now - *last_optimize_ >= optimize_interval) {
    auto reports = manager_.Optimize();
    uint64_t evicted = 0;
    for (const auto& [name, report] : reports) {
      evicted += report.evicted;
    }
    spdlog::debug("Scheduled optimize: {} domains, {} evicted", reports.size(), evicted);
    last_optimize_ = now;
    result.optimized = true;
  }

  if (now - *last_expiry_ >= expiry_interval) {
    auto removed = manager_.ClearExpired(expiry_max_age_days_);
    uint64_t total = 0;
    for (const auto& [name, count] : removed) {
      total += count;
    }
    utils::StructuredLog()
        .Event("scheduled_expiry")
        .Field("max_age_days", static_cast<uint64_t>(expiry_max_age_days_))
        .Field("removed", total)
        .Info();
    last_expiry_ = now;
    result.expired = true;
  }
  return result;
}

void MaintenanceScheduler::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread(&MaintenanceScheduler::Run, this);
  spdlog::info("Maintenance scheduler started (optimize every {}s, expiry every {}s)", config_.optimize_interval_sec,
               config_.expiry_interval_sec);
}

void MaintenanceScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
  }
  stop_condition_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  spdlog::info("Maintenance scheduler stopped");
}

bool MaintenanceScheduler::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void MaintenanceScheduler::Run() {
  const auto poll_interval = std::chrono::milliseconds(config_.poll_interval_ms);
  while (true) {
    Tick();

    std::unique_lock<std::mutex> lock(mutex_);
    if (stop_condition_.wait_for(lock, poll_interval, [this] { return stop_requested_; })) {
      break;
    }
  }
}

}  // namespace semcache::cache

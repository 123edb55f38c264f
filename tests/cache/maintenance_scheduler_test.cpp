/**
 * @file maintenance_scheduler_test.cpp
 * @brief Unit tests for MaintenanceScheduler
 */

#include "cache/maintenance_scheduler.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace semcache::cache {

class MaintenanceSchedulerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.cache.max_size = 10;
    config_.cache.expiry_max_age_days = 30;
    maintenance_.optimize_interval_sec = 60;
    maintenance_.expiry_interval_sec = 3600;
    maintenance_.poll_interval_ms = 10;
    manager_ = std::make_unique<CacheManager>(config_, nullptr, clock_);
  }

  config::Config config_;
  config::MaintenanceConfig maintenance_;
  utils::ManualClock clock_;
  std::unique_ptr<CacheManager> manager_;
};

TEST_F(MaintenanceSchedulerTest, FirstTickOnlyRecordsBaseline) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(manager_->PutQuery("query " + std::to_string(i), {{"i", i}}));
  }
  MaintenanceScheduler scheduler(*manager_, maintenance_, config_.cache.expiry_max_age_days, clock_);

  auto result = scheduler.Tick();
  EXPECT_FALSE(result.optimized);
  EXPECT_FALSE(result.expired);
  EXPECT_EQ(manager_->GetCache("query")->Size(), 10U);
}

TEST_F(MaintenanceSchedulerTest, OptimizeRunsOnInterval) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(manager_->PutQuery("query " + std::to_string(i), {{"i", i}}));
  }
  MaintenanceScheduler scheduler(*manager_, maintenance_, config_.cache.expiry_max_age_days, clock_);
  scheduler.Tick();

  clock_.Advance(std::chrono::seconds(59));
  EXPECT_FALSE(scheduler.Tick().optimized);
  EXPECT_EQ(manager_->GetCache("query")->Size(), 10U);

  clock_.Advance(std::chrono::seconds(1));
  auto result = scheduler.Tick();
  EXPECT_TRUE(result.optimized);
  EXPECT_FALSE(result.expired);
  EXPECT_EQ(manager_->GetCache("query")->Size(), 8U);

  // Interval restarts from the last run
  clock_.Advance(std::chrono::seconds(30));
  EXPECT_FALSE(scheduler.Tick().optimized);
}

TEST_F(MaintenanceSchedulerTest, ExpirySweepUsesConfiguredAge) {
  MaintenanceScheduler scheduler(*manager_, maintenance_, 1, clock_);
  scheduler.Tick();

  ASSERT_TRUE(manager_->PutTicker("Apple Inc", {{"ticker", "AAPL"}}));
  clock_.Advance(std::chrono::hours(25));
  ASSERT_TRUE(manager_->PutTicker("Microsoft", {{"ticker", "MSFT"}}));

  auto result = scheduler.Tick();
  EXPECT_TRUE(result.expired);
  EXPECT_TRUE(result.optimized);
  EXPECT_EQ(manager_->GetCache("ticker")->Size(), 1U);
  auto hit = manager_->GetTicker("Microsoft");
  ASSERT_TRUE(hit && hit->has_value());
}

TEST_F(MaintenanceSchedulerTest, StartAndStop) {
  MaintenanceScheduler scheduler(*manager_, maintenance_, config_.cache.expiry_max_age_days, clock_);
  EXPECT_FALSE(scheduler.IsRunning());

  scheduler.Start();
  EXPECT_TRUE(scheduler.IsRunning());
  scheduler.Start();  // No-op while running
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  scheduler.Stop();
  EXPECT_FALSE(scheduler.IsRunning());
  scheduler.Stop();
}

TEST_F(MaintenanceSchedulerTest, BackgroundThreadRunsOptimize) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(manager_->PutQuery("query " + std::to_string(i), {{"i", i}}));
  }
  MaintenanceScheduler scheduler(*manager_, maintenance_, config_.cache.expiry_max_age_days, clock_);
  scheduler.Start();

  // Let the worker record its baseline, then move past the interval
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  clock_.Advance(std::chrono::seconds(61));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (manager_->GetCache("query")->Size() > 8 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  scheduler.Stop();
  EXPECT_EQ(manager_->GetCache("query")->Size(), 8U);
}

TEST_F(MaintenanceSchedulerTest, DestructorStopsWorker) {
  {
    MaintenanceScheduler scheduler(*manager_, maintenance_, config_.cache.expiry_max_age_days, clock_);
    scheduler.Start();
    EXPECT_TRUE(scheduler.IsRunning());
  }
  SUCCEED();
}

}  // namespace semcache::cache

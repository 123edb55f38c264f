/**
 * @file structured_log_test.cpp
 * @brief Unit tests for StructuredLog rendering
 */

#include "utils/structured_log.h"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace semcache::utils {

class StructuredLogTest : public ::testing::Test {
 protected:
  void TearDown() override { StructuredLog::SetFormat(LogFormat::JSON); }
};

TEST_F(StructuredLogTest, JsonKeepsFieldOrderAndTypes) {
  StructuredLog::SetFormat(LogFormat::JSON);
  const std::string line = StructuredLog()
                               .Event("cache_eviction")
                               .Field("cache", "query")
                               .Field("evicted", static_cast<uint64_t>(3))
                               .Field("ratio", 0.5)
                               .Field("degraded", false)
                               .Build();

  EXPECT_EQ(line, R"({"event":"cache_eviction","cache":"query","evicted":3,"ratio":0.5,"degraded":false})");
}

TEST_F(StructuredLogTest, JsonEscapesUserText) {
  StructuredLog::SetFormat(LogFormat::JSON);
  const std::string line =
      StructuredLog().Event("cache_lookup_error").Field("subject", "say \"hi\"\n").Message("bad lookup").Build();

  auto parsed = nlohmann::json::parse(line);
  EXPECT_EQ(parsed["subject"], "say \"hi\"\n");
  EXPECT_EQ(parsed["message"], "bad lookup");
}

TEST_F(StructuredLogTest, TextQuotesOnlyWhenNeeded) {
  StructuredLog::SetFormat(LogFormat::TEXT);
  const std::string line = StructuredLog()
                               .Event("cache_health_transition")
                               .Field("cache", "financial")
                               .Field("reason", "3 consecutive failures")
                               .Field("failures", static_cast<int64_t>(3))
                               .Build();

  EXPECT_EQ(line, R"(event=cache_health_transition cache=financial reason="3 consecutive failures" failures=3)");
}

TEST_F(StructuredLogTest, ParseFormat) {
  EXPECT_EQ(StructuredLog::ParseFormat("text"), LogFormat::TEXT);
  EXPECT_EQ(StructuredLog::ParseFormat("json"), LogFormat::JSON);
  EXPECT_EQ(StructuredLog::ParseFormat("yaml"), LogFormat::JSON);
}

}  // namespace semcache::utils

// Repository: Feedpool-engine
// Component: Engine Configuration Tests
// Purpose: JSON parsing and validation, file loading, serialization and
//          FEEDPOOL_* environment overrides.
// Copyright (c) 2025 Feedpool

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "feedpool/config/EngineConfig.hpp"

namespace feedpool::config {
namespace {

// =============================================================================
// JSON
// =============================================================================

TEST(EngineConfigTest, DefaultsAreValid) {
  EngineConfig config;
  EXPECT_TRUE(config.IsValid());
  EXPECT_EQ(config.pool.capacity, 0);
  EXPECT_EQ(config.pool.max_concurrent_creations, 3);
  EXPECT_EQ(config.feed.preload_ahead, 2);
  EXPECT_EQ(config.feed.preload_behind, 1);
  EXPECT_EQ(config.feed.position_interval_ms, 250);
}

TEST(EngineConfigTest, FromJsonReadsBothSections) {
  const std::string json = R"({
    "pool": {"capacity": 5, "max_concurrent_creations": 2, "eviction_attempts": 4,
             "eviction_retry_backoff_ms": 20, "distance_cancel_threshold": 6,
             "fast_scroll_jump": 3, "session_id": "s-42"},
    "feed": {"preload_ahead": 3, "preload_behind": 2, "position_interval_ms": 100,
             "initial_index": 7, "default_volume": 0.5}
  })";

  auto config = EngineConfig::FromJson(json);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->pool.capacity, 5);
  EXPECT_EQ(config->pool.max_concurrent_creations, 2);
  EXPECT_EQ(config->pool.eviction_attempts, 4);
  EXPECT_EQ(config->pool.eviction_retry_backoff_ms, 20);
  EXPECT_EQ(config->pool.distance_cancel_threshold, 6);
  EXPECT_EQ(config->pool.fast_scroll_jump, 3);
  EXPECT_EQ(config->pool.session_id, "s-42");
  EXPECT_EQ(config->feed.preload_ahead, 3);
  EXPECT_EQ(config->feed.preload_behind, 2);
  EXPECT_EQ(config->feed.position_interval_ms, 100);
  EXPECT_EQ(config->feed.initial_index, 7);
  EXPECT_DOUBLE_EQ(config->feed.default_volume, 0.5);
}

TEST(EngineConfigTest, MissingFieldsKeepDefaults) {
  auto config = EngineConfig::FromJson(R"({"pool": {"capacity": 2}})");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->pool.capacity, 2);
  EXPECT_EQ(config->pool.max_concurrent_creations, 3);
  EXPECT_EQ(config->feed.preload_ahead, 2);
}

TEST(EngineConfigTest, RejectsMalformedAndInvalidValues) {
  EXPECT_FALSE(EngineConfig::FromJson("").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"pool": {"capacity": "four"}})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"pool": {"capacity": -1}})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"pool": {"max_concurrent_creations": 0}})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"feed": {"preload_ahead": -2}})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"feed": {"default_volume": 1.5}})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"feed": {"position_interval_ms": 0}})").has_value());
}

TEST(EngineConfigTest, ToJsonParsesBack) {
  EngineConfig config;
  config.pool.capacity = 4;
  config.pool.session_id = "abc";
  config.feed.preload_behind = 0;

  auto parsed = EngineConfig::FromJson(config.ToJson());
  ASSERT_TRUE(parsed.has_value()) << config.ToJson();
  EXPECT_EQ(parsed->pool.capacity, 4);
  EXPECT_EQ(parsed->pool.session_id, "abc");
  EXPECT_EQ(parsed->feed.preload_behind, 0);
}

TEST(EngineConfigTest, FromFileLoadsAndReportsMissingFile) {
  const std::string path = ::testing::TempDir() + "feedpool_engine_config.json";
  {
    std::ofstream out(path);
    out << R"({"pool": {"capacity": 6}, "feed": {"preload_ahead": 1}})";
  }
  auto config = EngineConfig::FromFile(path);
  std::remove(path.c_str());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->pool.capacity, 6);
  EXPECT_EQ(config->feed.preload_ahead, 1);

  EXPECT_FALSE(EngineConfig::FromFile("/nonexistent/feedpool.json").has_value());
}

// =============================================================================
// Environment overrides
// =============================================================================

class EngineConfigEnvTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* name : {kEnvPoolCapacity, kEnvPreloadAhead, kEnvPreloadBehind,
                             kEnvMaxConcurrent}) {
      unsetenv(name);
    }
  }
};

TEST_F(EngineConfigEnvTest, AppliesValidOverrides) {
  setenv(kEnvPoolCapacity, "5", 1);
  setenv(kEnvPreloadAhead, "4", 1);
  setenv(kEnvMaxConcurrent, "2", 1);

  EngineConfig config;
  EXPECT_EQ(config.ApplyEnvironmentOverrides(), 3);
  EXPECT_EQ(config.pool.capacity, 5);
  EXPECT_EQ(config.feed.preload_ahead, 4);
  EXPECT_EQ(config.pool.max_concurrent_creations, 2);
  EXPECT_EQ(config.feed.preload_behind, 1);
}

TEST_F(EngineConfigEnvTest, IgnoresMalformedAndOutOfRangeValues) {
  setenv(kEnvPoolCapacity, "lots", 1);
  setenv(kEnvPreloadBehind, "-1", 1);
  setenv(kEnvMaxConcurrent, "0", 1);

  EngineConfig config;
  EXPECT_EQ(config.ApplyEnvironmentOverrides(), 0);
  EXPECT_EQ(config.pool.capacity, 0);
  EXPECT_EQ(config.feed.preload_behind, 1);
  EXPECT_EQ(config.pool.max_concurrent_creations, 3);
  EXPECT_TRUE(config.IsValid());
}

TEST_F(EngineConfigEnvTest, NoVariablesNoChanges) {
  EngineConfig config;
  EXPECT_EQ(config.ApplyEnvironmentOverrides(), 0);
  EXPECT_EQ(config.ToJson(), EngineConfig().ToJson());
}

}  // namespace
}  // namespace feedpool::config

// Repository: Feedpool-engine
// Component: Engine Configuration
// Purpose: Pool and feed configuration loaded from JSON and environment.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_CONFIG_ENGINE_CONFIG_HPP_
#define FEEDPOOL_CONFIG_ENGINE_CONFIG_HPP_

#include <optional>
#include <string>

#include "feedpool/feed/FeedConfig.hpp"
#include "feedpool/pool/PoolConfig.hpp"

namespace feedpool::config {

// Environment variables read by ApplyEnvironmentOverrides().
inline constexpr const char* kEnvPoolCapacity = "FEEDPOOL_POOL_CAPACITY";
inline constexpr const char* kEnvPreloadAhead = "FEEDPOOL_PRELOAD_AHEAD";
inline constexpr const char* kEnvPreloadBehind = "FEEDPOOL_PRELOAD_BEHIND";
inline constexpr const char* kEnvMaxConcurrent = "FEEDPOOL_MAX_CONCURRENT";

// EngineConfig schema (every field optional; missing fields keep defaults):
// {
//   "pool": { "capacity": 0, "max_concurrent_creations": 3,
//             "eviction_attempts": 0, "eviction_retry_backoff_ms": 10,
//             "distance_cancel_threshold": 3, "fast_scroll_jump": 2,
//             "session_id": "..." },
//   "feed": { "preload_ahead": 2, "preload_behind": 1,
//             "position_interval_ms": 250, "initial_index": 0,
//             "default_volume": 1.0 }
// }
struct EngineConfig {
  pool::PoolConfig pool;
  feed::FeedConfig feed;

  // nullopt on malformed numbers or values failing IsValid().
  static std::optional<EngineConfig> FromJson(const std::string& json_str);
  static std::optional<EngineConfig> FromFile(const std::string& path);

  std::string ToJson() const;
  bool IsValid() const;

  // Overrides from FEEDPOOL_* variables. Unparseable or out-of-range values
  // are logged and ignored. Returns the number of overrides applied.
  int ApplyEnvironmentOverrides();
};

}  // namespace feedpool::config

#endif  // FEEDPOOL_CONFIG_ENGINE_CONFIG_HPP_

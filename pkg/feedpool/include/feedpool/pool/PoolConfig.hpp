// Repository: Feedpool-engine
// Component: Pool Configuration
// Purpose: Configuration structure for PoolManager.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_POOL_POOL_CONFIG_HPP_
#define FEEDPOOL_POOL_POOL_CONFIG_HPP_

#include <cstdint>
#include <string>

namespace feedpool::pool {

// POD struct - immutable after the manager is constructed.
struct PoolConfig {
  int capacity = 0;                   // 0 = derive from device memory tier
  int max_concurrent_creations = 3;   // Native creations allowed in flight at once
  int eviction_attempts = 0;          // 0 = capacity attempts before giving up
  int eviction_retry_backoff_ms = 10; // Sleep between failed eviction attempts
  int distance_cancel_threshold = 3;  // In-flight requests farther than this are cancelled
  int fast_scroll_jump = 2;           // Active-index jump that triggers distant cancellation
  std::string session_id;             // Host-owned identifier stamped into log lines
};

}  // namespace feedpool::pool

#endif  // FEEDPOOL_POOL_POOL_CONFIG_HPP_

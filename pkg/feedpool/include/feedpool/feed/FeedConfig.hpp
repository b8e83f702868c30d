// Repository: Feedpool-engine
// Component: Feed Configuration
// Purpose: Preload window and playback defaults for FeedController.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_FEED_FEED_CONFIG_HPP_
#define FEEDPOOL_FEED_FEED_CONFIG_HPP_

#include <cstdint>

namespace feedpool::feed {

struct FeedConfig {
  int preload_ahead = 2;
  int preload_behind = 1;
  int64_t position_interval_ms = 250;
  int initial_index = 0;
  double default_volume = 1.0;  // Volume restored on ready / play
};

}  // namespace feedpool::feed

#endif  // FEEDPOOL_FEED_FEED_CONFIG_HPP_

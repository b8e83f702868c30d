// Repository: Feedpool-engine
// Component: Feed Types
// Purpose: Video items, per-index load state and the state snapshot
//          published to presentation code.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_FEED_FEED_TYPES_HPP_
#define FEEDPOOL_FEED_FEED_TYPES_HPP_

#include <memory>
#include <string>

#include "feedpool/media/PlayerHandle.hpp"

namespace feedpool::feed {

struct VideoItem {
  std::string id;   // Stable content identity; the pool key
  std::string url;  // Network source locator

  // Pool key for this item: id, or url when no id was assigned.
  const std::string& Key() const { return id.empty() ? url : id; }
};

// none -> loading -> ready | error; any -> none on window exit or eviction.
enum class LoadState {
  kNone = 0,
  kLoading = 1,
  kReady = 2,
  kError = 3,
};

const char* LoadStateName(LoadState state);

// Published per index. handle is null unless a live (non-disposed) handle
// is attached to the index.
struct IndexState {
  LoadState load_state = LoadState::kNone;
  std::shared_ptr<media::PlayerHandle> handle;
};

}  // namespace feedpool::feed

#endif  // FEEDPOOL_FEED_FEED_TYPES_HPP_

// Repository: Feedpool-engine
// Component: Feed Controller
// Purpose: Sliding preload window over a video list, per-index load state
//          machine, playback transitions and position callbacks.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_FEED_FEED_CONTROLLER_HPP_
#define FEEDPOOL_FEED_FEED_CONTROLLER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "feedpool/feed/FeedConfig.hpp"
#include "feedpool/feed/FeedTypes.hpp"
#include "feedpool/feed/PositionTimer.hpp"
#include "feedpool/media/PlayerHandle.hpp"
#include "feedpool/pool/PoolManager.hpp"

namespace feedpool::feed {

// FeedController keeps handles loaded for [current - behind, current + ahead]
// (clipped to the list) and drives playback of the current index.
//
// Per index: none -> loading -> ready | error. An index becomes ready on the
// first "not buffering" signal after open. Leaving the window, or eviction of
// the index's handle by the pool, returns it to none. A failed index stays in
// error until it leaves the window or Retry() is called.
//
// Ownership: instances are created through Create() and owned by
// std::shared_ptr. Acquisition callbacks, buffering/disposed listeners and
// timers hold weak references, so they become no-ops once the controller is
// gone.
//
// Threading: public methods may be called from any thread. Callbacks arrive
// on pool workers, native buffering threads and timer threads. No internal
// lock is held while calling into the pool manager, a handle, a timer, or a
// host hook / listener.
class FeedController : public std::enable_shared_from_this<FeedController> {
 public:
  // Returns a cached local locator for the item, or empty for item.url.
  using MediaSourceResolver = std::function<std::string(const VideoItem&)>;
  using VideoReadyCallback =
      std::function<void(int index, const std::shared_ptr<media::PlayerHandle>&)>;
  using PositionCallback = std::function<void(int index, int64_t position_ms)>;
  using Listener = std::function<void()>;
  using IndexListener = std::function<void(const IndexState&)>;

  struct Hooks {
    MediaSourceResolver media_source_resolver;
    VideoReadyCallback on_video_ready;
    PositionCallback on_position;
  };

  // Loads the initial window immediately when videos is non-empty.
  static std::shared_ptr<FeedController> Create(
      std::shared_ptr<pool::PoolManager> manager,
      std::vector<VideoItem> videos,
      FeedConfig config = FeedConfig(),
      Hooks hooks = Hooks());

  ~FeedController();

  FeedController(const FeedController&) = delete;
  FeedController& operator=(const FeedController&) = delete;

  // Visible page changed. Ignored when unchanged or out of range.
  void OnPageChanged(int index);

  // Inactive: pause and release every loaded index. Active: reload the
  // window around the current index.
  void SetActive(bool active);

  // User-initiated playback of the current index; guarded by ready.
  void Play();
  void Pause();
  void TogglePlayPause();

  void Seek(int64_t position_ms);
  void SetVolume(double volume);
  void SetPlaybackSpeed(double rate);

  void AddVideos(const std::vector<VideoItem>& videos);

  // Re-attempts an index in error that lies inside the window.
  void Retry(int index);

  // Stops timers, detaches subscriptions, pauses and releases every loaded
  // index. Idempotent; later calls to any method are no-ops.
  void Dispose();

  int CurrentIndex() const;
  bool IsPaused() const;
  bool IsActive() const;
  bool IsDisposed() const;
  size_t VideoCount() const;
  std::vector<VideoItem> Videos() const;

  LoadState GetLoadState(int index) const;
  bool IsVideoReady(int index) const;
  std::shared_ptr<media::PlayerHandle> GetHandle(int index) const;

  // Evicted-but-tracked handles report kNone with a null handle.
  IndexState GetIndexState(int index) const;

  // Indices currently holding a handle (loading after acquisition, or ready).
  std::set<int> LoadedIndices() const;
  std::vector<int> WindowIndices() const;
  bool HasPositionTimer(int index) const;
  size_t PositionTimerCount() const;

  // Global change notification.
  int AddListener(Listener listener);
  void RemoveListener(int id);

  // Fires on every state change of one index.
  int AddIndexListener(int index, IndexListener listener);
  void RemoveIndexListener(int id);

 private:
  struct Slot {
    LoadState state = LoadState::kNone;
    std::shared_ptr<media::PlayerHandle> handle;
    std::string key;
    uint64_t token = 0;  // load generation; stale completions compare unequal
    int buffering_listener_id = 0;
    int disposed_listener_id = 0;
  };

  FeedController(std::shared_ptr<pool::PoolManager> manager,
                 std::vector<VideoItem> videos, FeedConfig config, Hooks hooks);

  void UpdateWindow(int index);
  std::vector<int> WindowLocked(int index) const;

  void LoadIndex(int index);
  void OnAcquired(int index, uint64_t token, const std::string& locator,
                  const pool::AcquireResult& result);
  void OnBufferReady(int index, uint64_t token);
  void OnHandleDisposed(int index, const media::PlayerHandle* handle);
  void OnPositionTick(int index);

  void ReleaseIndex(int index);
  void ReleaseAll();
  // Detaches a removed slot from its handle and hands the key back.
  void ReleaseSlot(int index, Slot slot);

  void PlayIndex(int index);
  void PauseIndex(int index);
  void StartPositionTimer(int index);
  void StopPositionTimer(int index);

  bool KeyTrackedLocked(const std::string& key, int except_index) const;
  void NotifyIndex(int index);
  void NotifyListeners();

  std::shared_ptr<pool::PoolManager> manager_;
  const FeedConfig config_;
  const Hooks hooks_;

  mutable std::mutex mutex_;
  std::vector<VideoItem> videos_;
  int current_index_ = 0;
  bool active_ = true;
  bool paused_ = false;
  bool disposed_ = false;
  double volume_ = 1.0;
  uint64_t next_token_ = 1;

  std::map<int, Slot> slots_;  // absent == kNone
  std::map<int, std::unique_ptr<PositionTimer>> timers_;

  mutable std::mutex listeners_mutex_;
  int next_listener_id_ = 1;
  std::map<int, Listener> listeners_;
  std::map<int, std::pair<int, IndexListener>> index_listeners_;
};

}  // namespace feedpool::feed

#endif  // FEEDPOOL_FEED_FEED_CONTROLLER_HPP_

// Repository: Feedpool-engine
// Component: Feed Controller Implementation
// Purpose: Window recompute, load state machine and playback transitions.
// Copyright (c) 2025 Feedpool

#include "feedpool/feed/FeedController.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "feedpool/util/Logger.hpp"

namespace feedpool::feed {

using feedpool::media::PlayerHandle;
using feedpool::pool::AcquireRequest;
using feedpool::pool::AcquireResult;
using feedpool::pool::AcquireStatus;
using feedpool::util::Logger;

const char* LoadStateName(LoadState state) {
  switch (state) {
    case LoadState::kNone: return "none";
    case LoadState::kLoading: return "loading";
    case LoadState::kReady: return "ready";
    case LoadState::kError: return "error";
  }
  return "unknown";
}

std::shared_ptr<FeedController> FeedController::Create(
    std::shared_ptr<pool::PoolManager> manager,
    std::vector<VideoItem> videos,
    FeedConfig config,
    Hooks hooks) {
  std::shared_ptr<FeedController> controller(new FeedController(
      std::move(manager), std::move(videos), std::move(config), std::move(hooks)));

  int index = 0;
  bool empty = true;
  {
    std::lock_guard<std::mutex> lock(controller->mutex_);
    index = controller->current_index_;
    empty = controller->videos_.empty();
  }
  if (!empty) controller->UpdateWindow(index);
  return controller;
}

FeedController::FeedController(std::shared_ptr<pool::PoolManager> manager,
                               std::vector<VideoItem> videos,
                               FeedConfig config,
                               Hooks hooks)
    : manager_(std::move(manager)),
      config_(std::move(config)),
      hooks_(std::move(hooks)),
      videos_(std::move(videos)) {
  if (!manager_) {
    throw std::invalid_argument("FeedController requires a pool manager");
  }
  const int last = videos_.empty() ? 0 : static_cast<int>(videos_.size()) - 1;
  current_index_ = std::clamp(config_.initial_index, 0, last);
  volume_ = std::clamp(config_.default_volume, 0.0, 1.0);
}

FeedController::~FeedController() {
  Dispose();
}

// =============================================================================
// Navigation
// =============================================================================

void FeedController::OnPageChanged(int index) {
  int old_index = 0;
  bool play_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || index == current_index_) return;
    if (index < 0 || index >= static_cast<int>(videos_.size())) {
      std::ostringstream oss;
      oss << "[FeedController] PAGE_OUT_OF_RANGE index=" << index
          << " count=" << videos_.size();
      Logger::Warn(oss.str());
      return;
    }
    old_index = current_index_;
    current_index_ = index;
    auto it = slots_.find(index);
    play_now = active_ && !paused_ && it != slots_.end() &&
               it->second.state == LoadState::kReady;
  }

  PauseIndex(old_index);
  if (play_now) PlayIndex(index);

  bool active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active = active_;
  }
  if (active) UpdateWindow(index);

  NotifyListeners();
}

void FeedController::SetActive(bool active) {
  int index = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || active_ == active) return;
    active_ = active;
    index = current_index_;
  }

  std::ostringstream oss;
  oss << "[FeedController] SET_ACTIVE active=" << (active ? "true" : "false")
      << " index=" << index;
  Logger::Info(oss.str());

  if (!active) {
    PauseIndex(index);
    ReleaseAll();
  } else {
    UpdateWindow(index);
  }
  NotifyListeners();
}

void FeedController::AddVideos(const std::vector<VideoItem>& videos) {
  int index = 0;
  bool active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (videos.empty() || disposed_) return;
    videos_.insert(videos_.end(), videos.begin(), videos.end());
    index = current_index_;
    active = active_;
  }
  if (active) UpdateWindow(index);
  NotifyListeners();
}

void FeedController::Retry(int index) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || !active_) return;
    auto it = slots_.find(index);
    if (it == slots_.end() || it->second.state != LoadState::kError) return;
    const auto window = WindowLocked(current_index_);
    if (std::find(window.begin(), window.end(), index) == window.end()) return;
    slots_.erase(it);
  }
  std::ostringstream oss;
  oss << "[FeedController] RETRY index=" << index;
  Logger::Info(oss.str());
  LoadIndex(index);
}

std::vector<int> FeedController::WindowLocked(int index) const {
  std::vector<int> window;
  const int count = static_cast<int>(videos_.size());
  for (int i = index - config_.preload_behind; i <= index + config_.preload_ahead; ++i) {
    if (i >= 0 && i < count) window.push_back(i);
  }
  return window;
}

void FeedController::UpdateWindow(int index) {
  std::vector<int> to_release;
  std::vector<int> to_load;
  std::vector<std::string> prewarm;
  std::string active_key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || index < 0 || index >= static_cast<int>(videos_.size())) return;

    const auto window = WindowLocked(index);
    for (const auto& [slot_index, slot] : slots_) {
      if (std::find(window.begin(), window.end(), slot_index) == window.end()) {
        to_release.push_back(slot_index);
      }
    }

    // Current first, then the rest in window order.
    std::vector<int> order{index};
    for (int i : window) {
      if (i != index) order.push_back(i);
    }
    for (int i : order) {
      if (slots_.find(i) == slots_.end()) to_load.push_back(i);
    }

    active_key = videos_[static_cast<size_t>(index)].Key();
    // Ahead before behind: forward scrolling is the common case.
    for (int i = index + 1; i <= index + config_.preload_ahead; ++i) {
      if (i < static_cast<int>(videos_.size())) prewarm.push_back(videos_[static_cast<size_t>(i)].Key());
    }
    for (int i = index - 1; i >= index - config_.preload_behind; --i) {
      if (i >= 0) prewarm.push_back(videos_[static_cast<size_t>(i)].Key());
    }
  }

  manager_->SetActiveVideo(active_key, index);
  manager_->SetPrewarmVideos(prewarm, index);

  for (int i : to_release) ReleaseIndex(i);
  for (int i : to_load) LoadIndex(i);

  std::ostringstream oss;
  oss << "[FeedController] WINDOW index=" << index
      << " released=" << to_release.size() << " loading=" << to_load.size();
  Logger::Debug(oss.str());
}

// =============================================================================
// Loading
// =============================================================================

void FeedController::LoadIndex(int index) {
  VideoItem video;
  uint64_t token = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || index < 0 || index >= static_cast<int>(videos_.size())) return;
    if (slots_.count(index)) return;
    video = videos_[static_cast<size_t>(index)];
    token = next_token_++;
    Slot slot;
    slot.state = LoadState::kLoading;
    slot.key = video.Key();
    slot.token = token;
    slots_.emplace(index, std::move(slot));
  }
  NotifyIndex(index);

  std::string resolved;
  if (hooks_.media_source_resolver) {
    try {
      resolved = hooks_.media_source_resolver(video);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[FeedController] RESOLVER_FAILED index=" << index
          << " error=\"" << e.what() << "\"";
      Logger::Error(oss.str());
    }
  }

  AcquireRequest request;
  request.key = video.Key();
  request.source_locator = video.url;
  if (!resolved.empty() && resolved != video.url) request.cached_locator = resolved;
  const std::string locator =
      request.cached_locator.empty() ? request.source_locator : request.cached_locator;

  std::ostringstream oss;
  oss << "[FeedController] LOAD index=" << index << " key=" << request.key
      << " cached=" << (request.cached_locator.empty() ? "false" : "true");
  Logger::Debug(oss.str());

  manager_->RegisterVideoIndex(request.key, index);
  std::weak_ptr<FeedController> weak = weak_from_this();
  manager_->AcquireAsync(std::move(request),
                         [weak, index, token, locator](const AcquireResult& result) {
                           if (auto self = weak.lock()) {
                             self->OnAcquired(index, token, locator, result);
                           }
                         });
}

void FeedController::OnAcquired(int index, uint64_t token,
                                const std::string& locator,
                                const AcquireResult& result) {
  bool release_stale = false;
  std::string key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    auto it = slots_.find(index);
    if (it == slots_.end() || it->second.token != token) {
      // Index left the window while acquisition was outstanding.
      if (result.ok()) {
        key = result.handle->key();
        release_stale = !KeyTrackedLocked(key, -1);
      }
    } else if (!result.ok()) {
      if (result.status == AcquireStatus::kCancelled) {
        slots_.erase(it);
      } else {
        it->second.state = LoadState::kError;
      }
    } else {
      it->second.handle = result.handle;
    }
  }

  if (release_stale) {
    manager_->Release(key);
    return;
  }

  if (!result.ok()) {
    std::ostringstream oss;
    oss << "[FeedController] LOAD_FAILED index=" << index
        << " status=" << pool::AcquireStatusName(result.status);
    if (!result.message.empty()) oss << " reason=\"" << result.message << "\"";
    if (result.status == AcquireStatus::kCancelled) {
      Logger::Debug(oss.str());
    } else {
      Logger::Warn(oss.str());
    }
    NotifyIndex(index);
    NotifyListeners();
    return;
  }

  const auto& handle = result.handle;
  std::weak_ptr<FeedController> weak = weak_from_this();
  const PlayerHandle* raw = handle.get();
  const int disposed_id = handle->AddDisposedListener([weak, index, raw] {
    if (auto self = weak.lock()) self->OnHandleDisposed(index, raw);
  });
  if (disposed_id == 0) {
    // Evicted between resolution and subscription.
    OnHandleDisposed(index, raw);
    return;
  }

  const bool opened = handle->Open(locator);
  const int buffering_id = opened ? handle->AddBufferingListener(
      [weak, index, token](bool buffering) {
        if (buffering) return;
        if (auto self = weak.lock()) self->OnBufferReady(index, token);
      }) : 0;

  bool current = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    current = !disposed_ && it != slots_.end() && it->second.token == token;
    if (current) {
      it->second.disposed_listener_id = disposed_id;
      it->second.buffering_listener_id = buffering_id;
      if (!opened) {
        it->second.state = LoadState::kError;
        it->second.handle.reset();
      }
    }
  }

  if (!current) {
    // Released while subscribing; ReleaseSlot did not see these ids.
    handle->RemoveDisposedListener(disposed_id);
    if (buffering_id) handle->RemoveBufferingListener(buffering_id);
    return;
  }

  if (!opened) {
    handle->RemoveDisposedListener(disposed_id);
    manager_->Release(handle->key());
    std::ostringstream oss;
    oss << "[FeedController] OPEN_FAILED index=" << index << " locator=" << locator;
    Logger::Warn(oss.str());
    NotifyIndex(index);
    NotifyListeners();
    return;
  }

  NotifyIndex(index);

  // Pre-buffer muted; the first non-buffering signal marks the index ready.
  handle->SetVolume(0.0);
  handle->Play();
  if (!handle->IsBuffering()) OnBufferReady(index, token);
}

void FeedController::OnBufferReady(int index, uint64_t token) {
  std::shared_ptr<PlayerHandle> handle;
  int buffering_id = 0;
  bool play_now = false;
  double volume = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    auto it = slots_.find(index);
    if (it == slots_.end() || it->second.token != token) return;
    Slot& slot = it->second;
    if (slot.state != LoadState::kLoading || !slot.handle) return;
    slot.state = LoadState::kReady;
    handle = slot.handle;
    buffering_id = slot.buffering_listener_id;
    slot.buffering_listener_id = 0;
    play_now = index == current_index_ && active_ && !paused_;
    volume = volume_;
  }

  if (buffering_id) handle->RemoveBufferingListener(buffering_id);

  std::ostringstream oss;
  oss << "[FeedController] READY index=" << index << " key=" << handle->key()
      << " play=" << (play_now ? "true" : "false");
  Logger::Info(oss.str());

  if (hooks_.on_video_ready) {
    try {
      hooks_.on_video_ready(index, handle);
    } catch (const std::exception& e) {
      std::ostringstream err;
      err << "[FeedController] READY_HOOK_FAILED index=" << index
          << " error=\"" << e.what() << "\"";
      Logger::Error(err.str());
    }
  }

  handle->SetVolume(volume);
  if (play_now) {
    StartPositionTimer(index);
  } else {
    handle->Pause();
  }

  NotifyIndex(index);
  NotifyListeners();
}

void FeedController::OnHandleDisposed(int index, const PlayerHandle* handle) {
  std::unique_ptr<PositionTimer> timer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    auto it = slots_.find(index);
    // Stale: the index was released or reloaded with another handle.
    if (it == slots_.end() || it->second.handle.get() != handle) return;
    slots_.erase(it);
    auto tit = timers_.find(index);
    if (tit != timers_.end()) {
      timer = std::move(tit->second);
      timers_.erase(tit);
    }
  }
  if (timer) timer->Stop();

  std::ostringstream oss;
  oss << "[FeedController] EVICTED index=" << index;
  Logger::Info(oss.str());

  NotifyIndex(index);
  NotifyListeners();
}

// =============================================================================
// Release
// =============================================================================

void FeedController::ReleaseIndex(int index) {
  Slot slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    if (it == slots_.end()) return;
    slot = std::move(it->second);
    slots_.erase(it);
  }
  ReleaseSlot(index, std::move(slot));
  NotifyIndex(index);
}

void FeedController::ReleaseAll() {
  std::map<int, Slot> slots;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    slots.swap(slots_);
  }
  for (auto& [index, slot] : slots) {
    ReleaseSlot(index, std::move(slot));
    NotifyIndex(index);
  }
}

void FeedController::ReleaseSlot(int index, Slot slot) {
  StopPositionTimer(index);

  bool shared = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shared = KeyTrackedLocked(slot.key, index);
  }

  if (slot.handle) {
    if (slot.buffering_listener_id) slot.handle->RemoveBufferingListener(slot.buffering_listener_id);
    if (slot.disposed_listener_id) slot.handle->RemoveDisposedListener(slot.disposed_listener_id);
    if (!shared) {
      slot.handle->SetVolume(0.0);
      slot.handle->Pause();
      manager_->Release(slot.key);
    }
  } else if (slot.state == LoadState::kLoading && !shared) {
    manager_->CancelAcquisition(slot.key);
  }

  std::ostringstream oss;
  oss << "[FeedController] RELEASE index=" << index << " key=" << slot.key
      << " state=" << LoadStateName(slot.state);
  Logger::Debug(oss.str());
}

void FeedController::Dispose() {
  std::map<int, Slot> slots;
  std::map<int, std::unique_ptr<PositionTimer>> timers;
  std::vector<IndexListener> index_listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    disposed_ = true;
    slots.swap(slots_);
    timers.swap(timers_);
  }

  // Timers first: their ticks read handles.
  for (auto& [index, timer] : timers) timer->Stop();
  timers.clear();

  // Presentation drops its handles before they are released.
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& [id, entry] : index_listeners_) index_listeners.push_back(entry.second);
    index_listeners_.clear();
    listeners_.clear();
  }
  for (const auto& listener : index_listeners) {
    try {
      listener(IndexState());
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[FeedController] LISTENER_FAILED error=\"" << e.what() << "\"";
      Logger::Error(oss.str());
    }
  }

  std::set<std::string> released;
  for (auto& [index, slot] : slots) {
    if (!released.insert(slot.key).second) continue;
    if (slot.handle) {
      if (slot.buffering_listener_id) slot.handle->RemoveBufferingListener(slot.buffering_listener_id);
      if (slot.disposed_listener_id) slot.handle->RemoveDisposedListener(slot.disposed_listener_id);
      slot.handle->SetVolume(0.0);
      slot.handle->Pause();
      manager_->Release(slot.key);
    } else if (slot.state == LoadState::kLoading) {
      manager_->CancelAcquisition(slot.key);
    }
  }

  std::ostringstream oss;
  oss << "[FeedController] DISPOSED released=" << released.size();
  Logger::Info(oss.str());
}

// =============================================================================
// Playback
// =============================================================================

void FeedController::PlayIndex(int index) {
  std::shared_ptr<PlayerHandle> handle;
  double volume = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    if (it == slots_.end() || !it->second.handle) return;
    handle = it->second.handle;
    volume = volume_;
  }
  // Seeking to the start also refreshes the first presented frame.
  handle->Seek(0);
  handle->SetVolume(volume);
  if (!handle->IsPlaying()) handle->Play();
  StartPositionTimer(index);
}

void FeedController::PauseIndex(int index) {
  std::shared_ptr<PlayerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    if (it != slots_.end()) handle = it->second.handle;
  }
  StopPositionTimer(index);
  if (handle) handle->Pause();
}

void FeedController::Play() {
  std::shared_ptr<PlayerHandle> handle;
  int index = 0;
  double volume = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || !active_) return;
    index = current_index_;
    auto it = slots_.find(index);
    if (it == slots_.end() || it->second.state != LoadState::kReady) return;
    paused_ = false;
    handle = it->second.handle;
    volume = volume_;
  }
  if (handle) {
    handle->SetVolume(volume);
    if (!handle->IsPlaying()) handle->Play();
    StartPositionTimer(index);
  }
  NotifyListeners();
}

void FeedController::Pause() {
  std::shared_ptr<PlayerHandle> handle;
  int index = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    index = current_index_;
    auto it = slots_.find(index);
    if (it == slots_.end() || it->second.state != LoadState::kReady) return;
    paused_ = true;
    handle = it->second.handle;
  }
  if (handle) handle->Pause();
  StopPositionTimer(index);
  NotifyListeners();
}

void FeedController::TogglePlayPause() {
  if (IsPaused()) {
    Play();
  } else {
    Pause();
  }
}

void FeedController::Seek(int64_t position_ms) {
  auto handle = GetHandle(CurrentIndex());
  if (handle) handle->Seek(position_ms);
}

void FeedController::SetVolume(double volume) {
  std::shared_ptr<PlayerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    volume_ = std::clamp(volume, 0.0, 1.0);
    volume = volume_;
    auto it = slots_.find(current_index_);
    if (it != slots_.end()) handle = it->second.handle;
  }
  if (handle) handle->SetVolume(volume);
}

void FeedController::SetPlaybackSpeed(double rate) {
  auto handle = GetHandle(CurrentIndex());
  if (handle) handle->SetRate(rate);
}

// =============================================================================
// Position timers (at most one per index)
// =============================================================================

void FeedController::StartPositionTimer(int index) {
  if (!hooks_.on_position) return;

  std::weak_ptr<FeedController> weak = weak_from_this();
  auto timer = std::make_unique<PositionTimer>(
      std::chrono::milliseconds(config_.position_interval_ms),
      [weak, index] {
        if (auto self = weak.lock()) self->OnPositionTick(index);
      });

  std::unique_ptr<PositionTimer> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    const bool live = !disposed_ && it != slots_.end() &&
                      it->second.state == LoadState::kReady;
    if (live) {
      previous = std::move(timers_[index]);
      timers_[index] = std::move(timer);
    } else {
      previous = std::move(timer);
    }
  }
  if (previous) previous->Stop();
}

void FeedController::StopPositionTimer(int index) {
  std::unique_ptr<PositionTimer> timer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(index);
    if (it == timers_.end()) return;
    timer = std::move(it->second);
    timers_.erase(it);
  }
  timer->Stop();
}

void FeedController::OnPositionTick(int index) {
  std::shared_ptr<PlayerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    auto it = slots_.find(index);
    if (it == slots_.end()) return;
    handle = it->second.handle;
  }
  if (handle && handle->IsPlaying() && hooks_.on_position) {
    hooks_.on_position(index, handle->PositionMs());
  }
}

// =============================================================================
// Introspection
// =============================================================================

int FeedController::CurrentIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_index_;
}

bool FeedController::IsPaused() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paused_;
}

bool FeedController::IsActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

bool FeedController::IsDisposed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return disposed_;
}

size_t FeedController::VideoCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return videos_.size();
}

std::vector<VideoItem> FeedController::Videos() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return videos_;
}

LoadState FeedController::GetLoadState(int index) const {
  return GetIndexState(index).load_state;
}

bool FeedController::IsVideoReady(int index) const {
  return GetLoadState(index) == LoadState::kReady;
}

std::shared_ptr<PlayerHandle> FeedController::GetHandle(int index) const {
  return GetIndexState(index).handle;
}

IndexState FeedController::GetIndexState(int index) const {
  IndexState state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(index);
    if (it == slots_.end()) return state;
    state.load_state = it->second.state;
    state.handle = it->second.handle;
  }
  // Checked outside mutex_: the handle lock may be held by a thread that is
  // waiting for mutex_ inside a buffering callback.
  if (state.handle && state.handle->IsDisposed()) {
    state.load_state = LoadState::kNone;
    state.handle.reset();
  }
  return state;
}

std::set<int> FeedController::LoadedIndices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<int> indices;
  for (const auto& [index, slot] : slots_) {
    if (slot.handle) indices.insert(index);
  }
  return indices;
}

std::vector<int> FeedController::WindowIndices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return WindowLocked(current_index_);
}

bool FeedController::HasPositionTimer(int index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.count(index) > 0;
}

size_t FeedController::PositionTimerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

// =============================================================================
// Listeners
// =============================================================================

int FeedController::AddListener(Listener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const int id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void FeedController::RemoveListener(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(id);
}

int FeedController::AddIndexListener(int index, IndexListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const int id = next_listener_id_++;
  index_listeners_.emplace(id, std::make_pair(index, std::move(listener)));
  return id;
}

void FeedController::RemoveIndexListener(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  index_listeners_.erase(id);
}

bool FeedController::KeyTrackedLocked(const std::string& key, int except_index) const {
  for (const auto& [index, slot] : slots_) {
    if (index != except_index && slot.key == key) return true;
  }
  return false;
}

void FeedController::NotifyIndex(int index) {
  if (IsDisposed()) return;
  std::vector<IndexListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& [id, entry] : index_listeners_) {
      if (entry.first == index) listeners.push_back(entry.second);
    }
  }
  if (listeners.empty()) return;

  const IndexState state = GetIndexState(index);
  for (const auto& listener : listeners) {
    try {
      listener(state);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[FeedController] LISTENER_FAILED index=" << index
          << " error=\"" << e.what() << "\"";
      Logger::Error(oss.str());
    }
  }
}

void FeedController::NotifyListeners() {
  if (IsDisposed()) return;
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& [id, listener] : listeners_) listeners.push_back(listener);
  }
  for (const auto& listener : listeners) {
    try {
      listener();
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[FeedController] LISTENER_FAILED error=\"" << e.what() << "\"";
      Logger::Error(oss.str());
    }
  }
}

}  // namespace feedpool::feed

// Repository: Feedpool-engine
// Component: Fake Player Fixtures
// Purpose: Controllable IPlayerResource / IPlayerFactory for contract tests:
//          creation gates, failure injection, counters, buffering control.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_TESTS_FIXTURES_FAKE_PLAYER_HPP_
#define FEEDPOOL_TESTS_FIXTURES_FAKE_PLAYER_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "feedpool/media/IPlayerResource.hpp"

namespace feedpool::tests::fixtures {

// Observable state of one fake native session. Outlives the resource so
// tests can inspect a player after the pool disposed it.
struct FakePlayerState {
  mutable std::mutex mutex;
  std::string locator;
  bool playing = false;
  bool buffering = false;
  bool disposed = false;
  double volume = 1.0;
  double rate = 1.0;
  int64_t position_ms = 0;
  int open_count = 0;
  int play_count = 0;
  int pause_count = 0;
  int stop_count = 0;
  int dispose_count = 0;
  std::function<void(bool)> listener;

  // Delivers a buffering transition as the native runtime would.
  void EmitBuffering(bool value) {
    std::function<void(bool)> callback;
    {
      std::lock_guard<std::mutex> lock(mutex);
      buffering = value;
      callback = listener;
    }
    if (callback) callback(value);
  }

  bool IsDisposed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return disposed;
  }
  bool IsPlaying() const {
    std::lock_guard<std::mutex> lock(mutex);
    return playing;
  }
  double Volume() const {
    std::lock_guard<std::mutex> lock(mutex);
    return volume;
  }
  std::string Locator() const {
    std::lock_guard<std::mutex> lock(mutex);
    return locator;
  }
  int PauseCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pause_count;
  }
  int DisposeCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return dispose_count;
  }
};

struct FakeFactoryShared;

class FakePlayerResource : public media::IPlayerResource {
 public:
  FakePlayerResource(std::shared_ptr<FakePlayerState> state,
                     std::shared_ptr<FakeFactoryShared> shared)
      : state_(std::move(state)), shared_(std::move(shared)) {}
  ~FakePlayerResource() override;

  bool Open(const std::string& locator) override;

  void Play() override {
    bool auto_ready = false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->disposed) return;
      state_->playing = true;
      state_->play_count++;
      auto_ready = state_->buffering && AutoReady();
    }
    if (auto_ready) state_->EmitBuffering(false);
  }
  void Pause() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->playing = false;
    state_->pause_count++;
  }
  void Stop() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->playing = false;
    state_->stop_count++;
  }
  void Seek(int64_t position_ms) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->position_ms = position_ms;
  }
  void SetVolume(double volume) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->volume = volume;
  }
  void SetRate(double rate) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->rate = rate;
  }
  bool IsPlaying() const override { return state_->IsPlaying(); }
  bool IsBuffering() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->buffering;
  }
  int64_t PositionMs() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->position_ms;
  }
  void SetBufferingListener(BufferingListener listener) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->listener = std::move(listener);
  }
  void Dispose() override;

 private:
  bool AutoReady() const;

  std::shared_ptr<FakePlayerState> state_;
  std::shared_ptr<FakeFactoryShared> shared_;
};

class FakeRenderTarget : public media::IRenderTarget {
 public:
  explicit FakeRenderTarget(uint64_t id) : id_(id) {}
  uint64_t SurfaceId() const override { return detached_.load() ? 0 : id_; }
  void Detach() override { detached_.store(true); }

 private:
  const uint64_t id_;
  std::atomic<bool> detached_{false};
};

// Counters and knobs shared by a factory and every resource it created.
struct FakeFactoryShared {
  std::mutex mutex;
  std::condition_variable cv;
  bool gate_closed = false;
  bool dispose_gate_closed = false;
  int disposals_parked = 0;
  int creations_in_progress = 0;
  int max_concurrent_creations = 0;
  int live = 0;
  int max_live = 0;
  int fail_next_creates = 0;
  std::set<std::string> fail_open_locators;
  bool auto_ready = true;
  int64_t open_delay_ms = 0;
  std::vector<std::shared_ptr<FakePlayerState>> players;
};

inline FakePlayerResource::~FakePlayerResource() {
  Dispose();
}

inline bool FakePlayerResource::AutoReady() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->auto_ready;
}

inline bool FakePlayerResource::Open(const std::string& locator) {
  int64_t delay_ms = 0;
  bool fail = false;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    delay_ms = shared_->open_delay_ms;
    fail = shared_->fail_open_locators.count(locator) > 0;
  }
  if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->open_count++;
  if (fail || state_->disposed) return false;
  state_->locator = locator;
  state_->buffering = true;
  return true;
}

inline void FakePlayerResource::Dispose() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->disposed) return;
    state_->disposed = true;
    state_->playing = false;
    state_->dispose_count++;
    state_->listener = nullptr;
  }
  // The native session stays live until the dispose gate lets it go.
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->disposals_parked++;
  shared_->cv.notify_all();
  shared_->cv.wait(lock, [this] { return !shared_->dispose_gate_closed; });
  shared_->disposals_parked--;
  shared_->live--;
}

// FakePlayerFactory: CreatePlayer() blocks while the gate is closed, throws
// when failures are queued, and records concurrency and live-count peaks.
class FakePlayerFactory : public media::IPlayerFactory {
 public:
  FakePlayerFactory() : shared_(std::make_shared<FakeFactoryShared>()) {}

  std::unique_ptr<media::IPlayerResource> CreatePlayer() override {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    created_.fetch_add(1);
    shared_->creations_in_progress++;
    shared_->max_concurrent_creations =
        std::max(shared_->max_concurrent_creations, shared_->creations_in_progress);
    shared_->cv.notify_all();
    shared_->cv.wait(lock, [this] { return !shared_->gate_closed; });
    shared_->creations_in_progress--;

    if (shared_->fail_next_creates > 0) {
      shared_->fail_next_creates--;
      throw std::runtime_error("fake native creation failure");
    }

    auto state = std::make_shared<FakePlayerState>();
    shared_->players.push_back(state);
    shared_->live++;
    shared_->max_live = std::max(shared_->max_live, shared_->live);
    return std::make_unique<FakePlayerResource>(state, shared_);
  }

  std::unique_ptr<media::IRenderTarget> CreateRenderTarget(
      media::IPlayerResource& /*player*/) override {
    return std::make_unique<FakeRenderTarget>(next_surface_.fetch_add(1));
  }

  // ---- Gate ----
  void CloseGate() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->gate_closed = true;
  }
  void OpenGate() {
    {
      std::lock_guard<std::mutex> lock(shared_->mutex);
      shared_->gate_closed = false;
    }
    shared_->cv.notify_all();
  }
  // Waits until n creations are parked at the gate.
  bool WaitForBlockedCreations(int n, std::chrono::milliseconds timeout =
                                          std::chrono::milliseconds(2000)) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    return shared_->cv.wait_for(lock, timeout, [this, n] {
      return shared_->creations_in_progress >= n;
    });
  }

  // Dispose() parks before releasing its live slot while this gate is closed.
  void CloseDisposeGate() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->dispose_gate_closed = true;
  }
  void OpenDisposeGate() {
    {
      std::lock_guard<std::mutex> lock(shared_->mutex);
      shared_->dispose_gate_closed = false;
    }
    shared_->cv.notify_all();
  }
  bool WaitForParkedDisposals(int n, std::chrono::milliseconds timeout =
                                         std::chrono::milliseconds(2000)) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    return shared_->cv.wait_for(lock, timeout, [this, n] {
      return shared_->disposals_parked >= n;
    });
  }

  // ---- Failure injection ----
  void FailNextCreates(int n) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->fail_next_creates = n;
  }
  void FailOpen(const std::string& locator) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->fail_open_locators.insert(locator);
  }
  void ClearFailures() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->fail_next_creates = 0;
    shared_->fail_open_locators.clear();
  }

  // ---- Buffering / latency ----
  // When false, Play() leaves the player buffering until EmitBuffering().
  void SetAutoReady(bool auto_ready) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->auto_ready = auto_ready;
  }
  void SetOpenDelayMs(int64_t delay_ms) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->open_delay_ms = delay_ms;
  }

  // ---- Counters ----
  int CreatedCount() const { return created_.load(); }
  int LiveCount() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->live;
  }
  int MaxLive() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->max_live;
  }
  int MaxConcurrentCreations() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->max_concurrent_creations;
  }
  std::vector<std::shared_ptr<FakePlayerState>> Players() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->players;
  }
  // Most recent player opened with locator, or nullptr.
  std::shared_ptr<FakePlayerState> PlayerFor(const std::string& locator) const {
    auto players = Players();
    for (auto it = players.rbegin(); it != players.rend(); ++it) {
      if ((*it)->Locator() == locator) return *it;
    }
    return nullptr;
  }

 private:
  std::shared_ptr<FakeFactoryShared> shared_;
  std::atomic<int> created_{0};
  std::atomic<uint64_t> next_surface_{1};
};

}  // namespace feedpool::tests::fixtures

#endif  // FEEDPOOL_TESTS_FIXTURES_FAKE_PLAYER_HPP_

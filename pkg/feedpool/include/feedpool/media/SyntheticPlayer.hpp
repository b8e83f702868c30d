// Repository: Feedpool-engine
// Component: Synthetic Player
// Purpose: In-process IPlayerResource with simulated open latency, used by
//          the scroll simulator when no media backend is selected.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_MEDIA_SYNTHETIC_PLAYER_HPP_
#define FEEDPOOL_MEDIA_SYNTHETIC_PLAYER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "feedpool/media/IPlayerResource.hpp"

namespace feedpool::media {

struct SyntheticPlayerOptions {
  int64_t open_delay_ms = 0;     // Simulated open/probe latency
  int64_t duration_ms = 6000;    // Position wraps here
  std::string fail_prefix = "fail://";  // Locators with this prefix fail to open
};

// Open() sleeps for open_delay_ms, then succeeds unless the locator is empty
// or carries the failure prefix. Buffering is true from Open() until the
// first Play().
class SyntheticPlayerResource : public IPlayerResource {
 public:
  explicit SyntheticPlayerResource(SyntheticPlayerOptions options);

  bool Open(const std::string& locator) override;
  void Play() override;
  void Pause() override;
  void Stop() override;
  void Seek(int64_t position_ms) override;
  void SetVolume(double volume) override;
  void SetRate(double rate) override;

  bool IsPlaying() const override;
  bool IsBuffering() const override;
  int64_t PositionMs() const override;

  void SetBufferingListener(BufferingListener listener) override;
  void Dispose() override;

 private:
  void SetBuffering(bool buffering);
  int64_t PositionLocked() const;

  const SyntheticPlayerOptions options_;

  mutable std::mutex mutex_;
  bool opened_ = false;
  bool playing_ = false;
  bool buffering_ = false;
  bool disposed_ = false;
  double rate_ = 1.0;
  int64_t base_position_ms_ = 0;
  std::chrono::steady_clock::time_point play_started_;

  std::mutex listener_mutex_;
  BufferingListener listener_;
};

class SyntheticRenderTarget : public IRenderTarget {
 public:
  explicit SyntheticRenderTarget(uint64_t surface_id) : surface_id_(surface_id) {}

  uint64_t SurfaceId() const override { return attached_.load() ? surface_id_ : 0; }
  void Detach() override { attached_.store(false); }

 private:
  const uint64_t surface_id_;
  std::atomic<bool> attached_{true};
};

class SyntheticPlayerFactory : public IPlayerFactory {
 public:
  explicit SyntheticPlayerFactory(SyntheticPlayerOptions options = SyntheticPlayerOptions())
      : options_(std::move(options)) {}

  std::unique_ptr<IPlayerResource> CreatePlayer() override;
  std::unique_ptr<IRenderTarget> CreateRenderTarget(IPlayerResource& player) override;

  int64_t CreatedCount() const { return created_.load(); }

 private:
  const SyntheticPlayerOptions options_;
  std::atomic<int64_t> created_{0};
  std::atomic<uint64_t> next_surface_id_{1};
};

}  // namespace feedpool::media

#endif  // FEEDPOOL_MEDIA_SYNTHETIC_PLAYER_HPP_

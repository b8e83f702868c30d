// Repository: Feedpool-engine
// Component: Synthetic Player Implementation
// Purpose: Simulated open latency, buffering and position.
// Copyright (c) 2025 Feedpool

#include "feedpool/media/SyntheticPlayer.hpp"

#include <thread>
#include <utility>

namespace feedpool::media {

SyntheticPlayerResource::SyntheticPlayerResource(SyntheticPlayerOptions options)
    : options_(std::move(options)) {}

bool SyntheticPlayerResource::Open(const std::string& locator) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return false;
  }
  SetBuffering(true);

  if (options_.open_delay_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.open_delay_ms));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (disposed_ || locator.empty()) return false;
  if (!options_.fail_prefix.empty() &&
      locator.compare(0, options_.fail_prefix.size(), options_.fail_prefix) == 0) {
    return false;
  }
  opened_ = true;
  playing_ = false;
  base_position_ms_ = 0;
  return true;
}

void SyntheticPlayerResource::Play() {
  bool was_buffering = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || !opened_) return;
    if (!playing_) {
      playing_ = true;
      play_started_ = std::chrono::steady_clock::now();
    }
    was_buffering = buffering_;
  }
  if (was_buffering) SetBuffering(false);
}

void SyntheticPlayerResource::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playing_) return;
  base_position_ms_ = PositionLocked();
  playing_ = false;
}

void SyntheticPlayerResource::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  playing_ = false;
  base_position_ms_ = 0;
}

void SyntheticPlayerResource::Seek(int64_t position_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  base_position_ms_ = position_ms < 0 ? 0 : position_ms;
  play_started_ = std::chrono::steady_clock::now();
}

void SyntheticPlayerResource::SetVolume(double /*volume*/) {}

void SyntheticPlayerResource::SetRate(double rate) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (rate <= 0.0) return;
  if (playing_) {
    base_position_ms_ = PositionLocked();
    play_started_ = std::chrono::steady_clock::now();
  }
  rate_ = rate;
}

bool SyntheticPlayerResource::IsPlaying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return playing_;
}

bool SyntheticPlayerResource::IsBuffering() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffering_;
}

int64_t SyntheticPlayerResource::PositionMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return PositionLocked();
}

void SyntheticPlayerResource::SetBufferingListener(BufferingListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

void SyntheticPlayerResource::Dispose() {
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  disposed_ = true;
  opened_ = false;
  playing_ = false;
}

void SyntheticPlayerResource::SetBuffering(bool buffering) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffering_ == buffering) return;
    buffering_ = buffering;
  }
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_) listener_(buffering);
}

int64_t SyntheticPlayerResource::PositionLocked() const {
  int64_t position = base_position_ms_;
  if (playing_) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - play_started_);
    position += static_cast<int64_t>(static_cast<double>(elapsed.count()) * rate_);
  }
  if (options_.duration_ms > 0) position %= options_.duration_ms;
  return position;
}

std::unique_ptr<IPlayerResource> SyntheticPlayerFactory::CreatePlayer() {
  created_.fetch_add(1);
  return std::make_unique<SyntheticPlayerResource>(options_);
}

std::unique_ptr<IRenderTarget> SyntheticPlayerFactory::CreateRenderTarget(
    IPlayerResource& /*player*/) {
  return std::make_unique<SyntheticRenderTarget>(next_surface_id_.fetch_add(1));
}

}  // namespace feedpool::media

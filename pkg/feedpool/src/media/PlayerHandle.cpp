// Repository: Feedpool-engine
// Component: Player Handle Implementation
// Purpose: Disposed-flag guarded forwarding to the native player.
// Copyright (c) 2025 Feedpool

#include "feedpool/media/PlayerHandle.hpp"

#include <exception>
#include <sstream>
#include <utility>
#include <vector>

#include "feedpool/util/Logger.hpp"

namespace feedpool::media {

using feedpool::util::Logger;

PlayerHandle::PlayerHandle(std::string key,
                           std::unique_ptr<IPlayerResource> player,
                           std::unique_ptr<IRenderTarget> target)
    : key_(std::move(key)),
      player_(std::move(player)),
      target_(std::move(target)) {
  if (player_) {
    player_->SetBufferingListener(
        [this](bool buffering) { DispatchBuffering(buffering); });
  }
}

PlayerHandle::~PlayerHandle() {
  Dispose();
}

uint64_t PlayerHandle::SurfaceId() const {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !target_) return 0;
  return target_->SurfaceId();
}

bool PlayerHandle::Open(const std::string& locator) {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return false;
  if (!opened_locator_.empty() && opened_locator_ == locator) return true;

  if (!player_->Open(locator)) return false;
  opened_locator_ = locator;
  return true;
}

std::string PlayerHandle::OpenedLocator() const {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  return opened_locator_;
}

void PlayerHandle::Play() {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return;
  player_->Play();
}

void PlayerHandle::Pause() {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return;
  player_->Pause();
}

void PlayerHandle::Stop() {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return;
  player_->Stop();
}

void PlayerHandle::Seek(int64_t position_ms) {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return;
  player_->Seek(position_ms < 0 ? 0 : position_ms);
}

void PlayerHandle::SetVolume(double volume) {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return;
  if (volume < 0.0) volume = 0.0;
  if (volume > 1.0) volume = 1.0;
  player_->SetVolume(volume);
}

void PlayerHandle::SetRate(double rate) {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return;
  if (rate <= 0.0) return;
  player_->SetRate(rate);
}

bool PlayerHandle::IsPlaying() const {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return false;
  return player_->IsPlaying();
}

bool PlayerHandle::IsBuffering() const {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return false;
  return player_->IsBuffering();
}

int64_t PlayerHandle::PositionMs() const {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  if (disposed_ || !player_) return 0;
  return player_->PositionMs();
}

bool PlayerHandle::IsDisposed() const {
  std::lock_guard<std::recursive_mutex> lock(op_mutex_);
  return disposed_;
}

int PlayerHandle::AddBufferingListener(BufferingListener listener) {
  if (IsDisposed()) return 0;
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const int id = next_listener_id_++;
  buffering_listeners_.emplace(id, std::move(listener));
  return id;
}

void PlayerHandle::RemoveBufferingListener(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  buffering_listeners_.erase(id);
}

int PlayerHandle::AddDisposedListener(DisposedListener listener) {
  if (IsDisposed()) return 0;
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const int id = next_listener_id_++;
  disposed_listeners_.emplace(id, std::move(listener));
  return id;
}

void PlayerHandle::RemoveDisposedListener(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  disposed_listeners_.erase(id);
}

void PlayerHandle::DispatchBuffering(bool buffering) {
  std::vector<std::pair<int, BufferingListener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners.assign(buffering_listeners_.begin(), buffering_listeners_.end());
  }
  for (const auto& [id, listener] : listeners) {
    // Skip listeners removed by an earlier callback in this dispatch.
    {
      std::lock_guard<std::mutex> lock(listeners_mutex_);
      if (buffering_listeners_.count(id) == 0) continue;
    }
    listener(buffering);
  }
}

void PlayerHandle::Dispose() {
  {
    std::lock_guard<std::recursive_mutex> lock(op_mutex_);
    if (disposed_) return;
    disposed_ = true;

    try {
      if (target_) {
        target_->Detach();
      }
      if (player_) {
        player_->Stop();
        player_->SetBufferingListener(nullptr);
        player_->Dispose();
      }
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[PlayerHandle] DISPOSE_ERROR key=" << key_ << " error=" << e.what();
      Logger::Warn(oss.str());
    }
    target_.reset();
    player_.reset();
  }

  std::map<int, DisposedListener> disposed_listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    buffering_listeners_.clear();
    disposed_listeners.swap(disposed_listeners_);
  }
  for (const auto& entry : disposed_listeners) {
    entry.second();
  }
}

}  // namespace feedpool::media

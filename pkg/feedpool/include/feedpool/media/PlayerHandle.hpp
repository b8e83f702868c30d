// Repository: Feedpool-engine
// Component: Player Handle
// Purpose: Pooled unit pairing a native player with its render target.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_MEDIA_PLAYER_HANDLE_HPP_
#define FEEDPOOL_MEDIA_PLAYER_HANDLE_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "feedpool/media/IPlayerResource.hpp"

namespace feedpool::pool {
class PlayerPool;
class PoolManager;
}  // namespace feedpool::pool

namespace feedpool::media {

// PlayerHandle owns one IPlayerResource and the IRenderTarget bound to it.
//
// Lifetime: created and disposed only by PlayerPool / PoolManager. Consumers
// receive shared references but cannot dispose; Dispose() is private.
// After disposal every operation is a no-op returning a neutral value, so a
// consumer that still holds a reference after eviction observes an inert
// handle rather than freed native state.
//
// Disposal order: render target detached, player stopped, buffering listener
// removed, player disposed. Disposed listeners run after that, without the
// handle's lock held.
class PlayerHandle {
 public:
  using BufferingListener = std::function<void(bool buffering)>;
  using DisposedListener = std::function<void()>;

  PlayerHandle(std::string key,
               std::unique_ptr<IPlayerResource> player,
               std::unique_ptr<IRenderTarget> target);
  ~PlayerHandle();

  PlayerHandle(const PlayerHandle&) = delete;
  PlayerHandle& operator=(const PlayerHandle&) = delete;

  const std::string& key() const { return key_; }

  // 0 once disposed.
  uint64_t SurfaceId() const;

  // Opening the locator that is already open is a no-op returning true.
  bool Open(const std::string& locator);
  std::string OpenedLocator() const;

  void Play();
  void Pause();
  void Stop();
  void Seek(int64_t position_ms);
  void SetVolume(double volume);
  void SetRate(double rate);

  bool IsPlaying() const;
  bool IsBuffering() const;
  int64_t PositionMs() const;
  bool IsDisposed() const;

  // Returns a subscription id; 0 if the handle is already disposed.
  int AddBufferingListener(BufferingListener listener);
  // After return the listener is not started again. A call already running
  // on another thread may still complete.
  void RemoveBufferingListener(int id);

  // Returns a subscription id; 0 if the handle is already disposed.
  int AddDisposedListener(DisposedListener listener);
  void RemoveDisposedListener(int id);

 private:
  friend class pool::PlayerPool;
  friend class pool::PoolManager;

  // Idempotent.
  void Dispose();

  void DispatchBuffering(bool buffering);

  const std::string key_;

  // Serializes native calls and disposal. Recursive because a native
  // runtime may report buffering synchronously from inside Play()/Open(),
  // and listeners may call back into the handle on the same thread.
  mutable std::recursive_mutex op_mutex_;
  std::unique_ptr<IPlayerResource> player_;
  std::unique_ptr<IRenderTarget> target_;
  std::string opened_locator_;
  bool disposed_ = false;

  mutable std::mutex listeners_mutex_;
  int next_listener_id_ = 1;
  std::map<int, BufferingListener> buffering_listeners_;
  std::map<int, DisposedListener> disposed_listeners_;
};

}  // namespace feedpool::media

#endif  // FEEDPOOL_MEDIA_PLAYER_HANDLE_HPP_

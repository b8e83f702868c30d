// Repository: Feedpool-engine
// Component: Player Resource Interface
// Purpose: Minimal seam to the native media runtime (decoder/player + surface).
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_MEDIA_IPLAYER_RESOURCE_HPP_
#define FEEDPOOL_MEDIA_IPLAYER_RESOURCE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace feedpool::media {

// IPlayerResource is one native decoder/player session. The engine never
// decodes or renders; it only decides which of these exist and when.
//
// Threading: calls may arrive from pool workers, the feed controller and
// position timers. Implementations must tolerate calls from any thread.
// The buffering listener may be invoked from any thread, including
// synchronously from inside Open() or Play().
class IPlayerResource {
 public:
  using BufferingListener = std::function<void(bool buffering)>;

  virtual ~IPlayerResource() = default;

  // Opens a media locator (URL or local file path). Slow.
  // Returns false if the source cannot be opened.
  virtual bool Open(const std::string& locator) = 0;

  virtual void Play() = 0;
  virtual void Pause() = 0;
  virtual void Stop() = 0;
  virtual void Seek(int64_t position_ms) = 0;

  // Volume in [0.0, 1.0].
  virtual void SetVolume(double volume) = 0;
  virtual void SetRate(double rate) = 0;

  virtual bool IsPlaying() const = 0;
  virtual bool IsBuffering() const = 0;
  virtual int64_t PositionMs() const = 0;

  // Single listener slot. Passing nullptr detaches; once that call returns
  // the previous listener is never invoked again.
  virtual void SetBufferingListener(BufferingListener listener) = 0;

  // Releases native resources. Called exactly once by PlayerHandle.
  virtual void Dispose() = 0;
};

// IRenderTarget is the surface binding that presents a player's frames.
// It must be detached before the player it is bound to is disposed.
class IRenderTarget {
 public:
  virtual ~IRenderTarget() = default;

  virtual uint64_t SurfaceId() const = 0;
  virtual void Detach() = 0;
};

// IPlayerFactory creates native sessions. Injected into the pools by the
// host; tests install fakes with controllable latency and failures.
class IPlayerFactory {
 public:
  virtual ~IPlayerFactory() = default;

  // May throw std::exception on native failure.
  virtual std::unique_ptr<IPlayerResource> CreatePlayer() = 0;

  virtual std::unique_ptr<IRenderTarget> CreateRenderTarget(
      IPlayerResource& player) = 0;
};

}  // namespace feedpool::media

#endif  // FEEDPOOL_MEDIA_IPLAYER_RESOURCE_HPP_

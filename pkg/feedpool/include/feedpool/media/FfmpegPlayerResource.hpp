// Repository: Feedpool-engine
// Component: FFmpeg Player Resource
// Purpose: IPlayerResource backed by a libavformat demux session.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_MEDIA_FFMPEG_PLAYER_RESOURCE_HPP_
#define FEEDPOOL_MEDIA_FFMPEG_PLAYER_RESOURCE_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "feedpool/media/IPlayerResource.hpp"

// Forward declarations to avoid FFmpeg headers in public API
struct AVFormatContext;

namespace feedpool::media {

// FfmpegPlayerResource opens a container with libavformat, probes stream
// info and locates the video stream. It does not decode: presentation
// belongs to the host's render pipeline. Playback position is tracked
// against a steady clock scaled by rate and wraps at the stream duration
// (single-item loop).
//
// Buffering: true from the start of Open() until the first Play() of a
// probed stream; cleared again when Open() fails.
class FfmpegPlayerResource : public IPlayerResource {
 public:
  FfmpegPlayerResource();
  ~FfmpegPlayerResource() override;

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

  int64_t DurationMs() const;
  int VideoStreamIndex() const;
  double Volume() const;

 private:
  bool OpenLocked(const std::string& locator);
  void Close();
  void SetBuffering(bool buffering);
  int64_t PositionLocked() const;

  mutable std::mutex mutex_;
  AVFormatContext* format_ctx_ = nullptr;
  int video_stream_index_ = -1;
  int64_t duration_ms_ = 0;

  bool playing_ = false;
  bool buffering_ = false;
  bool disposed_ = false;
  double volume_ = 1.0;
  double rate_ = 1.0;
  int64_t base_position_ms_ = 0;
  std::chrono::steady_clock::time_point play_started_;

  // Listener slot has its own lock so it can be invoked without mutex_.
  std::mutex listener_mutex_;
  BufferingListener listener_;
};

// Headless render target: a process-unique surface id, no presentation.
class FfmpegRenderTarget : public IRenderTarget {
 public:
  FfmpegRenderTarget();

  uint64_t SurfaceId() const override;
  void Detach() override;
  bool IsAttached() const;

 private:
  static std::atomic<uint64_t> next_surface_id_;
  const uint64_t surface_id_;
  std::atomic<bool> attached_{true};
};

class FfmpegPlayerFactory : public IPlayerFactory {
 public:
  std::unique_ptr<IPlayerResource> CreatePlayer() override;
  std::unique_ptr<IRenderTarget> CreateRenderTarget(IPlayerResource& player) override;
};

}  // namespace feedpool::media

#endif  // FEEDPOOL_MEDIA_FFMPEG_PLAYER_RESOURCE_HPP_

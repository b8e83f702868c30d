// Repository: Feedpool-engine
// Component: FFmpeg Player Resource Implementation
// Purpose: Container open/probe/seek via libavformat.
// Copyright (c) 2025 Feedpool

#include "feedpool/media/FfmpegPlayerResource.hpp"

#include <sstream>
#include <utility>

#include "feedpool/util/Logger.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace feedpool::media {

using feedpool::util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FfmpegPlayerResource::FfmpegPlayerResource() = default;

FfmpegPlayerResource::~FfmpegPlayerResource() {
  Dispose();
}

bool FfmpegPlayerResource::Open(const std::string& locator) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return false;
  }
  SetBuffering(true);

  bool opened = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    opened = OpenLocked(locator);
  }
  // A failed open leaves nothing to wait for.
  if (!opened) SetBuffering(false);
  return opened;
}

bool FfmpegPlayerResource::OpenLocked(const std::string& locator) {
  Close();

  // Only libav errors reach stderr.
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    Logger::Error("[FfmpegPlayer] Failed to allocate format context");
    return false;
  }

  int ret = avformat_open_input(&format_ctx_, locator.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FfmpegPlayer] OPEN_STEP open_input FAILED uri=" << locator
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FfmpegPlayer] OPEN_STEP find_stream_info FAILED uri=" << locator
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    Close();
    return false;
  }

  video_stream_index_ =
      av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_index_ < 0) {
    std::ostringstream oss;
    oss << "[FfmpegPlayer] OPEN_STEP find_video_stream FAILED uri=" << locator
        << " (no video stream)";
    Logger::Warn(oss.str());
    Close();
    return false;
  }

  duration_ms_ = format_ctx_->duration > 0
                     ? format_ctx_->duration / (AV_TIME_BASE / 1000)
                     : 0;
  base_position_ms_ = 0;
  playing_ = false;

  std::ostringstream oss;
  oss << "[FfmpegPlayer] OPENED uri=" << locator
      << " video_stream=" << video_stream_index_
      << " duration_ms=" << duration_ms_;
  Logger::Debug(oss.str());
  return true;
}

void FfmpegPlayerResource::Play() {
  bool ready = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || !format_ctx_) return;
    if (!playing_) {
      playing_ = true;
      play_started_ = std::chrono::steady_clock::now();
    }
    ready = buffering_;
  }
  // Probed streams are immediately presentable.
  if (ready) SetBuffering(false);
}

void FfmpegPlayerResource::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playing_) return;
  base_position_ms_ = PositionLocked();
  playing_ = false;
}

void FfmpegPlayerResource::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  playing_ = false;
  base_position_ms_ = 0;
}

void FfmpegPlayerResource::Seek(int64_t position_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposed_ || !format_ctx_) return;
  if (position_ms < 0) position_ms = 0;
  if (duration_ms_ > 0 && position_ms > duration_ms_) position_ms = duration_ms_;

  const int64_t target = position_ms * (AV_TIME_BASE / 1000);
  const int ret = av_seek_frame(format_ctx_, -1, target, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FfmpegPlayer] SEEK_FAILED position_ms=" << position_ms
        << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    return;
  }
  base_position_ms_ = position_ms;
  play_started_ = std::chrono::steady_clock::now();
}

void FfmpegPlayerResource::SetVolume(double volume) {
  std::lock_guard<std::mutex> lock(mutex_);
  volume_ = volume;
}

void FfmpegPlayerResource::SetRate(double rate) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (rate <= 0.0) return;
  if (playing_) {
    base_position_ms_ = PositionLocked();
    play_started_ = std::chrono::steady_clock::now();
  }
  rate_ = rate;
}

bool FfmpegPlayerResource::IsPlaying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return playing_;
}

bool FfmpegPlayerResource::IsBuffering() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffering_;
}

int64_t FfmpegPlayerResource::PositionMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return PositionLocked();
}

int64_t FfmpegPlayerResource::DurationMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return duration_ms_;
}

int FfmpegPlayerResource::VideoStreamIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return video_stream_index_;
}

double FfmpegPlayerResource::Volume() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return volume_;
}

void FfmpegPlayerResource::SetBufferingListener(BufferingListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

void FfmpegPlayerResource::Dispose() {
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposed_) return;
  disposed_ = true;
  playing_ = false;
  Close();
}

void FfmpegPlayerResource::Close() {
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
    format_ctx_ = nullptr;
  }
  video_stream_index_ = -1;
  duration_ms_ = 0;
}

void FfmpegPlayerResource::SetBuffering(bool buffering) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffering_ == buffering) return;
    buffering_ = buffering;
  }
  // Held across the call so a concurrent detach waits for it.
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_) listener_(buffering);
}

int64_t FfmpegPlayerResource::PositionLocked() const {
  int64_t position = base_position_ms_;
  if (playing_) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - play_started_);
    position += static_cast<int64_t>(static_cast<double>(elapsed.count()) * rate_);
  }
  if (duration_ms_ > 0) position %= duration_ms_;
  return position;
}

std::atomic<uint64_t> FfmpegRenderTarget::next_surface_id_{1};

FfmpegRenderTarget::FfmpegRenderTarget()
    : surface_id_(next_surface_id_.fetch_add(1)) {}

uint64_t FfmpegRenderTarget::SurfaceId() const {
  return attached_.load() ? surface_id_ : 0;
}

void FfmpegRenderTarget::Detach() {
  attached_.store(false);
}

bool FfmpegRenderTarget::IsAttached() const {
  return attached_.load();
}

std::unique_ptr<IPlayerResource> FfmpegPlayerFactory::CreatePlayer() {
  return std::make_unique<FfmpegPlayerResource>();
}

std::unique_ptr<IRenderTarget> FfmpegPlayerFactory::CreateRenderTarget(
    IPlayerResource& /*player*/) {
  return std::make_unique<FfmpegRenderTarget>();
}

}  // namespace feedpool::media

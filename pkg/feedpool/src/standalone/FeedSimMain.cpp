// Repository: Feedpool-engine
// Component: Feed Scroll Simulator
// Purpose: Drives a FeedController through a scripted scroll path and prints
//          per-index load states after every step.
// Copyright (c) 2025 Feedpool
//
// This binary is for diagnostics only. It exercises the same PoolManager and
// FeedController a host embeds, backed by either the synthetic in-process
// player or, with --media, the FFmpeg backend.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "feedpool/config/EngineConfig.hpp"
#include "feedpool/feed/FeedController.hpp"
#include "feedpool/media/SyntheticPlayer.hpp"
#include "feedpool/pool/DeviceMemory.hpp"
#include "feedpool/pool/PoolManager.hpp"
#include "feedpool/util/Logger.hpp"

#if defined(FEEDPOOL_WITH_FFMPEG)
#include "feedpool/media/FfmpegPlayerResource.hpp"
#endif

namespace {

using feedpool::config::EngineConfig;
using feedpool::feed::FeedController;
using feedpool::feed::LoadState;
using feedpool::feed::LoadStateName;
using feedpool::feed::VideoItem;
using feedpool::util::Logger;

// =============================================================================
// Set by SIGINT/SIGTERM; polled between scroll steps.
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  int items = 10;
  int capacity = -1;  // -1 = keep config
  int ahead = -1;
  int behind = -1;
  std::vector<int> path;
  std::string config_path;
  std::string media_path;  // FFmpeg backend when set
  int64_t open_delay_ms = 40;
  int64_t dwell_ms = 250;
  bool metrics = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Scroll simulator for the pooled feed engine.\n"
            << "\n"
            << "FEED OPTIONS:\n"
            << "  --items N            Number of videos in the feed (default: 10)\n"
            << "  --path I,J,K         Index visit sequence (default: 0..items-1)\n"
            << "  --ahead N            Preload ahead count\n"
            << "  --behind N           Preload behind count\n"
            << "  --dwell-ms MS        Time spent on each index (default: 250)\n"
            << "\n"
            << "POOL OPTIONS:\n"
            << "  --capacity N         Pool capacity (default: device memory tier)\n"
            << "  --config PATH        Engine configuration JSON\n"
            << "\n"
            << "BACKEND OPTIONS:\n"
            << "  --media PATH         Open PATH with the FFmpeg backend for every item\n"
            << "  --open-delay-ms MS   Synthetic backend open latency (default: 40)\n"
            << "\n"
            << "OUTPUT OPTIONS:\n"
            << "  --metrics            Print Prometheus metrics at exit\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --items 20 --capacity 3 --path 0,1,2,5,6\n"
            << "  " << program_name << " --media /tmp/clip.mp4 --metrics\n"
            << "\n";
}

bool ParsePath(const std::string& text, std::vector<int>& out) {
  std::stringstream ss(text);
  std::string token;
  while (std::getline(ss, token, ',')) {
    if (token.empty()) return false;
    char* end = nullptr;
    const long value = std::strtol(token.c_str(), &end, 10);
    if (*end != '\0' || value < 0) return false;
    out.push_back(static_cast<int>(value));
  }
  return !out.empty();
}

bool ParseInt(const char* text, int64_t& out) {
  char* end = nullptr;
  const long long value = std::strtoll(text, &end, 10);
  if (end == text || *end != '\0') return false;
  out = value;
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    int64_t value = 0;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--path" && i + 1 < argc) {
      if (!ParsePath(argv[++i], args.path)) {
        args.error = "--path expects comma-separated non-negative indices";
        return args;
      }
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--media" && i + 1 < argc) {
      args.media_path = argv[++i];
    } else if (arg == "--metrics") {
      args.metrics = true;
    } else if ((arg == "--items" || arg == "--capacity" || arg == "--ahead" ||
                arg == "--behind" || arg == "--open-delay-ms" || arg == "--dwell-ms") &&
               i + 1 < argc) {
      if (!ParseInt(argv[++i], value) || value < 0) {
        args.error = arg + " expects a non-negative integer";
        return args;
      }
      if (arg == "--items") args.items = static_cast<int>(value);
      else if (arg == "--capacity") args.capacity = static_cast<int>(value);
      else if (arg == "--ahead") args.ahead = static_cast<int>(value);
      else if (arg == "--behind") args.behind = static_cast<int>(value);
      else if (arg == "--open-delay-ms") args.open_delay_ms = value;
      else args.dwell_ms = value;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.items <= 0) {
    args.error = "--items must be positive";
    return args;
  }
  if (args.path.empty()) {
    for (int i = 0; i < args.items; ++i) args.path.push_back(i);
  }
  for (int index : args.path) {
    if (index >= args.items) {
      args.error = "--path index " + std::to_string(index) + " is outside the feed";
      return args;
    }
  }
#if !defined(FEEDPOOL_WITH_FFMPEG)
  if (!args.media_path.empty()) {
    args.error = "--media requires a build with FEEDPOOL_WITH_FFMPEG";
    return args;
  }
#endif

  args.valid = true;
  return args;
}

std::string DescribeStates(const FeedController& feed, int items) {
  std::ostringstream oss;
  oss << "[";
  for (int i = 0; i < items; ++i) {
    const LoadState state = feed.GetLoadState(i);
    if (state == LoadState::kNone) continue;
    if (oss.tellp() > 1) oss << " ";
    oss << i << ":" << LoadStateName(state);
  }
  oss << "]";
  return oss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  EngineConfig config;
  if (!args.config_path.empty()) {
    auto loaded = EngineConfig::FromFile(args.config_path);
    if (!loaded) return 1;
    config = *loaded;
  }
  config.ApplyEnvironmentOverrides();
  if (args.capacity >= 0) config.pool.capacity = args.capacity;
  if (args.ahead >= 0) config.feed.preload_ahead = args.ahead;
  if (args.behind >= 0) config.feed.preload_behind = args.behind;
  if (config.pool.session_id.empty()) config.pool.session_id = "sim";
  if (!config.IsValid()) {
    std::cerr << "Error: invalid configuration " << config.ToJson() << "\n";
    return 1;
  }

  std::shared_ptr<feedpool::media::IPlayerFactory> factory;
#if defined(FEEDPOOL_WITH_FFMPEG)
  if (!args.media_path.empty()) {
    factory = std::make_shared<feedpool::media::FfmpegPlayerFactory>();
  }
#endif
  if (!factory) {
    feedpool::media::SyntheticPlayerOptions options;
    options.open_delay_ms = args.open_delay_ms;
    factory = std::make_shared<feedpool::media::SyntheticPlayerFactory>(options);
  }

  std::vector<VideoItem> videos;
  videos.reserve(static_cast<size_t>(args.items));
  for (int i = 0; i < args.items; ++i) {
    VideoItem item;
    item.id = "v" + std::to_string(i);
    item.url = args.media_path.empty() ? "synthetic://" + item.id : args.media_path;
    videos.push_back(std::move(item));
  }

  auto manager = std::make_shared<feedpool::pool::PoolManager>(factory, config.pool);

  std::atomic<int64_t> position_ticks{0};
  FeedController::Hooks hooks;
  hooks.on_position = [&position_ticks](int /*index*/, int64_t /*position_ms*/) {
    position_ticks.fetch_add(1);
  };

  {
    std::ostringstream oss;
    oss << "[FeedSim] START items=" << args.items
        << " capacity=" << manager->capacity()
        << " ahead=" << config.feed.preload_ahead
        << " behind=" << config.feed.preload_behind
        << " backend=" << (args.media_path.empty() ? "synthetic" : "ffmpeg");
    Logger::Info(oss.str());
  }

  auto feed = FeedController::Create(manager, videos, config.feed, hooks);

  int step = 0;
  for (int index : args.path) {
    if (g_termination_requested.load(std::memory_order_acquire)) break;
    feed->OnPageChanged(index);
    std::this_thread::sleep_for(std::chrono::milliseconds(args.dwell_ms));

    std::cout << "step=" << step++ << " index=" << index
              << " states=" << DescribeStates(*feed, args.items)
              << " resident=" << manager->ResidentCount() << "/" << manager->capacity()
              << std::endl;
  }

  feed->Dispose();
  feed.reset();

  std::cout << "position_ticks=" << position_ticks.load() << std::endl;
  if (args.metrics) {
    std::cout << manager->Metrics().GeneratePrometheusText();
  }

  manager->Shutdown();
  return 0;
}

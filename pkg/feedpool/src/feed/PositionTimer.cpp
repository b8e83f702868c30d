// Repository: Feedpool-engine
// Component: Position Timer Implementation
// Purpose: Interval loop with prompt, self-safe shutdown.
// Copyright (c) 2025 Feedpool

#include "feedpool/feed/PositionTimer.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "feedpool/util/Logger.hpp"

namespace feedpool::feed {

using feedpool::util::Logger;

PositionTimer::PositionTimer(std::chrono::milliseconds interval, TickFn tick)
    : state_(std::make_shared<State>()) {
  if (interval.count() <= 0) interval = std::chrono::milliseconds(1);
  thread_ = std::thread(&PositionTimer::Run, state_, interval, std::move(tick));
}

PositionTimer::~PositionTimer() {
  Stop();
}

void PositionTimer::Stop() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stop = true;
  }
  state_->cv.notify_all();

  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
  } else {
    thread_.join();
  }
}

bool PositionTimer::IsRunning() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return !state_->stop;
}

void PositionTimer::Run(std::shared_ptr<State> state,
                        std::chrono::milliseconds interval, TickFn tick) {
  auto next = std::chrono::steady_clock::now() + interval;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      if (state->cv.wait_until(lock, next, [&state] { return state->stop; })) {
        return;
      }
    }
    next += interval;

    try {
      tick();
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[PositionTimer] TICK_FAILED error=\"" << e.what() << "\"";
      Logger::Error(oss.str());
    }

    // Resync after a long tick instead of firing a burst.
    const auto now = std::chrono::steady_clock::now();
    if (next < now) next = now + interval;
  }
}

}  // namespace feedpool::feed

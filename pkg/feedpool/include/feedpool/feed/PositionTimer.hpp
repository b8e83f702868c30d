// Repository: Feedpool-engine
// Component: Position Timer
// Purpose: Periodic tick thread driving playback position callbacks.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_FEED_POSITION_TIMER_HPP_
#define FEEDPOOL_FEED_POSITION_TIMER_HPP_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace feedpool::feed {

// PositionTimer invokes tick every interval on its own thread until stopped.
//
// Stop() is safe from any thread, including from inside tick: in that case
// the thread is detached rather than joined and exits after tick returns.
// No tick starts after Stop() returns. Exceptions thrown by tick are logged
// and the timer keeps running.
class PositionTimer {
 public:
  using TickFn = std::function<void()>;

  PositionTimer(std::chrono::milliseconds interval, TickFn tick);
  ~PositionTimer();

  PositionTimer(const PositionTimer&) = delete;
  PositionTimer& operator=(const PositionTimer&) = delete;

  void Stop();
  bool IsRunning() const;

 private:
  // Shared with the thread so a detached thread never touches a destroyed
  // timer.
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool stop = false;
  };

  static void Run(std::shared_ptr<State> state,
                  std::chrono::milliseconds interval, TickFn tick);

  std::shared_ptr<State> state_;
  std::thread thread_;
};

}  // namespace feedpool::feed

#endif  // FEEDPOOL_FEED_POSITION_TIMER_HPP_

// Repository: Feedpool-engine
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents multi-thread interleave.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_UTIL_LOGGER_HPP_
#define FEEDPOOL_UTIL_LOGGER_HPP_

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace feedpool::util {

// Process-wide logger guarded by one static mutex.
// Every call writes one whole line, newline included, and
// flushes, so lines from creation workers, position timers and native
// buffering callbacks never interleave.
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when FEEDPOOL_DEBUG env is set
// Warn  -> stderr (degraded but recoverable: failed creation, exhausted eviction)
// Error -> stderr (host callback failures, broken invariants)
//
// Test-only: SetInfoSink / SetWarnSink / SetErrorSink install a callback
// invoked for every line of that level in addition to the stream. Sinks run
// under the logger mutex and must not log.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(Sink sink);
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);

 private:
  static void Emit(std::ostream& out, const Sink& sink, const std::string& line);
  static void Replace(Sink& slot, Sink sink);

  static std::mutex mutex_;
  static Sink error_sink_;
  static Sink info_sink_;
  static Sink warn_sink_;
};

}  // namespace feedpool::util

#endif  // FEEDPOOL_UTIL_LOGGER_HPP_

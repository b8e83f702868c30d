// Repository: Feedpool-engine
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents multi-thread interleave.
// Copyright (c) 2025 Feedpool

#include "feedpool/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace feedpool::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::error_sink_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;

void Logger::Replace(Sink& slot, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  slot = std::move(sink);
}

// Caller holds mutex_.
void Logger::Emit(std::ostream& out, const Sink& sink, const std::string& line) {
  if (sink) sink(line);
  out << line << '\n';
  out.flush();
}

void Logger::SetErrorSink(Sink sink) { Replace(error_sink_, std::move(sink)); }
void Logger::SetInfoSink(Sink sink) { Replace(info_sink_, std::move(sink)); }
void Logger::SetWarnSink(Sink sink) { Replace(warn_sink_, std::move(sink)); }

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, info_sink_, line);
}

void Logger::Debug(const std::string& line) {
  static const bool enabled = std::getenv("FEEDPOOL_DEBUG") != nullptr;
  if (!enabled) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, Sink{}, line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, warn_sink_, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, error_sink_, line);
}

}  // namespace feedpool::util

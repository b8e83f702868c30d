// Repository: Feedpool-engine
// Component: Engine Configuration Implementation
// Purpose: Parse, validate and serialize EngineConfig.
// Copyright (c) 2025 Feedpool

#include "feedpool/config/EngineConfig.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <initializer_list>
#include <regex>
#include <sstream>
#include <utility>

#include "feedpool/util/Logger.hpp"

namespace feedpool::config {

using feedpool::util::Logger;

namespace {
  // The schema is fixed and flat, so fields are matched directly.
  enum class Field { kMissing, kOk, kMalformed };

  // Integer field lookup; false when absent.
  Field ExtractInt(const std::string& json, const std::string& field_name, int& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) return Field::kMissing;

    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+)\\s*[,}]");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) return Field::kMalformed;
    try {
      out_value = std::stoi(match[1].str());
    } catch (const std::exception&) {
      return Field::kMalformed;
    }
    return Field::kOk;
  }

  Field ExtractDouble(const std::string& json, const std::string& field_name, double& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) return Field::kMissing;

    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+(?:\\.\\d+)?)\\s*[,}]");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) return Field::kMalformed;
    try {
      out_value = std::stod(match[1].str());
    } catch (const std::exception&) {
      return Field::kMalformed;
    }
    return Field::kOk;
  }

  // String field lookup; false when absent.
  Field ExtractString(const std::string& json, const std::string& field_name, std::string& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) return Field::kMissing;

    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"([^\"]*)\"");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) return Field::kMalformed;
    out_value = match[1].str();
    return Field::kOk;
  }

  // Extract nested object (e.g., "pool": { ... })
  bool ExtractNestedObject(const std::string& json, const std::string& field_name, std::string& out_json) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\\{");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }

    size_t start_pos = match.position() + match.length() - 1;  // '{'
    int brace_count = 1;
    size_t pos = start_pos + 1;
    while (pos < json.length() && brace_count > 0) {
      if (json[pos] == '{') brace_count++;
      else if (json[pos] == '}') brace_count--;
      pos++;
    }

    if (brace_count == 0) {
      out_json = json.substr(start_pos, pos - start_pos);
      return true;
    }
    return false;
  }

  bool ReadInts(const std::string& json,
                std::initializer_list<std::pair<const char*, int*>> fields) {
    for (const auto& [name, target] : fields) {
      if (ExtractInt(json, name, *target) == Field::kMalformed) return false;
    }
    return true;
  }

  // Non-negative integer from the environment; nullopt when unset.
  std::optional<int> EnvInt(const char* name, bool& malformed) {
    malformed = false;
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return std::nullopt;
    char* end = nullptr;
    const long value = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || value < 0 || value > 1000000) {
      malformed = true;
      return std::nullopt;
    }
    return static_cast<int>(value);
  }
}  // namespace

std::optional<EngineConfig> EngineConfig::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  EngineConfig config;

  std::string pool_json;
  if (ExtractNestedObject(json_str, "pool", pool_json)) {
    pool::PoolConfig& p = config.pool;
    if (!ReadInts(pool_json, {{"capacity", &p.capacity},
                              {"max_concurrent_creations", &p.max_concurrent_creations},
                              {"eviction_attempts", &p.eviction_attempts},
                              {"eviction_retry_backoff_ms", &p.eviction_retry_backoff_ms},
                              {"distance_cancel_threshold", &p.distance_cancel_threshold},
                              {"fast_scroll_jump", &p.fast_scroll_jump}})) {
      return std::nullopt;
    }
    if (ExtractString(pool_json, "session_id", p.session_id) == Field::kMalformed) {
      return std::nullopt;
    }
  }

  std::string feed_json;
  if (ExtractNestedObject(json_str, "feed", feed_json)) {
    feed::FeedConfig& f = config.feed;
    int interval_ms = static_cast<int>(f.position_interval_ms);
    if (!ReadInts(feed_json, {{"preload_ahead", &f.preload_ahead},
                              {"preload_behind", &f.preload_behind},
                              {"position_interval_ms", &interval_ms},
                              {"initial_index", &f.initial_index}})) {
      return std::nullopt;
    }
    f.position_interval_ms = interval_ms;
    if (ExtractDouble(feed_json, "default_volume", f.default_volume) == Field::kMalformed) {
      return std::nullopt;
    }
  }

  if (!config.IsValid()) {
    return std::nullopt;
  }
  return config;
}

std::optional<EngineConfig> EngineConfig::FromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    Logger::Error("[EngineConfig] CONFIG_UNREADABLE path=" + path);
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  auto config = FromJson(contents.str());
  if (!config) {
    Logger::Error("[EngineConfig] CONFIG_INVALID path=" + path);
  }
  return config;
}

std::string EngineConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"pool\":{"
      << "\"capacity\":" << pool.capacity << ","
      << "\"max_concurrent_creations\":" << pool.max_concurrent_creations << ","
      << "\"eviction_attempts\":" << pool.eviction_attempts << ","
      << "\"eviction_retry_backoff_ms\":" << pool.eviction_retry_backoff_ms << ","
      << "\"distance_cancel_threshold\":" << pool.distance_cancel_threshold << ","
      << "\"fast_scroll_jump\":" << pool.fast_scroll_jump << ","
      << "\"session_id\":\"" << pool.session_id << "\""
      << "},"
      << "\"feed\":{"
      << "\"preload_ahead\":" << feed.preload_ahead << ","
      << "\"preload_behind\":" << feed.preload_behind << ","
      << "\"position_interval_ms\":" << feed.position_interval_ms << ","
      << "\"initial_index\":" << feed.initial_index << ","
      << "\"default_volume\":" << feed.default_volume
      << "}"
      << "}";
  return oss.str();
}

bool EngineConfig::IsValid() const {
  // Pool
  if (pool.capacity < 0) return false;
  if (pool.max_concurrent_creations < 1) return false;
  if (pool.eviction_attempts < 0 || pool.eviction_retry_backoff_ms < 0) return false;
  if (pool.distance_cancel_threshold < 0 || pool.fast_scroll_jump < 0) return false;

  // Feed
  if (feed.preload_ahead < 0 || feed.preload_behind < 0) return false;
  if (feed.position_interval_ms <= 0) return false;
  if (feed.initial_index < 0) return false;
  if (feed.default_volume < 0.0 || feed.default_volume > 1.0) return false;

  return true;
}

int EngineConfig::ApplyEnvironmentOverrides() {
  struct Override {
    const char* name;
    int* target;
    int minimum;
  };
  const Override overrides[] = {
      {kEnvPoolCapacity, &pool.capacity, 0},
      {kEnvPreloadAhead, &feed.preload_ahead, 0},
      {kEnvPreloadBehind, &feed.preload_behind, 0},
      {kEnvMaxConcurrent, &pool.max_concurrent_creations, 1},
  };

  int applied = 0;
  for (const auto& o : overrides) {
    bool malformed = false;
    auto value = EnvInt(o.name, malformed);
    if (malformed || (value && *value < o.minimum)) {
      std::ostringstream oss;
      oss << "[EngineConfig] ENV_IGNORED " << o.name << "=\"" << std::getenv(o.name) << "\"";
      Logger::Warn(oss.str());
      continue;
    }
    if (!value) continue;
    *o.target = *value;
    applied++;

    std::ostringstream oss;
    oss << "[EngineConfig] ENV_OVERRIDE " << o.name << "=" << *value;
    Logger::Info(oss.str());
  }
  return applied;
}

}  // namespace feedpool::config

// Repository: Feedpool-engine
// Component: Player Pool Implementation
// Purpose: Strict-LRU bounded cache with single-flight creation.
// Copyright (c) 2025 Feedpool

#include "feedpool/pool/PlayerPool.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "feedpool/util/Logger.hpp"

namespace feedpool::pool {

using feedpool::media::PlayerHandle;
using feedpool::util::Logger;

PlayerPool::PlayerPool(std::shared_ptr<media::IPlayerFactory> factory,
                       size_t capacity)
    : factory_(std::move(factory)), capacity_(std::max<size_t>(capacity, 1)) {
  if (!factory_) {
    throw std::invalid_argument("PlayerPool requires a player factory");
  }
}

PlayerPool::~PlayerPool() {
  DisposeAll();
}

std::shared_ptr<PlayerHandle> PlayerPool::Get(const std::string& key) {
  std::shared_ptr<Creation> creation;
  std::vector<std::shared_ptr<PlayerHandle>> evicted;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (disposed_) {
      throw std::runtime_error("PlayerPool: pool has been disposed");
    }

    auto it = players_.find(key);
    if (it != players_.end()) {
      TouchLocked(key);
      return it->second;
    }

    // Single-flight: join the outstanding creation for this key.
    auto pending_it = creating_.find(key);
    if (pending_it != creating_.end()) {
      auto pending = pending_it->second;
      creation_cv_.wait(lock, [&pending] { return pending->done; });
      if (pending->error) std::rethrow_exception(pending->error);
      return pending->handle;
    }

    creation = std::make_shared<Creation>();
    creating_.emplace(key, creation);
    evicted = EvictForLocked(1, key);
  }

  for (const auto& handle : evicted) {
    handle->Dispose();
  }

  std::shared_ptr<PlayerHandle> handle;
  std::exception_ptr error;
  try {
    auto player = factory_->CreatePlayer();
    if (!player) {
      throw std::runtime_error("player factory returned no player");
    }
    auto target = factory_->CreateRenderTarget(*player);
    handle = std::make_shared<PlayerHandle>(key, std::move(player), std::move(target));
  } catch (...) {
    error = std::current_exception();
  }

  bool discard = false;
  std::vector<std::shared_ptr<PlayerHandle>> late_evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    creating_.erase(key);
    creation->done = true;
    if (error) {
      creation->error = error;
    } else if (disposed_) {
      discard = true;
      creation->error = std::make_exception_ptr(
          std::runtime_error("PlayerPool: pool disposed during creation"));
    } else {
      // Concurrent creations of other keys may have filled the pool.
      late_evicted = EvictForLocked(1, key);
      players_.emplace(key, handle);
      lru_.push_back(key);
      creation->handle = handle;
    }
  }
  creation_cv_.notify_all();

  for (const auto& victim : late_evicted) {
    victim->Dispose();
  }

  if (error) {
    std::ostringstream oss;
    oss << "[PlayerPool] CREATE_FAILED key=" << key;
    Logger::Warn(oss.str());
    std::rethrow_exception(error);
  }
  if (discard) {
    handle->Dispose();
    std::rethrow_exception(creation->error);
  }

  std::ostringstream oss;
  oss << "[PlayerPool] CREATED key=" << key << " surface=" << handle->SurfaceId();
  Logger::Debug(oss.str());
  return handle;
}

std::shared_ptr<PlayerHandle> PlayerPool::Peek(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(key);
  if (it == players_.end()) return nullptr;
  TouchLocked(key);
  return it->second;
}

bool PlayerPool::HasPlayer(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_.count(key) > 0;
}

size_t PlayerPool::PlayerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_.size();
}

std::vector<std::string> PlayerPool::LruOrder() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(lru_.begin(), lru_.end());
}

void PlayerPool::Release(const std::string& key) {
  std::shared_ptr<PlayerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(key);
    if (it == players_.end()) return;
    handle = std::move(it->second);
    players_.erase(it);
    lru_.remove(key);
  }
  handle->Dispose();
}

void PlayerPool::StopAll() {
  std::vector<std::shared_ptr<PlayerHandle>> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handles.reserve(players_.size());
    for (const auto& entry : players_) {
      handles.push_back(entry.second);
    }
  }
  for (const auto& handle : handles) {
    handle->Pause();
  }
}

void PlayerPool::DisposeAll() {
  std::vector<std::shared_ptr<PlayerHandle>> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) return;
    disposed_ = true;
    handles.reserve(players_.size());
    for (auto& entry : players_) {
      handles.push_back(std::move(entry.second));
    }
    players_.clear();
    lru_.clear();
  }
  creation_cv_.notify_all();

  for (const auto& handle : handles) {
    handle->Dispose();
  }
}

bool PlayerPool::IsDisposed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return disposed_;
}

void PlayerPool::TouchLocked(const std::string& key) {
  lru_.remove(key);
  lru_.push_back(key);
}

std::vector<std::shared_ptr<PlayerHandle>> PlayerPool::EvictForLocked(
    size_t reserve, const std::string& keep) {
  std::vector<std::shared_ptr<PlayerHandle>> evicted;
  while (players_.size() + reserve > capacity_ && !lru_.empty()) {
    auto victim = std::find_if(lru_.begin(), lru_.end(),
                               [&keep](const std::string& k) { return k != keep; });
    if (victim == lru_.end()) break;

    const std::string victim_key = *victim;
    lru_.erase(victim);
    auto it = players_.find(victim_key);
    if (it == players_.end()) continue;
    evicted.push_back(std::move(it->second));
    players_.erase(it);

    std::ostringstream oss;
    oss << "[PlayerPool] EVICT_LRU key=" << victim_key << " for=" << keep;
    Logger::Debug(oss.str());
  }
  return evicted;
}

}  // namespace feedpool::pool

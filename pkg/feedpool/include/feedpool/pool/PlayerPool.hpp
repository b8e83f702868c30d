// Repository: Feedpool-engine
// Component: Player Pool
// Purpose: Fixed-capacity, key-indexed cache of PlayerHandles with strict
//          LRU eviction and single-flight creation.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_POOL_PLAYER_POOL_HPP_
#define FEEDPOOL_POOL_PLAYER_POOL_HPP_

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "feedpool/media/IPlayerResource.hpp"
#include "feedpool/media/PlayerHandle.hpp"

namespace feedpool::pool {

// PlayerPool is the plain bounded layer: no protection, no distances.
//
// Get() returns the resident handle for a key (marking it most recently
// used) or creates one, evicting least-recently-used entries first when at
// capacity. Creation is slow and runs without the pool lock held; a second
// Get() for a key whose creation is outstanding waits for that creation
// instead of starting another one.
//
// Get() after DisposeAll() throws std::runtime_error.
class PlayerPool {
 public:
  PlayerPool(std::shared_ptr<media::IPlayerFactory> factory, size_t capacity);
  ~PlayerPool();

  PlayerPool(const PlayerPool&) = delete;
  PlayerPool& operator=(const PlayerPool&) = delete;

  // Blocking. Propagates a creation exception to every caller waiting on key.
  std::shared_ptr<media::PlayerHandle> Get(const std::string& key);

  // Resident handle without creating one; marks it most recently used.
  std::shared_ptr<media::PlayerHandle> Peek(const std::string& key);

  bool HasPlayer(const std::string& key) const;
  size_t PlayerCount() const;
  size_t capacity() const { return capacity_; }

  // Keys from least to most recently used.
  std::vector<std::string> LruOrder() const;

  // Removes and disposes one entry.
  void Release(const std::string& key);

  // Stops playback on every handle without disposing (neutralizes native
  // callbacks during a host reload while keeping the cache).
  void StopAll();

  // Disposes every entry; the pool rejects further Get() calls.
  void DisposeAll();
  bool IsDisposed() const;

 private:
  struct Creation {
    bool done = false;
    std::shared_ptr<media::PlayerHandle> handle;
    std::exception_ptr error;
  };

  void TouchLocked(const std::string& key);
  // Pops LRU entries until `reserve` more entries fit; returns them for
  // disposal outside the lock.
  std::vector<std::shared_ptr<media::PlayerHandle>> EvictForLocked(
      size_t reserve, const std::string& keep);

  std::shared_ptr<media::IPlayerFactory> factory_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable creation_cv_;
  std::unordered_map<std::string, std::shared_ptr<media::PlayerHandle>> players_;
  std::list<std::string> lru_;  // front = least recently used
  std::unordered_map<std::string, std::shared_ptr<Creation>> creating_;
  bool disposed_ = false;
};

}  // namespace feedpool::pool

#endif  // FEEDPOOL_POOL_PLAYER_POOL_HPP_

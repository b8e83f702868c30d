// Repository: Feedpool-engine
// Component: Pool Manager
// Purpose: Protected, distance-aware pool of PlayerHandles with asynchronous
//          single-flight acquisition, bounded concurrent creation,
//          cancellation and memory-pressure release.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_POOL_POOL_MANAGER_HPP_
#define FEEDPOOL_POOL_POOL_MANAGER_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "feedpool/media/IPlayerResource.hpp"
#include "feedpool/media/PlayerHandle.hpp"
#include "feedpool/pool/DeviceMemory.hpp"
#include "feedpool/pool/PoolConfig.hpp"
#include "feedpool/pool/PoolMetrics.hpp"

namespace feedpool::pool {

// Typed acquisition outcome. Only kOk carries a handle; every other status
// is an expected "no handle" answer, never an exception.
enum class AcquireStatus {
  kOk = 0,
  kCancelled = 1,          // CancelAcquisition / distant cancellation / superseded
  kEvictionExhausted = 2,  // Every occupied slot is protected; try again later
  kCreateFailed = 3,       // Native creation threw or Open() failed
  kShutdown = 4,           // Manager shut down before completion
};

const char* AcquireStatusName(AcquireStatus status);

struct AcquireRequest {
  std::string key;             // Content identity (stable video id)
  std::string source_locator;  // Network URL
  std::string cached_locator;  // Local cached file; preferred when non-empty
};

struct AcquireResult {
  AcquireStatus status = AcquireStatus::kCancelled;
  std::shared_ptr<media::PlayerHandle> handle;
  std::string message;

  bool ok() const { return status == AcquireStatus::kOk && handle != nullptr; }
};

// PoolManager owns every PlayerHandle it hands out.
//
// Protection:
//   - the active key is never evicted; acquiring a new key when only the
//     active key is resident fails with kEvictionExhausted
//   - prewarm keys are evicted only when no plain cached key remains
//   - among candidates of the same class, the key registered farthest from
//     the current index goes first; ties go to the least recently used
//
// Concurrency: creation runs on max_concurrent_creations worker threads.
// Requests beyond that queue in FIFO order. Two acquisitions for the same
// key share one creation. Resident entries, reserved creation slots and
// removed entries still being disposed never exceed capacity together. An
// evicting flight takes over its victim's slot, and no new player is created
// until the victim has been disposed.
//
// A waiter callback may drop the last owner of the manager. Shutdown then
// runs on that worker, which is detached rather than joined.
//
// Callbacks run on a worker thread, or synchronously on the calling thread
// for resident hits, shutdown, and cancellation of a request that had not
// started. No internal lock is held while a callback or pool-change
// listener runs; callers must not hold a lock the callback also takes.
class PoolManager {
 public:
  using AcquireCallback = std::function<void(const AcquireResult&)>;
  using PoolChangeListener = std::function<void()>;

  PoolManager(std::shared_ptr<media::IPlayerFactory> factory,
              PoolConfig config,
              const DeviceMemoryClassifier& classifier = DeviceMemoryClassifier());
  ~PoolManager();

  PoolManager(const PoolManager&) = delete;
  PoolManager& operator=(const PoolManager&) = delete;

  // Blocking acquisition; waits for the shared creation if one is running.
  AcquireResult Acquire(const AcquireRequest& request);

  // Non-blocking acquisition; callback receives exactly one result.
  void AcquireAsync(AcquireRequest request, AcquireCallback callback);

  // Synchronous, non-creating lookup.
  std::shared_ptr<media::PlayerHandle> GetExisting(const std::string& key) const;

  // Caller no longer needs key. The entry is paused and stays cached,
  // eviction-eligible, and loses prewarm protection.
  void Release(const std::string& key);

  // No-op (and no listener notification) when key and index are unchanged.
  // A jump larger than fast_scroll_jump cancels distant in-flight requests.
  void SetActiveVideo(const std::string& key, std::optional<int> index,
                      bool cancel_distant = true);

  // Replaces the prewarm set, truncated to capacity - 1 keys.
  void SetPrewarmVideos(const std::vector<std::string>& keys,
                        std::optional<int> current_index = std::nullopt);

  void RegisterVideoIndex(const std::string& key, int index);

  // Releases n - ceil(n/2) resident entries, never the active key.
  void HandleMemoryPressure();

  void CancelAcquisition(const std::string& key);

  // Cancels every in-flight request (except the active key) registered more
  // than distance_cancel_threshold away from from_index.
  void CancelDistantInFlightRequests(int from_index);

  // Disposes every entry and resets protection state; stays usable.
  void ClearPool();

  // Cancels outstanding work, joins workers, disposes every entry. Later
  // acquisitions resolve with kShutdown. Idempotent.
  void Shutdown();

  int AddPoolChangeListener(PoolChangeListener listener);
  void RemovePoolChangeListener(int id);

  // Introspection.
  int capacity() const { return capacity_; }
  size_t ResidentCount() const;
  std::optional<std::string> ActiveKey() const;
  std::optional<int> CurrentIndex() const;
  std::set<std::string> PrewarmKeys() const;
  std::set<std::string> InFlightKeys() const;
  std::vector<std::string> AssignedKeys() const;  // LRU order, oldest first
  PoolMetrics Metrics() const;

 private:
  struct Entry {
    std::shared_ptr<media::PlayerHandle> handle;
    uint64_t last_used = 0;
  };

  struct Flight {
    uint64_t id = 0;
    AcquireRequest request;
    std::optional<int> target_index;
    std::vector<AcquireCallback> waiters;
    bool cancelled = false;
    bool started = false;
  };

  using FlightPtr = std::shared_ptr<Flight>;

  void WorkerLoop();
  void ProcessFlight(const FlightPtr& flight);

  // Blocks until a capacity slot is reserved for flight. Returns the
  // terminal status when no slot can be had.
  std::optional<AcquireStatus> ReserveSlot(const FlightPtr& flight);

  // Resolves flight with result and notifies pool-change listeners.
  void Finish(const FlightPtr& flight, AcquireResult result);
  void Resolve(std::vector<AcquireCallback> waiters, const AcquireResult& result);

  std::optional<std::string> SelectVictimLocked() const;
  // Resident keys, least recently used first.
  std::vector<std::string> AssignedKeysLocked() const;
  std::vector<std::string> SortedByReleasePriorityLocked() const;
  int DistanceFromCurrentLocked(const std::string& key) const;
  std::shared_ptr<media::PlayerHandle> RemoveEntryLocked(const std::string& key);
  void TouchLocked(const std::string& key);

  // Marks key's flight cancelled. A flight that had not started is removed
  // from the queue and appended to `unstarted` for immediate resolution.
  void CancelLocked(const std::string& key, std::vector<FlightPtr>& unstarted);
  void CancelDistantLocked(int from_index, std::vector<FlightPtr>& unstarted);
  void ResolveCancelled(std::vector<FlightPtr> unstarted);

  static void DisposeEvicted(const std::shared_ptr<media::PlayerHandle>& handle);
  // Disposes handles counted in disposing_slots_, then frees their slots.
  void DisposeAndFreeSlots(const std::vector<std::shared_ptr<media::PlayerHandle>>& handles);
  int OccupiedLocked() const;
  void NotifyListeners();

  std::shared_ptr<media::IPlayerFactory> factory_;
  const PoolConfig config_;
  const int capacity_;
  const int eviction_attempts_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable slot_cv_;

  std::unordered_map<std::string, Entry> entries_;
  uint64_t use_clock_ = 0;  // monotonic counter for LRU ordering
  int reserved_slots_ = 0;
  int disposing_slots_ = 0;  // removed entries whose handles are not yet disposed

  std::optional<std::string> active_key_;
  std::optional<int> current_index_;
  std::set<std::string> prewarm_keys_;
  std::unordered_map<std::string, int> index_map_;

  std::unordered_map<std::string, FlightPtr> in_flight_;  // live flight per key
  std::deque<FlightPtr> queue_;                           // awaiting a worker
  uint64_t next_flight_id_ = 1;

  std::vector<std::thread> workers_;
  bool shutdown_ = false;

  PoolMetrics metrics_;

  std::mutex listeners_mutex_;
  int next_listener_id_ = 1;
  std::map<int, PoolChangeListener> listeners_;
};

}  // namespace feedpool::pool

#endif  // FEEDPOOL_POOL_POOL_MANAGER_HPP_

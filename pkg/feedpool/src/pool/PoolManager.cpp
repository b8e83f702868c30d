// Repository: Feedpool-engine
// Component: Pool Manager Implementation
// Purpose: Protected, distance-aware acquisition, eviction and release.
// Copyright (c) 2025 Feedpool

#include "feedpool/pool/PoolManager.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "feedpool/util/Logger.hpp"

namespace feedpool::pool {

using feedpool::media::PlayerHandle;
using feedpool::util::Logger;

namespace {
// Set on a worker whose own waiter callback shut the manager down. The
// manager may already be destroyed when that callback returns.
thread_local bool t_worker_released = false;
}  // namespace

const char* AcquireStatusName(AcquireStatus status) {
  switch (status) {
    case AcquireStatus::kOk: return "OK";
    case AcquireStatus::kCancelled: return "CANCELLED";
    case AcquireStatus::kEvictionExhausted: return "EVICTION_EXHAUSTED";
    case AcquireStatus::kCreateFailed: return "CREATE_FAILED";
    case AcquireStatus::kShutdown: return "SHUTDOWN";
  }
  return "UNKNOWN";
}

PoolManager::PoolManager(std::shared_ptr<media::IPlayerFactory> factory,
                         PoolConfig config,
                         const DeviceMemoryClassifier& classifier)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      capacity_(ResolveCapacity(config_, classifier)),
      eviction_attempts_(config_.eviction_attempts > 0
                             ? config_.eviction_attempts
                             : capacity_) {
  if (!factory_) {
    throw std::invalid_argument("PoolManager requires a player factory");
  }
  metrics_.capacity = capacity_;
  metrics_.session_id = config_.session_id;

  const int workers = std::max(1, config_.max_concurrent_creations);
  workers_.reserve(static_cast<size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    workers_.emplace_back(&PoolManager::WorkerLoop, this);
  }

  std::ostringstream oss;
  oss << "[PoolManager] INIT capacity=" << capacity_
      << " max_concurrent=" << workers
      << " eviction_attempts=" << eviction_attempts_
      << " session=" << config_.session_id;
  Logger::Info(oss.str());
}

PoolManager::~PoolManager() {
  Shutdown();
}

// =============================================================================
// Acquisition
// =============================================================================

AcquireResult PoolManager::Acquire(const AcquireRequest& request) {
  struct Waiter {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    AcquireResult result;
  };
  auto waiter = std::make_shared<Waiter>();

  AcquireAsync(request, [waiter](const AcquireResult& result) {
    {
      std::lock_guard<std::mutex> lock(waiter->mutex);
      waiter->result = result;
      waiter->done = true;
    }
    waiter->cv.notify_all();
  });

  std::unique_lock<std::mutex> lock(waiter->mutex);
  waiter->cv.wait(lock, [&waiter] { return waiter->done; });
  return waiter->result;
}

void PoolManager::AcquireAsync(AcquireRequest request, AcquireCallback callback) {
  AcquireResult immediate;
  bool resolve_now = false;
  bool notify = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      immediate.status = AcquireStatus::kShutdown;
      immediate.message = "pool manager shut down";
      resolve_now = true;
    } else if (auto it = entries_.find(request.key); it != entries_.end()) {
      TouchLocked(request.key);
      metrics_.acquire_hits_total++;
      immediate.status = AcquireStatus::kOk;
      immediate.handle = it->second.handle;
      resolve_now = true;
      notify = true;
    } else if (auto fit = in_flight_.find(request.key); fit != in_flight_.end()) {
      // Single-flight: share the outstanding creation.
      fit->second->waiters.push_back(std::move(callback));
      metrics_.acquire_joined_total++;
      return;
    } else {
      auto flight = std::make_shared<Flight>();
      flight->id = next_flight_id_++;
      flight->request = std::move(request);
      if (auto iit = index_map_.find(flight->request.key); iit != index_map_.end()) {
        flight->target_index = iit->second;
      }
      flight->waiters.push_back(std::move(callback));
      in_flight_[flight->request.key] = flight;
      queue_.push_back(flight);
    }
  }

  if (resolve_now) {
    std::vector<AcquireCallback> waiters;
    waiters.push_back(std::move(callback));
    Resolve(std::move(waiters), immediate);
    if (notify) NotifyListeners();
    return;
  }
  work_cv_.notify_one();
}

std::shared_ptr<PlayerHandle> PoolManager::GetExisting(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return nullptr;
  return it->second.handle;
}

// =============================================================================
// WorkerLoop: persistent creation threads
// =============================================================================

void PoolManager::WorkerLoop() {
  while (true) {
    FlightPtr flight;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (shutdown_) return;
      flight = queue_.front();
      queue_.pop_front();
      flight->started = true;
    }
    ProcessFlight(flight);
    if (t_worker_released) return;
  }
}

void PoolManager::ProcessFlight(const FlightPtr& flight) {
  const std::string& key = flight->request.key;

  // Checkpoint 1: cancelled while queued behind a busy worker.
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled = flight->cancelled;
  }
  if (cancelled) {
    AcquireResult result;
    result.status = AcquireStatus::kCancelled;
    result.message = "cancelled before creation";
    Finish(flight, std::move(result));
    return;
  }

  auto terminal = ReserveSlot(flight);
  if (terminal) {
    AcquireResult result;
    result.status = *terminal;
    if (*terminal == AcquireStatus::kEvictionExhausted) {
      result.message = "every resident entry is protected";
      std::ostringstream oss;
      oss << "[PoolManager] EVICTION_EXHAUSTED key=" << key
          << " attempts=" << eviction_attempts_
          << " session=" << config_.session_id;
      Logger::Warn(oss.str());
    } else if (*terminal == AcquireStatus::kCancelled) {
      result.message = "cancelled while waiting for a slot";
    }
    Finish(flight, std::move(result));
    return;
  }

  const std::string& locator = flight->request.cached_locator.empty()
                                   ? flight->request.source_locator
                                   : flight->request.cached_locator;

  // Native creation runs without any manager lock.
  std::shared_ptr<PlayerHandle> handle;
  std::string failure;
  try {
    auto player = factory_->CreatePlayer();
    if (!player) {
      throw std::runtime_error("player factory returned no player");
    }
    auto target = factory_->CreateRenderTarget(*player);
    handle = std::make_shared<PlayerHandle>(key, std::move(player), std::move(target));
    if (!handle->Open(locator)) {
      failure = "open failed: " + locator;
    }
  } catch (const std::exception& e) {
    failure = e.what();
    if (failure.empty()) failure = "native creation failed";
  }

  AcquireResult result;
  std::shared_ptr<PlayerHandle> discard;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Anything but a resident insert keeps its reservation until the
    // discarded handle is disposed below.
    if (!failure.empty()) {
      metrics_.creations_failed_total++;
      discard = handle;
      result.status = AcquireStatus::kCreateFailed;
      result.message = failure;
    } else if (shutdown_) {
      discard = handle;
      result.status = AcquireStatus::kShutdown;
      result.message = "pool manager shut down during creation";
    } else if (flight->cancelled) {
      // Superseded or cancelled; the handle never becomes observable.
      metrics_.cancelled_results_discarded_total++;
      discard = handle;
      result.status = AcquireStatus::kCancelled;
      result.message = "cancelled during creation";
    } else {
      reserved_slots_--;
      entries_[key] = Entry{handle, ++use_clock_};
      metrics_.creations_succeeded_total++;
      result.status = AcquireStatus::kOk;
      result.handle = handle;
    }
  }
  if (discard) discard->Dispose();
  if (result.status != AcquireStatus::kOk) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_slots_--;
  }
  slot_cv_.notify_all();

  std::ostringstream oss;
  oss << "[PoolManager] CREATE_" << AcquireStatusName(result.status)
      << " key=" << key << " flight=" << flight->id;
  if (!result.message.empty()) oss << " reason=\"" << result.message << "\"";
  oss << " session=" << config_.session_id;
  if (result.status == AcquireStatus::kCreateFailed) {
    Logger::Warn(oss.str());
  } else {
    Logger::Debug(oss.str());
  }

  Finish(flight, std::move(result));
}

std::optional<AcquireStatus> PoolManager::ReserveSlot(const FlightPtr& flight) {
  int failed_attempts = 0;
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (shutdown_) return AcquireStatus::kShutdown;
    if (flight->cancelled) return AcquireStatus::kCancelled;

    if (OccupiedLocked() < capacity_) {
      reserved_slots_++;
      metrics_.creations_started_total++;
      return std::nullopt;
    }

    auto victim = SelectVictimLocked();
    if (victim) {
      const bool prewarm = prewarm_keys_.count(*victim) > 0;
      const int distance = DistanceFromCurrentLocked(*victim);
      auto handle = RemoveEntryLocked(*victim);
      metrics_.evictions_total++;
      if (prewarm) metrics_.evictions_prewarm_total++;
      // The victim's slot passes straight to this flight and stays occupied
      // while the victim is disposed.
      reserved_slots_++;
      lock.unlock();

      std::ostringstream oss;
      oss << "[PoolManager] EVICT key=" << *victim << " distance=" << distance
          << " prewarm=" << (prewarm ? "true" : "false")
          << " for=" << flight->request.key
          << " reason=capacity session=" << config_.session_id;
      Logger::Info(oss.str());

      DisposeEvicted(handle);
      lock.lock();
      if (shutdown_ || flight->cancelled) {
        const AcquireStatus status =
            shutdown_ ? AcquireStatus::kShutdown : AcquireStatus::kCancelled;
        reserved_slots_--;
        lock.unlock();
        slot_cv_.notify_all();
        return status;
      }
      metrics_.creations_started_total++;
      return std::nullopt;
    }

    if (reserved_slots_ > 0 || disposing_slots_ > 0) {
      // Another creation holds a slot, or a released entry is still being
      // disposed. Waiting here does not consume an attempt.
      slot_cv_.wait(lock);
      continue;
    }

    if (++failed_attempts >= eviction_attempts_) {
      metrics_.eviction_exhausted_total++;
      return AcquireStatus::kEvictionExhausted;
    }
    slot_cv_.wait_for(lock, std::chrono::milliseconds(
                                std::max(0, config_.eviction_retry_backoff_ms)));
  }
}

void PoolManager::Finish(const FlightPtr& flight, AcquireResult result) {
  std::vector<AcquireCallback> waiters;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(flight->request.key);
    if (it != in_flight_.end() && it->second == flight) {
      in_flight_.erase(it);
    }
    waiters.swap(flight->waiters);
  }
  NotifyListeners();
  // A waiter may drop the last owner of this manager; nothing touches
  // members after Resolve.
  Resolve(std::move(waiters), result);
}

void PoolManager::Resolve(std::vector<AcquireCallback> waiters,
                          const AcquireResult& result) {
  const std::string session = config_.session_id;
  for (auto& waiter : waiters) {
    if (!waiter) continue;
    try {
      waiter(result);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[PoolManager] CALLBACK_FAILED status=" << AcquireStatusName(result.status)
          << " error=\"" << e.what() << "\" session=" << session;
      Logger::Error(oss.str());
    }
  }
}

// =============================================================================
// Protection state
// =============================================================================

void PoolManager::Release(const std::string& key) {
  std::shared_ptr<PlayerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    handle = it->second.handle;
    prewarm_keys_.erase(key);
  }
  if (handle->IsPlaying()) handle->Pause();

  std::ostringstream oss;
  oss << "[PoolManager] RELEASE key=" << key << " session=" << config_.session_id;
  Logger::Debug(oss.str());
  NotifyListeners();
}

void PoolManager::SetActiveVideo(const std::string& key, std::optional<int> index,
                                 bool cancel_distant) {
  std::vector<FlightPtr> unstarted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_key_ == key && current_index_ == index) return;

    const std::optional<int> previous = current_index_;
    active_key_ = key;
    current_index_ = index;
    if (index) {
      index_map_[key] = *index;
      if (cancel_distant && previous &&
          std::abs(*index - *previous) > config_.fast_scroll_jump) {
        std::ostringstream oss;
        oss << "[PoolManager] FAST_SCROLL from=" << *previous << " to=" << *index
            << " session=" << config_.session_id;
        Logger::Debug(oss.str());
        CancelDistantLocked(*index, unstarted);
      }
    }
    if (entries_.count(key)) TouchLocked(key);
  }
  ResolveCancelled(std::move(unstarted));
  NotifyListeners();
}

void PoolManager::SetPrewarmVideos(const std::vector<std::string>& keys,
                                   std::optional<int> current_index) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_index) current_index_ = current_index;
    const size_t limit = static_cast<size_t>(std::max(0, capacity_ - 1));
    prewarm_keys_.clear();
    for (const auto& key : keys) {
      if (prewarm_keys_.size() >= limit) break;
      prewarm_keys_.insert(key);
    }
  }
  NotifyListeners();
}

void PoolManager::RegisterVideoIndex(const std::string& key, int index) {
  std::lock_guard<std::mutex> lock(mutex_);
  index_map_[key] = index;
}

// =============================================================================
// Release policies
// =============================================================================

void PoolManager::HandleMemoryPressure() {
  std::vector<std::shared_ptr<PlayerHandle>> released;
  std::vector<std::string> released_keys;
  size_t before = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.memory_pressure_events_total++;
    before = entries_.size();
    if (before == 0) return;
    const size_t keep = std::max<size_t>(1, (before + 1) / 2);
    const size_t to_release = before - keep;

    auto ordered = SortedByReleasePriorityLocked();
    for (size_t i = 0; i < ordered.size() && released.size() < to_release; ++i) {
      released.push_back(RemoveEntryLocked(ordered[i]));
      released_keys.push_back(ordered[i]);
    }
    metrics_.memory_pressure_released_total += static_cast<int64_t>(released.size());
    disposing_slots_ += static_cast<int>(released.size());
  }

  std::ostringstream oss;
  oss << "[PoolManager] MEMORY_PRESSURE resident=" << before
      << " released=" << released.size() << " keys=";
  for (size_t i = 0; i < released_keys.size(); ++i) {
    if (i > 0) oss << ",";
    oss << released_keys[i];
  }
  oss << " session=" << config_.session_id;
  Logger::Info(oss.str());

  DisposeAndFreeSlots(released);
  NotifyListeners();
}

void PoolManager::CancelAcquisition(const std::string& key) {
  std::vector<FlightPtr> unstarted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    CancelLocked(key, unstarted);
  }
  slot_cv_.notify_all();
  ResolveCancelled(std::move(unstarted));
}

void PoolManager::CancelDistantInFlightRequests(int from_index) {
  std::vector<FlightPtr> unstarted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    CancelDistantLocked(from_index, unstarted);
  }
  slot_cv_.notify_all();
  ResolveCancelled(std::move(unstarted));
}

void PoolManager::ClearPool() {
  std::vector<std::shared_ptr<PlayerHandle>> all;
  std::vector<FlightPtr> unstarted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(in_flight_.size());
    for (const auto& [key, flight] : in_flight_) keys.push_back(key);
    for (const auto& key : keys) CancelLocked(key, unstarted);

    for (auto& [key, entry] : entries_) all.push_back(std::move(entry.handle));
    entries_.clear();
    disposing_slots_ += static_cast<int>(all.size());
    active_key_.reset();
    current_index_.reset();
    prewarm_keys_.clear();
    index_map_.clear();
  }
  slot_cv_.notify_all();

  std::ostringstream oss;
  oss << "[PoolManager] CLEAR disposed=" << all.size()
      << " session=" << config_.session_id;
  Logger::Info(oss.str());

  DisposeAndFreeSlots(all);
  ResolveCancelled(std::move(unstarted));
  NotifyListeners();
}

void PoolManager::Shutdown() {
  std::vector<FlightPtr> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return;
    shutdown_ = true;
    pending.assign(queue_.begin(), queue_.end());
    queue_.clear();
  }
  work_cv_.notify_all();
  slot_cv_.notify_all();

  // Running creations complete, observe shutdown_, and dispose their result.
  // A worker running this from its own waiter callback cannot join itself.
  const auto self = std::this_thread::get_id();
  for (auto& worker : workers_) {
    if (!worker.joinable()) continue;
    if (worker.get_id() == self) {
      t_worker_released = true;
      worker.detach();
    } else {
      worker.join();
    }
  }

  std::vector<std::shared_ptr<PlayerHandle>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, entry] : entries_) all.push_back(std::move(entry.handle));
    entries_.clear();
    in_flight_.clear();
    active_key_.reset();
    prewarm_keys_.clear();
  }
  for (const auto& handle : all) DisposeEvicted(handle);

  AcquireResult result;
  result.status = AcquireStatus::kShutdown;
  result.message = "pool manager shut down";
  for (const auto& flight : pending) {
    std::vector<AcquireCallback> waiters;
    waiters.swap(flight->waiters);
    Resolve(std::move(waiters), result);
  }

  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.clear();
  }

  std::ostringstream oss;
  oss << "[PoolManager] SHUTDOWN disposed=" << all.size()
      << " session=" << config_.session_id;
  Logger::Info(oss.str());
}

// =============================================================================
// Listeners and introspection
// =============================================================================

int PoolManager::AddPoolChangeListener(PoolChangeListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  const int id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void PoolManager::RemovePoolChangeListener(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(id);
}

size_t PoolManager::ResidentCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::optional<std::string> PoolManager::ActiveKey() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_key_;
}

std::optional<int> PoolManager::CurrentIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_index_;
}

std::set<std::string> PoolManager::PrewarmKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return prewarm_keys_;
}

std::set<std::string> PoolManager::InFlightKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> keys;
  for (const auto& [key, flight] : in_flight_) keys.insert(key);
  return keys;
}

std::vector<std::string> PoolManager::AssignedKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return AssignedKeysLocked();
}

PoolMetrics PoolManager::Metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PoolMetrics snapshot = metrics_;
  snapshot.resident = static_cast<int32_t>(entries_.size());
  snapshot.in_flight = static_cast<int32_t>(in_flight_.size());
  snapshot.queued = static_cast<int32_t>(queue_.size());
  return snapshot;
}

// =============================================================================
// Private helpers (mutex_ held unless stated)
// =============================================================================

std::optional<std::string> PoolManager::SelectVictimLocked() const {
  std::optional<std::string> best_plain;
  std::optional<std::string> best_prewarm;
  int best_plain_distance = -1;
  int best_prewarm_distance = -1;

  // Oldest first, so a strict '>' keeps the LRU entry on distance ties.
  for (const auto& key : AssignedKeysLocked()) {
    if (active_key_ && key == *active_key_) continue;
    const int distance = DistanceFromCurrentLocked(key);
    if (prewarm_keys_.count(key)) {
      if (distance > best_prewarm_distance) {
        best_prewarm_distance = distance;
        best_prewarm = key;
      }
    } else if (distance > best_plain_distance) {
      best_plain_distance = distance;
      best_plain = key;
    }
  }
  return best_plain ? best_plain : best_prewarm;
}

std::vector<std::string> PoolManager::SortedByReleasePriorityLocked() const {
  struct Candidate {
    std::string key;
    bool prewarm;
    int distance;
    uint64_t last_used;
  };
  std::vector<Candidate> candidates;
  for (const auto& [key, entry] : entries_) {
    if (active_key_ && key == *active_key_) continue;
    candidates.push_back(Candidate{key, prewarm_keys_.count(key) > 0,
                                   DistanceFromCurrentLocked(key), entry.last_used});
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) {
              if (a.prewarm != b.prewarm) return !a.prewarm;
              if (a.distance != b.distance) return a.distance > b.distance;
              return a.last_used < b.last_used;
            });
  std::vector<std::string> keys;
  keys.reserve(candidates.size());
  for (auto& c : candidates) keys.push_back(std::move(c.key));
  return keys;
}

std::vector<std::string> PoolManager::AssignedKeysLocked() const {
  std::vector<std::pair<uint64_t, std::string>> ordered;
  ordered.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) ordered.emplace_back(entry.last_used, key);
  std::sort(ordered.begin(), ordered.end());
  std::vector<std::string> keys;
  keys.reserve(ordered.size());
  for (auto& [stamp, key] : ordered) keys.push_back(std::move(key));
  return keys;
}

int PoolManager::DistanceFromCurrentLocked(const std::string& key) const {
  if (!current_index_) return 0;
  auto it = index_map_.find(key);
  if (it == index_map_.end()) return 0;
  return std::abs(it->second - *current_index_);
}

std::shared_ptr<PlayerHandle> PoolManager::RemoveEntryLocked(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) return nullptr;
  auto handle = std::move(it->second.handle);
  entries_.erase(it);
  prewarm_keys_.erase(key);
  slot_cv_.notify_all();
  return handle;
}

void PoolManager::TouchLocked(const std::string& key) {
  auto it = entries_.find(key);
  if (it != entries_.end()) it->second.last_used = ++use_clock_;
}

void PoolManager::CancelLocked(const std::string& key,
                               std::vector<FlightPtr>& unstarted) {
  auto it = in_flight_.find(key);
  if (it == in_flight_.end()) return;
  FlightPtr flight = it->second;
  flight->cancelled = true;
  // A later acquisition for key starts a new flight.
  in_flight_.erase(it);
  metrics_.cancellations_total++;

  if (!flight->started) {
    queue_.erase(std::remove(queue_.begin(), queue_.end(), flight), queue_.end());
    unstarted.push_back(flight);
  }

  std::ostringstream oss;
  oss << "[PoolManager] CANCEL key=" << key << " flight=" << flight->id
      << " started=" << (flight->started ? "true" : "false")
      << " session=" << config_.session_id;
  Logger::Debug(oss.str());
}

void PoolManager::CancelDistantLocked(int from_index,
                                      std::vector<FlightPtr>& unstarted) {
  std::vector<std::string> distant;
  for (const auto& [key, flight] : in_flight_) {
    if (active_key_ && key == *active_key_) continue;
    std::optional<int> index = flight->target_index;
    if (auto it = index_map_.find(key); it != index_map_.end()) index = it->second;
    if (!index) continue;
    if (std::abs(*index - from_index) > config_.distance_cancel_threshold) {
      distant.push_back(key);
    }
  }
  for (const auto& key : distant) CancelLocked(key, unstarted);
}

void PoolManager::ResolveCancelled(std::vector<FlightPtr> unstarted) {
  if (unstarted.empty()) return;
  AcquireResult result;
  result.status = AcquireStatus::kCancelled;
  result.message = "cancelled before creation";
  for (const auto& flight : unstarted) {
    std::vector<AcquireCallback> waiters;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      waiters.swap(flight->waiters);
    }
    Resolve(std::move(waiters), result);
  }
  NotifyListeners();
}

// Runs without mutex_ held.
void PoolManager::DisposeEvicted(const std::shared_ptr<PlayerHandle>& handle) {
  if (!handle) return;
  if (handle->IsPlaying()) handle->Pause();
  handle->Dispose();
}

int PoolManager::OccupiedLocked() const {
  return static_cast<int>(entries_.size()) + reserved_slots_ + disposing_slots_;
}

// Runs without mutex_ held.
void PoolManager::DisposeAndFreeSlots(
    const std::vector<std::shared_ptr<PlayerHandle>>& handles) {
  if (handles.empty()) return;
  for (const auto& handle : handles) DisposeEvicted(handle);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    disposing_slots_ -= static_cast<int>(handles.size());
  }
  slot_cv_.notify_all();
}

// Runs without mutex_ held.
void PoolManager::NotifyListeners() {
  std::vector<PoolChangeListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) listeners.push_back(listener);
  }
  for (const auto& listener : listeners) {
    try {
      listener();
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[PoolManager] LISTENER_FAILED error=\"" << e.what()
          << "\" session=" << config_.session_id;
      Logger::Error(oss.str());
    }
  }
}

}  // namespace feedpool::pool

// Repository: Feedpool-engine
// Component: Pool Manager Contract Tests
// Purpose: Capacity invariant, single-flight, protection classes, distance
//          and LRU eviction order, memory pressure, failures and shutdown.
// Copyright (c) 2025 Feedpool

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "FakePlayer.hpp"
#include "TestWait.hpp"
#include "feedpool/pool/PoolManager.hpp"
#include "feedpool/util/Logger.hpp"

namespace feedpool::pool {
namespace {

using feedpool::tests::fixtures::FakePlayerFactory;
using feedpool::tests::fixtures::WaitUntil;

AcquireRequest Req(const std::string& key) {
  AcquireRequest request;
  request.key = key;
  request.source_locator = "https://cdn/" + key + ".mp4";
  return request;
}

// Collects async results keyed by acquisition key.
class ResultSink {
 public:
  PoolManager::AcquireCallback For(const std::string& key) {
    return [this, key](const AcquireResult& result) {
      std::lock_guard<std::mutex> lock(mutex_);
      results_.emplace_back(key, result);
    };
  }

  size_t Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
  }

  std::vector<AcquireResult> ResultsFor(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AcquireResult> out;
    for (const auto& [k, r] : results_) {
      if (k == key) out.push_back(r);
    }
    return out;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, AcquireResult>> results_;
};

class PoolManagerContractTest : public ::testing::Test {
 protected:
  void SetUp() override { factory_ = std::make_shared<FakePlayerFactory>(); }

  void TearDown() override {
    if (manager_) manager_->Shutdown();
  }

  PoolManager& Make(int capacity, int max_concurrent = 3) {
    PoolConfig config;
    config.capacity = capacity;
    config.max_concurrent_creations = max_concurrent;
    config.eviction_retry_backoff_ms = 1;
    config.session_id = "test";
    manager_ = std::make_unique<PoolManager>(factory_, config);
    return *manager_;
  }

  bool Resident(const std::string& key) const {
    return manager_->GetExisting(key) != nullptr;
  }

  std::shared_ptr<FakePlayerFactory> factory_;
  std::unique_ptr<PoolManager> manager_;
};

// =============================================================================
// Acquisition basics
// =============================================================================

TEST_F(PoolManagerContractTest, AcquireCreatesAndOpensSourceLocator) {
  auto& manager = Make(3);
  auto result = manager.Acquire(Req("a"));

  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.handle->key(), "a");
  EXPECT_EQ(result.handle->OpenedLocator(), "https://cdn/a.mp4");
  EXPECT_EQ(manager.ResidentCount(), 1u);
}

TEST_F(PoolManagerContractTest, CachedLocatorIsPreferred) {
  auto& manager = Make(3);
  auto request = Req("a");
  request.cached_locator = "/var/cache/a.mp4";

  auto result = manager.Acquire(request);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.handle->OpenedLocator(), "/var/cache/a.mp4");
}

TEST_F(PoolManagerContractTest, ResidentHitDoesNotCreate) {
  auto& manager = Make(3);
  auto first = manager.Acquire(Req("a"));
  auto second = manager.Acquire(Req("a"));

  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first.handle, second.handle);
  EXPECT_EQ(factory_->CreatedCount(), 1);
  EXPECT_EQ(manager.Metrics().acquire_hits_total, 1);
}

TEST_F(PoolManagerContractTest, ConcurrentAcquisitionsShareOneCreation) {
  auto& manager = Make(3);
  factory_->CloseGate();
  ResultSink sink;

  manager.AcquireAsync(Req("x"), sink.For("x"));
  ASSERT_TRUE(factory_->WaitForBlockedCreations(1));
  manager.AcquireAsync(Req("x"), sink.For("x"));
  manager.AcquireAsync(Req("x"), sink.For("x"));
  EXPECT_EQ(manager.InFlightKeys(), (std::set<std::string>{"x"}));

  factory_->OpenGate();
  ASSERT_TRUE(WaitUntil([&] { return sink.Count() == 3; }));

  auto results = sink.ResultsFor("x");
  for (const auto& r : results) {
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.handle, results.front().handle);
  }
  EXPECT_EQ(factory_->CreatedCount(), 1);
  EXPECT_EQ(manager.Metrics().acquire_joined_total, 2);
  EXPECT_TRUE(manager.InFlightKeys().empty());
}

// =============================================================================
// Capacity invariant and bounded creation
// =============================================================================

TEST_F(PoolManagerContractTest, ResidentPlusReservedNeverExceedsCapacity) {
  auto& manager = Make(3, 3);
  ResultSink sink;

  for (int i = 0; i < 12; ++i) {
    const std::string key = "k" + std::to_string(i);
    manager.AcquireAsync(Req(key), sink.For(key));
  }
  ASSERT_TRUE(WaitUntil([&] { return sink.Count() == 12; }));

  EXPECT_LE(manager.ResidentCount(), 3u);
  EXPECT_LE(factory_->MaxLive(), 3);
  EXPECT_EQ(factory_->LiveCount(), static_cast<int>(manager.ResidentCount()));
}

TEST_F(PoolManagerContractTest, EvictedSlotStaysOccupiedUntilVictimIsDisposed) {
  auto& manager = Make(2, 2);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  manager.SetActiveVideo("b", std::nullopt);

  factory_->CloseDisposeGate();
  ResultSink sink;
  manager.AcquireAsync(Req("c"), sink.For("c"));
  ASSERT_TRUE(factory_->WaitForParkedDisposals(1));

  // "b" is protected and "a" is still live, so "d" has nowhere to go.
  manager.AcquireAsync(Req("d"), sink.For("d"));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(factory_->CreatedCount(), 2);
  EXPECT_LE(factory_->LiveCount(), 2);
  EXPECT_EQ(manager.Metrics().evictions_total, 1);

  factory_->OpenDisposeGate();
  ASSERT_TRUE(WaitUntil([&] { return sink.Count() == 2; }));
  ASSERT_TRUE(sink.ResultsFor("c").front().ok());
  ASSERT_TRUE(sink.ResultsFor("d").front().ok());

  // One eviction per insert: "a" for "c", then "c" for "d".
  EXPECT_EQ(manager.Metrics().evictions_total, 2);
  EXPECT_LE(factory_->MaxLive(), 2);
  EXPECT_EQ(manager.AssignedKeys().size(), 2u);
  EXPECT_NE(manager.GetExisting("b"), nullptr);
  EXPECT_NE(manager.GetExisting("d"), nullptr);
}

TEST_F(PoolManagerContractTest, MemoryPressureSlotsStayOccupiedUntilDisposed) {
  auto& manager = Make(2, 1);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  manager.SetActiveVideo("b", std::nullopt);

  factory_->CloseDisposeGate();
  std::thread pressure([&] { manager.HandleMemoryPressure(); });
  ASSERT_TRUE(factory_->WaitForParkedDisposals(1));

  ResultSink sink;
  manager.AcquireAsync(Req("c"), sink.For("c"));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(factory_->CreatedCount(), 2);
  EXPECT_EQ(sink.Count(), 0u);

  factory_->OpenDisposeGate();
  pressure.join();
  ASSERT_TRUE(WaitUntil([&] { return sink.Count() == 1; }));
  EXPECT_TRUE(sink.ResultsFor("c").front().ok());
  EXPECT_LE(factory_->MaxLive(), 2);
  EXPECT_EQ(manager.Metrics().evictions_total, 0);
}

TEST_F(PoolManagerContractTest, ConcurrentCreationsAreBounded) {
  auto& manager = Make(6, 2);
  factory_->CloseGate();
  ResultSink sink;

  for (int i = 0; i < 5; ++i) {
    const std::string key = "k" + std::to_string(i);
    manager.AcquireAsync(Req(key), sink.For(key));
  }
  ASSERT_TRUE(factory_->WaitForBlockedCreations(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(factory_->MaxConcurrentCreations(), 2);
  EXPECT_EQ(manager.Metrics().queued, 3);

  factory_->OpenGate();
  ASSERT_TRUE(WaitUntil([&] { return sink.Count() == 5; }));
  EXPECT_LE(factory_->MaxConcurrentCreations(), 2);
  EXPECT_EQ(manager.ResidentCount(), 5u);
}

TEST_F(PoolManagerContractTest, CapacityDerivedFromMemoryTierWhenUnset) {
  PoolConfig config;
  DeviceMemoryClassifier low([] { return uint64_t{2} * 1024 * 1024 * 1024; });
  PoolManager manager(factory_, config, low);

  EXPECT_EQ(manager.capacity(), kLowMemoryPoolSize);
  manager.Shutdown();
}

// =============================================================================
// Protection and eviction order
// =============================================================================

TEST_F(PoolManagerContractTest, ActiveKeyIsNeverEvicted) {
  auto& manager = Make(1);
  auto a = manager.Acquire(Req("a"));
  ASSERT_TRUE(a.ok());
  manager.SetActiveVideo("a", 0);

  std::mutex warn_mutex;
  std::vector<std::string> warnings;
  util::Logger::SetWarnSink([&](const std::string& line) {
    std::lock_guard<std::mutex> lock(warn_mutex);
    warnings.push_back(line);
  });
  auto b = manager.Acquire(Req("b"));
  util::Logger::SetWarnSink(nullptr);

  bool logged = false;
  for (const auto& line : warnings) {
    if (line.find("[PoolManager] EVICTION_EXHAUSTED key=b") != std::string::npos) logged = true;
  }
  EXPECT_TRUE(logged);

  EXPECT_EQ(b.status, AcquireStatus::kEvictionExhausted);
  EXPECT_EQ(b.handle, nullptr);
  EXPECT_TRUE(Resident("a"));
  EXPECT_FALSE(a.handle->IsDisposed());
  EXPECT_EQ(manager.Metrics().eviction_exhausted_total, 1);
}

TEST_F(PoolManagerContractTest, FarthestFromCurrentIndexIsEvictedFirst) {
  auto& manager = Make(3);
  for (int index : {0, 2, 5}) {
    const std::string key = "k" + std::to_string(index);
    manager.RegisterVideoIndex(key, index);
    ASSERT_TRUE(manager.Acquire(Req(key)).ok());
  }
  manager.SetActiveVideo("k2", 2, false);
  manager.RegisterVideoIndex("k3", 3);

  ASSERT_TRUE(manager.Acquire(Req("k3")).ok());

  EXPECT_TRUE(Resident("k0"));
  EXPECT_TRUE(Resident("k2"));
  EXPECT_TRUE(Resident("k3"));
  EXPECT_FALSE(Resident("k5"));
}

TEST_F(PoolManagerContractTest, PrewarmKeysAreEvictedAfterPlainKeys) {
  auto& manager = Make(3);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  ASSERT_TRUE(manager.Acquire(Req("c")).ok());
  manager.SetPrewarmVideos({"a"});

  ASSERT_TRUE(manager.Acquire(Req("d")).ok());

  EXPECT_TRUE(Resident("a"));
  EXPECT_FALSE(Resident("b"));
  EXPECT_TRUE(Resident("c"));
}

TEST_F(PoolManagerContractTest, PrewarmKeyEvictedWhenNoPlainKeyRemains) {
  auto& manager = Make(2);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  manager.SetActiveVideo("a", std::nullopt);
  manager.SetPrewarmVideos({"b"});

  ASSERT_TRUE(manager.Acquire(Req("c")).ok());

  EXPECT_TRUE(Resident("a"));
  EXPECT_FALSE(Resident("b"));
  EXPECT_EQ(manager.Metrics().evictions_prewarm_total, 1);
}

TEST_F(PoolManagerContractTest, EqualDistanceFallsBackToLeastRecentlyUsed) {
  auto& manager = Make(2);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());  // touch
  EXPECT_EQ(manager.AssignedKeys(), (std::vector<std::string>{"b", "a"}));

  ASSERT_TRUE(manager.Acquire(Req("c")).ok());

  EXPECT_TRUE(Resident("a"));
  EXPECT_FALSE(Resident("b"));
}

TEST_F(PoolManagerContractTest, EvictedHandleIsPausedAndDisposed) {
  auto& manager = Make(1);
  auto a = manager.Acquire(Req("a"));
  ASSERT_TRUE(a.ok());
  a.handle->Play();
  auto state = factory_->PlayerFor("https://cdn/a.mp4");

  ASSERT_TRUE(manager.Acquire(Req("b")).ok());

  EXPECT_TRUE(a.handle->IsDisposed());
  EXPECT_TRUE(state->IsDisposed());
  EXPECT_EQ(state->PauseCount(), 1);
  EXPECT_EQ(manager.Metrics().evictions_total, 1);
}

TEST_F(PoolManagerContractTest, PrewarmSetIsTruncatedToCapacityMinusOne) {
  auto& manager = Make(3);
  manager.SetPrewarmVideos({"a", "b", "c", "d"});
  EXPECT_EQ(manager.PrewarmKeys(), (std::set<std::string>{"a", "b"}));
}

TEST_F(PoolManagerContractTest, ReleaseKeepsEntryButDropsPrewarmAndPauses) {
  auto& manager = Make(3);
  auto a = manager.Acquire(Req("a"));
  ASSERT_TRUE(a.ok());
  a.handle->Play();
  manager.SetPrewarmVideos({"a"});

  manager.Release("a");

  EXPECT_TRUE(Resident("a"));
  EXPECT_FALSE(a.handle->IsDisposed());
  EXPECT_FALSE(a.handle->IsPlaying());
  EXPECT_TRUE(manager.PrewarmKeys().empty());
}

TEST_F(PoolManagerContractTest, SetActiveVideoUnchangedDoesNotNotify) {
  auto& manager = Make(3);
  std::atomic<int> notifications{0};
  manager.AddPoolChangeListener([&notifications] { notifications.fetch_add(1); });

  manager.SetActiveVideo("a", 1);
  const int after_first = notifications.load();
  manager.SetActiveVideo("a", 1);

  EXPECT_EQ(after_first, 1);
  EXPECT_EQ(notifications.load(), 1);
  EXPECT_EQ(manager.ActiveKey(), std::optional<std::string>("a"));
  EXPECT_EQ(manager.CurrentIndex(), std::optional<int>(1));
}

// =============================================================================
// Memory pressure
// =============================================================================

TEST_F(PoolManagerContractTest, MemoryPressureHalvesPoolAndKeepsActive) {
  auto& manager = Make(4);
  for (const char* key : {"a", "b", "c", "d"}) {
    ASSERT_TRUE(manager.Acquire(Req(key)).ok());
  }
  manager.SetActiveVideo("a", std::nullopt);

  manager.HandleMemoryPressure();

  EXPECT_EQ(manager.ResidentCount(), 2u);
  EXPECT_TRUE(Resident("a"));
  EXPECT_EQ(factory_->LiveCount(), 2);
  EXPECT_EQ(manager.Metrics().memory_pressure_released_total, 2);
}

TEST_F(PoolManagerContractTest, MemoryPressureReleasesPlainBeforePrewarm) {
  auto& manager = Make(4);
  for (const char* key : {"a", "b", "c"}) {
    ASSERT_TRUE(manager.Acquire(Req(key)).ok());
  }
  manager.SetPrewarmVideos({"a"});

  manager.HandleMemoryPressure();  // 3 resident, keep 2

  EXPECT_EQ(manager.ResidentCount(), 2u);
  EXPECT_TRUE(Resident("a"));
  EXPECT_FALSE(Resident("b"));
}

TEST_F(PoolManagerContractTest, MemoryPressureWithSingleEntryReleasesNothing) {
  auto& manager = Make(4);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());

  manager.HandleMemoryPressure();

  EXPECT_EQ(manager.ResidentCount(), 1u);
  EXPECT_EQ(manager.Metrics().memory_pressure_events_total, 1);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(PoolManagerContractTest, NativeCreationFailureIsTyped) {
  auto& manager = Make(3);
  factory_->FailNextCreates(1);

  auto result = manager.Acquire(Req("a"));

  EXPECT_EQ(result.status, AcquireStatus::kCreateFailed);
  EXPECT_NE(result.message.find("fake native creation failure"), std::string::npos);
  EXPECT_FALSE(Resident("a"));
  EXPECT_TRUE(manager.InFlightKeys().empty());

  EXPECT_TRUE(manager.Acquire(Req("a")).ok());
}

TEST_F(PoolManagerContractTest, OpenFailureDisposesPlayer) {
  auto& manager = Make(3);
  factory_->FailOpen("https://cdn/bad.mp4");

  auto result = manager.Acquire(Req("bad"));

  EXPECT_EQ(result.status, AcquireStatus::kCreateFailed);
  EXPECT_FALSE(Resident("bad"));
  EXPECT_EQ(factory_->LiveCount(), 0);
  EXPECT_EQ(manager.Metrics().creations_failed_total, 1);
}

// =============================================================================
// Listeners, clear, shutdown
// =============================================================================

TEST_F(PoolManagerContractTest, PoolChangeListenerFiresOnAcquisition) {
  auto& manager = Make(3);
  std::atomic<int> notifications{0};
  const int id = manager.AddPoolChangeListener([&notifications] { notifications.fetch_add(1); });

  ASSERT_TRUE(manager.Acquire(Req("a")).ok());
  ASSERT_TRUE(WaitUntil([&] { return notifications.load() >= 1; }));

  manager.RemovePoolChangeListener(id);
  const int before = notifications.load();
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  EXPECT_EQ(notifications.load(), before);
}

TEST_F(PoolManagerContractTest, ClearPoolDisposesEverythingAndStaysUsable) {
  auto& manager = Make(3);
  auto a = manager.Acquire(Req("a"));
  ASSERT_TRUE(manager.Acquire(Req("b")).ok());
  manager.SetActiveVideo("a", 0);
  manager.SetPrewarmVideos({"b"});

  manager.ClearPool();

  EXPECT_EQ(manager.ResidentCount(), 0u);
  EXPECT_TRUE(a.handle->IsDisposed());
  EXPECT_FALSE(manager.ActiveKey().has_value());
  EXPECT_TRUE(manager.PrewarmKeys().empty());
  EXPECT_TRUE(manager.Acquire(Req("c")).ok());
}

TEST_F(PoolManagerContractTest, ShutdownDisposesAndRejectsLaterAcquisitions) {
  auto& manager = Make(3);
  auto a = manager.Acquire(Req("a"));
  ASSERT_TRUE(a.ok());

  manager.Shutdown();
  manager.Shutdown();

  EXPECT_TRUE(a.handle->IsDisposed());
  EXPECT_EQ(factory_->LiveCount(), 0);
  EXPECT_EQ(manager.Acquire(Req("b")).status, AcquireStatus::kShutdown);
}

TEST_F(PoolManagerContractTest, LastOwnerDroppedInsideWaiterShutsDownOnWorker) {
  PoolConfig config;
  config.capacity = 2;
  config.max_concurrent_creations = 2;
  config.session_id = "self-owned";
  auto owner = std::make_shared<PoolManager>(factory_, config);
  PoolManager& manager = *owner;

  std::atomic<bool> dropped{false};
  std::atomic<bool> ok{false};
  manager.AcquireAsync(Req("a"), [owner = std::move(owner), &dropped, &ok](
                                     const AcquireResult& result) mutable {
    ok.store(result.ok());
    owner.reset();
    dropped.store(true);
  });

  ASSERT_TRUE(WaitUntil([&] { return dropped.load(); }));
  EXPECT_TRUE(ok.load());
  EXPECT_EQ(factory_->LiveCount(), 0);
}

TEST_F(PoolManagerContractTest, MetricsExposePrometheusText) {
  auto& manager = Make(3);
  ASSERT_TRUE(manager.Acquire(Req("a")).ok());

  const auto metrics = manager.Metrics();
  EXPECT_EQ(metrics.capacity, 3);
  EXPECT_EQ(metrics.resident, 1);
  EXPECT_EQ(metrics.creations_succeeded_total, 1);

  const std::string text = metrics.GeneratePrometheusText();
  EXPECT_NE(text.find("feedpool_pool_resident{session=\"test\"} 1"), std::string::npos) << text;
}

}  // namespace
}  // namespace feedpool::pool

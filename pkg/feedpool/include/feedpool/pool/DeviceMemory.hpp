// Repository: Feedpool-engine
// Component: Device Memory Classification
// Purpose: Map physical memory to a tier and the tier to a default pool size.
// Copyright (c) 2025 Feedpool

#ifndef FEEDPOOL_POOL_DEVICE_MEMORY_HPP_
#define FEEDPOOL_POOL_DEVICE_MEMORY_HPP_

#include <cstdint>
#include <functional>

#include "feedpool/pool/PoolConfig.hpp"

namespace feedpool::pool {

enum class MemoryTier { kLow, kMedium, kHigh };

const char* MemoryTierName(MemoryTier tier);

// Default pool capacity per tier.
inline constexpr int kLowMemoryPoolSize = 2;
inline constexpr int kMediumMemoryPoolSize = 3;
inline constexpr int kHighMemoryPoolSize = 4;

int PoolSizeForTier(MemoryTier tier);

// DeviceMemoryClassifier reads total physical memory and buckets it:
//   < 3 GiB  -> kLow
//   < 6 GiB  -> kMedium
//   otherwise kHigh
// The probe is injectable so tests can pose as any device. A probe that
// reports 0 bytes (unknown) classifies as kMedium.
class DeviceMemoryClassifier {
 public:
  using MemoryProbeFn = std::function<uint64_t()>;

  DeviceMemoryClassifier();
  explicit DeviceMemoryClassifier(MemoryProbeFn probe);

  MemoryTier Classify() const;

  // Physical memory reported by sysconf().
  static uint64_t SystemPhysicalMemoryBytes();

 private:
  MemoryProbeFn probe_;
};

// Explicit config.capacity if positive, otherwise the tier default.
int ResolveCapacity(const PoolConfig& config,
                    const DeviceMemoryClassifier& classifier);

}  // namespace feedpool::pool

#endif  // FEEDPOOL_POOL_DEVICE_MEMORY_HPP_

// Repository: Feedpool-engine
// Component: Device Memory Classification
// Purpose: Tier classification from physical memory.
// Copyright (c) 2025 Feedpool

#include "feedpool/pool/DeviceMemory.hpp"

#include <unistd.h>

#include <sstream>
#include <utility>

#include "feedpool/util/Logger.hpp"

namespace feedpool::pool {

using feedpool::util::Logger;

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;
constexpr uint64_t kLowTierCeiling = 3 * kGiB;
constexpr uint64_t kMediumTierCeiling = 6 * kGiB;

}  // namespace

const char* MemoryTierName(MemoryTier tier) {
  switch (tier) {
    case MemoryTier::kLow:    return "low";
    case MemoryTier::kMedium: return "medium";
    case MemoryTier::kHigh:   return "high";
  }
  return "unknown";
}

int PoolSizeForTier(MemoryTier tier) {
  switch (tier) {
    case MemoryTier::kLow:    return kLowMemoryPoolSize;
    case MemoryTier::kMedium: return kMediumMemoryPoolSize;
    case MemoryTier::kHigh:   return kHighMemoryPoolSize;
  }
  return kMediumMemoryPoolSize;
}

DeviceMemoryClassifier::DeviceMemoryClassifier()
    : probe_(&DeviceMemoryClassifier::SystemPhysicalMemoryBytes) {}

DeviceMemoryClassifier::DeviceMemoryClassifier(MemoryProbeFn probe)
    : probe_(std::move(probe)) {
  if (!probe_) {
    probe_ = &DeviceMemoryClassifier::SystemPhysicalMemoryBytes;
  }
}

MemoryTier DeviceMemoryClassifier::Classify() const {
  const uint64_t bytes = probe_();
  if (bytes == 0) return MemoryTier::kMedium;
  if (bytes < kLowTierCeiling) return MemoryTier::kLow;
  if (bytes < kMediumTierCeiling) return MemoryTier::kMedium;
  return MemoryTier::kHigh;
}

uint64_t DeviceMemoryClassifier::SystemPhysicalMemoryBytes() {
  const long pages = sysconf(_SC_PHYS_PAGES);
  const long page_size = sysconf(_SC_PAGE_SIZE);
  if (pages <= 0 || page_size <= 0) return 0;
  return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
}

int ResolveCapacity(const PoolConfig& config,
                    const DeviceMemoryClassifier& classifier) {
  if (config.capacity > 0) return config.capacity;

  const MemoryTier tier = classifier.Classify();
  const int capacity = PoolSizeForTier(tier);
  std::ostringstream oss;
  oss << "[DeviceMemory] TIER tier=" << MemoryTierName(tier)
      << " capacity=" << capacity;
  Logger::Info(oss.str());
  return capacity;
}

}  // namespace feedpool::pool

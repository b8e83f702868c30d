// Repository: Feedpool-engine
// Component: Pool Metrics
// Purpose: Passive observability counters for PoolManager.
// Copyright (c) 2025 Feedpool
//
// Header-only.  All metric names use the "feedpool_pool_" prefix.
// These metrics are passive observations only; they do NOT affect
// eviction, cancellation, or acquisition order.

#ifndef FEEDPOOL_POOL_POOL_METRICS_HPP_
#define FEEDPOOL_POOL_POOL_METRICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace feedpool::pool {

struct PoolMetrics {
  // ---- Acquisition ----
  int64_t acquire_hits_total = 0;        // Served from a resident entry
  int64_t acquire_joined_total = 0;      // Joined an in-flight creation
  int64_t creations_started_total = 0;
  int64_t creations_succeeded_total = 0;
  int64_t creations_failed_total = 0;

  // ---- Eviction ----
  int64_t evictions_total = 0;
  int64_t evictions_prewarm_total = 0;   // Subset of evictions that took a prewarm key
  int64_t eviction_exhausted_total = 0;

  // ---- Cancellation ----
  int64_t cancellations_total = 0;
  int64_t cancelled_results_discarded_total = 0;

  // ---- Memory Pressure ----
  int64_t memory_pressure_events_total = 0;
  int64_t memory_pressure_released_total = 0;

  // ---- Gauges ----
  int32_t capacity = 0;
  int32_t resident = 0;
  int32_t in_flight = 0;
  int32_t queued = 0;

  std::string session_id;

  // Prometheus text rendering of the current counters.
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;
    const std::string labels = "{session=\"" + session_id + "\"}";

    auto counter = [&oss, &labels](const char* name, const char* help,
                                   int64_t value) {
      oss << "# HELP feedpool_pool_" << name << " " << help << "\n";
      oss << "# TYPE feedpool_pool_" << name << " counter\n";
      oss << "feedpool_pool_" << name << labels << " " << value << "\n\n";
    };
    auto gauge = [&oss, &labels](const char* name, const char* help,
                                 int64_t value) {
      oss << "# HELP feedpool_pool_" << name << " " << help << "\n";
      oss << "# TYPE feedpool_pool_" << name << " gauge\n";
      oss << "feedpool_pool_" << name << labels << " " << value << "\n\n";
    };

    counter("acquire_hits_total", "Acquisitions served from a resident entry",
            acquire_hits_total);
    counter("acquire_joined_total", "Acquisitions that joined an in-flight creation",
            acquire_joined_total);
    counter("creations_started_total", "Native creations started",
            creations_started_total);
    counter("creations_succeeded_total", "Native creations inserted into the pool",
            creations_succeeded_total);
    counter("creations_failed_total", "Native creations that failed to open",
            creations_failed_total);
    counter("evictions_total", "Entries evicted to make room",
            evictions_total);
    counter("evictions_prewarm_total", "Evictions that sacrificed a prewarm key",
            evictions_prewarm_total);
    counter("eviction_exhausted_total", "Acquisitions refused because every slot was protected",
            eviction_exhausted_total);
    counter("cancellations_total", "In-flight acquisitions cancelled",
            cancellations_total);
    counter("cancelled_results_discarded_total", "Handles created after cancellation and disposed",
            cancelled_results_discarded_total);
    counter("memory_pressure_events_total", "Memory pressure notifications handled",
            memory_pressure_events_total);
    counter("memory_pressure_released_total", "Entries released under memory pressure",
            memory_pressure_released_total);

    gauge("capacity", "Configured pool capacity", capacity);
    gauge("resident", "Entries currently resident", resident);
    gauge("in_flight", "Acquisitions currently in flight", in_flight);
    gauge("queued", "Creations waiting for a creation slot", queued);

    return oss.str();
  }
};

}  // namespace feedpool::pool

#endif  // FEEDPOOL_POOL_POOL_METRICS_HPP_

#ifndef ENGINE_STATS_HPP
#define ENGINE_STATS_HPP

#include "core/runtime_config.hpp"
#include "utils/bounded_worker_pool.hpp"
#include "utils/circuit_breaker.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace correlation {

struct CacheStats {
  std::string name;
  size_t size = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  double hit_ratio = 0.0;
  uint64_t ttl_ms = 0;
};

struct PoolStats {
  std::string name;
  size_t queue_depth = 0;
  size_t in_flight = 0;
  BoundedWorkerPool::Stats counters;
};

struct DispatchStats {
  uint64_t submitted = 0;
  uint64_t rejected = 0;
  uint64_t incidents_created = 0;
  uint64_t incidents_updated = 0;
  uint64_t failures = 0;
  uint64_t actions_executed = 0;
  uint64_t action_failures = 0;
  size_t queue_depth = 0;
};

// Point-in-time view for health endpoints and the /stats page
struct EngineStats {
  // Index
  uint64_t index_generation = 0;
  size_t active_rules = 0;
  size_t indexed_key_count = 0;
  size_t total_index_entries = 0;
  size_t membership_entries = 0;

  // Ingress
  uint64_t events_received = 0;
  uint64_t events_processed = 0;
  uint64_t dropped_circuit_open = 0;
  uint64_t dropped_overload = 0;
  uint64_t dropped_pool_rejected = 0;
  uint64_t processed_realtime = 0;
  uint64_t processed_stream = 0;
  uint64_t processed_batch = 0;

  // Queues
  PoolStats fast_pool;
  PoolStats normal_pool;

  // Caches
  CacheStats rule_cache;
  CacheStats fast_path_cache;
  double cache_hit_ratio = 0.0; // both caches combined

  // Latency
  double average_ms = 0.0;
  double p99_ms = 0.0;
  uint64_t performance_samples = 0;

  // Evaluation
  uint64_t rule_evaluations = 0;
  uint64_t evaluation_failures = 0;
  uint64_t matches = 0;
  uint64_t pattern_matches = 0;

  // Batch mode
  uint64_t batch_flushes = 0;
  uint64_t batched_events = 0;
  size_t batch_pending = 0;
  double last_batch_throughput_eps = 0.0;

  // Event buffers
  size_t buffer_keys = 0;
  size_t buffered_events = 0;

  std::string circuit_breaker_status;
  circuit_breaker::CircuitBreaker::Snapshot circuit_breaker;

  DispatchStats dispatch;
  RuntimeConfig runtime_config;
  uint64_t tuner_ticks = 0;
};

} // namespace correlation

#endif // ENGINE_STATS_HPP

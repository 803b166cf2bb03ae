#ifndef RUNTIME_CONFIG_HPP
#define RUNTIME_CONFIG_HPP

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace correlation {

// Tunables read by every in-flight operation
struct RuntimeConfig {
  uint32_t max_processing_time_ms = 200;
  bool batch_processing_enabled = false;
  size_t batch_size = 50;
  size_t batch_chunk_size = 10;
  uint64_t fast_path_cache_ttl_ms = 30000;
  bool parallel_rule_evaluation = true;
  bool fast_path_enabled = true;
  bool stream_processing_mode = false;
  bool circuit_breaker_enabled = true;
  size_t max_concurrent_events = 1000;
  bool priority_queue_enabled = true;

  static RuntimeConfig from_engine_config(const Config::EngineConfig &engine);
};

struct RuntimeConfigPatch {
  std::optional<uint32_t> max_processing_time_ms;
  std::optional<bool> batch_processing_enabled;
  std::optional<size_t> batch_size;
  std::optional<size_t> batch_chunk_size;
  std::optional<uint64_t> fast_path_cache_ttl_ms;
  std::optional<bool> parallel_rule_evaluation;
  std::optional<bool> fast_path_enabled;
  std::optional<bool> stream_processing_mode;
  std::optional<bool> circuit_breaker_enabled;
  std::optional<size_t> max_concurrent_events;
  std::optional<bool> priority_queue_enabled;

  bool empty() const;
};

class RuntimeConfigStore {
public:
  explicit RuntimeConfigStore(const RuntimeConfig &initial = RuntimeConfig{});

  RuntimeConfig snapshot() const;

  // Applies every set field, or nothing if any of them is invalid.
  bool merge(const RuntimeConfigPatch &patch,
             std::vector<std::string> &errors);

private:
  mutable std::shared_mutex mutex_;
  RuntimeConfig config_;
};

} // namespace correlation

#endif // RUNTIME_CONFIG_HPP

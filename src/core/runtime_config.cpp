#include "runtime_config.hpp"

#include <mutex>

namespace correlation {

RuntimeConfig
RuntimeConfig::from_engine_config(const Config::EngineConfig &engine) {
  RuntimeConfig rc;
  rc.max_processing_time_ms = engine.max_processing_time_ms;
  rc.batch_processing_enabled = engine.batch_processing_enabled;
  rc.batch_size = engine.batch_size;
  rc.batch_chunk_size = engine.batch_chunk_size;
  rc.fast_path_cache_ttl_ms = engine.fast_path_cache_ttl_ms;
  rc.parallel_rule_evaluation = engine.parallel_rule_evaluation;
  rc.fast_path_enabled = engine.fast_path_enabled;
  rc.stream_processing_mode = engine.stream_processing_mode;
  rc.circuit_breaker_enabled = engine.circuit_breaker_enabled;
  rc.max_concurrent_events = engine.max_concurrent_events;
  rc.priority_queue_enabled = engine.priority_queue_enabled;
  return rc;
}

bool RuntimeConfigPatch::empty() const {
  return !max_processing_time_ms && !batch_processing_enabled && !batch_size &&
         !batch_chunk_size && !fast_path_cache_ttl_ms &&
         !parallel_rule_evaluation && !fast_path_enabled &&
         !stream_processing_mode && !circuit_breaker_enabled &&
         !max_concurrent_events && !priority_queue_enabled;
}

RuntimeConfigStore::RuntimeConfigStore(const RuntimeConfig &initial)
    : config_(initial) {}

RuntimeConfig RuntimeConfigStore::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return config_;
}

bool RuntimeConfigStore::merge(const RuntimeConfigPatch &patch,
                               std::vector<std::string> &errors) {
  size_t errors_before = errors.size();
  if (patch.max_processing_time_ms && *patch.max_processing_time_ms == 0)
    errors.push_back("max_processing_time_ms must be positive");
  if (patch.batch_size && *patch.batch_size == 0)
    errors.push_back("batch_size must be positive");
  if (patch.batch_chunk_size && *patch.batch_chunk_size == 0)
    errors.push_back("batch_chunk_size must be positive");
  if (patch.fast_path_cache_ttl_ms && *patch.fast_path_cache_ttl_ms == 0)
    errors.push_back("fast_path_cache_ttl_ms must be positive");
  if (patch.max_concurrent_events && *patch.max_concurrent_events == 0)
    errors.push_back("max_concurrent_events must be positive");
  if (errors.size() != errors_before)
    return false;

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (patch.max_processing_time_ms)
    config_.max_processing_time_ms = *patch.max_processing_time_ms;
  if (patch.batch_processing_enabled)
    config_.batch_processing_enabled = *patch.batch_processing_enabled;
  if (patch.batch_size)
    config_.batch_size = *patch.batch_size;
  if (patch.batch_chunk_size)
    config_.batch_chunk_size = *patch.batch_chunk_size;
  if (patch.fast_path_cache_ttl_ms)
    config_.fast_path_cache_ttl_ms = *patch.fast_path_cache_ttl_ms;
  if (patch.parallel_rule_evaluation)
    config_.parallel_rule_evaluation = *patch.parallel_rule_evaluation;
  if (patch.fast_path_enabled)
    config_.fast_path_enabled = *patch.fast_path_enabled;
  if (patch.stream_processing_mode)
    config_.stream_processing_mode = *patch.stream_processing_mode;
  if (patch.circuit_breaker_enabled)
    config_.circuit_breaker_enabled = *patch.circuit_breaker_enabled;
  if (patch.max_concurrent_events)
    config_.max_concurrent_events = *patch.max_concurrent_events;
  if (patch.priority_queue_enabled)
    config_.priority_queue_enabled = *patch.priority_queue_enabled;
  return true;
}

} // namespace correlation

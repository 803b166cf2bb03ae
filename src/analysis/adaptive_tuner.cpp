#include "adaptive_tuner.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace analysis {

AdaptiveTuner::AdaptiveTuner(const Config::TuningConfig &config,
                             correlation::RuntimeConfigStore &runtime_config,
                             const PerformanceWindow &performance,
                             QueueDepthProvider deepest_queue)
    : config_(config), runtime_config_(runtime_config),
      performance_(performance), deepest_queue_(std::move(deepest_queue)) {}

TuningDecision AdaptiveTuner::tune_once() {
  ++ticks_;
  TuningDecision decision;

  PerformanceSnapshot perf = performance_.snapshot();
  correlation::RuntimeConfig rc = runtime_config_.snapshot();
  size_t queue_depth = deepest_queue_ ? deepest_queue_() : 0;
  double target = static_cast<double>(rc.max_processing_time_ms);

  if (perf.total_events > 0 && perf.average_ms > target) {
    LOG(LogLevel::WARN, LogComponent::TUNER,
        "Performance degradation: average " << perf.average_ms
                                            << "ms, p99 " << perf.p99_ms
                                            << "ms, target " << target << "ms");
  }

  correlation::RuntimeConfigPatch patch;

  // No samples means no evidence of headroom
  if (perf.total_events > 0 &&
      perf.average_ms < target * config_.stream_mode_latency_ratio &&
      !rc.stream_processing_mode) {
    patch.stream_processing_mode = true;
    decision.enabled_stream_mode = true;
  }

  if (queue_depth > config_.queue_depth_batch_threshold &&
      !rc.batch_processing_enabled) {
    patch.batch_processing_enabled = true;
    decision.enabled_batch_mode = true;
  }

  if (perf.average_ms > target && rc.batch_size > config_.min_batch_size) {
    size_t reduced = rc.batch_size > config_.batch_size_step
                         ? rc.batch_size - config_.batch_size_step
                         : 0;
    decision.new_batch_size = std::max(config_.min_batch_size, reduced);
    patch.batch_size = decision.new_batch_size;
  }

  if (!decision.changed())
    return decision;

  std::vector<std::string> errors;
  if (!runtime_config_.merge(patch, errors)) {
    for (const auto &error : errors)
      LOG(LogLevel::ERROR, LogComponent::TUNER,
          "Rejected tuning adjustment: " << error);
    return TuningDecision{};
  }

  if (decision.enabled_stream_mode)
    LOG(LogLevel::INFO, LogComponent::TUNER,
        "Enabled stream processing mode (average " << perf.average_ms
                                                   << "ms)");
  if (decision.enabled_batch_mode)
    LOG(LogLevel::INFO, LogComponent::TUNER,
        "Enabled batch processing mode (queue depth " << queue_depth << ")");
  if (decision.new_batch_size)
    LOG(LogLevel::INFO, LogComponent::TUNER,
        "Reduced batch size to " << *decision.new_batch_size);
  return decision;
}

} // namespace analysis

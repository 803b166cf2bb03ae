#ifndef ADAPTIVE_TUNER_HPP
#define ADAPTIVE_TUNER_HPP

#include "analysis/performance_window.hpp"
#include "core/config.hpp"
#include "core/runtime_config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace analysis {

struct TuningDecision {
  bool enabled_stream_mode = false;
  bool enabled_batch_mode = false;
  std::optional<size_t> new_batch_size;

  bool changed() const {
    return enabled_stream_mode || enabled_batch_mode ||
           new_batch_size.has_value();
  }
};

// One step of the feedback loop. Adjustments only ever move one way:
// stream and batch mode are switched on but never off again, and the
// batch size only shrinks, down to min_batch_size.
class AdaptiveTuner {
public:
  using QueueDepthProvider = std::function<size_t()>;

  AdaptiveTuner(const Config::TuningConfig &config,
                correlation::RuntimeConfigStore &runtime_config,
                const PerformanceWindow &performance,
                QueueDepthProvider deepest_queue);

  TuningDecision tune_once();

  uint64_t tick_count() const { return ticks_; }

private:
  const Config::TuningConfig config_;
  correlation::RuntimeConfigStore &runtime_config_;
  const PerformanceWindow &performance_;
  QueueDepthProvider deepest_queue_;
  uint64_t ticks_ = 0;
};

} // namespace analysis

#endif // ADAPTIVE_TUNER_HPP

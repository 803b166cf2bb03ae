#ifndef CORRELATION_PIPELINE_HPP
#define CORRELATION_PIPELINE_HPP

#include "analysis/adaptive_tuner.hpp"
#include "analysis/event_buffer_manager.hpp"
#include "analysis/pattern_matcher.hpp"
#include "analysis/performance_window.hpp"
#include "core/admission_controller.hpp"
#include "core/batch_aggregator.hpp"
#include "core/config.hpp"
#include "core/engine_stats.hpp"
#include "core/event.hpp"
#include "core/match_dispatcher.hpp"
#include "core/runtime_config.hpp"
#include "detection/evaluation_path_selector.hpp"
#include "detection/expiring_cache.hpp"
#include "detection/priority_router.hpp"
#include "detection/rule_evaluator.hpp"
#include "detection/rule_index.hpp"
#include "io/actions/base_action_executor.hpp"
#include "io/incident/base_incident_manager.hpp"
#include "io/rule_store/base_rule_store.hpp"
#include "utils/circuit_breaker.hpp"
#include "utils/periodic_task.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace prometheus {
class PrometheusMetricsExporter;
}

namespace correlation {

// What happened to an event handed to process_event()
enum class ProcessOutcome {
  QUEUED,   // routed to a worker pool
  STREAMED, // evaluated inline (stream mode)
  BATCHED,  // accepted by the batch aggregator
  DROPPED_CIRCUIT_OPEN,
  DROPPED_OVERLOAD,
  DROPPED_POOL_REJECTED,
  DROPPED_SHUTDOWN,
  FAILED,
  INVALID
};

const char *process_outcome_to_string(ProcessOutcome outcome);
bool is_dropped(ProcessOutcome outcome);

struct PipelineCollaborators {
  std::shared_ptr<IRuleStore> rule_store;
  std::shared_ptr<IRuleEvaluator> evaluator;
  std::shared_ptr<IIncidentManager> incident_manager;
  std::vector<std::shared_ptr<IActionExecutor>> action_executors;
  std::shared_ptr<analysis::IPatternMatcher> pattern_matcher; // optional
};

class CorrelationPipeline {
public:
  // Throws std::invalid_argument when a required collaborator is missing
  CorrelationPipeline(const Config::AppConfig &config,
                      PipelineCollaborators collaborators,
                      Utils::Clock clock = Utils::system_clock_ms());
  ~CorrelationPipeline();

  CorrelationPipeline(const CorrelationPipeline &) = delete;
  CorrelationPipeline &operator=(const CorrelationPipeline &) = delete;

  // Loads rules and starts the background loops. A failed rule load is
  // logged and the engine runs with no rules until the next reload.
  void initialize();

  // Never throws
  ProcessOutcome process_event(EventPtr event);

  bool reload_rules();

  EngineStats get_engine_stats() const;

  bool update_runtime_config(const RuntimeConfigPatch &patch,
                             std::vector<std::string> &errors);
  void enable_stream_mode();
  RuntimeConfig runtime_config() const { return runtime_config_.snapshot(); }

  // Registers the ce_* metrics and feeds them from then on
  void set_metrics_exporter(
      std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter);

  // Runs one tuner tick: performance summary, tuning and metric publishing
  analysis::TuningDecision run_tuning_cycle();
  void sweep_caches();
  analysis::BufferSweepResult sweep_buffers();
  void publish_metrics();

  // Blocks until the worker pools and the dispatcher have nothing queued
  // or running. Does not flush a partial batch.
  void wait_idle();

  // Flushes the pending batch, drains the queues, then closes the
  // collaborators. Idempotent.
  void shutdown();

  bool is_circuit_open() const;

private:
  enum class Mode { REALTIME, STREAM, BATCH };

  void process_routed(const EventPtr &event);
  void process_inline(const EventPtr &event, Mode mode);
  void handle_outcome(const IndexSnapshotPtr &index, const EventPtr &event,
                      const EvaluationOutcome &outcome);
  void run_pattern_matching(const EventPtr &event);
  void record_completion(std::chrono::steady_clock::time_point start,
                         const RuntimeConfig &config, Mode mode);
  void record_failure(const Event &event, const std::exception &e);
  void flush_batch(std::vector<EventPtr> &&batch);
  void warm_up(const IndexSnapshot &index);
  void count_drop(ProcessOutcome outcome);

  void register_metrics(prometheus::PrometheusMetricsExporter &exporter);
  void increment_metric(const std::string &name,
                        const std::map<std::string, std::string> &labels = {},
                        double value = 1.0);
  void publish_counter_delta(prometheus::PrometheusMetricsExporter &exporter,
                             const std::string &name,
                             const std::map<std::string, std::string> &labels,
                             uint64_t current);

  const Config::AppConfig config_;
  Utils::Clock clock_;
  PipelineCollaborators collaborators_;

  RuntimeConfigStore runtime_config_;
  circuit_breaker::CircuitBreaker breaker_;
  RuleIndex rule_index_;
  ExpiringCache<EvaluationResult> rule_cache_;
  ExpiringCache<bool> fast_path_cache_;
  EvaluationPathSelector selector_;
  PriorityRouter router_;
  AdmissionController admission_;
  analysis::EventBufferManager buffers_;
  analysis::PerformanceWindow performance_;
  analysis::AdaptiveTuner tuner_;
  MatchDispatcher dispatcher_;
  std::unique_ptr<BatchAggregator> batch_;

  std::unique_ptr<PeriodicTask> cache_sweep_task_;
  std::unique_ptr<PeriodicTask> buffer_sweep_task_;
  std::unique_ptr<PeriodicTask> tuning_task_;
  std::unique_ptr<PeriodicTask> metrics_task_;

  std::shared_ptr<prometheus::PrometheusMetricsExporter> metrics_;
  mutable std::mutex metrics_mutex_;
  std::map<std::string, uint64_t> published_counters_;

  std::atomic<bool> initialized_{false};
  std::atomic<bool> shutting_down_{false};
  std::mutex lifecycle_mutex_;

  std::atomic<uint64_t> events_received_{0};
  std::atomic<uint64_t> events_processed_{0};
  std::atomic<uint64_t> dropped_pool_rejected_{0};
  std::atomic<uint64_t> processed_realtime_{0};
  std::atomic<uint64_t> processed_stream_{0};
  std::atomic<uint64_t> processed_batch_{0};
  std::atomic<uint64_t> matches_{0};
  std::atomic<uint64_t> pattern_matches_{0};
  std::atomic<double> last_batch_throughput_{0.0};
};

} // namespace correlation

#endif // CORRELATION_PIPELINE_HPP

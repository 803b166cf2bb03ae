#include "correlation_pipeline.hpp"
#include "core/logger.hpp"
#include "core/prometheus_metrics_exporter.hpp"

#include <algorithm>
#include <array>
#include <future>
#include <stdexcept>
#include <utility>

namespace correlation {

namespace {

constexpr std::array<const char *, 4> WARM_UP_EVENT_TYPES = {"4624", "4625",
                                                             "4648", "4778"};
constexpr std::array<const char *, 2> WARM_UP_SOURCES = {"security",
                                                         "system"};

PipelineCollaborators validated(PipelineCollaborators collaborators) {
  if (!collaborators.rule_store)
    throw std::invalid_argument("CorrelationPipeline requires a rule store");
  if (!collaborators.evaluator)
    throw std::invalid_argument("CorrelationPipeline requires a rule evaluator");
  if (!collaborators.incident_manager)
    throw std::invalid_argument(
        "CorrelationPipeline requires an incident manager");
  return collaborators;
}

circuit_breaker::CircuitBreaker::Config
breaker_config(const Config::CircuitBreakerConfig &config) {
  circuit_breaker::CircuitBreaker::Config result;
  result.failure_threshold = config.failure_threshold;
  result.timeout_ms = config.timeout_ms;
  return result;
}

CacheStats cache_stats(const std::string &name, size_t size, uint64_t hits,
                       uint64_t misses, double ratio, uint64_t ttl_ms) {
  CacheStats stats;
  stats.name = name;
  stats.size = size;
  stats.hits = hits;
  stats.misses = misses;
  stats.hit_ratio = ratio;
  stats.ttl_ms = ttl_ms;
  return stats;
}

PoolStats pool_stats(const BoundedWorkerPool &pool) {
  PoolStats stats;
  stats.name = pool.name();
  stats.queue_depth = pool.pending();
  stats.in_flight = pool.in_flight();
  stats.counters = pool.get_stats();
  return stats;
}

} // namespace

const char *process_outcome_to_string(ProcessOutcome outcome) {
  switch (outcome) {
  case ProcessOutcome::QUEUED:
    return "queued";
  case ProcessOutcome::STREAMED:
    return "streamed";
  case ProcessOutcome::BATCHED:
    return "batched";
  case ProcessOutcome::DROPPED_CIRCUIT_OPEN:
    return "circuit_open";
  case ProcessOutcome::DROPPED_OVERLOAD:
    return "overload";
  case ProcessOutcome::DROPPED_POOL_REJECTED:
    return "pool_rejected";
  case ProcessOutcome::DROPPED_SHUTDOWN:
    return "shutdown";
  case ProcessOutcome::FAILED:
    return "failed";
  case ProcessOutcome::INVALID:
    return "invalid";
  }
  return "unknown";
}

bool is_dropped(ProcessOutcome outcome) {
  return outcome == ProcessOutcome::DROPPED_CIRCUIT_OPEN ||
         outcome == ProcessOutcome::DROPPED_OVERLOAD ||
         outcome == ProcessOutcome::DROPPED_POOL_REJECTED ||
         outcome == ProcessOutcome::DROPPED_SHUTDOWN;
}

CorrelationPipeline::CorrelationPipeline(const Config::AppConfig &config,
                                         PipelineCollaborators collaborators,
                                         Utils::Clock clock)
    : config_(config), clock_(std::move(clock)),
      collaborators_(validated(std::move(collaborators))),
      runtime_config_(RuntimeConfig::from_engine_config(config.engine)),
      breaker_("event_admission", breaker_config(config.circuit_breaker),
               clock_),
      rule_cache_("rule_evaluation", config.cache.rule_evaluation_ttl_ms,
                  config.cache.shard_count, clock_),
      fast_path_cache_("fast_path", config.engine.fast_path_cache_ttl_ms,
                       config.cache.shard_count, clock_),
      selector_(*collaborators_.evaluator, rule_cache_, fast_path_cache_,
                clock_),
      router_(config.worker_pools, clock_),
      admission_(breaker_, [this]() { return router_.total_queue_depth(); }),
      buffers_(config.event_buffer, clock_),
      tuner_(config.tuning, runtime_config_, performance_,
             [this]() {
               return std::max(router_.fast_queue_depth(),
                               router_.normal_queue_depth());
             }),
      dispatcher_(config.dispatch, collaborators_.incident_manager,
                  collaborators_.action_executors, clock_) {
  batch_ = std::make_unique<BatchAggregator>(
      [this](std::vector<EventPtr> &&batch) { flush_batch(std::move(batch)); },
      [this]() { return runtime_config_.snapshot().batch_size; },
      std::chrono::milliseconds(config.engine.batch_flush_interval_ms));
}

CorrelationPipeline::~CorrelationPipeline() { shutdown(); }

void CorrelationPipeline::initialize() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (initialized_.load() || shutting_down_.load())
    return;

  if (!reload_rules())
    LOG(LogLevel::WARN, LogComponent::CORE,
        "Starting with no active rules; they will be picked up on the next "
        "reload.");

  cache_sweep_task_ = std::make_unique<PeriodicTask>(
      "cache_sweep",
      std::chrono::seconds(config_.cache.cleanup_interval_seconds),
      [this]() { sweep_caches(); });
  buffer_sweep_task_ = std::make_unique<PeriodicTask>(
      "buffer_sweep",
      std::chrono::seconds(config_.event_buffer.sweep_interval_seconds),
      [this]() { sweep_buffers(); });
  tuning_task_ = std::make_unique<PeriodicTask>(
      "tuning", std::chrono::seconds(config_.tuning.interval_seconds),
      [this]() { run_tuning_cycle(); });
  metrics_task_ = std::make_unique<PeriodicTask>(
      "metrics_publish",
      std::chrono::seconds(config_.prometheus.publish_interval_seconds),
      [this]() { publish_metrics(); });

  cache_sweep_task_->start();
  buffer_sweep_task_->start();
  tuning_task_->start();
  metrics_task_->start();

  initialized_.store(true);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Correlation pipeline initialized with "
          << rule_index_.snapshot()->active_rule_count() << " active rules");
}

ProcessOutcome CorrelationPipeline::process_event(EventPtr event) {
  if (!event)
    return ProcessOutcome::INVALID;

  try {
    if (shutting_down_.load()) {
      count_drop(ProcessOutcome::DROPPED_SHUTDOWN);
      return ProcessOutcome::DROPPED_SHUTDOWN;
    }

    events_received_.fetch_add(1, std::memory_order_relaxed);
    increment_metric("ce_events_received_total");

    // Fresh snapshot per event so tuner changes apply to the next one
    RuntimeConfig config = runtime_config_.snapshot();

    AdmissionDecision decision = admission_.admit(*event, config);
    if (decision == AdmissionDecision::REJECTED_CIRCUIT_OPEN) {
      count_drop(ProcessOutcome::DROPPED_CIRCUIT_OPEN);
      return ProcessOutcome::DROPPED_CIRCUIT_OPEN;
    }
    if (decision == AdmissionDecision::REJECTED_OVERLOAD) {
      count_drop(ProcessOutcome::DROPPED_OVERLOAD);
      return ProcessOutcome::DROPPED_OVERLOAD;
    }

    if (config.stream_processing_mode) {
      process_inline(event, Mode::STREAM);
      return ProcessOutcome::STREAMED;
    }

    if (config.batch_processing_enabled) {
      if (batch_->add(event))
        return ProcessOutcome::BATCHED;
      count_drop(ProcessOutcome::DROPPED_SHUTDOWN);
      return ProcessOutcome::DROPPED_SHUTDOWN;
    }

    EventPriority priority = PriorityRouter::classify(*event);
    bool routed = router_.route(priority, config.priority_queue_enabled,
                                [this, event]() { process_routed(event); });
    if (!routed) {
      dropped_pool_rejected_.fetch_add(1, std::memory_order_relaxed);
      LOG(LogLevel::WARN, LogComponent::ROUTING,
          "Worker pool refused " << event_priority_to_string(priority)
                                 << " priority event " << event->id);
      count_drop(ProcessOutcome::DROPPED_POOL_REJECTED);
      return ProcessOutcome::DROPPED_POOL_REJECTED;
    }
    return ProcessOutcome::QUEUED;
  } catch (const std::exception &e) {
    record_failure(*event, e);
    return ProcessOutcome::FAILED;
  }
}

void CorrelationPipeline::process_routed(const EventPtr &event) {
  auto start = std::chrono::steady_clock::now();
  RuntimeConfig config = runtime_config_.snapshot();
  try {
    IndexSnapshotPtr index = rule_index_.snapshot();
    std::vector<RulePtr> candidates = index->candidates_for(*event);
    EvaluationOutcome outcome = selector_.evaluate(
        *event, candidates, config, router_.normal_queue_depth());

    LOG(LogLevel::TRACE, LogComponent::EVAL,
        "Event " << event->id << " took the "
                 << evaluation_path_to_string(outcome.path) << " path with "
                 << outcome.candidate_count << " candidates");

    // Only the standard path feeds the cross-event heuristics
    if (outcome.path != EvaluationPath::FAST)
      run_pattern_matching(event);

    handle_outcome(index, event, outcome);
    processed_realtime_.fetch_add(1, std::memory_order_relaxed);
    record_completion(start, config, Mode::REALTIME);
  } catch (const std::exception &e) {
    record_failure(*event, e);
  }
}

void CorrelationPipeline::process_inline(const EventPtr &event, Mode mode) {
  auto start = std::chrono::steady_clock::now();
  RuntimeConfig config = runtime_config_.snapshot();
  try {
    IndexSnapshotPtr index = rule_index_.snapshot();
    std::vector<RulePtr> candidates = index->candidates_for(*event);
    EvaluationOutcome outcome = selector_.evaluate_stream(*event, candidates);
    handle_outcome(index, event, outcome);

    if (mode == Mode::BATCH)
      processed_batch_.fetch_add(1, std::memory_order_relaxed);
    else
      processed_stream_.fetch_add(1, std::memory_order_relaxed);
    record_completion(start, config, mode);
  } catch (const std::exception &e) {
    record_failure(*event, e);
  }
}

void CorrelationPipeline::handle_outcome(const IndexSnapshotPtr &index,
                                         const EventPtr &event,
                                         const EvaluationOutcome &outcome) {
  for (const auto &match : outcome.matches) {
    matches_.fetch_add(1, std::memory_order_relaxed);
    increment_metric("ce_matches_total");
    dispatcher_.dispatch(index, match, event);
  }
}

void CorrelationPipeline::run_pattern_matching(const EventPtr &event) {
  buffers_.add(event);
  if (!collaborators_.pattern_matcher)
    return;

  try {
    auto found = collaborators_.pattern_matcher->find_matches(
        *event, buffers_.snapshot(analysis::EventBufferManager::buffer_key(*event)));
    if (!found.empty()) {
      pattern_matches_.fetch_add(found.size(), std::memory_order_relaxed);
      for (const auto &match : found)
        LOG(LogLevel::INFO, LogComponent::EVAL,
            "Pattern " << match.pattern_name << " detected around event "
                       << event->id << " (confidence " << match.confidence
                       << ", " << match.event_ids.size() << " events)");
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::EVAL,
        "Pattern matching failed for event " << event->id << ": " << e.what());
  }
}

void CorrelationPipeline::record_completion(
    std::chrono::steady_clock::time_point start, const RuntimeConfig &config,
    Mode mode) {
  double duration_ms = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - start)
                           .count();
  performance_.record(duration_ms);
  events_processed_.fetch_add(1, std::memory_order_relaxed);

  if (duration_ms > static_cast<double>(config.max_processing_time_ms)) {
    breaker_.record_slow();
    LOG(LogLevel::DEBUG, LogComponent::CORE,
        "Event processing took " << duration_ms << "ms, over the "
                                 << config.max_processing_time_ms
                                 << "ms target");
  } else {
    breaker_.record_success();
  }

  const char *mode_label = mode == Mode::REALTIME ? "realtime"
                           : mode == Mode::STREAM ? "stream"
                                                  : "batch";
  increment_metric("ce_events_processed_total", {{"mode", mode_label}});

  std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter;
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    exporter = metrics_;
  }
  if (exporter) {
    try {
      exporter->observe_histogram("ce_event_processing_duration_seconds",
                                  duration_ms / 1000.0);
    } catch (const std::invalid_argument &e) {
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Failed to record processing duration: " << e.what());
    }
  }
}

void CorrelationPipeline::record_failure(const Event &event,
                                         const std::exception &e) {
  breaker_.record_exception();
  LOG(LogLevel::ERROR, LogComponent::CORE,
      "Processing failed for event " << event.id << ": " << e.what());
}

void CorrelationPipeline::flush_batch(std::vector<EventPtr> &&batch) {
  if (batch.empty())
    return;

  auto start = std::chrono::steady_clock::now();
  size_t chunk_size = std::max<size_t>(1, runtime_config_.snapshot().batch_chunk_size);

  for (size_t offset = 0; offset < batch.size(); offset += chunk_size) {
    size_t end = std::min(batch.size(), offset + chunk_size);
    std::vector<std::future<void>> chunk;
    chunk.reserve(end - offset);
    for (size_t i = offset; i < end; ++i) {
      const EventPtr &event = batch[i];
      chunk.push_back(std::async(std::launch::async, [this, &event]() {
        process_inline(event, Mode::BATCH);
      }));
    }
    for (auto &task : chunk)
      task.get();
  }

  double seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();
  double throughput = seconds > 0.0 ? batch.size() / seconds : 0.0;
  last_batch_throughput_.store(throughput);
  LOG(LogLevel::DEBUG, LogComponent::BATCH,
      "Flushed batch of " << batch.size() << " events in " << seconds * 1000.0
                          << "ms (" << throughput << " events/s)");
}

bool CorrelationPipeline::reload_rules() {
  std::vector<RulePtr> rules;
  try {
    rules = collaborators_.rule_store->load_enabled_rules();
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::INDEX,
        "Rule load from " << collaborators_.rule_store->get_store_type()
                          << " store failed: " << e.what());
    return false;
  }

  IndexSnapshotPtr index = rule_index_.rebuild(rules);
  // Cached verdicts belong to the previous rule set
  rule_cache_.clear();
  fast_path_cache_.clear();

  LOG(LogLevel::INFO, LogComponent::INDEX,
      "Rule index generation " << index->generation() << ": "
                               << index->active_rule_count() << " rules under "
                               << index->indexed_key_count() << " keys");
  warm_up(*index);
  return true;
}

void CorrelationPipeline::warm_up(const IndexSnapshot &index) {
  for (const char *type : WARM_UP_EVENT_TYPES) {
    for (const char *source : WARM_UP_SOURCES) {
      Event probe;
      probe.id = "warmup";
      probe.event_type = type;
      probe.source = source;
      probe.timestamp_ms = clock_();
      LOG(LogLevel::DEBUG, LogComponent::INDEX,
          "Warm-up " << type << "/" << source << ": "
                     << index.candidates_for(probe).size() << " candidates");
    }
  }
}

void CorrelationPipeline::count_drop(ProcessOutcome outcome) {
  increment_metric("ce_events_dropped_total",
                   {{"reason", process_outcome_to_string(outcome)}});
}

EngineStats CorrelationPipeline::get_engine_stats() const {
  EngineStats stats;

  IndexSnapshotPtr index = rule_index_.snapshot();
  stats.index_generation = index->generation();
  stats.active_rules = index->active_rule_count();
  stats.indexed_key_count = index->indexed_key_count();
  stats.total_index_entries = index->total_index_entries();
  stats.membership_entries = index->membership_entries();

  stats.events_received = events_received_.load();
  stats.events_processed = events_processed_.load();
  stats.dropped_circuit_open = admission_.rejected_circuit_open();
  stats.dropped_overload = admission_.rejected_overload();
  stats.dropped_pool_rejected = dropped_pool_rejected_.load();
  stats.processed_realtime = processed_realtime_.load();
  stats.processed_stream = processed_stream_.load();
  stats.processed_batch = processed_batch_.load();

  stats.fast_pool = pool_stats(router_.fast_pool());
  stats.normal_pool = pool_stats(router_.normal_pool());

  stats.rule_cache = cache_stats(rule_cache_.name(), rule_cache_.size(),
                                 rule_cache_.hits(), rule_cache_.misses(),
                                 rule_cache_.hit_ratio(), rule_cache_.ttl_ms());
  stats.fast_path_cache = cache_stats(
      fast_path_cache_.name(), fast_path_cache_.size(),
      fast_path_cache_.hits(), fast_path_cache_.misses(),
      fast_path_cache_.hit_ratio(), fast_path_cache_.ttl_ms());
  uint64_t hits = stats.rule_cache.hits + stats.fast_path_cache.hits;
  uint64_t lookups = hits + stats.rule_cache.misses + stats.fast_path_cache.misses;
  stats.cache_hit_ratio =
      lookups == 0 ? 0.0 : static_cast<double>(hits) / lookups;

  analysis::PerformanceSnapshot perf = performance_.snapshot();
  stats.average_ms = perf.average_ms;
  stats.p99_ms = perf.p99_ms;
  stats.performance_samples = perf.total_events;

  stats.rule_evaluations = selector_.rule_evaluations();
  stats.evaluation_failures = selector_.evaluation_failures();
  stats.matches = matches_.load();
  stats.pattern_matches = pattern_matches_.load();

  stats.batch_flushes = batch_->flush_count();
  stats.batched_events = batch_->flushed_events();
  stats.batch_pending = batch_->pending_count();
  stats.last_batch_throughput_eps = last_batch_throughput_.load();

  stats.buffer_keys = buffers_.key_count();
  stats.buffered_events = buffers_.total_events();

  stats.circuit_breaker = breaker_.snapshot();
  stats.circuit_breaker_status = breaker_.get_state_string();

  stats.dispatch = dispatcher_.get_stats();
  stats.runtime_config = runtime_config_.snapshot();
  stats.tuner_ticks = tuner_.tick_count();
  return stats;
}

bool CorrelationPipeline::update_runtime_config(
    const RuntimeConfigPatch &patch, std::vector<std::string> &errors) {
  if (!runtime_config_.merge(patch, errors)) {
    for (const auto &error : errors)
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Rejected runtime configuration change: " << error);
    return false;
  }

  if (patch.fast_path_cache_ttl_ms)
    fast_path_cache_.set_ttl_ms(*patch.fast_path_cache_ttl_ms);
  LOG(LogLevel::INFO, LogComponent::CONFIG, "Runtime configuration updated");
  return true;
}

void CorrelationPipeline::enable_stream_mode() {
  RuntimeConfigPatch patch;
  patch.stream_processing_mode = true;
  std::vector<std::string> errors;
  if (update_runtime_config(patch, errors))
    LOG(LogLevel::INFO, LogComponent::CORE, "Stream processing mode enabled");
}

analysis::TuningDecision CorrelationPipeline::run_tuning_cycle() {
  analysis::PerformanceSnapshot perf = performance_.snapshot();
  LOG(LogLevel::INFO, LogComponent::TUNER,
      "Performance: " << perf.total_events << " events, average "
                      << perf.average_ms << "ms, p99 " << perf.p99_ms
                      << "ms, queues fast=" << router_.fast_queue_depth()
                      << " normal=" << router_.normal_queue_depth()
                      << ", circuit " << breaker_.get_state_string());

  if (!config_.tuning.enabled)
    return analysis::TuningDecision{};
  return tuner_.tune_once();
}

void CorrelationPipeline::sweep_caches() {
  size_t rule_removed = rule_cache_.sweep();
  size_t fast_removed = fast_path_cache_.sweep();
  LOG(LogLevel::DEBUG, LogComponent::CACHE,
      "Cache sweep removed " << rule_removed << " rule and " << fast_removed
                             << " fast path entries");
}

analysis::BufferSweepResult CorrelationPipeline::sweep_buffers() {
  return buffers_.sweep();
}

bool CorrelationPipeline::is_circuit_open() const {
  return breaker_.get_state() == circuit_breaker::State::OPEN;
}

void CorrelationPipeline::wait_idle() {
  router_.wait_idle();
  dispatcher_.wait_idle();
}

void CorrelationPipeline::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (shutting_down_.exchange(true))
    return;

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutting down correlation pipeline");
  for (auto *task : {cache_sweep_task_.get(), buffer_sweep_task_.get(),
                     tuning_task_.get(), metrics_task_.get()})
    if (task)
      task->stop();

  batch_->shutdown();
  router_.wait_idle();
  router_.shutdown();
  dispatcher_.shutdown();
  collaborators_.rule_store->close();

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Pipeline stopped after " << events_processed_.load() << " events, "
                                << matches_.load() << " matches");
}

void CorrelationPipeline::set_metrics_exporter(
    std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter) {
  if (exporter)
    register_metrics(*exporter);

  std::lock_guard<std::mutex> lock(metrics_mutex_);
  metrics_ = std::move(exporter);
  published_counters_.clear();
}

void CorrelationPipeline::register_metrics(
    prometheus::PrometheusMetricsExporter &exporter) {
  auto counter = [&exporter](const std::string &name, const std::string &help,
                             const std::vector<std::string> &labels) {
    try {
      exporter.register_counter(name, help, labels);
    } catch (const std::invalid_argument &e) {
      LOG(LogLevel::WARN, LogComponent::METRICS,
          "Metric registration skipped: " << e.what());
    }
  };
  auto gauge = [&exporter](const std::string &name, const std::string &help,
                           const std::vector<std::string> &labels) {
    try {
      exporter.register_gauge(name, help, labels);
    } catch (const std::invalid_argument &e) {
      LOG(LogLevel::WARN, LogComponent::METRICS,
          "Metric registration skipped: " << e.what());
    }
  };

  counter("ce_events_received_total", "Events handed to the pipeline", {});
  counter("ce_events_dropped_total", "Events dropped before evaluation",
          {"reason"});
  counter("ce_events_processed_total", "Events fully evaluated", {"mode"});
  counter("ce_rule_evaluations_total", "Rule evaluator invocations", {});
  counter("ce_rule_evaluation_failures_total",
          "Rule evaluations that threw", {});
  counter("ce_matches_total", "Rule matches handed to the dispatcher", {});
  counter("ce_pool_tasks_timed_out_total",
          "Tasks discarded after waiting past the pool timeout", {"pool"});

  gauge("ce_queue_depth", "Tasks waiting in a worker pool", {"queue"});
  gauge("ce_cache_entries", "Entries held by a cache", {"cache"});
  gauge("ce_cache_hit_ratio", "Combined hit ratio of both caches", {});
  gauge("ce_event_processing_p99_ms", "P99 processing time", {});
  gauge("ce_event_processing_average_ms",
        "Moving average of processing time", {});
  gauge("ce_active_rules", "Rules in the current index generation", {});
  gauge("ce_indexed_keys", "Distinct index keys", {});
  gauge("ce_buffered_events", "Events held for pattern matching", {});
  gauge("ce_circuit_breaker_open", "1 while admission is rejecting", {});

  try {
    exporter.register_histogram("ce_event_processing_duration_seconds",
                                "Per-event processing time");
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::WARN, LogComponent::METRICS,
        "Metric registration skipped: " << e.what());
  }
}

void CorrelationPipeline::increment_metric(
    const std::string &name, const std::map<std::string, std::string> &labels,
    double value) {
  std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter;
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    exporter = metrics_;
  }
  if (!exporter)
    return;

  try {
    exporter->increment_counter(name, labels, value);
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Failed to update " << name << ": " << e.what());
  }
}

void CorrelationPipeline::publish_counter_delta(
    prometheus::PrometheusMetricsExporter &exporter, const std::string &name,
    const std::map<std::string, std::string> &labels, uint64_t current) {
  std::string key = name;
  for (const auto &[label, value] : labels)
    key += "|" + label + "=" + value;

  uint64_t previous;
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    previous = published_counters_[key];
    published_counters_[key] = current;
  }
  if (current > previous)
    exporter.increment_counter(name, labels,
                               static_cast<double>(current - previous));
}

void CorrelationPipeline::publish_metrics() {
  std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter;
  {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    exporter = metrics_;
  }
  if (!exporter)
    return;

  EngineStats stats = get_engine_stats();
  try {
    exporter->set_gauge("ce_queue_depth",
                        static_cast<double>(stats.fast_pool.queue_depth),
                        {{"queue", "fast"}});
    exporter->set_gauge("ce_queue_depth",
                        static_cast<double>(stats.normal_pool.queue_depth),
                        {{"queue", "normal"}});
    exporter->set_gauge("ce_queue_depth",
                        static_cast<double>(stats.dispatch.queue_depth),
                        {{"queue", "dispatch"}});
    exporter->set_gauge("ce_cache_entries",
                        static_cast<double>(stats.rule_cache.size),
                        {{"cache", stats.rule_cache.name}});
    exporter->set_gauge("ce_cache_entries",
                        static_cast<double>(stats.fast_path_cache.size),
                        {{"cache", stats.fast_path_cache.name}});
    exporter->set_gauge("ce_cache_hit_ratio", stats.cache_hit_ratio);
    exporter->set_gauge("ce_event_processing_p99_ms", stats.p99_ms);
    exporter->set_gauge("ce_event_processing_average_ms", stats.average_ms);
    exporter->set_gauge("ce_active_rules",
                        static_cast<double>(stats.active_rules));
    exporter->set_gauge("ce_indexed_keys",
                        static_cast<double>(stats.indexed_key_count));
    exporter->set_gauge("ce_buffered_events",
                        static_cast<double>(stats.buffered_events));
    exporter->set_gauge("ce_circuit_breaker_open",
                        stats.circuit_breaker.is_open ? 1.0 : 0.0);

    publish_counter_delta(*exporter, "ce_rule_evaluations_total", {},
                          stats.rule_evaluations);
    publish_counter_delta(*exporter, "ce_rule_evaluation_failures_total", {},
                          stats.evaluation_failures);
    publish_counter_delta(*exporter, "ce_pool_tasks_timed_out_total",
                          {{"pool", stats.fast_pool.name}},
                          stats.fast_pool.counters.timed_out);
    publish_counter_delta(*exporter, "ce_pool_tasks_timed_out_total",
                          {{"pool", stats.normal_pool.name}},
                          stats.normal_pool.counters.timed_out);
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Metric publishing failed: " << e.what());
  }
}

} // namespace correlation

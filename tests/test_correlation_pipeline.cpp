#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "core/correlation_pipeline.hpp"
#include "core/prometheus_metrics_exporter.hpp"
#include "test_helpers.hpp"

using namespace correlation;
using test_helpers::condition;
using test_helpers::FakeActionExecutor;
using test_helpers::FakeEvaluator;
using test_helpers::FakeIncidentManager;
using test_helpers::FakeRuleStore;
using test_helpers::make_event;
using test_helpers::make_rule;
using test_helpers::ManualClock;
using test_helpers::wait_for;

namespace {

class RecordingPatternMatcher : public analysis::IPatternMatcher {
public:
  std::vector<analysis::PatternMatch>
  find_matches(const Event &event, const std::vector<EventPtr> &buffer) override {
    last_buffer_size_ = buffer.size();
    calls_++;
    analysis::PatternMatch match;
    match.pattern_name = "burst";
    match.confidence = 0.5;
    match.event_ids = {event.id};
    return {match};
  }

  int calls() const { return calls_.load(); }
  size_t last_buffer_size() const { return last_buffer_size_.load(); }

private:
  std::atomic<int> calls_{0};
  std::atomic<size_t> last_buffer_size_{0};
};

} // namespace

class CorrelationPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Events in these tests never qualify for the fast path (4688/sysmon)
    rule_store_ = std::make_shared<FakeRuleStore>(std::vector<RulePtr>{
        make_rule("R1", {condition("event_id", "4688")}, 10, "high")});
    evaluator_ = std::make_shared<FakeEvaluator>();
    incidents_ = std::make_shared<FakeIncidentManager>();
    action_ = std::make_shared<FakeActionExecutor>();
    patterns_ = std::make_shared<RecordingPatternMatcher>();

    config_.worker_pools.fast_pool_concurrency = 2;
    config_.worker_pools.normal_pool_concurrency = 2;
    config_.dispatch.worker_threads = 2;
  }

  void TearDown() override {
    if (pipeline_)
      pipeline_->shutdown();
  }

  PipelineCollaborators collaborators() {
    PipelineCollaborators c;
    c.rule_store = rule_store_;
    c.evaluator = evaluator_;
    c.incident_manager = incidents_;
    c.action_executors = {action_};
    c.pattern_matcher = patterns_;
    return c;
  }

  void start() {
    pipeline_ = std::make_unique<CorrelationPipeline>(config_, collaborators(),
                                                      clock_.clock());
    pipeline_->initialize();
  }

  EventPtr sysmon_event(const std::string &id) {
    return make_event(id, "4688", "sysmon", clock_.now());
  }

  ManualClock clock_{1000};
  Config::AppConfig config_;
  std::shared_ptr<FakeRuleStore> rule_store_;
  std::shared_ptr<FakeEvaluator> evaluator_;
  std::shared_ptr<FakeIncidentManager> incidents_;
  std::shared_ptr<FakeActionExecutor> action_;
  std::shared_ptr<RecordingPatternMatcher> patterns_;
  std::unique_ptr<CorrelationPipeline> pipeline_;
};

// =================================================================================
// Construction and lifecycle
// =================================================================================

TEST_F(CorrelationPipelineTest, RequiresCoreCollaborators) {
  auto missing_store = collaborators();
  missing_store.rule_store.reset();
  EXPECT_THROW(CorrelationPipeline(config_, missing_store), std::invalid_argument);

  auto missing_evaluator = collaborators();
  missing_evaluator.evaluator.reset();
  EXPECT_THROW(CorrelationPipeline(config_, missing_evaluator), std::invalid_argument);

  auto missing_incidents = collaborators();
  missing_incidents.incident_manager.reset();
  EXPECT_THROW(CorrelationPipeline(config_, missing_incidents), std::invalid_argument);

  // The pattern matcher and action executors are optional
  auto minimal = collaborators();
  minimal.pattern_matcher.reset();
  minimal.action_executors.clear();
  EXPECT_NO_THROW(CorrelationPipeline(config_, minimal));
}

TEST_F(CorrelationPipelineTest, InitializeLoadsRules) {
  start();
  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(rule_store_->loads(), 1);
  EXPECT_EQ(stats.active_rules, 1u);
  EXPECT_EQ(stats.index_generation, 1u);
}

TEST_F(CorrelationPipelineTest, NullEventIsInvalid) {
  start();
  EXPECT_EQ(pipeline_->process_event(nullptr), ProcessOutcome::INVALID);
  EXPECT_EQ(pipeline_->get_engine_stats().events_received, 0u);
}

TEST_F(CorrelationPipelineTest, ShutdownClosesEverythingAndRefusesEvents) {
  start();
  pipeline_->shutdown();
  pipeline_->shutdown();

  auto outcome = pipeline_->process_event(sysmon_event("late"));
  EXPECT_EQ(outcome, ProcessOutcome::DROPPED_SHUTDOWN);
  EXPECT_TRUE(is_dropped(outcome));
  EXPECT_TRUE(rule_store_->closed());
  EXPECT_TRUE(incidents_->closed());
  EXPECT_TRUE(action_->closed());
}

// =================================================================================
// Event processing
// =================================================================================

TEST_F(CorrelationPipelineTest, RoutedMatchOpensIncident) {
  start();
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  pipeline_->wait_idle();

  EXPECT_EQ(incidents_->created(), 1);
  ASSERT_EQ(incidents_->drafts().size(), 1u);
  EXPECT_EQ(incidents_->drafts()[0].rule_id, "R1");
  EXPECT_EQ(incidents_->drafts()[0].title, "Security: R1");
  EXPECT_TRUE(wait_for([this]() { return action_->calls().size() == 1; }));

  // Routed events feed the pattern matcher through the event buffer
  EXPECT_EQ(patterns_->calls(), 1);
  EXPECT_EQ(patterns_->last_buffer_size(), 1u);

  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(stats.events_received, 1u);
  EXPECT_EQ(stats.events_processed, 1u);
  EXPECT_EQ(stats.processed_realtime, 1u);
  EXPECT_EQ(stats.matches, 1u);
  EXPECT_EQ(stats.pattern_matches, 1u);
  EXPECT_EQ(stats.buffered_events, 1u);
  EXPECT_EQ(stats.normal_pool.counters.submitted, 1u);
}

TEST_F(CorrelationPipelineTest, NonMatchingEventCreatesNothing) {
  start();
  EXPECT_EQ(pipeline_->process_event(make_event("e1", "4689", "sysmon", clock_.now())),
            ProcessOutcome::QUEUED);
  pipeline_->wait_idle();
  EXPECT_EQ(incidents_->created(), 0);
  EXPECT_EQ(pipeline_->get_engine_stats().matches, 0u);
}

TEST_F(CorrelationPipelineTest, UnindexedEventNeverReachesEvaluator) {
  // Only keyed rules, nothing under the wildcard
  rule_store_->set_rules({make_rule("R1", {condition("event_id", "4688")}),
                          make_rule("R2", {condition("source", "security")})});
  start();

  EXPECT_EQ(pipeline_->process_event(make_event("e1", "4689", "sysmon", clock_.now())),
            ProcessOutcome::QUEUED);
  pipeline_->wait_idle();

  EXPECT_EQ(evaluator_->calls(), 0u);
  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(stats.events_processed, 1u);
  EXPECT_EQ(stats.rule_evaluations, 0u);
  EXPECT_EQ(incidents_->created(), 0);
}

TEST_F(CorrelationPipelineTest, EvaluatorFailureIsIsolated) {
  evaluator_->throw_for("R1");
  start();
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  pipeline_->wait_idle();

  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(stats.evaluation_failures, 1u);
  EXPECT_EQ(stats.events_processed, 1u);
  EXPECT_EQ(incidents_->created(), 0);
  EXPECT_FALSE(pipeline_->is_circuit_open());
}

TEST_F(CorrelationPipelineTest, StreamModeEvaluatesInline) {
  start();
  pipeline_->enable_stream_mode();
  EXPECT_TRUE(pipeline_->runtime_config().stream_processing_mode);

  EXPECT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::STREAMED);
  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(stats.processed_stream, 1u);
  EXPECT_EQ(stats.matches, 1u);
  EXPECT_EQ(stats.normal_pool.counters.submitted, 0u);
  // Stream mode bypasses the pattern matcher
  EXPECT_EQ(patterns_->calls(), 0);

  pipeline_->wait_idle();
  EXPECT_EQ(incidents_->created(), 1);
}

TEST_F(CorrelationPipelineTest, BatchModeFlushesFullBatches) {
  // Batch members are evaluated concurrently; one dispatch thread keeps
  // the incident lookups ordered
  config_.dispatch.worker_threads = 1;
  start();
  RuntimeConfigPatch patch;
  patch.batch_processing_enabled = true;
  patch.batch_size = 2;
  std::vector<std::string> errors;
  ASSERT_TRUE(pipeline_->update_runtime_config(patch, errors));

  EXPECT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::BATCHED);
  EXPECT_EQ(pipeline_->get_engine_stats().batch_pending, 1u);
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e2")), ProcessOutcome::BATCHED);

  // The second add filled the batch and flushed it on this thread
  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(stats.processed_batch, 2u);
  EXPECT_EQ(stats.batch_flushes, 1u);
  EXPECT_EQ(stats.batched_events, 2u);
  EXPECT_EQ(stats.batch_pending, 0u);

  pipeline_->wait_idle();
  // Same rule and host, so the second match updates the first incident
  EXPECT_EQ(incidents_->created(), 1);
  EXPECT_EQ(incidents_->updated(), 1);
}

// =================================================================================
// Admission
// =================================================================================

TEST_F(CorrelationPipelineTest, SlowProcessingOpensCircuit) {
  config_.circuit_breaker.failure_threshold = 2;
  config_.engine.max_processing_time_ms = 1;
  // Never matches, so nothing is cached and every event pays the delay
  rule_store_->set_rules({make_rule(
      "R9", {condition("event_id", "4688"), condition("user_name", "nobody")})});
  evaluator_->set_delay_ms(20);
  start();

  for (const char *id : {"e1", "e2"}) {
    EXPECT_EQ(pipeline_->process_event(sysmon_event(id)), ProcessOutcome::QUEUED);
    pipeline_->wait_idle();
  }
  EXPECT_TRUE(pipeline_->is_circuit_open());

  evaluator_->set_delay_ms(0);
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e3")),
            ProcessOutcome::DROPPED_CIRCUIT_OPEN);
  EXPECT_EQ(pipeline_->get_engine_stats().dropped_circuit_open, 1u);
  EXPECT_EQ(pipeline_->get_engine_stats().circuit_breaker_status, "OPEN");

  // Once the timeout has passed since the last failure, admission resumes
  clock_.set(1000 + 30001);
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e4")), ProcessOutcome::QUEUED);
}

TEST_F(CorrelationPipelineTest, DeepQueuesAreShedAsOverload) {
  config_.engine.max_concurrent_events = 1;
  config_.worker_pools.normal_pool_concurrency = 1;
  evaluator_->set_delay_ms(300);
  start();

  EXPECT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  ASSERT_TRUE(wait_for([this]() {
    return pipeline_->get_engine_stats().normal_pool.in_flight == 1;
  }));

  EXPECT_EQ(pipeline_->process_event(sysmon_event("e2")), ProcessOutcome::QUEUED);
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e3")), ProcessOutcome::QUEUED);
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e4")),
            ProcessOutcome::DROPPED_OVERLOAD);
  EXPECT_EQ(pipeline_->get_engine_stats().dropped_overload, 1u);
}

// =================================================================================
// Rules and runtime configuration
// =================================================================================

TEST_F(CorrelationPipelineTest, FailedReloadKeepsCurrentRules) {
  start();
  rule_store_->set_fail(true);
  EXPECT_FALSE(pipeline_->reload_rules());
  EXPECT_EQ(pipeline_->get_engine_stats().index_generation, 1u);
  EXPECT_EQ(pipeline_->get_engine_stats().active_rules, 1u);

  rule_store_->set_fail(false);
  rule_store_->set_rules({make_rule("R1", {condition("event_id", "4688")}),
                          make_rule("R2", {condition("source", "sysmon")})});
  EXPECT_TRUE(pipeline_->reload_rules());
  auto stats = pipeline_->get_engine_stats();
  EXPECT_EQ(stats.index_generation, 2u);
  EXPECT_EQ(stats.active_rules, 2u);
}

TEST_F(CorrelationPipelineTest, FailedInitialLoadStartsEmpty) {
  rule_store_->set_fail(true);
  start();
  EXPECT_EQ(pipeline_->get_engine_stats().active_rules, 0u);
  EXPECT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  pipeline_->wait_idle();
  EXPECT_EQ(incidents_->created(), 0);
}

TEST_F(CorrelationPipelineTest, InvalidRuntimePatchIsRejectedWhole) {
  start();
  RuntimeConfigPatch patch;
  patch.batch_size = 0;
  patch.priority_queue_enabled = false;
  std::vector<std::string> errors;

  EXPECT_FALSE(pipeline_->update_runtime_config(patch, errors));
  EXPECT_FALSE(errors.empty());
  auto config = pipeline_->runtime_config();
  EXPECT_EQ(config.batch_size, 50u);
  EXPECT_TRUE(config.priority_queue_enabled);
}

TEST_F(CorrelationPipelineTest, TuningCycleEnablesStreamModeWhenFast) {
  start();
  ASSERT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  pipeline_->wait_idle();

  auto decision = pipeline_->run_tuning_cycle();
  EXPECT_TRUE(decision.enabled_stream_mode);
  EXPECT_TRUE(pipeline_->runtime_config().stream_processing_mode);
  EXPECT_EQ(pipeline_->get_engine_stats().tuner_ticks, 1u);
}

TEST_F(CorrelationPipelineTest, TuningDisabledLeavesConfigAlone) {
  config_.tuning.enabled = false;
  start();
  ASSERT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  pipeline_->wait_idle();

  EXPECT_FALSE(pipeline_->run_tuning_cycle().changed());
  EXPECT_FALSE(pipeline_->runtime_config().stream_processing_mode);
}

// =================================================================================
// Metrics
// =================================================================================

TEST_F(CorrelationPipelineTest, PublishesMetrics) {
  auto exporter = std::make_shared<prometheus::PrometheusMetricsExporter>();
  start();
  pipeline_->set_metrics_exporter(exporter);

  ASSERT_EQ(pipeline_->process_event(sysmon_event("e1")), ProcessOutcome::QUEUED);
  pipeline_->wait_idle();

  EXPECT_DOUBLE_EQ(exporter->get_value("ce_events_received_total"), 1.0);
  EXPECT_DOUBLE_EQ(exporter->get_value("ce_events_processed_total", {{"mode", "realtime"}}), 1.0);
  EXPECT_DOUBLE_EQ(exporter->get_value("ce_matches_total"), 1.0);

  pipeline_->publish_metrics();
  pipeline_->publish_metrics();
  EXPECT_DOUBLE_EQ(exporter->get_value("ce_active_rules"), 1.0);
  // Counters fed from engine totals are published as deltas
  EXPECT_DOUBLE_EQ(exporter->get_value("ce_rule_evaluations_total"), 1.0);

  pipeline_->shutdown();
  pipeline_->process_event(sysmon_event("late"));
  EXPECT_DOUBLE_EQ(exporter->get_value("ce_events_dropped_total", {{"reason", "shutdown"}}), 1.0);

  std::string output = exporter->generate_metrics_output();
  EXPECT_NE(output.find("ce_event_processing_duration_seconds_count 1"), std::string::npos);
}

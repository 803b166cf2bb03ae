#include "evaluation_path_selector.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <future>
#include <system_error>
#include <utility>

namespace correlation {

namespace {

constexpr std::array<const char *, 5> FAST_PATH_EVENT_TYPES = {
    "4624", "4625", "4648", "4776", "4778"};
constexpr std::array<const char *, 2> FAST_PATH_SOURCES = {"security",
                                                           "system"};

template <size_t N>
bool contains(const std::array<const char *, N> &set, const std::string &v) {
  return std::any_of(set.begin(), set.end(),
                     [&v](const char *item) { return v == item; });
}

} // namespace

const char *evaluation_path_to_string(EvaluationPath path) {
  switch (path) {
  case EvaluationPath::FAST:
    return "fast";
  case EvaluationPath::STANDARD_PARALLEL:
    return "parallel";
  case EvaluationPath::STANDARD_SEQUENTIAL:
    return "sequential";
  case EvaluationPath::STREAM:
    return "stream";
  }
  return "unknown";
}

EvaluationPathSelector::EvaluationPathSelector(
    IRuleEvaluator &evaluator, ExpiringCache<EvaluationResult> &rule_cache,
    ExpiringCache<bool> &fast_path_cache, Utils::Clock clock)
    : evaluator_(evaluator), rule_cache_(rule_cache),
      fast_path_cache_(fast_path_cache), clock_(std::move(clock)) {}

bool EvaluationPathSelector::is_fast_path_eligible(const Event &event,
                                                   size_t candidate_count) {
  return contains(FAST_PATH_EVENT_TYPES, event.event_type) &&
         contains(FAST_PATH_SOURCES, Utils::to_lower(event.source)) &&
         !event.metadata_flag("complex") &&
         candidate_count <= path_limits::FAST_PATH_MAX_CANDIDATES;
}

std::string EvaluationPathSelector::rule_cache_key(const Rule &rule,
                                                   const Event &event) {
  return "rule:" + rule.id + ":" + event.event_type + ":" + event.source;
}

std::string EvaluationPathSelector::fast_path_cache_key(const Event &event) {
  return "fast:" + event.event_type + ":" + event.source + ":" +
         event.user_name.value_or("unknown");
}

EvaluationResult EvaluationPathSelector::evaluate_with_cache(const Rule &rule,
                                                             const Event &event) {
  std::string key = rule_cache_key(rule, event);
  if (auto cached = rule_cache_.get(key))
    return *cached;

  EvaluationContext context;
  context.source = event.source;
  context.event_type = event.event_type;
  context.time_window_minutes = rule.time_window_minutes;
  context.now_ms = clock_();

  rule_evaluations_.fetch_add(1, std::memory_order_relaxed);
  EvaluationResult result = evaluator_.evaluate(rule, event, context);
  if (result.rule_id.empty())
    result.rule_id = rule.id;
  if (result.matched)
    rule_cache_.put(key, result);
  return result;
}

void EvaluationPathSelector::record_result(const Event &event, const Rule &rule,
                                           const EvaluationResult &result,
                                           EvaluationOutcome &outcome) {
  ++outcome.evaluated;
  if (result.matched) {
    LOG(LogLevel::DEBUG, LogComponent::EVAL,
        "Rule " << rule.id << " matched event " << event.id << " (confidence "
                << result.confidence << ")");
    outcome.matches.push_back(result);
  }
}

void EvaluationPathSelector::record_failure(const Event &event,
                                            const Rule &rule,
                                            const std::exception &error,
                                            EvaluationOutcome &outcome) {
  ++outcome.failures;
  evaluation_failures_.fetch_add(1, std::memory_order_relaxed);
  LOG(LogLevel::ERROR, LogComponent::EVAL,
      "Rule " << rule.id << " failed on event " << event.id << ": "
              << error.what());
}

void EvaluationPathSelector::evaluate_chunked(const Event &event,
                                              const std::vector<RulePtr> &rules,
                                              size_t chunk_size,
                                              EvaluationOutcome &outcome) {
  for (size_t start = 0; start < rules.size(); start += chunk_size) {
    size_t end = std::min(rules.size(), start + chunk_size);

    std::vector<std::future<EvaluationResult>> futures;
    futures.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      const Rule *rule = rules[i].get();
      try {
        futures.push_back(std::async(std::launch::async, [this, rule, &event] {
          return evaluate_with_cache(*rule, event);
        }));
      } catch (const std::system_error &e) {
        // Launch failed; an invalid future marks the slot as already counted
        futures.emplace_back();
        record_failure(event, *rule, e, outcome);
      }
    }

    for (size_t i = 0; i < futures.size(); ++i) {
      if (!futures[i].valid())
        continue;
      const Rule &rule = *rules[start + i];
      try {
        record_result(event, rule, futures[i].get(), outcome);
      } catch (const std::exception &e) {
        record_failure(event, rule, e, outcome);
      }
    }
  }
}

EvaluationOutcome
EvaluationPathSelector::evaluate_fast_path(const Event &event,
                                           const std::vector<RulePtr> &candidates) {
  EvaluationOutcome outcome;
  outcome.path = EvaluationPath::FAST;
  outcome.candidate_count = candidates.size();

  std::string key = fast_path_cache_key(event);
  if (fast_path_cache_.get(key)) {
    outcome.fast_path_cache_hit = true;
    LOG(LogLevel::TRACE, LogComponent::CACHE,
        "Fast path cache hit for " << key);
    return outcome;
  }

  size_t top_n = std::min(candidates.size(), path_limits::FAST_PATH_TOP_N);
  std::vector<RulePtr> top(candidates.begin(), candidates.begin() + top_n);
  evaluate_chunked(event, top, path_limits::FAST_PATH_TOP_N, outcome);

  if (outcome.failures == 0)
    fast_path_cache_.put(key, true);
  return outcome;
}

EvaluationOutcome
EvaluationPathSelector::evaluate_parallel(const Event &event,
                                          const std::vector<RulePtr> &candidates) {
  EvaluationOutcome outcome;
  outcome.path = EvaluationPath::STANDARD_PARALLEL;
  outcome.candidate_count = candidates.size();
  evaluate_chunked(event, candidates, path_limits::PARALLEL_CHUNK_SIZE,
                   outcome);
  return outcome;
}

EvaluationOutcome EvaluationPathSelector::evaluate_sequential(
    const Event &event, const std::vector<RulePtr> &candidates) {
  EvaluationOutcome outcome;
  outcome.path = EvaluationPath::STANDARD_SEQUENTIAL;
  outcome.candidate_count = candidates.size();

  size_t limit = std::min(candidates.size(), path_limits::SEQUENTIAL_CAP);
  for (size_t i = 0; i < limit; ++i) {
    const Rule &rule = *candidates[i];
    try {
      record_result(event, rule, evaluate_with_cache(rule, event), outcome);
    } catch (const std::exception &e) {
      record_failure(event, rule, e, outcome);
    }
  }
  return outcome;
}

EvaluationOutcome
EvaluationPathSelector::evaluate_stream(const Event &event,
                                        const std::vector<RulePtr> &candidates) {
  EvaluationOutcome outcome;
  outcome.path = EvaluationPath::STREAM;
  outcome.candidate_count = candidates.size();
  evaluate_chunked(event, candidates, path_limits::STREAM_CHUNK_SIZE, outcome);
  return outcome;
}

EvaluationOutcome EvaluationPathSelector::evaluate(
    const Event &event, const std::vector<RulePtr> &candidates,
    const RuntimeConfig &config, size_t normal_queue_depth) {
  if (config.fast_path_enabled &&
      is_fast_path_eligible(event, candidates.size()))
    return evaluate_fast_path(event, candidates);

  bool parallel = config.parallel_rule_evaluation &&
                  candidates.size() > path_limits::PARALLEL_MIN_CANDIDATES &&
                  normal_queue_depth < path_limits::PARALLEL_QUEUE_SATURATION;
  if (parallel)
    return evaluate_parallel(event, candidates);
  return evaluate_sequential(event, candidates);
}

} // namespace correlation

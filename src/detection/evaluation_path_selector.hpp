#ifndef EVALUATION_PATH_SELECTOR_HPP
#define EVALUATION_PATH_SELECTOR_HPP

#include "core/event.hpp"
#include "core/rule.hpp"
#include "core/runtime_config.hpp"
#include "expiring_cache.hpp"
#include "rule_evaluator.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace correlation {

enum class EvaluationPath {
  FAST,
  STANDARD_PARALLEL,
  STANDARD_SEQUENTIAL,
  STREAM
};

const char *evaluation_path_to_string(EvaluationPath path);

struct EvaluationOutcome {
  EvaluationPath path = EvaluationPath::STANDARD_SEQUENTIAL;
  size_t candidate_count = 0;
  size_t evaluated = 0;
  size_t failures = 0;
  bool fast_path_cache_hit = false;
  std::vector<EvaluationResult> matches;
};

namespace path_limits {
constexpr size_t FAST_PATH_MAX_CANDIDATES = 5;
constexpr size_t FAST_PATH_TOP_N = 3;
constexpr size_t PARALLEL_MIN_CANDIDATES = 5; // parallel needs more than this
constexpr size_t PARALLEL_CHUNK_SIZE = 5;
constexpr size_t PARALLEL_QUEUE_SATURATION = 100;
constexpr size_t SEQUENTIAL_CAP = 20;
constexpr size_t STREAM_CHUNK_SIZE = 10;
} // namespace path_limits

// Chooses how one event's candidate rules are evaluated and runs them
// through the rule evaluator, consulting the rule-evaluation and fast-path
// caches. A failure in one rule's evaluation never aborts the others.
class EvaluationPathSelector {
public:
  EvaluationPathSelector(IRuleEvaluator &evaluator,
                         ExpiringCache<EvaluationResult> &rule_cache,
                         ExpiringCache<bool> &fast_path_cache,
                         Utils::Clock clock = Utils::system_clock_ms());

  static bool is_fast_path_eligible(const Event &event,
                                    size_t candidate_count);
  static std::string rule_cache_key(const Rule &rule, const Event &event);
  static std::string fast_path_cache_key(const Event &event);

  // Per-event path choice for real-time mode
  EvaluationOutcome evaluate(const Event &event,
                             const std::vector<RulePtr> &candidates,
                             const RuntimeConfig &config,
                             size_t normal_queue_depth);

  EvaluationOutcome evaluate_fast_path(const Event &event,
                                       const std::vector<RulePtr> &candidates);
  EvaluationOutcome evaluate_parallel(const Event &event,
                                      const std::vector<RulePtr> &candidates);
  EvaluationOutcome evaluate_sequential(const Event &event,
                                        const std::vector<RulePtr> &candidates);
  EvaluationOutcome evaluate_stream(const Event &event,
                                    const std::vector<RulePtr> &candidates);

  // Cache-aware single evaluation; rethrows evaluator failures
  EvaluationResult evaluate_with_cache(const Rule &rule, const Event &event);

  uint64_t rule_evaluations() const { return rule_evaluations_.load(); }
  uint64_t evaluation_failures() const { return evaluation_failures_.load(); }

private:
  void evaluate_chunked(const Event &event, const std::vector<RulePtr> &rules,
                        size_t chunk_size, EvaluationOutcome &outcome);
  void record_result(const Event &event, const Rule &rule,
                     const EvaluationResult &result,
                     EvaluationOutcome &outcome);
  void record_failure(const Event &event, const Rule &rule,
                      const std::exception &error, EvaluationOutcome &outcome);

  IRuleEvaluator &evaluator_;
  ExpiringCache<EvaluationResult> &rule_cache_;
  ExpiringCache<bool> &fast_path_cache_;
  Utils::Clock clock_;

  std::atomic<uint64_t> rule_evaluations_{0};
  std::atomic<uint64_t> evaluation_failures_{0};
};

} // namespace correlation

#endif // EVALUATION_PATH_SELECTOR_HPP

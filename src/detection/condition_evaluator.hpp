#ifndef CONDITION_EVALUATOR_HPP
#define CONDITION_EVALUATOR_HPP

#include "rule_evaluator.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace correlation {

// Reference rule evaluator: "simple" rules combine field conditions with
// AND/OR; "threshold" rules count qualifying events per rule and group_by
// values inside a sliding window. Other rule types never match.
class ConditionEvaluator : public IRuleEvaluator {
public:
  EvaluationResult evaluate(const Rule &rule, const Event &event,
                            const EvaluationContext &context) override;
  const char *get_evaluator_type() const override { return "condition"; }

  static bool evaluate_condition(const RuleCondition &condition,
                                 const Event &event);

  size_t tracked_threshold_keys() const;

private:
  bool evaluate_simple(const Rule &rule, const Event &event,
                       EvaluationResult &result) const;
  bool evaluate_threshold(const Rule &rule, const Event &event,
                          EvaluationResult &result);

  mutable std::mutex threshold_mutex_;
  std::unordered_map<std::string, std::deque<uint64_t>> threshold_windows_;
};

} // namespace correlation

#endif // CONDITION_EVALUATOR_HPP

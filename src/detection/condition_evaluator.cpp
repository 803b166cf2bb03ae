#include "condition_evaluator.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <regex>

namespace correlation {

namespace {

std::string describe(const RuleCondition &condition) {
  std::string value = condition.value;
  if (!condition.values.empty()) {
    value = "[";
    for (size_t i = 0; i < condition.values.size(); ++i) {
      if (i > 0)
        value += ",";
      value += condition.values[i];
    }
    value += "]";
  }
  return condition.field + " " + condition.op + " " + value;
}

bool compare_numbers(const std::string &lhs, const std::string &rhs,
                     bool greater) {
  auto a = Utils::string_to_number<double>(Utils::trim_copy(lhs));
  auto b = Utils::string_to_number<double>(Utils::trim_copy(rhs));
  if (!a || !b)
    return false;
  return greater ? *a > *b : *a < *b;
}

} // namespace

bool ConditionEvaluator::evaluate_condition(const RuleCondition &condition,
                                            const Event &event) {
  auto field_value = event.field(condition.field);
  const std::string &op = condition.op;

  if (op == "not_equals")
    return !field_value || *field_value != condition.value;
  if (op == "not_in") {
    return !field_value ||
           std::find(condition.values.begin(), condition.values.end(),
                     *field_value) == condition.values.end();
  }
  if (!field_value)
    return false;

  if (op == "equals")
    return *field_value == condition.value;
  if (op == "contains")
    return Utils::to_lower(*field_value).find(Utils::to_lower(
               condition.value)) != std::string::npos;
  if (op == "greater_than")
    return compare_numbers(*field_value, condition.value, true);
  if (op == "less_than")
    return compare_numbers(*field_value, condition.value, false);
  if (op == "in")
    return std::find(condition.values.begin(), condition.values.end(),
                     *field_value) != condition.values.end();
  if (op == "regex_match") {
    try {
      auto flags = std::regex::ECMAScript;
      if (!condition.case_sensitive)
        flags |= std::regex::icase;
      return std::regex_search(*field_value, std::regex(condition.value, flags));
    } catch (const std::regex_error &) {
      return false;
    }
  }
  return false;
}

bool ConditionEvaluator::evaluate_simple(const Rule &rule, const Event &event,
                                         EvaluationResult &result) const {
  if (rule.conditions.empty())
    return false;

  size_t matched = 0;
  for (const auto &condition : rule.conditions) {
    if (evaluate_condition(condition, event)) {
      ++matched;
      result.matched_conditions.push_back(describe(condition));
    }
  }

  result.confidence =
      static_cast<double>(matched) / static_cast<double>(rule.conditions.size());
  if (rule.logic_operator == "OR")
    return matched > 0;
  return matched == rule.conditions.size();
}

bool ConditionEvaluator::evaluate_threshold(const Rule &rule,
                                            const Event &event,
                                            EvaluationResult &result) {
  if (!rule.threshold)
    return false;

  // Conditions, when present, decide which events count toward the threshold
  for (const auto &condition : rule.conditions) {
    if (!evaluate_condition(condition, event))
      return false;
  }

  const ThresholdSpec &spec = *rule.threshold;
  uint32_t window_minutes = spec.time_window_minutes
                                ? spec.time_window_minutes
                                : (rule.time_window_minutes
                                       ? rule.time_window_minutes
                                       : 5);
  uint32_t required = spec.count ? spec.count : 1;
  uint64_t window_ms = static_cast<uint64_t>(window_minutes) * 60 * 1000;

  std::string key = rule.id;
  for (const auto &field : spec.group_by) {
    key += ':';
    key += event.field(field).value_or("");
  }

  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(threshold_mutex_);
    auto &window = threshold_windows_[key];
    auto pos = std::upper_bound(window.begin(), window.end(),
                                event.timestamp_ms);
    window.insert(pos, event.timestamp_ms);

    uint64_t newest = window.back();
    uint64_t cutoff = newest > window_ms ? newest - window_ms : 0;
    while (!window.empty() && window.front() < cutoff)
      window.pop_front();
    count = window.size();
  }

  if (count < required)
    return false;

  result.matched_conditions.push_back(
      "Event count " + std::to_string(count) + " >= " +
      std::to_string(required) + " in " + std::to_string(window_minutes) +
      " minutes");
  result.metadata["event_count"] = std::to_string(count);
  result.metadata["time_window_minutes"] = std::to_string(window_minutes);
  result.confidence = 1.0;
  return true;
}

EvaluationResult ConditionEvaluator::evaluate(const Rule &rule,
                                              const Event &event,
                                              const EvaluationContext &) {
  EvaluationResult result;
  result.rule_id = rule.id;

  if (rule.type == "simple")
    result.matched = evaluate_simple(rule, event, result);
  else if (rule.type == "threshold")
    result.matched = evaluate_threshold(rule, event, result);

  if (!result.matched)
    result.confidence = 0.0;
  return result;
}

size_t ConditionEvaluator::tracked_threshold_keys() const {
  std::lock_guard<std::mutex> lock(threshold_mutex_);
  return threshold_windows_.size();
}

} // namespace correlation

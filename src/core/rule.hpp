#ifndef RULE_HPP
#define RULE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

struct RuleCondition {
  std::string field;
  std::string op; // equals, not_equals, contains, greater_than, ...
  std::string value;
  std::vector<std::string> values; // for "in" / "not_in"
  bool case_sensitive = false;
};

struct ThresholdSpec {
  uint32_t count = 1;
  uint32_t time_window_minutes = 0; // 0 falls back to the rule's window
  std::vector<std::string> group_by;
};

struct Rule {
  std::string id;
  std::string name;
  std::string description;
  int priority = 0;
  std::string severity = "medium";
  std::string type = "simple";
  bool enabled = true;

  std::vector<RuleCondition> conditions;
  std::string logic_operator = "AND";
  uint32_t time_window_minutes = 5;
  uint32_t event_count_threshold = 1;
  std::optional<ThresholdSpec> threshold;

  std::optional<std::string> category; // metadata.category

  static Rule from_json(const nlohmann::json &j);
};

using RulePtr = std::shared_ptr<const Rule>;

struct EvaluationResult {
  std::string rule_id;
  bool matched = false;
  double confidence = 0.0;
  std::vector<std::string> matched_conditions;
  std::unordered_map<std::string, std::string> metadata;
};

// critical=4, high=3, medium=2, low=1, anything else 0
int severity_rank(const std::string &severity);

// Priority descending, then severity rank descending; stable for ties.
void sort_rules_by_precedence(std::vector<RulePtr> &rules);

#endif // RULE_HPP

#include "rule.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace {

std::string value_to_string(const nlohmann::json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_boolean())
    return value.get<bool>() ? "true" : "false";
  if (value.is_null())
    return "";
  return value.dump();
}

RuleCondition condition_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw std::invalid_argument("rule condition must be an object");

  RuleCondition condition;
  if (j.contains("field"))
    condition.field = j.at("field").get<std::string>();
  else if (j.contains("field_name"))
    condition.field = j.at("field_name").get<std::string>();
  else
    throw std::invalid_argument("rule condition is missing 'field'");

  condition.op = j.value("operator", std::string("equals"));
  condition.case_sensitive = j.value("case_sensitive", false);

  auto value = j.find("value");
  if (value != j.end()) {
    if (value->is_array()) {
      for (const auto &item : *value)
        condition.values.push_back(value_to_string(item));
    } else {
      condition.value = value_to_string(*value);
    }
  }
  return condition;
}

} // namespace

Rule Rule::from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw std::invalid_argument("rule must be a JSON object");

  Rule rule;
  rule.id = value_to_string(j.at("id"));
  if (rule.id.empty())
    throw std::invalid_argument("rule id must not be empty");

  rule.name = j.value("name", rule.id);
  rule.description = j.value("description", std::string());
  rule.priority = j.value("priority", 0);
  rule.severity = Utils::to_lower(j.value("severity", std::string("medium")));
  rule.type = Utils::to_lower(j.value("type", std::string("simple")));
  rule.enabled = j.value("enabled", true);
  rule.time_window_minutes = j.value("time_window_minutes", 5u);
  rule.event_count_threshold = j.value("event_count_threshold", 1u);

  // Conditions may sit at the top level or under rule_logic
  const nlohmann::json *logic = &j;
  if (j.contains("rule_logic") && j.at("rule_logic").is_object())
    logic = &j.at("rule_logic");

  auto conditions = logic->find("conditions");
  if (conditions != logic->end() && conditions->is_array()) {
    for (const auto &c : *conditions)
      rule.conditions.push_back(condition_from_json(c));
  }

  std::string op = logic->value("logic_operator", std::string());
  if (op.empty())
    op = logic->value("operator", std::string("AND"));
  std::transform(op.begin(), op.end(), op.begin(), ::toupper);
  rule.logic_operator = (op == "OR") ? "OR" : "AND";

  auto threshold = logic->find("threshold");
  if (threshold != logic->end() && threshold->is_object()) {
    ThresholdSpec spec;
    spec.count = threshold->value("count", rule.event_count_threshold);
    spec.time_window_minutes = threshold->value("time_window_minutes", 0u);
    auto group_by = threshold->find("group_by");
    if (group_by != threshold->end() && group_by->is_array()) {
      for (const auto &field : *group_by)
        spec.group_by.push_back(field.get<std::string>());
    }
    rule.threshold = spec;
  }

  auto metadata = j.find("metadata");
  if (metadata != j.end() && metadata->is_object() &&
      metadata->contains("category") && metadata->at("category").is_string())
    rule.category = metadata->at("category").get<std::string>();

  return rule;
}

int severity_rank(const std::string &severity) {
  std::string s = Utils::to_lower(severity);
  if (s == "critical")
    return 4;
  if (s == "high")
    return 3;
  if (s == "medium")
    return 2;
  if (s == "low")
    return 1;
  return 0;
}

void sort_rules_by_precedence(std::vector<RulePtr> &rules) {
  std::stable_sort(rules.begin(), rules.end(),
                   [](const RulePtr &a, const RulePtr &b) {
                     if (a->priority != b->priority)
                       return a->priority > b->priority;
                     return severity_rank(a->severity) >
                            severity_rank(b->severity);
                   });
}

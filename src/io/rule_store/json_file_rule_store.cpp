#include "json_file_rule_store.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

JsonFileRuleStore::JsonFileRuleStore(const std::string &file_path)
    : file_path_(file_path) {}

std::vector<RulePtr>
JsonFileRuleStore::rules_from_json(const nlohmann::json &rules,
                                   const std::string &origin) {
  std::vector<RulePtr> result;
  size_t skipped = 0, disabled = 0;

  for (const auto &entry : rules) {
    try {
      Rule rule = Rule::from_json(entry);
      if (!rule.enabled) {
        ++disabled;
        continue;
      }
      result.push_back(std::make_shared<const Rule>(std::move(rule)));
    } catch (const std::exception &e) {
      ++skipped;
      LOG(LogLevel::WARN, LogComponent::IO_RULES,
          "Skipping malformed rule in " << origin << ": " << e.what());
    }
  }

  sort_rules_by_precedence(result);
  LOG(LogLevel::INFO, LogComponent::IO_RULES,
      "Loaded " << result.size() << " enabled rules from " << origin << " ("
                << disabled << " disabled, " << skipped << " skipped)");
  return result;
}

std::vector<RulePtr> JsonFileRuleStore::load_enabled_rules() {
  std::ifstream file(file_path_);
  if (!file.is_open())
    throw std::runtime_error("Could not open rules file: " + file_path_);

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Rules file " + file_path_ +
                             " is not valid JSON: " + e.what());
  }

  if (doc.is_object() && doc.contains("rules"))
    doc = doc.at("rules");
  if (!doc.is_array())
    throw std::runtime_error("Rules file " + file_path_ +
                             " must contain an array of rules");

  return rules_from_json(doc, file_path_);
}

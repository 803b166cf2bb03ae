#ifndef JSON_FILE_RULE_STORE_HPP
#define JSON_FILE_RULE_STORE_HPP

#include "base_rule_store.hpp"

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Rules from a JSON file: either a top-level array or {"rules": [...]}.
// A malformed rule is skipped with a warning; an unreadable file throws.
class JsonFileRuleStore : public IRuleStore {
public:
  explicit JsonFileRuleStore(const std::string &file_path);

  std::vector<RulePtr> load_enabled_rules() override;
  std::string get_store_type() const override { return "file"; }

  // Shared with the MongoDB store, which hands over documents as JSON
  static std::vector<RulePtr> rules_from_json(const nlohmann::json &rules,
                                              const std::string &origin);

private:
  std::string file_path_;
};

#endif // JSON_FILE_RULE_STORE_HPP

#ifndef BASE_RULE_STORE_HPP
#define BASE_RULE_STORE_HPP

#include "core/rule.hpp"

#include <string>
#include <vector>

class IRuleStore {
public:
  virtual ~IRuleStore() = default;

  // Enabled rules only, highest priority first, then by severity.
  // Throws when the backing store cannot be read.
  virtual std::vector<RulePtr> load_enabled_rules() = 0;

  virtual void close() {}
  virtual std::string get_store_type() const = 0;
};

#endif // BASE_RULE_STORE_HPP

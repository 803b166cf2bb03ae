#ifndef MONGO_RULE_STORE_HPP
#define MONGO_RULE_STORE_HPP

#include "base_rule_store.hpp"
#include "core/config.hpp"

#include <memory>
#include <string>
#include <vector>

class MongoManager;

// Rules from a MongoDB collection, filter {enabled: true}
class MongoRuleStore : public IRuleStore {
public:
  MongoRuleStore(std::shared_ptr<MongoManager> manager,
                 const Config::MongoRuleStoreConfig &config);

  std::vector<RulePtr> load_enabled_rules() override;
  void close() override;
  std::string get_store_type() const override { return "mongodb"; }

private:
  std::shared_ptr<MongoManager> mongo_manager_;
  const Config::MongoRuleStoreConfig config_;
};

#endif // MONGO_RULE_STORE_HPP

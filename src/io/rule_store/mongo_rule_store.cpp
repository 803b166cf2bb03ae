#include "mongo_rule_store.hpp"
#include "core/logger.hpp"
#include "io/db/mongo_manager.hpp"
#include "json_file_rule_store.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/json.hpp>
#include <mongocxx/exception/query_exception.hpp>
#include <mongocxx/options/find.hpp>

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

MongoRuleStore::MongoRuleStore(std::shared_ptr<MongoManager> manager,
                               const Config::MongoRuleStoreConfig &config)
    : mongo_manager_(std::move(manager)), config_(config) {
  if (!mongo_manager_)
    throw std::invalid_argument("MongoRuleStore requires a MongoManager");
}

std::vector<RulePtr> MongoRuleStore::load_enabled_rules() {
  using bsoncxx::builder::basic::kvp;

  nlohmann::json documents = nlohmann::json::array();
  try {
    auto client = mongo_manager_->get_client();
    auto collection = (*client)[config_.database][config_.rules_collection];

    bsoncxx::builder::basic::document filter{};
    filter.append(kvp("enabled", true));

    mongocxx::options::find opts{};
    bsoncxx::builder::basic::document sort{};
    sort.append(kvp("priority", -1));
    opts.sort(sort.view());

    for (const auto &doc : collection.find(filter.view(), opts)) {
      nlohmann::json j = nlohmann::json::parse(bsoncxx::to_json(doc));
      // Fall back to the ObjectId when the document has no explicit id
      if (!j.contains("id") && j.contains("_id")) {
        const auto &oid = j.at("_id");
        j["id"] = oid.is_object() && oid.contains("$oid")
                      ? oid.at("$oid").get<std::string>()
                      : oid.dump();
      }
      documents.push_back(std::move(j));
    }
  } catch (const mongocxx::query_exception &e) {
    throw std::runtime_error("Rule query against " + config_.database + "." +
                             config_.rules_collection +
                             " failed: " + e.what());
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_RULES,
      "Fetched " << documents.size() << " rule documents from "
                 << config_.database << "." << config_.rules_collection);

  return JsonFileRuleStore::rules_from_json(
      documents, "mongodb:" + config_.database + "." + config_.rules_collection);
}

void MongoRuleStore::close() {
  LOG(LogLevel::INFO, LogComponent::IO_RULES, "MongoRuleStore closed.");
  mongo_manager_.reset();
}

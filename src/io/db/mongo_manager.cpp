#include "mongo_manager.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <exception>
#include <mongocxx/uri.hpp>
#include <stdexcept>

mongocxx::instance &MongoManager::driver_instance() {
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const std::string &uri) {
  driver_instance();
  try {
    pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri{uri});
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_RULES,
        "Could not initialize MongoDB connection pool: " << e.what());
    throw std::runtime_error("MongoDB pool initialization failed for " + uri +
                             ": " + e.what());
  }
  LOG(LogLevel::INFO, LogComponent::IO_RULES,
      "MongoDB connection pool initialized for URI: " << uri);
}

mongocxx::pool::entry MongoManager::get_client() { return pool_->acquire(); }

bool MongoManager::ping() {
  try {
    auto client = pool_->acquire();
    bsoncxx::builder::basic::document command{};
    command.append(bsoncxx::builder::basic::kvp("ping", 1));
    (*client)["admin"].run_command(command.view());
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_RULES,
        "MongoDB server is unreachable: " << e.what());
    return false;
  }
}

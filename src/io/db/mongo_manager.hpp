#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include <memory>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <string>

// Process-wide driver instance plus one connection pool per URI
class MongoManager {
public:
  // Throws std::runtime_error when the URI is invalid
  explicit MongoManager(const std::string &uri);

  mongocxx::pool::entry get_client();
  bool ping();

private:
  static mongocxx::instance &driver_instance();
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP

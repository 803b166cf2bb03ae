#ifndef IN_MEMORY_INCIDENT_MANAGER_HPP
#define IN_MEMORY_INCIDENT_MANAGER_HPP

#include "base_incident_manager.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class InMemoryIncidentManager : public IIncidentManager {
public:
  explicit InMemoryIncidentManager(
      Utils::Clock clock = Utils::system_clock_ms());

  IncidentPtr find_open_incident(const std::string &rule_id,
                                 const Event &event,
                                 uint32_t window_minutes) override;
  IncidentPtr create_incident(const IncidentDraft &draft) override;
  IncidentPtr update_incident(const std::string &incident_id,
                              const Event &event,
                              const EvaluationResult &result) override;

  void close() override;
  std::string get_name() const override { return "InMemoryIncidentManager"; }

  size_t incident_count() const;
  std::vector<IncidentPtr> all_incidents() const;

private:
  static std::string open_key(const std::string &rule_id,
                              const std::string &asset_key);

  Utils::Clock clock_;
  mutable std::mutex mutex_;
  // Incidents are replaced, never mutated, so handed-out pointers stay valid
  std::unordered_map<std::string, IncidentPtr> incidents_;
  std::unordered_map<std::string, std::string> open_by_key_;
  uint64_t next_id_ = 1;
};

#endif // IN_MEMORY_INCIDENT_MANAGER_HPP

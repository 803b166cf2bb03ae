#ifndef BASE_INCIDENT_MANAGER_HPP
#define BASE_INCIDENT_MANAGER_HPP

#include "core/event.hpp"
#include "core/rule.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct IncidentDraft {
  std::string rule_id;
  std::string title;
  std::string description;
  std::string severity;
  std::string category;
  uint64_t first_seen_ms = 0;
  uint64_t last_seen_ms = 0;
  uint32_t event_count = 1;
  std::vector<std::string> affected_assets;
  std::string asset_key; // computer-ip, used to find the open incident again
  std::string triggering_event_id;
  double confidence = 0.0;
};

struct Incident {
  std::string id;
  std::string status = "open";
  IncidentDraft data;
};

using IncidentPtr = std::shared_ptr<const Incident>;

class IIncidentManager {
public:
  virtual ~IIncidentManager() = default;

  // An open incident for this rule and the event's asset whose last event
  // lies inside the window, or nullptr
  virtual IncidentPtr find_open_incident(const std::string &rule_id,
                                         const Event &event,
                                         uint32_t window_minutes) = 0;
  virtual IncidentPtr create_incident(const IncidentDraft &draft) = 0;
  virtual IncidentPtr update_incident(const std::string &incident_id,
                                      const Event &event,
                                      const EvaluationResult &result) = 0;

  virtual void close() {}
  virtual std::string get_name() const = 0;
};

// "computer-ip" with "unknown" standing in for missing parts
std::string incident_asset_key(const Event &event);

#endif // BASE_INCIDENT_MANAGER_HPP

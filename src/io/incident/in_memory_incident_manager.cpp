#include "in_memory_incident_manager.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

std::string incident_asset_key(const Event &event) {
  return event.computer_name.value_or("unknown") + "-" +
         event.ip_address.value_or("unknown");
}

namespace {

void add_asset(std::vector<std::string> &assets, const std::string &asset) {
  if (std::find(assets.begin(), assets.end(), asset) == assets.end())
    assets.push_back(asset);
}

} // namespace

InMemoryIncidentManager::InMemoryIncidentManager(Utils::Clock clock)
    : clock_(std::move(clock)) {}

std::string InMemoryIncidentManager::open_key(const std::string &rule_id,
                                              const std::string &asset_key) {
  return rule_id + "|" + asset_key;
}

IncidentPtr InMemoryIncidentManager::find_open_incident(
    const std::string &rule_id, const Event &event, uint32_t window_minutes) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto key_it = open_by_key_.find(open_key(rule_id, incident_asset_key(event)));
  if (key_it == open_by_key_.end())
    return nullptr;

  auto it = incidents_.find(key_it->second);
  if (it == incidents_.end() || it->second->status != "open")
    return nullptr;

  uint64_t window_ms = static_cast<uint64_t>(window_minutes) * 60 * 1000;
  uint64_t now = clock_();
  uint64_t cutoff = now > window_ms ? now - window_ms : 0;
  if (it->second->data.last_seen_ms < cutoff)
    return nullptr;
  return it->second;
}

IncidentPtr InMemoryIncidentManager::create_incident(const IncidentDraft &draft) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto incident = std::make_shared<Incident>();
  incident->id = "INC-" + std::to_string(next_id_++);
  incident->data = draft;

  incidents_[incident->id] = incident;
  open_by_key_[open_key(draft.rule_id, draft.asset_key)] = incident->id;

  LOG(LogLevel::DEBUG, LogComponent::DISPATCH,
      "Created incident " << incident->id << " for rule " << draft.rule_id
                          << " (" << draft.title << ")");
  return incident;
}

IncidentPtr
InMemoryIncidentManager::update_incident(const std::string &incident_id,
                                         const Event &event,
                                         const EvaluationResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = incidents_.find(incident_id);
  if (it == incidents_.end())
    throw std::runtime_error("Unknown incident: " + incident_id);

  auto updated = std::make_shared<Incident>(*it->second);
  updated->data.event_count++;
  updated->data.last_seen_ms = std::max(updated->data.last_seen_ms,
                                        event.timestamp_ms);
  updated->data.confidence =
      std::max(updated->data.confidence, result.confidence);

  auto &assets = updated->data.affected_assets;
  if (event.computer_name)
    add_asset(assets, *event.computer_name);
  if (event.user_name)
    add_asset(assets, "user:" + *event.user_name);
  if (event.ip_address)
    add_asset(assets, "ip:" + *event.ip_address);

  it->second = updated;
  LOG(LogLevel::TRACE, LogComponent::DISPATCH,
      "Updated incident " << incident_id << ", event count "
                          << updated->data.event_count);
  return updated;
}

void InMemoryIncidentManager::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  LOG(LogLevel::INFO, LogComponent::DISPATCH,
      "InMemoryIncidentManager closed with " << incidents_.size()
                                             << " incidents.");
  open_by_key_.clear();
}

size_t InMemoryIncidentManager::incident_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return incidents_.size();
}

std::vector<IncidentPtr> InMemoryIncidentManager::all_incidents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<IncidentPtr> result;
  result.reserve(incidents_.size());
  for (const auto &entry : incidents_)
    result.push_back(entry.second);
  return result;
}

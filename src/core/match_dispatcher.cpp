#include "match_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace correlation {

namespace {

BoundedWorkerPool::Options dispatch_pool_options(
    const Config::DispatchConfig &config) {
  BoundedWorkerPool::Options options;
  options.name = "dispatch";
  options.concurrency = config.worker_threads;
  options.queue_timeout_ms = 0;
  options.max_pending = config.max_pending;
  return options;
}

} // namespace

MatchDispatcher::MatchDispatcher(
    const Config::DispatchConfig &config,
    std::shared_ptr<IIncidentManager> incidents,
    std::vector<std::shared_ptr<IActionExecutor>> executors,
    Utils::Clock clock)
    : incidents_(std::move(incidents)), executors_(std::move(executors)),
      pool_(dispatch_pool_options(config), std::move(clock)) {
  if (!incidents_)
    throw std::invalid_argument("MatchDispatcher requires an incident manager");
}

MatchDispatcher::~MatchDispatcher() { shutdown(); }

std::string MatchDispatcher::incident_title(const Rule &rule,
                                            const Event &event) {
  const std::string category = rule.category.value_or("");
  if (category == "authentication")
    return "Auth Alert: " + rule.name + " (" +
           event.user_name.value_or("unknown") + ")";
  if (category == "network")
    return "Network: " + rule.name + " (" +
           event.ip_address.value_or("unknown") + ")";
  if (category == "malware")
    return "Malware: " + rule.name + " (" +
           event.computer_name.value_or("unknown") + ")";
  if (category == "data_exfiltration")
    return "Data Exfil: " + rule.name;
  if (category == "privilege_escalation")
    return "PrivEsc: " + rule.name;
  if (category == "lateral_movement")
    return "Lateral: " + rule.name;
  return "Security: " + rule.name;
}

std::string MatchDispatcher::incident_description(
    const Rule &rule, const Event &event, const EvaluationResult &result) {
  std::ostringstream description;
  description << (rule.description.empty() ? "Security incident detected."
                                           : rule.description);
  description << "\nEvent: " << event.event_type << " from " << event.source
              << " at " << Utils::format_iso8601_ms(event.timestamp_ms);

  if (!result.metadata.empty()) {
    // Sorted so the text is stable across runs
    std::map<std::string, std::string> context(result.metadata.begin(),
                                               result.metadata.end());
    description << "\nContext: ";
    bool first = true;
    for (const auto &[key, value] : context) {
      if (!first)
        description << ", ";
      description << key << "=" << value;
      first = false;
    }
  }
  return description.str();
}

std::vector<std::string> MatchDispatcher::affected_assets(const Event &event) {
  std::vector<std::string> assets;
  auto add = [&assets](std::string asset) {
    if (std::find(assets.begin(), assets.end(), asset) == assets.end())
      assets.push_back(std::move(asset));
  };

  if (event.computer_name)
    add(*event.computer_name);
  if (event.user_name)
    add("user:" + *event.user_name);
  if (event.ip_address)
    add("ip:" + *event.ip_address);
  if (auto target = event.metadata_value("target_host"))
    add(*target);
  return assets;
}

IncidentDraft MatchDispatcher::build_incident_draft(
    const Rule &rule, const Event &event, const EvaluationResult &result) {
  IncidentDraft draft;
  draft.rule_id = rule.id;
  draft.title = incident_title(rule, event);
  draft.description = incident_description(rule, event, result);
  draft.severity = rule.severity;
  draft.category = rule.category.value_or("general");
  draft.first_seen_ms = event.timestamp_ms;
  draft.last_seen_ms = event.timestamp_ms;
  draft.event_count = 1;
  draft.affected_assets = affected_assets(event);
  draft.asset_key = incident_asset_key(event);
  draft.triggering_event_id = event.id;
  draft.confidence = result.confidence;
  return draft;
}

bool MatchDispatcher::dispatch(IndexSnapshotPtr index,
                               const EvaluationResult &result,
                               EventPtr event) {
  if (!index || !event)
    return false;

  bool accepted = pool_.submit([this, index = std::move(index), result,
                                event = std::move(event)]() {
    handle_match(*index, result, event);
  });

  if (accepted) {
    submitted_.fetch_add(1, std::memory_order_relaxed);
  } else {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    LOG(LogLevel::WARN, LogComponent::DISPATCH,
        "Dispatch queue refused match for rule " << result.rule_id);
  }
  return accepted;
}

void MatchDispatcher::handle_match(const IndexSnapshot &index,
                                   const EvaluationResult &result,
                                   const EventPtr &event) {
  RulePtr rule = index.find_rule(result.rule_id);
  if (!rule) {
    LOG(LogLevel::DEBUG, LogComponent::DISPATCH,
        "Rule " << result.rule_id << " not in index generation "
                << index.generation() << "; match dropped");
    return;
  }

  try {
    IncidentPtr incident =
        incidents_->find_open_incident(rule->id, *event,
                                       rule->time_window_minutes);
    if (incident) {
      incident = incidents_->update_incident(incident->id, *event, result);
      incidents_updated_.fetch_add(1, std::memory_order_relaxed);
    } else {
      incident =
          incidents_->create_incident(build_incident_draft(*rule, *event, result));
      incidents_created_.fetch_add(1, std::memory_order_relaxed);
      LOG(LogLevel::INFO, LogComponent::DISPATCH,
          "Incident " << incident->id << " opened: " << incident->data.title);
    }

    if (incident && !executors_.empty())
      schedule_actions(rule, incident, event);
  } catch (const std::exception &e) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    LOG(LogLevel::ERROR, LogComponent::DISPATCH,
        "Failed to handle match of rule " << rule->id << " for event "
                                          << event->id << ": " << e.what());
  }
}

void MatchDispatcher::schedule_actions(RulePtr rule, IncidentPtr incident,
                                       EventPtr event) {
  const std::string incident_id = incident->id;
  bool accepted = pool_.submit([this, rule = std::move(rule),
                                incident = std::move(incident),
                                event = std::move(event)]() {
    for (const auto &executor : executors_) {
      try {
        if (executor->execute_actions(*rule, *incident, *event)) {
          actions_executed_.fetch_add(1, std::memory_order_relaxed);
          continue;
        }
        LOG(LogLevel::ERROR, LogComponent::DISPATCH,
            executor->get_name() << " failed for incident " << incident->id);
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::DISPATCH,
            executor->get_name() << " threw for incident " << incident->id
                                 << ": " << e.what());
      }
      action_failures_.fetch_add(1, std::memory_order_relaxed);
    }
  });

  if (!accepted) {
    action_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG(LogLevel::WARN, LogComponent::DISPATCH,
        "Dispatch queue refused actions for incident " << incident_id);
  }
}

void MatchDispatcher::wait_idle() { pool_.wait_idle(); }

void MatchDispatcher::shutdown() {
  if (shut_down_.exchange(true))
    return;

  // Match tasks can queue action tasks, so wait before closing the pool
  pool_.wait_idle();
  pool_.shutdown();

  for (const auto &executor : executors_)
    executor->close();
  incidents_->close();
}

DispatchStats MatchDispatcher::get_stats() const {
  DispatchStats stats;
  stats.submitted = submitted_.load();
  stats.rejected = rejected_.load();
  stats.incidents_created = incidents_created_.load();
  stats.incidents_updated = incidents_updated_.load();
  stats.failures = failures_.load();
  stats.actions_executed = actions_executed_.load();
  stats.action_failures = action_failures_.load();
  stats.queue_depth = pool_.pending();
  return stats;
}

} // namespace correlation

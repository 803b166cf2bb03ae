#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/engine_stats.hpp"
#include "core/event.hpp"
#include "core/rule.hpp"
#include "core/runtime_config.hpp"
#include "io/incident/base_incident_manager.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace JsonFormatter {

nlohmann::json event_to_json_object(const Event &event);
nlohmann::json incident_to_json_object(const Incident &incident);
nlohmann::json runtime_config_to_json_object(
    const correlation::RuntimeConfig &config);
nlohmann::json engine_stats_to_json_object(
    const correlation::EngineStats &stats);

// One record per (incident, triggering event), as written by the action
// executors
nlohmann::json action_record_to_json_object(const Rule &rule,
                                            const Incident &incident,
                                            const Event &event);

std::string format_action_record(const Rule &rule, const Incident &incident,
                                 const Event &event);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP

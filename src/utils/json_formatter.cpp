#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <optional>

namespace {

nlohmann::json cache_stats_to_json(const correlation::CacheStats &cache) {
  return {{"name", cache.name},         {"size", cache.size},
          {"hits", cache.hits},         {"misses", cache.misses},
          {"hit_ratio", cache.hit_ratio}, {"ttl_ms", cache.ttl_ms}};
}

nlohmann::json pool_stats_to_json(const correlation::PoolStats &pool) {
  return {{"name", pool.name},
          {"queue_depth", pool.queue_depth},
          {"in_flight", pool.in_flight},
          {"submitted", pool.counters.submitted},
          {"rejected", pool.counters.rejected},
          {"completed", pool.counters.completed},
          {"timed_out", pool.counters.timed_out},
          {"failed", pool.counters.failed}};
}

} // namespace

nlohmann::json JsonFormatter::event_to_json_object(const Event &event) {
  nlohmann::json j;
  j["id"] = event.id;
  j["event_id"] = event.event_type;
  j["source"] = event.source;
  j["timestamp"] = Utils::format_iso8601_ms(event.timestamp_ms);

  // Optional fields are emitted as null so consumers see a stable shape
  auto opt = [](const std::optional<std::string> &value) -> nlohmann::json {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
  };
  j["severity"] = opt(event.severity);
  j["computer_name"] = opt(event.computer_name);
  j["user_name"] = opt(event.user_name);
  j["ip_address"] = opt(event.ip_address);

  nlohmann::json metadata = nlohmann::json::object();
  for (const auto &[key, value] : event.metadata)
    metadata[key] = value;
  j["metadata"] = metadata;
  return j;
}

nlohmann::json
JsonFormatter::incident_to_json_object(const Incident &incident) {
  const auto &data = incident.data;
  return {{"id", incident.id},
          {"status", incident.status},
          {"rule_id", data.rule_id},
          {"title", data.title},
          {"description", data.description},
          {"severity", data.severity},
          {"category", data.category},
          {"first_seen", Utils::format_iso8601_ms(data.first_seen_ms)},
          {"last_seen", Utils::format_iso8601_ms(data.last_seen_ms)},
          {"event_count", data.event_count},
          {"affected_assets", data.affected_assets},
          {"confidence", data.confidence}};
}

nlohmann::json JsonFormatter::runtime_config_to_json_object(
    const correlation::RuntimeConfig &config) {
  return {{"max_processing_time_ms", config.max_processing_time_ms},
          {"batch_processing_enabled", config.batch_processing_enabled},
          {"batch_size", config.batch_size},
          {"batch_chunk_size", config.batch_chunk_size},
          {"fast_path_cache_ttl_ms", config.fast_path_cache_ttl_ms},
          {"parallel_rule_evaluation", config.parallel_rule_evaluation},
          {"fast_path_enabled", config.fast_path_enabled},
          {"stream_processing_mode", config.stream_processing_mode},
          {"circuit_breaker_enabled", config.circuit_breaker_enabled},
          {"max_concurrent_events", config.max_concurrent_events},
          {"priority_queue_enabled", config.priority_queue_enabled}};
}

nlohmann::json JsonFormatter::engine_stats_to_json_object(
    const correlation::EngineStats &stats) {
  nlohmann::json j;

  j["index"] = {{"generation", stats.index_generation},
                {"active_rules", stats.active_rules},
                {"indexed_keys", stats.indexed_key_count},
                {"total_entries", stats.total_index_entries},
                {"membership_entries", stats.membership_entries}};

  j["events"] = {{"received", stats.events_received},
                 {"processed", stats.events_processed},
                 {"processed_by_mode",
                  {{"realtime", stats.processed_realtime},
                   {"stream", stats.processed_stream},
                   {"batch", stats.processed_batch}}},
                 {"dropped",
                  {{"circuit_open", stats.dropped_circuit_open},
                   {"overload", stats.dropped_overload},
                   {"pool_rejected", stats.dropped_pool_rejected}}}};

  j["queue_sizes"] = {{"fast", stats.fast_pool.queue_depth},
                      {"normal", stats.normal_pool.queue_depth},
                      {"dispatch", stats.dispatch.queue_depth}};
  j["pools"] = nlohmann::json::array({pool_stats_to_json(stats.fast_pool),
                pool_stats_to_json(stats.normal_pool)});

  j["caches"] = nlohmann::json::array({cache_stats_to_json(stats.rule_cache),
                 cache_stats_to_json(stats.fast_path_cache)});
  j["cache_hit_ratio"] = stats.cache_hit_ratio;

  j["performance"] = {{"average_ms", stats.average_ms},
                      {"p99_ms", stats.p99_ms},
                      {"samples", stats.performance_samples}};

  j["evaluation"] = {{"rule_evaluations", stats.rule_evaluations},
                     {"failures", stats.evaluation_failures},
                     {"matches", stats.matches},
                     {"pattern_matches", stats.pattern_matches}};

  j["batch"] = {{"flushes", stats.batch_flushes},
                {"events", stats.batched_events},
                {"pending", stats.batch_pending},
                {"last_throughput_eps", stats.last_batch_throughput_eps}};

  j["buffers"] = {{"keys", stats.buffer_keys},
                  {"events", stats.buffered_events}};

  const auto &cb = stats.circuit_breaker;
  j["circuit_breaker"] = {{"status", stats.circuit_breaker_status},
                          {"failures", cb.failures},
                          {"last_failure_time_ms", cb.last_failure_time_ms},
                          {"is_open", cb.is_open},
                          {"threshold", cb.threshold},
                          {"timeout_ms", cb.timeout_ms}};

  const auto &d = stats.dispatch;
  j["dispatch"] = {{"submitted", d.submitted},
                   {"rejected", d.rejected},
                   {"incidents_created", d.incidents_created},
                   {"incidents_updated", d.incidents_updated},
                   {"failures", d.failures},
                   {"actions_executed", d.actions_executed},
                   {"action_failures", d.action_failures}};

  j["runtime_config"] = runtime_config_to_json_object(stats.runtime_config);
  j["tuner_ticks"] = stats.tuner_ticks;
  return j;
}

nlohmann::json JsonFormatter::action_record_to_json_object(
    const Rule &rule, const Incident &incident, const Event &event) {
  nlohmann::json j;
  j["rule"] = {{"id", rule.id},
               {"name", rule.name},
               {"severity", rule.severity},
               {"type", rule.type}};
  j["incident"] = incident_to_json_object(incident);
  j["event"] = event_to_json_object(event);
  return j;
}

std::string JsonFormatter::format_action_record(const Rule &rule,
                                                const Incident &incident,
                                                const Event &event) {
  return action_record_to_json_object(rule, incident, event).dump();
}

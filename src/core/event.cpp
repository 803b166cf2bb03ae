#include "event.hpp"
#include "utils/utils.hpp"

#include <nlohmann/json.hpp>

namespace {

std::optional<std::string> string_member(const nlohmann::json &j,
                                         const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (it->is_string())
    return it->get<std::string>();
  if (it->is_number_integer())
    return std::to_string(it->get<long long>());
  return it->dump();
}

std::string scalar_to_string(const nlohmann::json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_boolean())
    return value.get<bool>() ? "true" : "false";
  return value.dump();
}

} // namespace

std::optional<std::string> Event::metadata_value(const std::string &key) const {
  auto it = metadata.find(key);
  if (it == metadata.end())
    return std::nullopt;
  return it->second;
}

bool Event::metadata_flag(const std::string &key) const {
  auto value = metadata_value(key);
  if (!value)
    return false;
  std::string lowered = Utils::to_lower(*value);
  return lowered == "true" || lowered == "1";
}

std::optional<std::string> Event::field(const std::string &name) const {
  if (name == "id")
    return id;
  if (name == "event_id" || name == "event_type")
    return event_type;
  if (name == "source")
    return source;
  if (name == "severity")
    return severity;
  if (name == "timestamp")
    return std::to_string(timestamp_ms);
  if (name == "computer_name")
    return computer_name;
  if (name == "user_name")
    return user_name;
  if (name == "ip_address")
    return ip_address;

  static const std::string prefix = "metadata.";
  if (name.compare(0, prefix.size(), prefix) == 0)
    return metadata_value(name.substr(prefix.size()));
  return metadata_value(name);
}

std::optional<Event> Event::from_json(const nlohmann::json &j,
                                      std::string *error) {
  auto fail = [error](const std::string &reason) -> std::optional<Event> {
    if (error)
      *error = reason;
    return std::nullopt;
  };

  if (!j.is_object())
    return fail("event is not a JSON object");

  Event event;
  auto type = string_member(j, "event_id");
  if (!type)
    type = string_member(j, "eventType");
  if (!type || type->empty())
    return fail("missing event_id");
  event.event_type = *type;

  auto source = string_member(j, "source");
  if (!source || source->empty())
    return fail("missing source");
  event.source = *source;

  event.id = string_member(j, "id").value_or("");
  event.severity = string_member(j, "severity");
  event.computer_name = string_member(j, "computer_name");
  event.user_name = string_member(j, "user_name");
  event.ip_address = string_member(j, "ip_address");

  auto ts = j.find("timestamp");
  if (ts == j.end() || ts->is_null()) {
    event.timestamp_ms = Utils::get_current_time_ms();
  } else if (ts->is_number_unsigned()) {
    event.timestamp_ms = ts->get<uint64_t>();
  } else if (ts->is_number_integer()) {
    if (ts->get<long long>() < 0)
      return fail("negative timestamp");
    event.timestamp_ms = static_cast<uint64_t>(ts->get<long long>());
  } else if (ts->is_string()) {
    auto parsed = Utils::parse_iso8601_to_ms(ts->get<std::string>());
    if (!parsed)
      return fail("unparseable timestamp '" + ts->get<std::string>() + "'");
    event.timestamp_ms = *parsed;
  } else {
    return fail("timestamp must be a string or a number");
  }

  auto meta = j.find("metadata");
  if (meta != j.end() && meta->is_object()) {
    for (auto it = meta->begin(); it != meta->end(); ++it) {
      if (!it.value().is_null())
        event.metadata[it.key()] = scalar_to_string(it.value());
    }
  }

  return event;
}

#ifndef EVENT_HPP
#define EVENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

// A received security event. Shared read-only between the buffer, the
// caches and in-flight evaluations once constructed.
struct Event {
  std::string id;
  std::string event_type; // Windows event id or similar discriminator
  std::string source;
  std::optional<std::string> severity;
  uint64_t timestamp_ms = 0;

  std::optional<std::string> computer_name;
  std::optional<std::string> user_name;
  std::optional<std::string> ip_address;

  std::unordered_map<std::string, std::string> metadata;

  // Looks up a condition field: top-level names first, then
  // "metadata.<key>" or a bare metadata key.
  std::optional<std::string> field(const std::string &name) const;

  std::optional<std::string> metadata_value(const std::string &key) const;

  // "true"/"1" in metadata
  bool metadata_flag(const std::string &key) const;

  static std::optional<Event> from_json(const nlohmann::json &j,
                                        std::string *error = nullptr);
};

using EventPtr = std::shared_ptr<const Event>;

#endif // EVENT_HPP

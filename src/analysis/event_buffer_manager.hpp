#ifndef EVENT_BUFFER_MANAGER_HPP
#define EVENT_BUFFER_MANAGER_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace analysis {

struct BufferSweepResult {
  size_t removed_events = 0;
  size_t removed_keys = 0;
  size_t active_keys = 0;
};

// Recent events per (source, event type), kept for the pattern matcher.
// A buffer is trimmed on insert once it grows past trim_threshold; the
// periodic sweep trims every buffer and drops keys that end up empty.
class EventBufferManager {
public:
  explicit EventBufferManager(const Config::EventBufferConfig &config,
                              Utils::Clock clock = Utils::system_clock_ms());

  static std::string buffer_key(const Event &event);

  void add(const EventPtr &event);
  std::vector<EventPtr> snapshot(const std::string &key) const;
  BufferSweepResult sweep();

  size_t key_count() const;
  size_t total_events() const;

private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::deque<EventPtr>> buffers;
  };

  static constexpr size_t SHARD_COUNT = 16;

  Shard &shard_for(const std::string &key);
  const Shard &shard_for(const std::string &key) const;
  uint64_t cutoff_ms() const;
  // Returns the number of events removed
  size_t trim(std::deque<EventPtr> &buffer, uint64_t cutoff, size_t cap) const;

  const Config::EventBufferConfig config_;
  Utils::Clock clock_;
  Shard shards_[SHARD_COUNT];
};

} // namespace analysis

#endif // EVENT_BUFFER_MANAGER_HPP

#include "event_buffer_manager.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace analysis {

EventBufferManager::EventBufferManager(const Config::EventBufferConfig &config,
                                       Utils::Clock clock)
    : config_(config), clock_(std::move(clock)) {}

std::string EventBufferManager::buffer_key(const Event &event) {
  return event.source + "-" + event.event_type;
}

EventBufferManager::Shard &
EventBufferManager::shard_for(const std::string &key) {
  return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
}

const EventBufferManager::Shard &
EventBufferManager::shard_for(const std::string &key) const {
  return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
}

uint64_t EventBufferManager::cutoff_ms() const {
  uint64_t retention_ms =
      static_cast<uint64_t>(config_.retention_minutes) * 60 * 1000;
  uint64_t now = clock_();
  return now > retention_ms ? now - retention_ms : 0;
}

size_t EventBufferManager::trim(std::deque<EventPtr> &buffer, uint64_t cutoff,
                                size_t cap) const {
  size_t before = buffer.size();
  buffer.erase(std::remove_if(buffer.begin(), buffer.end(),
                              [cutoff](const EventPtr &e) {
                                return e->timestamp_ms <= cutoff;
                              }),
               buffer.end());
  while (buffer.size() > cap)
    buffer.pop_front();
  return before - buffer.size();
}

void EventBufferManager::add(const EventPtr &event) {
  std::string key = buffer_key(*event);
  Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto &buffer = shard.buffers[key];
  buffer.push_back(event);
  if (buffer.size() > config_.trim_threshold)
    trim(buffer, cutoff_ms(), config_.inline_cap);
}

std::vector<EventPtr>
EventBufferManager::snapshot(const std::string &key) const {
  const Shard &shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.buffers.find(key);
  if (it == shard.buffers.end())
    return {};
  return std::vector<EventPtr>(it->second.begin(), it->second.end());
}

BufferSweepResult EventBufferManager::sweep() {
  BufferSweepResult result;
  uint64_t cutoff = cutoff_ms();
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.buffers.begin(); it != shard.buffers.end();) {
      result.removed_events += trim(it->second, cutoff, config_.sweep_cap);
      if (it->second.empty()) {
        it = shard.buffers.erase(it);
        ++result.removed_keys;
      } else {
        ++it;
      }
    }
    result.active_keys += shard.buffers.size();
  }

  LOG(LogLevel::DEBUG, LogComponent::BUFFER,
      "Buffer sweep removed " << result.removed_events << " events and "
                              << result.removed_keys << " keys, "
                              << result.active_keys << " buffers active");
  return result;
}

size_t EventBufferManager::key_count() const {
  size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    total += shard.buffers.size();
  }
  return total;
}

size_t EventBufferManager::total_events() const {
  size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto &entry : shard.buffers)
      total += entry.second.size();
  }
  return total;
}

} // namespace analysis

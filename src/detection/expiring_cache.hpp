#ifndef EXPIRING_CACHE_HPP
#define EXPIRING_CACHE_HPP

#include "utils/utils.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace correlation {

// String-keyed cache whose entries expire `ttl_ms` after insertion. Each
// shard has its own lock. Size is bounded only by sweep().
template <typename V> class ExpiringCache {
public:
  ExpiringCache(std::string name, uint64_t ttl_ms, size_t shard_count = 16,
                Utils::Clock clock = Utils::system_clock_ms())
      : name_(std::move(name)), ttl_ms_(ttl_ms), clock_(std::move(clock)) {
    if (shard_count == 0)
      shard_count = 1;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i)
      shards_.push_back(std::make_unique<Shard>());
  }

  // Expired entries count as misses and are removed on the way out
  std::optional<V> get(const std::string &key) {
    Shard &shard = shard_for(key);
    uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
      misses_.fetch_add(1, std::memory_order_relaxed);
      return std::nullopt;
    }
    if (is_expired(it->second, now)) {
      shard.entries.erase(it);
      misses_.fetch_add(1, std::memory_order_relaxed);
      return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second.value;
  }

  void put(const std::string &key, V value) {
    Shard &shard = shard_for(key);
    uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.entries[key] = Entry{std::move(value), now};
  }

  // Removes every expired entry; returns how many were removed
  size_t sweep() {
    uint64_t now = clock_();
    size_t removed = 0;
    for (auto &shard : shards_) {
      std::lock_guard<std::mutex> lock(shard->mutex);
      for (auto it = shard->entries.begin(); it != shard->entries.end();) {
        if (is_expired(it->second, now)) {
          it = shard->entries.erase(it);
          ++removed;
        } else {
          ++it;
        }
      }
    }
    return removed;
  }

  void clear() {
    for (auto &shard : shards_) {
      std::lock_guard<std::mutex> lock(shard->mutex);
      shard->entries.clear();
    }
  }

  size_t size() const {
    size_t total = 0;
    for (const auto &shard : shards_) {
      std::lock_guard<std::mutex> lock(shard->mutex);
      total += shard->entries.size();
    }
    return total;
  }

  void set_ttl_ms(uint64_t ttl_ms) { ttl_ms_.store(ttl_ms); }
  uint64_t ttl_ms() const { return ttl_ms_.load(); }
  uint64_t hits() const { return hits_.load(); }
  uint64_t misses() const { return misses_.load(); }
  const std::string &name() const { return name_; }

  double hit_ratio() const {
    uint64_t h = hits(), m = misses();
    return (h + m) == 0 ? 0.0 : static_cast<double>(h) / (h + m);
  }

private:
  struct Entry {
    V value;
    uint64_t inserted_at_ms;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
  };

  bool is_expired(const Entry &entry, uint64_t now) const {
    return now >= entry.inserted_at_ms &&
           now - entry.inserted_at_ms >= ttl_ms_.load();
  }

  Shard &shard_for(const std::string &key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
  }

  const std::string name_;
  std::atomic<uint64_t> ttl_ms_;
  Utils::Clock clock_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
};

} // namespace correlation

#endif // EXPIRING_CACHE_HPP

#pragma once

#include "utils/utils.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace circuit_breaker {

enum class State {
  CLOSED, // Admitting work
  OPEN    // Rejecting work until the timeout elapses
};

// Failure-count breaker guarding event admission. There is no trial phase:
// once timeout_ms has passed since the last recorded failure, the next
// allow_request() resets the count and closes the breaker.
class CircuitBreaker {
public:
  struct Config {
    uint32_t failure_threshold;
    uint64_t timeout_ms;

    Config() : failure_threshold(5), timeout_ms(30000) {}
  };

  struct Snapshot {
    uint32_t failures = 0;
    uint64_t last_failure_time_ms = 0;
    bool is_open = false;
    uint32_t threshold = 0;
    uint64_t timeout_ms = 0;
  };

  explicit CircuitBreaker(const std::string &name,
                          const Config &config = Config{},
                          Utils::Clock clock = Utils::system_clock_ms());
  ~CircuitBreaker() = default;

  // Admission check. May transition OPEN -> CLOSED as a side effect.
  bool allow_request();

  // Event finished inside its latency budget
  void record_success();
  // Event finished but exceeded its latency budget
  void record_slow();
  // Event processing threw; also stamps the failure time
  void record_exception();

  State get_state() const;
  std::string get_state_string() const;
  uint32_t get_failure_count() const;
  uint64_t get_rejected_count() const { return rejected_calls_.load(); }
  Snapshot snapshot() const;
  const std::string &name() const { return name_; }

  void reset();

private:
  bool is_open_locked(uint64_t now) const;

  const std::string name_;
  const Config config_;
  Utils::Clock clock_;

  mutable std::mutex mutex_;
  uint32_t failures_ = 0;
  uint64_t last_failure_time_ms_ = 0;
  std::atomic<uint64_t> rejected_calls_{0};
};

} // namespace circuit_breaker

#include "circuit_breaker.hpp"

#include <utility>

namespace circuit_breaker {

CircuitBreaker::CircuitBreaker(const std::string &name, const Config &config,
                               Utils::Clock clock)
    : name_(name), config_(config), clock_(std::move(clock)) {}

bool CircuitBreaker::is_open_locked(uint64_t now) const {
  if (failures_ < config_.failure_threshold)
    return false;
  return now < last_failure_time_ms_ ||
         now - last_failure_time_ms_ < config_.timeout_ms;
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failures_ < config_.failure_threshold)
    return true;

  if (is_open_locked(clock_())) {
    rejected_calls_.fetch_add(1);
    return false;
  }

  // Timeout elapsed since the last failure
  failures_ = 0;
  return true;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failures_ > 0)
    --failures_;
}

void CircuitBreaker::record_slow() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++failures_;
}

void CircuitBreaker::record_exception() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++failures_;
  last_failure_time_ms_ = clock_();
}

State CircuitBreaker::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return is_open_locked(clock_()) ? State::OPEN : State::CLOSED;
}

std::string CircuitBreaker::get_state_string() const {
  switch (get_state()) {
  case State::CLOSED:
    return "CLOSED";
  case State::OPEN:
    return "OPEN";
  }
  return "UNKNOWN";
}

uint32_t CircuitBreaker::get_failure_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  snap.failures = failures_;
  snap.last_failure_time_ms = last_failure_time_ms_;
  snap.is_open = is_open_locked(clock_());
  snap.threshold = config_.failure_threshold;
  snap.timeout_ms = config_.timeout_ms;
  return snap;
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_ = 0;
  last_failure_time_ms_ = 0;
  rejected_calls_.store(0);
}

} // namespace circuit_breaker

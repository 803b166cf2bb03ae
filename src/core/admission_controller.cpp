#include "admission_controller.hpp"
#include "core/logger.hpp"

#include <utility>

namespace correlation {

const char *admission_decision_to_string(AdmissionDecision decision) {
  switch (decision) {
  case AdmissionDecision::ADMITTED:
    return "admitted";
  case AdmissionDecision::REJECTED_CIRCUIT_OPEN:
    return "circuit_open";
  case AdmissionDecision::REJECTED_OVERLOAD:
    return "overload";
  }
  return "unknown";
}

AdmissionController::AdmissionController(
    circuit_breaker::CircuitBreaker &breaker, QueueDepthProvider queue_depth)
    : breaker_(breaker), queue_depth_(std::move(queue_depth)) {}

AdmissionDecision AdmissionController::admit(const Event &event,
                                             const RuntimeConfig &config) {
  if (config.circuit_breaker_enabled && !breaker_.allow_request()) {
    rejected_circuit_.fetch_add(1, std::memory_order_relaxed);
    LOG(LogLevel::WARN, LogComponent::ADMISSION,
        "Circuit breaker open, dropping event " << event.id);
    return AdmissionDecision::REJECTED_CIRCUIT_OPEN;
  }

  size_t depth = queue_depth_ ? queue_depth_() : 0;
  if (depth > config.max_concurrent_events) {
    rejected_overload_.fetch_add(1, std::memory_order_relaxed);
    LOG(LogLevel::WARN, LogComponent::ADMISSION,
        "Max concurrent events reached (" << depth << " queued), dropping event "
                                          << event.id);
    return AdmissionDecision::REJECTED_OVERLOAD;
  }

  admitted_.fetch_add(1, std::memory_order_relaxed);
  return AdmissionDecision::ADMITTED;
}

} // namespace correlation

#ifndef ADMISSION_CONTROLLER_HPP
#define ADMISSION_CONTROLLER_HPP

#include "core/event.hpp"
#include "core/runtime_config.hpp"
#include "utils/circuit_breaker.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace correlation {

enum class AdmissionDecision {
  ADMITTED,
  REJECTED_CIRCUIT_OPEN,
  REJECTED_OVERLOAD
};

const char *admission_decision_to_string(AdmissionDecision decision);

// First gate of the pipeline. Rejections are returned, logged at WARN and
// counted; nothing is thrown.
class AdmissionController {
public:
  using QueueDepthProvider = std::function<size_t()>;

  AdmissionController(circuit_breaker::CircuitBreaker &breaker,
                      QueueDepthProvider queue_depth);

  AdmissionDecision admit(const Event &event, const RuntimeConfig &config);

  uint64_t admitted_count() const { return admitted_.load(); }
  uint64_t rejected_circuit_open() const { return rejected_circuit_.load(); }
  uint64_t rejected_overload() const { return rejected_overload_.load(); }

private:
  circuit_breaker::CircuitBreaker &breaker_;
  QueueDepthProvider queue_depth_;

  std::atomic<uint64_t> admitted_{0};
  std::atomic<uint64_t> rejected_circuit_{0};
  std::atomic<uint64_t> rejected_overload_{0};
};

} // namespace correlation

#endif // ADMISSION_CONTROLLER_HPP

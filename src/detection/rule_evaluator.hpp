#ifndef RULE_EVALUATOR_HPP
#define RULE_EVALUATOR_HPP

#include "core/event.hpp"
#include "core/rule.hpp"

#include <cstdint>
#include <string>

namespace correlation {

struct EvaluationContext {
  std::string source;
  std::string event_type;
  uint32_t time_window_minutes = 0;
  uint64_t now_ms = 0;
};

// Decides whether a single rule matches a single event. Called concurrently
// from several pipeline threads; may throw on failure.
class IRuleEvaluator {
public:
  virtual ~IRuleEvaluator() = default;
  virtual EvaluationResult evaluate(const Rule &rule, const Event &event,
                                    const EvaluationContext &context) = 0;
  virtual const char *get_evaluator_type() const = 0;
};

} // namespace correlation

#endif // RULE_EVALUATOR_HPP

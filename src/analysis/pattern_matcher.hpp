#ifndef PATTERN_MATCHER_HPP
#define PATTERN_MATCHER_HPP

#include "core/event.hpp"

#include <string>
#include <vector>

namespace analysis {

struct PatternMatch {
  std::string pattern_name;
  double confidence = 0.0;
  std::vector<std::string> event_ids;
};

// Cross-event heuristics (brute force, lateral movement, ...) fed from the
// per-(source, type) event buffer.
class IPatternMatcher {
public:
  virtual ~IPatternMatcher() = default;
  virtual std::vector<PatternMatch>
  find_matches(const Event &event, const std::vector<EventPtr> &buffer) = 0;
};

} // namespace analysis

#endif // PATTERN_MATCHER_HPP

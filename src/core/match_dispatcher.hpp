#ifndef MATCH_DISPATCHER_HPP
#define MATCH_DISPATCHER_HPP

#include "core/config.hpp"
#include "core/engine_stats.hpp"
#include "core/event.hpp"
#include "core/rule.hpp"
#include "detection/rule_index.hpp"
#include "io/actions/base_action_executor.hpp"
#include "io/incident/base_incident_manager.hpp"
#include "utils/bounded_worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace correlation {

// Turns matches into incidents off the event path. Each match is one task
// on the dispatcher's own pool; action execution for the resulting incident
// is queued as a second task that nobody waits for.
class MatchDispatcher {
public:
  MatchDispatcher(const Config::DispatchConfig &config,
                  std::shared_ptr<IIncidentManager> incidents,
                  std::vector<std::shared_ptr<IActionExecutor>> executors,
                  Utils::Clock clock = Utils::system_clock_ms());
  ~MatchDispatcher();

  MatchDispatcher(const MatchDispatcher &) = delete;
  MatchDispatcher &operator=(const MatchDispatcher &) = delete;

  // `index` is the generation the match was evaluated against, so a
  // concurrent reload cannot make the rule disappear underneath us.
  // Returns false when the pool refused the task.
  bool dispatch(IndexSnapshotPtr index, const EvaluationResult &result,
                EventPtr event);

  static std::string incident_title(const Rule &rule, const Event &event);
  static std::string incident_description(const Rule &rule,
                                          const Event &event,
                                          const EvaluationResult &result);
  static std::vector<std::string> affected_assets(const Event &event);
  static IncidentDraft build_incident_draft(const Rule &rule,
                                            const Event &event,
                                            const EvaluationResult &result);

  void wait_idle();
  // Drains queued matches and actions, then closes the collaborators
  void shutdown();

  DispatchStats get_stats() const;

private:
  void handle_match(const IndexSnapshot &index, const EvaluationResult &result,
                    const EventPtr &event);
  void schedule_actions(RulePtr rule, IncidentPtr incident, EventPtr event);

  std::shared_ptr<IIncidentManager> incidents_;
  std::vector<std::shared_ptr<IActionExecutor>> executors_;
  BoundedWorkerPool pool_;
  std::atomic<bool> shut_down_{false};

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> incidents_created_{0};
  std::atomic<uint64_t> incidents_updated_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> actions_executed_{0};
  std::atomic<uint64_t> action_failures_{0};
};

} // namespace correlation

#endif // MATCH_DISPATCHER_HPP

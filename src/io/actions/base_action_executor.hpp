#ifndef BASE_ACTION_EXECUTOR_HPP
#define BASE_ACTION_EXECUTOR_HPP

#include "core/event.hpp"
#include "core/rule.hpp"
#include "io/incident/base_incident_manager.hpp"

#include <string>

// Response side effects for an incident (notifications, tickets, ...).
// Called off the event path; a false return is logged and counted only.
class IActionExecutor {
public:
  virtual ~IActionExecutor() = default;
  virtual bool execute_actions(const Rule &rule, const Incident &incident,
                               const Event &event) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_executor_type() const = 0;
  virtual void close() {}
};

#endif // BASE_ACTION_EXECUTOR_HPP

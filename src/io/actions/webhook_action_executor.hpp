#ifndef WEBHOOK_ACTION_EXECUTOR_HPP
#define WEBHOOK_ACTION_EXECUTOR_HPP

#include "base_action_executor.hpp"

#include <string>

// POSTs the incident record to a webhook as application/json
class WebhookActionExecutor : public IActionExecutor {
public:
  explicit WebhookActionExecutor(const std::string &webhook_url);

  bool execute_actions(const Rule &rule, const Incident &incident,
                       const Event &event) override;
  const char *get_name() const override { return "WebhookActionExecutor"; }
  std::string get_executor_type() const override { return "http"; }

  // "scheme://host[:port]" and the request path parsed from the URL;
  // empty when the URL was rejected
  const std::string &base_url() const { return base_url_; }
  const std::string &path() const { return path_; }

private:
  std::string base_url_;
  std::string path_;
};

#endif // WEBHOOK_ACTION_EXECUTOR_HPP

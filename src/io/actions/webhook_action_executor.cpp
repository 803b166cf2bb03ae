#include "webhook_action_executor.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/json_formatter.hpp"

#include <regex>
#include <stdexcept>
#include <string>

WebhookActionExecutor::WebhookActionExecutor(const std::string &webhook_url) {
  // 1: scheme, 2: host[:port], 3: path
  std::regex url_regex(R"(^(https?):\/\/([^\/]+)(\/.*)?$)");
  std::smatch match;

  if (!std::regex_match(webhook_url, match, url_regex))
    throw std::invalid_argument("Invalid webhook URL: " + webhook_url);

  base_url_ = match[1].str() + "://" + match[2].str();
  path_ = match[3].matched ? match[3].str() : "/";
  LOG(LogLevel::INFO, LogComponent::IO_ACTIONS,
      "WebhookActionExecutor posting to " << base_url_ << path_);
}

bool WebhookActionExecutor::execute_actions(const Rule &rule,
                                            const Incident &incident,
                                            const Event &event) {
  httplib::Client client(base_url_);
  client.set_connection_timeout(2, 0);
  client.set_read_timeout(5, 0);

  std::string body = JsonFormatter::format_action_record(rule, incident, event);
  auto res = client.Post(path_.c_str(), body, "application/json");

  if (res && res->status < 400) {
    LOG(LogLevel::TRACE, LogComponent::IO_ACTIONS,
        "Incident " << incident.id << " posted to " << base_url_ << path_
                    << " | Status: " << res->status);
    return true;
  }

  LOG(LogLevel::ERROR, LogComponent::IO_ACTIONS,
      "Webhook delivery failed for incident "
          << incident.id << " to " << base_url_ << path_ << " | "
          << (res ? "Status: " + std::to_string(res->status)
                  : "Error: " + httplib::to_string(res.error())));
  return false;
}

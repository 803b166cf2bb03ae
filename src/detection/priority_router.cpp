#include "priority_router.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace correlation {

namespace {

const std::unordered_set<std::string> CRITICAL_EVENT_TYPES = {
    // Authentication
    "4624", "4625", "4648", "4778", "4779",
    // Account administration and audit log clearing
    "1102", "4720", "4732", "4728", "4756",
    // Kerberos
    "4768", "4769", "4771",
    // Network shares and filtering platform
    "5140", "5145", "5156"};

const std::unordered_set<std::string> CRITICAL_SOURCES = {
    "security", "system", "application"};

const char *const PRIVILEGED_USER_MARKERS[] = {"administrator", "admin",
                                               "root"};

} // namespace

const char *event_priority_to_string(EventPriority priority) {
  return priority == EventPriority::HIGH ? "high" : "normal";
}

PriorityRouter::PriorityRouter(const Config::WorkerPoolConfig &config,
                               Utils::Clock clock,
                               size_t max_pending_per_pool) {
  BoundedWorkerPool::Options fast;
  fast.name = "fast";
  fast.concurrency = config.fast_pool_concurrency;
  fast.queue_timeout_ms = config.fast_pool_timeout_ms;
  fast.max_pending = max_pending_per_pool;
  fast_pool_ = std::make_unique<BoundedWorkerPool>(fast, clock);

  BoundedWorkerPool::Options normal;
  normal.name = "normal";
  normal.concurrency = config.normal_pool_concurrency;
  normal.queue_timeout_ms = config.normal_pool_timeout_ms;
  normal.max_pending = max_pending_per_pool;
  normal_pool_ = std::make_unique<BoundedWorkerPool>(normal, std::move(clock));
}

EventPriority PriorityRouter::classify(const Event &event) {
  if (CRITICAL_EVENT_TYPES.count(event.event_type))
    return EventPriority::HIGH;
  if (CRITICAL_SOURCES.count(Utils::to_lower(event.source)))
    return EventPriority::HIGH;

  auto severity = event.metadata_value("severity");
  if (!severity && event.severity)
    severity = event.severity;
  if (severity && Utils::to_lower(*severity) == "critical")
    return EventPriority::HIGH;

  auto priority = event.metadata_value("priority");
  if (priority && Utils::to_lower(*priority) == "high")
    return EventPriority::HIGH;

  if (event.user_name) {
    std::string user = Utils::to_lower(*event.user_name);
    for (const char *marker : PRIVILEGED_USER_MARKERS) {
      if (user.find(marker) != std::string::npos)
        return EventPriority::HIGH;
    }
  }
  return EventPriority::NORMAL;
}

bool PriorityRouter::route(EventPriority priority, bool priority_queue_enabled,
                           std::function<void()> task) {
  if (priority_queue_enabled && priority == EventPriority::HIGH)
    return fast_pool_->submit(std::move(task));
  return normal_pool_->submit(std::move(task));
}

size_t PriorityRouter::total_queue_depth() const {
  return fast_pool_->pending() + normal_pool_->pending();
}

void PriorityRouter::wait_idle() {
  fast_pool_->wait_idle();
  normal_pool_->wait_idle();
}

void PriorityRouter::shutdown() {
  fast_pool_->shutdown();
  normal_pool_->shutdown();
}

} // namespace correlation

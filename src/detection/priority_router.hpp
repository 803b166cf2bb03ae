#ifndef PRIORITY_ROUTER_HPP
#define PRIORITY_ROUTER_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "utils/bounded_worker_pool.hpp"

#include <cstddef>
#include <functional>
#include <memory>

namespace correlation {

enum class EventPriority { HIGH, NORMAL };

const char *event_priority_to_string(EventPriority priority);

// Classifies events and runs their processing on one of two bounded pools:
// a small fast pool with a short queue timeout for critical traffic and a
// larger one for everything else.
class PriorityRouter {
public:
  explicit PriorityRouter(const Config::WorkerPoolConfig &config,
                          Utils::Clock clock = Utils::system_clock_ms(),
                          size_t max_pending_per_pool = 100000);

  static EventPriority classify(const Event &event);

  // With priority queueing disabled everything goes to the normal pool.
  // Returns false when the chosen pool refused the task.
  bool route(EventPriority priority, bool priority_queue_enabled,
             std::function<void()> task);

  size_t fast_queue_depth() const { return fast_pool_->pending(); }
  size_t normal_queue_depth() const { return normal_pool_->pending(); }
  size_t total_queue_depth() const;

  BoundedWorkerPool &fast_pool() { return *fast_pool_; }
  BoundedWorkerPool &normal_pool() { return *normal_pool_; }
  const BoundedWorkerPool &fast_pool() const { return *fast_pool_; }
  const BoundedWorkerPool &normal_pool() const { return *normal_pool_; }

  void wait_idle();
  void shutdown();

private:
  std::unique_ptr<BoundedWorkerPool> fast_pool_;
  std::unique_ptr<BoundedWorkerPool> normal_pool_;
};

} // namespace correlation

#endif // PRIORITY_ROUTER_HPP

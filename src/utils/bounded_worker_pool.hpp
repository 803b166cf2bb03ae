#ifndef BOUNDED_WORKER_POOL_HPP
#define BOUNDED_WORKER_POOL_HPP

#include "utils/utils.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Fixed-size thread pool with a bounded backlog. A task that sat in the
// backlog for longer than queue_timeout_ms is discarded instead of run;
// running tasks are never interrupted.
class BoundedWorkerPool {
public:
  struct Options {
    std::string name = "pool";
    size_t concurrency = 4;
    uint64_t queue_timeout_ms = 0; // 0 disables the timeout
    size_t max_pending = 10000;
  };

  struct Stats {
    uint64_t submitted = 0;
    uint64_t rejected = 0;
    uint64_t completed = 0;
    uint64_t timed_out = 0;
    uint64_t failed = 0;
  };

  explicit BoundedWorkerPool(const Options &options,
                             Utils::Clock clock = Utils::system_clock_ms());
  ~BoundedWorkerPool();

  BoundedWorkerPool(const BoundedWorkerPool &) = delete;
  BoundedWorkerPool &operator=(const BoundedWorkerPool &) = delete;

  // false when shut down or when the backlog is full
  bool submit(std::function<void()> task);

  size_t pending() const;
  size_t in_flight() const;
  void wait_idle();
  void shutdown();

  Stats get_stats() const;
  const std::string &name() const { return options_.name; }

private:
  struct QueuedTask {
    std::function<void()> fn;
    uint64_t enqueued_at_ms;
  };

  void worker_loop();

  const Options options_;
  Utils::Clock clock_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<QueuedTask> queue_;
  size_t active_ = 0;
  bool shutdown_requested_ = false;
  std::mutex join_mutex_;
  std::vector<std::thread> workers_;

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> timed_out_{0};
  std::atomic<uint64_t> failed_{0};
};

#endif // BOUNDED_WORKER_POOL_HPP

#include "bounded_worker_pool.hpp"
#include "core/logger.hpp"

#include <exception>
#include <utility>

BoundedWorkerPool::BoundedWorkerPool(const Options &options, Utils::Clock clock)
    : options_(options), clock_(std::move(clock)) {
  size_t threads = options_.concurrency == 0 ? 1 : options_.concurrency;
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i)
    workers_.emplace_back(&BoundedWorkerPool::worker_loop, this);
}

BoundedWorkerPool::~BoundedWorkerPool() { shutdown(); }

bool BoundedWorkerPool::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_requested_ || queue_.size() >= options_.max_pending) {
      rejected_.fetch_add(1);
      return false;
    }
    queue_.push_back(QueuedTask{std::move(task), clock_()});
  }
  submitted_.fetch_add(1);
  work_cv_.notify_one();
  return true;
}

void BoundedWorkerPool::worker_loop() {
  while (true) {
    QueuedTask task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock,
                    [this] { return !queue_.empty() || shutdown_requested_; });
      if (queue_.empty())
        return; // shut down and drained

      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    uint64_t now = clock_();
    if (options_.queue_timeout_ms > 0 && now >= task.enqueued_at_ms &&
        now - task.enqueued_at_ms > options_.queue_timeout_ms) {
      timed_out_.fetch_add(1);
      LOG(LogLevel::DEBUG, LogComponent::ROUTING,
          "Pool '" << options_.name << "' dropped a task that waited "
                   << (now - task.enqueued_at_ms) << "ms");
    } else {
      try {
        task.fn();
        completed_.fetch_add(1);
      } catch (const std::exception &e) {
        failed_.fetch_add(1);
        LOG(LogLevel::ERROR, LogComponent::ROUTING,
            "Task in pool '" << options_.name << "' threw: " << e.what());
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (queue_.empty() && active_ == 0)
        idle_cv_.notify_all();
    }
  }
}

size_t BoundedWorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

size_t BoundedWorkerPool::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

void BoundedWorkerPool::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void BoundedWorkerPool::shutdown() {
  std::lock_guard<std::mutex> join_lock(join_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_requested_ = true;
  }
  work_cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
  workers_.clear();
}

BoundedWorkerPool::Stats BoundedWorkerPool::get_stats() const {
  Stats stats;
  stats.submitted = submitted_.load();
  stats.rejected = rejected_.load();
  stats.completed = completed_.load();
  stats.timed_out = timed_out_.load();
  stats.failed = failed_.load();
  return stats;
}

#include "periodic_task.hpp"
#include "core/logger.hpp"

#include <exception>
#include <utility>

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> callback)
    : name_(std::move(name)), interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true))
    return;
  shutdown_flag_ = false;
  thread_ = std::thread(&PeriodicTask::thread_func, this);
}

void PeriodicTask::stop() {
  {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    shutdown_flag_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

void PeriodicTask::thread_func() {
  while (!shutdown_flag_) {
    {
      std::unique_lock<std::mutex> lock(cv_mutex_);
      cv_.wait_for(lock, interval_, [this] { return shutdown_flag_.load(); });
    }
    if (shutdown_flag_)
      break;

    try {
      callback_();
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::CORE,
          "Periodic task '" << name_ << "' failed: " << e.what());
    }
    run_count_.fetch_add(1);
  }
}

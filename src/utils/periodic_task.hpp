#ifndef PERIODIC_TASK_HPP
#define PERIODIC_TASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs a callback on its own thread every `interval` until stopped.
// The first run happens one interval after start().
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> callback);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;

  void start();
  void stop();
  bool is_running() const { return running_.load(); }
  uint64_t run_count() const { return run_count_.load(); }

private:
  void thread_func();

  const std::string name_;
  const std::chrono::milliseconds interval_;
  std::function<void()> callback_;

  std::thread thread_;
  std::mutex cv_mutex_;
  std::condition_variable cv_;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> run_count_{0};
};

#endif // PERIODIC_TASK_HPP

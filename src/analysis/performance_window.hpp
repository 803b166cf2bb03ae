#ifndef PERFORMANCE_WINDOW_HPP
#define PERFORMANCE_WINDOW_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace analysis {

struct PerformanceSnapshot {
  uint64_t total_events = 0;
  double average_ms = 0.0; // exponential moving average
  double p99_ms = 0.0;
  size_t sample_count = 0;
};

// Rolling record of per-event processing times. Keeps the most recent
// `capacity` samples for the P99 and an EMA over everything observed.
class PerformanceWindow {
public:
  static constexpr size_t DEFAULT_CAPACITY = 1000;
  static constexpr double EMA_ALPHA = 0.1;
  static constexpr size_t MIN_SAMPLES_FOR_P99 = 10;

  explicit PerformanceWindow(size_t capacity = DEFAULT_CAPACITY);

  void record(double duration_ms);
  PerformanceSnapshot snapshot() const;

  double average_ms() const;
  double p99_ms() const;

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<double> samples_;
  uint64_t total_events_ = 0;
  double average_ms_ = 0.0;
};

} // namespace analysis

#endif // PERFORMANCE_WINDOW_HPP

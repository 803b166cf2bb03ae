#include "performance_window.hpp"

#include <algorithm>
#include <vector>

namespace analysis {

PerformanceWindow::PerformanceWindow(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void PerformanceWindow::record(double duration_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++total_events_;
  average_ms_ = average_ms_ * (1.0 - EMA_ALPHA) + duration_ms * EMA_ALPHA;
  samples_.push_back(duration_ms);
  if (samples_.size() > capacity_)
    samples_.pop_front();
}

double PerformanceWindow::average_ms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return average_ms_;
}

double PerformanceWindow::p99_ms() const { return snapshot().p99_ms; }

PerformanceSnapshot PerformanceWindow::snapshot() const {
  std::vector<double> sorted;
  PerformanceSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snap.total_events = total_events_;
    snap.average_ms = average_ms_;
    snap.sample_count = samples_.size();
    if (samples_.size() < MIN_SAMPLES_FOR_P99)
      return snap;
    sorted.assign(samples_.begin(), samples_.end());
  }

  // Same index rule as the nearest-rank P99 on the retained samples
  size_t index = static_cast<size_t>(sorted.size() * 0.99);
  if (index >= sorted.size())
    index = sorted.size() - 1;
  std::nth_element(sorted.begin(), sorted.begin() + index, sorted.end());
  snap.p99_ms = sorted[index];
  return snap;
}

} // namespace analysis

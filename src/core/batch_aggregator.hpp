#ifndef BATCH_AGGREGATOR_HPP
#define BATCH_AGGREGATOR_HPP

#include "core/event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace correlation {

// Accumulates events and hands them to the flush handler either as soon as
// the batch reaches the current batch size (on the adding thread) or when
// the flush interval has passed since the first event of a partial batch
// (on the aggregator's timer thread), whichever comes first.
class BatchAggregator {
public:
  using FlushHandler = std::function<void(std::vector<EventPtr> &&)>;
  using BatchSizeProvider = std::function<size_t()>;

  BatchAggregator(FlushHandler handler, BatchSizeProvider batch_size,
                  std::chrono::milliseconds flush_interval);
  ~BatchAggregator();

  BatchAggregator(const BatchAggregator &) = delete;
  BatchAggregator &operator=(const BatchAggregator &) = delete;

  // false once shut down
  bool add(EventPtr event);

  // Flushes whatever is pending; returns the number of events handed over
  size_t flush();

  bool has_pending_timer() const;
  size_t pending_count() const;
  uint64_t flush_count() const { return flush_count_.load(); }
  uint64_t flushed_events() const { return flushed_events_.load(); }

  // Stops the timer and flushes the remainder
  void shutdown();

private:
  std::vector<EventPtr> take_locked();
  void deliver(std::vector<EventPtr> &&batch);
  void timer_loop();

  FlushHandler handler_;
  BatchSizeProvider batch_size_;
  const std::chrono::milliseconds flush_interval_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<EventPtr> pending_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool shutdown_ = false;
  std::thread timer_thread_;

  std::atomic<uint64_t> flush_count_{0};
  std::atomic<uint64_t> flushed_events_{0};
};

} // namespace correlation

#endif // BATCH_AGGREGATOR_HPP

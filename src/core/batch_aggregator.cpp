#include "batch_aggregator.hpp"
#include "core/logger.hpp"

#include <exception>
#include <utility>

namespace correlation {

BatchAggregator::BatchAggregator(FlushHandler handler,
                                 BatchSizeProvider batch_size,
                                 std::chrono::milliseconds flush_interval)
    : handler_(std::move(handler)), batch_size_(std::move(batch_size)),
      flush_interval_(flush_interval) {
  timer_thread_ = std::thread(&BatchAggregator::timer_loop, this);
}

BatchAggregator::~BatchAggregator() { shutdown(); }

std::vector<EventPtr> BatchAggregator::take_locked() {
  std::vector<EventPtr> batch;
  batch.swap(pending_);
  deadline_.reset();
  return batch;
}

void BatchAggregator::deliver(std::vector<EventPtr> &&batch) {
  if (batch.empty())
    return;
  size_t size = batch.size();
  flush_count_.fetch_add(1);
  flushed_events_.fetch_add(size);
  try {
    handler_(std::move(batch));
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::BATCH,
        "Batch of " << size << " events failed: " << e.what());
  }
}

bool BatchAggregator::add(EventPtr event) {
  std::vector<EventPtr> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_)
      return false;

    pending_.push_back(std::move(event));
    size_t limit = batch_size_ ? batch_size_() : 1;
    if (pending_.size() >= limit) {
      ready = take_locked();
    } else if (!deadline_) {
      deadline_ = std::chrono::steady_clock::now() + flush_interval_;
      cv_.notify_all();
    }
  }

  if (!ready.empty())
    deliver(std::move(ready));
  return true;
}

size_t BatchAggregator::flush() {
  std::vector<EventPtr> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch = take_locked();
  }
  cv_.notify_all();
  size_t size = batch.size();
  deliver(std::move(batch));
  return size;
}

bool BatchAggregator::has_pending_timer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadline_.has_value();
}

size_t BatchAggregator::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void BatchAggregator::timer_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!shutdown_) {
    if (!deadline_) {
      cv_.wait(lock);
      continue;
    }

    auto deadline = *deadline_;
    cv_.wait_until(lock, deadline);
    if (shutdown_)
      break;

    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
      auto batch = take_locked();
      lock.unlock();
      LOG(LogLevel::TRACE, LogComponent::BATCH,
          "Flush timer fired with " << batch.size() << " events");
      deliver(std::move(batch));
      lock.lock();
    }
  }
}

void BatchAggregator::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_)
      return;
    shutdown_ = true;
  }
  cv_.notify_all();
  if (timer_thread_.joinable())
    timer_thread_.join();
  flush();
}

} // namespace correlation

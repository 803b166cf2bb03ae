#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>

#include "test_helpers.hpp"
#include "utils/bounded_worker_pool.hpp"

using test_helpers::ManualClock;

namespace {

BoundedWorkerPool::Options options(size_t concurrency, uint64_t timeout_ms = 0,
                                   size_t max_pending = 100) {
  BoundedWorkerPool::Options o;
  o.name = "test";
  o.concurrency = concurrency;
  o.queue_timeout_ms = timeout_ms;
  o.max_pending = max_pending;
  return o;
}

// Occupies the pool's only worker until release() is called
struct Gate {
  std::promise<void> started;
  std::promise<void> released;
  std::shared_future<void> release_signal{released.get_future().share()};

  std::function<void()> task() {
    return [this]() {
      started.set_value();
      release_signal.wait();
    };
  }
  void release() { released.set_value(); }
};

} // namespace

TEST(BoundedWorkerPoolTest, RunsSubmittedTasks) {
  BoundedWorkerPool pool(options(4));
  std::atomic<int> counter{0};
  for (int i = 0; i < 50; ++i)
    ASSERT_TRUE(pool.submit([&counter]() { counter++; }));

  pool.wait_idle();
  EXPECT_EQ(counter.load(), 50);
  auto stats = pool.get_stats();
  EXPECT_EQ(stats.submitted, 50u);
  EXPECT_EQ(stats.completed, 50u);
  EXPECT_EQ(pool.pending(), 0u);
  EXPECT_EQ(pool.in_flight(), 0u);
}

TEST(BoundedWorkerPoolTest, RejectsWhenBacklogFull) {
  BoundedWorkerPool pool(options(1, 0, 2));
  Gate gate;
  auto started = gate.started.get_future();
  ASSERT_TRUE(pool.submit(gate.task()));
  started.wait();

  EXPECT_TRUE(pool.submit([]() {}));
  EXPECT_TRUE(pool.submit([]() {}));
  EXPECT_FALSE(pool.submit([]() {}));
  EXPECT_EQ(pool.pending(), 2u);

  gate.release();
  pool.wait_idle();
  EXPECT_EQ(pool.get_stats().rejected, 1u);
  EXPECT_EQ(pool.get_stats().completed, 3u);
}

TEST(BoundedWorkerPoolTest, DiscardsTasksThatWaitedPastTimeout) {
  ManualClock clock(1000);
  BoundedWorkerPool pool(options(1, 100), clock.clock());
  Gate gate;
  auto started = gate.started.get_future();
  ASSERT_TRUE(pool.submit(gate.task()));
  started.wait();

  std::atomic<bool> ran{false};
  ASSERT_TRUE(pool.submit([&ran]() { ran = true; }));
  clock.advance(500);
  gate.release();
  pool.wait_idle();

  EXPECT_FALSE(ran.load());
  EXPECT_EQ(pool.get_stats().timed_out, 1u);
}

TEST(BoundedWorkerPoolTest, RunningTasksAreNeverInterrupted) {
  ManualClock clock(0);
  BoundedWorkerPool pool(options(1, 10), clock.clock());
  std::atomic<bool> finished{false};
  ASSERT_TRUE(pool.submit([&]() {
    clock.advance(1000);
    finished = true;
  }));
  pool.wait_idle();
  EXPECT_TRUE(finished.load());
  EXPECT_EQ(pool.get_stats().timed_out, 0u);
}

TEST(BoundedWorkerPoolTest, ThrowingTaskIsCountedAndPoolKeepsWorking) {
  BoundedWorkerPool pool(options(1));
  ASSERT_TRUE(pool.submit([]() { throw std::runtime_error("boom"); }));
  std::atomic<bool> ran{false};
  ASSERT_TRUE(pool.submit([&ran]() { ran = true; }));
  pool.wait_idle();

  EXPECT_TRUE(ran.load());
  EXPECT_EQ(pool.get_stats().failed, 1u);
  EXPECT_EQ(pool.get_stats().completed, 1u);
}

TEST(BoundedWorkerPoolTest, ShutdownDrainsQueueAndRefusesNewWork) {
  BoundedWorkerPool pool(options(1));
  Gate gate;
  auto started = gate.started.get_future();
  ASSERT_TRUE(pool.submit(gate.task()));
  started.wait();

  std::atomic<int> counter{0};
  for (int i = 0; i < 5; ++i)
    ASSERT_TRUE(pool.submit([&counter]() { counter++; }));

  std::thread releaser([&gate]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate.release();
  });
  pool.shutdown();
  releaser.join();

  EXPECT_EQ(counter.load(), 5);
  EXPECT_FALSE(pool.submit([]() {}));
  // Second shutdown is a no-op
  pool.shutdown();
}

#include <gtest/gtest.h>

#include "analysis/performance_window.hpp"

using analysis::PerformanceWindow;

TEST(PerformanceWindowTest, EmptyWindow) {
  PerformanceWindow window;
  auto snap = window.snapshot();
  EXPECT_EQ(snap.total_events, 0u);
  EXPECT_DOUBLE_EQ(snap.average_ms, 0.0);
  EXPECT_DOUBLE_EQ(snap.p99_ms, 0.0);
}

TEST(PerformanceWindowTest, ExponentialMovingAverage) {
  PerformanceWindow window;
  window.record(100.0);
  EXPECT_DOUBLE_EQ(window.average_ms(), 10.0);
  window.record(100.0);
  EXPECT_DOUBLE_EQ(window.average_ms(), 19.0);
}

TEST(PerformanceWindowTest, P99NeedsTenSamples) {
  PerformanceWindow window;
  for (int i = 0; i < 9; ++i)
    window.record(5.0);
  EXPECT_DOUBLE_EQ(window.p99_ms(), 0.0);
  window.record(5.0);
  EXPECT_DOUBLE_EQ(window.p99_ms(), 5.0);
}

TEST(PerformanceWindowTest, P99OverRetainedSamples) {
  PerformanceWindow window(100);
  for (int i = 1; i <= 100; ++i)
    window.record(static_cast<double>(i));
  // index floor(100 * 0.99) = 99 of the sorted samples
  EXPECT_DOUBLE_EQ(window.p99_ms(), 100.0);

  // Old samples fall out of the window
  for (int i = 0; i < 100; ++i)
    window.record(1.0);
  auto snap = window.snapshot();
  EXPECT_DOUBLE_EQ(snap.p99_ms, 1.0);
  EXPECT_EQ(snap.sample_count, 100u);
  EXPECT_EQ(snap.total_events, 200u);
}

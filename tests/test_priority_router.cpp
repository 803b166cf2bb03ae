#include <gtest/gtest.h>

#include <atomic>

#include "detection/priority_router.hpp"
#include "test_helpers.hpp"

using namespace correlation;
using test_helpers::make_event;

namespace {

std::shared_ptr<Event> event(const std::string &type,
                             const std::string &source) {
  return std::make_shared<Event>(*make_event("e", type, source));
}

Config::WorkerPoolConfig small_pools() {
  Config::WorkerPoolConfig config;
  config.fast_pool_concurrency = 2;
  config.normal_pool_concurrency = 2;
  return config;
}

} // namespace

TEST(PriorityRouterTest, ClassifiesCriticalTraffic) {
  EXPECT_EQ(PriorityRouter::classify(*event("4625", "sysmon")),
            EventPriority::HIGH);
  EXPECT_EQ(PriorityRouter::classify(*event("1102", "eventlog")),
            EventPriority::HIGH);
  EXPECT_EQ(PriorityRouter::classify(*event("9999", "Security")),
            EventPriority::HIGH);
  EXPECT_EQ(PriorityRouter::classify(*event("9999", "sysmon")),
            EventPriority::NORMAL);
}

TEST(PriorityRouterTest, ClassifiesBySeverityPriorityAndUser) {
  auto critical = event("9999", "sysmon");
  critical->metadata["severity"] = "CRITICAL";
  EXPECT_EQ(PriorityRouter::classify(*critical), EventPriority::HIGH);

  auto top_level = event("9999", "sysmon");
  top_level->severity = "critical";
  EXPECT_EQ(PriorityRouter::classify(*top_level), EventPriority::HIGH);

  auto flagged = event("9999", "sysmon");
  flagged->metadata["priority"] = "high";
  EXPECT_EQ(PriorityRouter::classify(*flagged), EventPriority::HIGH);

  auto admin = event("9999", "sysmon");
  admin->user_name = "CORP\\Administrator";
  EXPECT_EQ(PriorityRouter::classify(*admin), EventPriority::HIGH);

  auto regular = event("9999", "sysmon");
  regular->user_name = "alice";
  regular->severity = "high";
  EXPECT_EQ(PriorityRouter::classify(*regular), EventPriority::NORMAL);
  EXPECT_STREQ(event_priority_to_string(EventPriority::NORMAL), "normal");
}

TEST(PriorityRouterTest, RoutesHighPriorityToFastPool) {
  PriorityRouter router(small_pools());
  std::atomic<int> ran{0};

  ASSERT_TRUE(router.route(EventPriority::HIGH, true, [&ran]() { ran++; }));
  ASSERT_TRUE(router.route(EventPriority::NORMAL, true, [&ran]() { ran++; }));
  router.wait_idle();

  EXPECT_EQ(ran.load(), 2);
  EXPECT_EQ(router.fast_pool().get_stats().submitted, 1u);
  EXPECT_EQ(router.normal_pool().get_stats().submitted, 1u);
  EXPECT_EQ(router.fast_pool().name(), "fast");
  EXPECT_EQ(router.normal_pool().name(), "normal");
}

TEST(PriorityRouterTest, DisabledPriorityQueueUsesNormalPool) {
  PriorityRouter router(small_pools());
  ASSERT_TRUE(router.route(EventPriority::HIGH, false, []() {}));
  router.wait_idle();
  EXPECT_EQ(router.fast_pool().get_stats().submitted, 0u);
  EXPECT_EQ(router.normal_pool().get_stats().submitted, 1u);
}

TEST(PriorityRouterTest, RefusesAfterShutdown) {
  PriorityRouter router(small_pools());
  router.shutdown();
  EXPECT_FALSE(router.route(EventPriority::HIGH, true, []() {}));
  EXPECT_EQ(router.total_queue_depth(), 0u);
}

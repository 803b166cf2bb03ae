#include <gtest/gtest.h>

#include "core/rule.hpp"
#include "detection/expiring_cache.hpp"
#include "test_helpers.hpp"

using correlation::ExpiringCache;
using test_helpers::ManualClock;

class ExpiringCacheTest : public ::testing::Test {
protected:
  ManualClock clock_{1000};
};

TEST_F(ExpiringCacheTest, HitWithinTtlMissAfter) {
  ExpiringCache<int> cache("test", 100, 4, clock_.clock());
  cache.put("a", 1);

  clock_.advance(99);
  auto hit = cache.get("a");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, 1);

  clock_.advance(1);
  EXPECT_FALSE(cache.get("a").has_value());
  // The expired entry was dropped on the way out
  EXPECT_EQ(cache.size(), 0u);

  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.misses(), 1u);
  EXPECT_DOUBLE_EQ(cache.hit_ratio(), 0.5);
}

TEST_F(ExpiringCacheTest, RepeatedLookupsReturnSameValue) {
  ExpiringCache<EvaluationResult> cache("rules", 10000, 16,
                                                     clock_.clock());
  EvaluationResult result;
  result.rule_id = "R1";
  result.matched = true;
  result.confidence = 0.75;
  cache.put("rule:R1:4625:security", result);

  for (int i = 0; i < 3; ++i) {
    auto cached = cache.get("rule:R1:4625:security");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->rule_id, "R1");
    EXPECT_TRUE(cached->matched);
    EXPECT_DOUBLE_EQ(cached->confidence, 0.75);
  }
  EXPECT_EQ(cache.hits(), 3u);
}

TEST_F(ExpiringCacheTest, SweepRemovesOnlyExpired) {
  ExpiringCache<bool> cache("fast", 100, 8, clock_.clock());
  cache.put("old1", true);
  cache.put("old2", true);
  clock_.advance(60);
  cache.put("fresh", true);
  clock_.advance(50);

  EXPECT_EQ(cache.sweep(), 2u);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_TRUE(cache.get("fresh").has_value());
}

TEST_F(ExpiringCacheTest, TtlCanBeChanged) {
  ExpiringCache<int> cache("test", 100, 1, clock_.clock());
  cache.put("a", 1);
  cache.set_ttl_ms(1000);
  EXPECT_EQ(cache.ttl_ms(), 1000u);
  clock_.advance(500);
  EXPECT_TRUE(cache.get("a").has_value());
}

TEST_F(ExpiringCacheTest, ClearAndZeroShards) {
  ExpiringCache<int> cache("test", 100, 0, clock_.clock());
  for (int i = 0; i < 10; ++i)
    cache.put("k" + std::to_string(i), i);
  EXPECT_EQ(cache.size(), 10u);
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.name(), "test");
  EXPECT_DOUBLE_EQ(cache.hit_ratio(), 0.0);
}

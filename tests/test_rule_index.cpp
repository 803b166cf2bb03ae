#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "detection/condition_evaluator.hpp"
#include "detection/membership_filter.hpp"
#include "detection/rule_index.hpp"
#include "test_helpers.hpp"

using namespace correlation;
using test_helpers::condition;
using test_helpers::make_event;
using test_helpers::make_rule;

namespace {

std::vector<std::string> ids(const std::vector<RulePtr> &rules) {
  std::vector<std::string> out;
  for (const auto &rule : rules)
    out.push_back(rule->id);
  return out;
}

} // namespace

TEST(RuleIndexKeysTest, RuleKeysFromEqualityConditions) {
  auto rule = make_rule("R", {condition("event_id", "4625"),
                              condition("source", "security"),
                              condition("user_name", "bob"),
                              condition("severity", "high", "not_equals")});
  auto keys = derive_rule_keys(*rule);
  EXPECT_EQ(keys, (std::vector<std::string>{"event_id:4625", "source:security"}));
}

TEST(RuleIndexKeysTest, UnkeyedRuleGoesToWildcardPlusCategory) {
  auto rule = std::make_shared<Rule>(
      *make_rule("R", {condition("user_name", "admin", "contains")}));
  rule->category = "authentication";
  auto keys = derive_rule_keys(*rule);
  EXPECT_EQ(keys, (std::vector<std::string>{"*", "category:authentication"}));
}

TEST(RuleIndexKeysTest, OrRuleWithUnkeyedConditionGoesToWildcard) {
  auto rule = std::make_shared<Rule>(*make_rule(
      "R", {condition("event_id", "4625"), condition("user_name", "admin")}));
  rule->logic_operator = "OR";
  EXPECT_EQ(derive_rule_keys(*rule), (std::vector<std::string>{"*"}));

  // Every disjunct keyed: the rule sits under each key
  rule->conditions = {condition("event_id", "4625"),
                      condition("source", "sysmon")};
  EXPECT_EQ(derive_rule_keys(*rule),
            (std::vector<std::string>{"event_id:4625", "source:sysmon"}));
}

TEST(RuleIndexKeysTest, EventKeysIncludeDefaultsAndMetadata) {
  auto event = std::make_shared<Event>(*make_event("e", "4688", "sysmon"));
  event->metadata["category"] = "process";
  event->metadata["type"] = "creation";

  auto keys = derive_event_keys(*event);
  EXPECT_EQ(keys, (std::vector<std::string>{
                      "event_id:4688", "source:sysmon", "severity:medium",
                      "category:process", "type:creation", "*"}));

  event->severity = "critical";
  EXPECT_EQ(derive_event_keys(*event)[2], "severity:critical");
}

TEST(RuleIndexTest, CandidateSetHasNoDuplicates) {
  RuleIndex index;
  auto snapshot = index.rebuild(
      {make_rule("R1", {condition("event_id", "4625")}),
       make_rule("R2", {condition("source", "security")}),
       make_rule("R3", {condition("user_name", "x", "contains")})});

  auto candidates =
      snapshot->candidates_for(*make_event("e1", "4625", "security"));
  EXPECT_EQ(ids(candidates), (std::vector<std::string>{"R1", "R2", "R3"}));
}

TEST(RuleIndexTest, RuleUnderSeveralMatchingKeysAppearsOnce) {
  RuleIndex index;
  auto snapshot = index.rebuild({make_rule(
      "R1", {condition("event_id", "4625"), condition("source", "security")})});

  EXPECT_EQ(snapshot->total_index_entries(), 2u);
  EXPECT_EQ(snapshot->membership_entries(), 2u);
  auto candidates =
      snapshot->candidates_for(*make_event("e1", "4625", "security"));
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0]->id, "R1");
}

TEST(RuleIndexTest, CandidatesFollowLoadOrder) {
  RuleIndex index;
  // Wildcard rule loaded first must still come first
  auto snapshot = index.rebuild({make_rule("W", {}),
                                 make_rule("S", {condition("source", "security")}),
                                 make_rule("E", {condition("event_id", "4625")})});
  auto candidates =
      snapshot->candidates_for(*make_event("e1", "4625", "security"));
  EXPECT_EQ(ids(candidates), (std::vector<std::string>{"W", "S", "E"}));
}

TEST(RuleIndexTest, NonMatchingEventGetsOnlyWildcardRules) {
  RuleIndex index;
  auto snapshot = index.rebuild(
      {make_rule("R1", {condition("event_id", "4625")}),
       make_rule("R3", {condition("user_name", "x", "contains")})});
  auto candidates = snapshot->candidates_for(*make_event("e", "1", "dns"));
  EXPECT_EQ(ids(candidates), (std::vector<std::string>{"R3"}));
}

TEST(RuleIndexTest, NoCandidatesWithoutWildcardRules) {
  RuleIndex index;
  auto snapshot = index.rebuild(
      {make_rule("R1", {condition("event_id", "4625")}),
       make_rule("R2", {condition("source", "security")})});
  EXPECT_TRUE(snapshot->candidates_for(*make_event("e", "1", "dns")).empty());
}

TEST(RuleIndexTest, OrRuleIsCandidateWheneverItCanMatch) {
  auto rule = std::make_shared<Rule>(*make_rule(
      "OR1", {condition("event_id", "4625"), condition("user_name", "admin")}));
  rule->logic_operator = "OR";

  RuleIndex index;
  auto snapshot = index.rebuild({rule});

  auto event = std::make_shared<Event>(*make_event("e", "4624", "security"));
  event->user_name = "admin";

  ConditionEvaluator evaluator;
  ASSERT_TRUE(evaluator.evaluate(*rule, *event, EvaluationContext{}).matched);
  EXPECT_EQ(ids(snapshot->candidates_for(*event)),
            (std::vector<std::string>{"OR1"}));
}

TEST(RuleIndexTest, SkipsDisabledAndDuplicateRules) {
  auto disabled = std::make_shared<Rule>(
      *make_rule("D", {condition("event_id", "4625")}));
  disabled->enabled = false;

  RuleIndex index;
  auto snapshot = index.rebuild(
      {make_rule("R1", {condition("event_id", "4625")}), disabled,
       make_rule("R1", {condition("source", "security")})});

  EXPECT_EQ(snapshot->active_rule_count(), 1u);
  EXPECT_EQ(snapshot->find_rule("D"), nullptr);
  ASSERT_NE(snapshot->find_rule("R1"), nullptr);
  EXPECT_EQ(snapshot->find_rule("R1")->conditions[0].field, "event_id");
}

TEST(RuleIndexTest, RebuildSwapsWholeGeneration) {
  RuleIndex index;
  EXPECT_EQ(index.snapshot()->generation(), 0u);
  EXPECT_EQ(index.snapshot()->active_rule_count(), 0u);

  auto first = index.rebuild({make_rule("R1", {condition("event_id", "4625")})});
  auto second = index.rebuild({make_rule("R2", {condition("event_id", "4625")})});

  EXPECT_EQ(first->generation(), 1u);
  EXPECT_EQ(second->generation(), 2u);
  EXPECT_EQ(index.snapshot()->generation(), 2u);

  // A reader holding the old generation keeps a consistent view
  auto event = make_event("e", "4625", "security");
  EXPECT_EQ(ids(first->candidates_for(*event)), (std::vector<std::string>{"R1"}));
  EXPECT_EQ(ids(index.snapshot()->candidates_for(*event)),
            (std::vector<std::string>{"R2"}));
}

TEST(RuleIndexTest, ConcurrentRebuildsEndOnNewestGeneration) {
  RuleIndex index;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&index, t]() {
      for (int i = 0; i < 25; ++i)
        index.rebuild({make_rule("R" + std::to_string(t),
                                 {condition("event_id", "4625")})});
    });
  }
  for (auto &thread : threads)
    thread.join();
  EXPECT_EQ(index.snapshot()->generation(), 100u);
}

TEST(MembershipFilterTest, NeverReportsRegisteredPairAbsent) {
  auto filter = make_membership_filter();
  for (int i = 0; i < 200; ++i)
    filter->add("event_id:" + std::to_string(i), "R" + std::to_string(i % 7));

  for (int i = 0; i < 200; ++i)
    EXPECT_TRUE(filter->contains("event_id:" + std::to_string(i),
                                 "R" + std::to_string(i % 7)));
  EXPECT_FALSE(filter->contains("event_id:0", "R3"));
  EXPECT_EQ(filter->size(), 200u);
  EXPECT_STREQ(filter->get_filter_type(), "exact");
}

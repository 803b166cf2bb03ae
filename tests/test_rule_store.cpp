#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "io/rule_store/json_file_rule_store.hpp"

class JsonFileRuleStoreTest : public ::testing::Test {
protected:
  void TearDown() override { std::remove(path_.c_str()); }

  void write(const std::string &content) {
    std::ofstream out(path_);
    out << content;
  }

  const std::string path_ = "test_rules_store.json";
};

TEST_F(JsonFileRuleStoreTest, LoadsTopLevelArraySortedByPrecedence) {
  write(R"([
    {"id": "low", "priority": 1, "severity": "low"},
    {"id": "crit", "priority": 5, "severity": "critical"},
    {"id": "high", "priority": 5, "severity": "high"},
    {"id": "off", "priority": 9, "enabled": false}
  ])");

  JsonFileRuleStore store(path_);
  auto rules = store.load_enabled_rules();
  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0]->id, "crit");
  EXPECT_EQ(rules[1]->id, "high");
  EXPECT_EQ(rules[2]->id, "low");
  EXPECT_EQ(store.get_store_type(), "file");
}

TEST_F(JsonFileRuleStoreTest, LoadsRulesObjectAndSkipsMalformed) {
  write(R"({"rules": [
    {"id": "ok", "rule_logic": {"conditions": [
      {"field": "event_id", "operator": "equals", "value": "4625"}]}},
    {"name": "no id"},
    "not an object"
  ]})");

  auto rules = JsonFileRuleStore(path_).load_enabled_rules();
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0]->id, "ok");
  EXPECT_EQ(rules[0]->conditions.size(), 1u);
}

TEST_F(JsonFileRuleStoreTest, UnreadableFilesThrow) {
  EXPECT_THROW(JsonFileRuleStore("missing_rules.json").load_enabled_rules(),
               std::runtime_error);

  write("{ not json");
  EXPECT_THROW(JsonFileRuleStore(path_).load_enabled_rules(),
               std::runtime_error);

  write(R"({"id": "single"})");
  EXPECT_THROW(JsonFileRuleStore(path_).load_enabled_rules(),
               std::runtime_error);
}

TEST(RulesFromJsonTest, EmptyArrayYieldsNoRules) {
  EXPECT_TRUE(
      JsonFileRuleStore::rules_from_json(nlohmann::json::array(), "test").empty());
}

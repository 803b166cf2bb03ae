#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "core/event.hpp"
#include "core/rule.hpp"
#include "detection/rule_evaluator.hpp"
#include "io/actions/base_action_executor.hpp"
#include "io/incident/base_incident_manager.hpp"
#include "io/rule_store/base_rule_store.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace test_helpers {

// Clock the test advances by hand
class ManualClock {
public:
  explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {}

  uint64_t now() const { return now_ms_.load(); }
  void set(uint64_t ms) { now_ms_.store(ms); }
  void advance(uint64_t ms) { now_ms_.fetch_add(ms); }

  Utils::Clock clock() {
    return [this]() { return now_ms_.load(); };
  }

private:
  std::atomic<uint64_t> now_ms_;
};

inline EventPtr make_event(const std::string &id, const std::string &type,
                           const std::string &source,
                           uint64_t timestamp_ms = 1700000000000ULL) {
  auto event = std::make_shared<Event>();
  event->id = id;
  event->event_type = type;
  event->source = source;
  event->timestamp_ms = timestamp_ms;
  return event;
}

inline RuleCondition condition(const std::string &field,
                               const std::string &value,
                               const std::string &op = "equals") {
  RuleCondition c;
  c.field = field;
  c.op = op;
  c.value = value;
  return c;
}

inline RulePtr make_rule(const std::string &id,
                         std::vector<RuleCondition> conditions,
                         int priority = 0,
                         const std::string &severity = "medium") {
  auto rule = std::make_shared<Rule>();
  rule->id = id;
  rule->name = id;
  rule->priority = priority;
  rule->severity = severity;
  rule->conditions = std::move(conditions);
  return rule;
}

// Matches a rule when every equality condition holds; can be told to throw
// for selected rules or to stall each call.
class FakeEvaluator : public correlation::IRuleEvaluator {
public:
  EvaluationResult
  evaluate(const Rule &rule, const Event &event,
           const correlation::EvaluationContext &) override {
    calls_.fetch_add(1);
    if (delay_ms_ > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (throwing_rules_.count(rule.id))
        throw std::runtime_error("evaluator failure for " + rule.id);
    }

    EvaluationResult result;
    result.rule_id = rule.id;
    result.matched = !rule.conditions.empty();
    for (const auto &c : rule.conditions) {
      auto value = event.field(c.field);
      if (!value || *value != c.value) {
        result.matched = false;
        break;
      }
    }
    result.confidence = result.matched ? 1.0 : 0.0;
    return result;
  }

  const char *get_evaluator_type() const override { return "fake"; }

  void throw_for(const std::string &rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwing_rules_[rule_id] = true;
  }
  void set_delay_ms(int delay_ms) { delay_ms_ = delay_ms; }
  uint64_t calls() const { return calls_.load(); }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, bool> throwing_rules_;
  std::atomic<int> delay_ms_{0};
  std::atomic<uint64_t> calls_{0};
};

class FakeRuleStore : public IRuleStore {
public:
  explicit FakeRuleStore(std::vector<RulePtr> rules = {})
      : rules_(std::move(rules)) {}

  std::vector<RulePtr> load_enabled_rules() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++loads_;
    if (fail_)
      throw std::runtime_error("rule store unavailable");
    return rules_;
  }
  void close() override { closed_ = true; }
  std::string get_store_type() const override { return "fake"; }

  void set_rules(std::vector<RulePtr> rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_ = std::move(rules);
  }
  void set_fail(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }
  int loads() const { return loads_; }
  bool closed() const { return closed_; }

private:
  std::mutex mutex_;
  std::vector<RulePtr> rules_;
  bool fail_ = false;
  std::atomic<int> loads_{0};
  std::atomic<bool> closed_{false};
};

// Records what the dispatcher asked for; keeps one incident per rule/asset
class FakeIncidentManager : public IIncidentManager {
public:
  IncidentPtr find_open_incident(const std::string &rule_id,
                                 const Event &event, uint32_t) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_.find(rule_id + "|" + incident_asset_key(event));
    return it == open_.end() ? nullptr : it->second;
  }

  IncidentPtr create_incident(const IncidentDraft &draft) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_create_)
      throw std::runtime_error("incident store unavailable");
    auto incident = std::make_shared<Incident>();
    incident->id = "FAKE-" + std::to_string(++created_);
    incident->data = draft;
    open_[draft.rule_id + "|" + draft.asset_key] = incident;
    drafts_.push_back(draft);
    return incident;
  }

  IncidentPtr update_incident(const std::string &incident_id,
                              const Event &,
                              const EvaluationResult &) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &entry : open_) {
      if (entry.second->id == incident_id) {
        auto updated = std::make_shared<Incident>(*entry.second);
        updated->data.event_count++;
        entry.second = updated;
        ++updated_;
        return updated;
      }
    }
    throw std::runtime_error("unknown incident " + incident_id);
  }

  void close() override { closed_ = true; }
  std::string get_name() const override { return "FakeIncidentManager"; }

  void set_fail_create(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_create_ = fail;
  }
  int created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
  }
  int updated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updated_;
  }
  std::vector<IncidentDraft> drafts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drafts_;
  }
  bool closed() const { return closed_; }

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, IncidentPtr> open_;
  std::vector<IncidentDraft> drafts_;
  int created_ = 0;
  int updated_ = 0;
  bool fail_create_ = false;
  std::atomic<bool> closed_{false};
};

class FakeActionExecutor : public IActionExecutor {
public:
  explicit FakeActionExecutor(bool succeed = true, bool throws = false)
      : succeed_(succeed), throws_(throws) {}

  bool execute_actions(const Rule &rule, const Incident &incident,
                       const Event &) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(rule.id + ":" + incident.id);
    }
    if (throws_)
      throw std::runtime_error("action backend down");
    return succeed_;
  }
  const char *get_name() const override { return "FakeActionExecutor"; }
  std::string get_executor_type() const override { return "fake"; }
  void close() override { closed_ = true; }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  bool closed() const { return closed_; }

private:
  const bool succeed_;
  const bool throws_;
  mutable std::mutex mutex_;
  std::vector<std::string> calls_;
  std::atomic<bool> closed_{false};
};

// Polls `predicate` until it holds or `timeout` passes
inline bool wait_for(const std::function<bool()> &predicate,
                     std::chrono::milliseconds timeout =
                         std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

} // namespace test_helpers

#endif // TEST_HELPERS_HPP

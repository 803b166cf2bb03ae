#include "rule_index.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace correlation {

namespace {

void add_unique(std::vector<std::string> &keys, std::string key) {
  if (std::find(keys.begin(), keys.end(), key) == keys.end())
    keys.push_back(std::move(key));
}

std::optional<std::string> condition_key(const RuleCondition &condition) {
  if (condition.op != "equals" || condition.value.empty())
    return std::nullopt;
  if (condition.field == "event_id" || condition.field == "event_type")
    return "event_id:" + condition.value;
  if (condition.field == "source")
    return "source:" + condition.value;
  if (condition.field == "severity")
    return "severity:" + condition.value;
  if (condition.field == "type" || condition.field == "metadata.type")
    return "type:" + condition.value;
  return std::nullopt;
}

} // namespace

std::vector<std::string> derive_rule_keys(const Rule &rule) {
  std::vector<std::string> keys;
  bool any_disjunct = rule.logic_operator == "OR";
  for (const auto &condition : rule.conditions) {
    auto key = condition_key(condition);
    if (key) {
      add_unique(keys, std::move(*key));
    } else if (any_disjunct) {
      // An OR rule can match on this condition alone, so no key covers it
      keys.clear();
      break;
    }
  }

  if (keys.empty())
    keys.emplace_back(WILDCARD_INDEX_KEY);
  if (rule.category && !rule.category->empty())
    add_unique(keys, "category:" + *rule.category);
  return keys;
}

std::vector<std::string> derive_event_keys(const Event &event) {
  std::vector<std::string> keys;
  keys.reserve(6);
  keys.push_back("event_id:" + event.event_type);
  keys.push_back("source:" + event.source);

  std::string severity = DEFAULT_EVENT_SEVERITY;
  if (event.severity && !event.severity->empty())
    severity = *event.severity;
  else if (auto meta = event.metadata_value("severity"); meta && !meta->empty())
    severity = *meta;
  keys.push_back("severity:" + severity);

  if (auto category = event.metadata_value("category"))
    keys.push_back("category:" + *category);
  if (auto type = event.metadata_value("type"))
    keys.push_back("type:" + *type);

  keys.emplace_back(WILDCARD_INDEX_KEY);
  return keys;
}

IndexSnapshot::IndexSnapshot(uint64_t generation, std::vector<RulePtr> rules)
    : generation_(generation), filter_(make_membership_filter()) {
  rules_.reserve(rules.size());
  for (auto &rule : rules) {
    if (!rule || !rule->enabled)
      continue;
    if (rank_.count(rule->id)) {
      LOG(LogLevel::WARN, LogComponent::INDEX,
          "Duplicate rule id '" << rule->id << "' ignored");
      continue;
    }
    rank_[rule->id] = rules_.size();

    for (const auto &key : derive_rule_keys(*rule)) {
      buckets_[key].push_back(rule);
      filter_->add(key, rule->id);
      ++total_entries_;
    }
    rules_.push_back(std::move(rule));
  }
}

std::vector<RulePtr> IndexSnapshot::candidates_for(const Event &event) const {
  return candidates_for_keys(derive_event_keys(event));
}

std::vector<RulePtr>
IndexSnapshot::candidates_for_keys(const std::vector<std::string> &keys) const {
  std::vector<RulePtr> candidates;
  std::unordered_set<std::string> seen;

  for (const auto &key : keys) {
    auto bucket = buckets_.find(key);
    if (bucket == buckets_.end())
      continue;
    for (const auto &rule : bucket->second) {
      if (!filter_->contains(key, rule->id))
        continue;
      if (seen.insert(rule->id).second)
        candidates.push_back(rule);
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [this](const RulePtr &a, const RulePtr &b) {
              return rank_.at(a->id) < rank_.at(b->id);
            });
  return candidates;
}

RulePtr IndexSnapshot::find_rule(const std::string &rule_id) const {
  auto it = rank_.find(rule_id);
  if (it == rank_.end())
    return nullptr;
  return rules_[it->second];
}

RuleIndex::RuleIndex()
    : current_(std::make_shared<IndexSnapshot>(0, std::vector<RulePtr>{})) {}

IndexSnapshotPtr RuleIndex::rebuild(const std::vector<RulePtr> &rules) {
  uint64_t generation;
  {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    generation = next_generation_++;
  }

  auto fresh = std::make_shared<IndexSnapshot>(generation, rules);
  LOG(LogLevel::INFO, LogComponent::INDEX,
      "Index generation " << generation << " built: "
                          << fresh->active_rule_count() << " rules, "
                          << fresh->indexed_key_count() << " keys, "
                          << fresh->membership_entries()
                          << " membership entries");

  std::lock_guard<std::mutex> lock(swap_mutex_);
  // A slower concurrent rebuild must not overwrite a newer generation
  if (current_->generation() < fresh->generation())
    current_ = fresh;
  return current_;
}

IndexSnapshotPtr RuleIndex::snapshot() const {
  std::lock_guard<std::mutex> lock(swap_mutex_);
  return current_;
}

} // namespace correlation

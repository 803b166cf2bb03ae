#ifndef RULE_INDEX_HPP
#define RULE_INDEX_HPP

#include "core/event.hpp"
#include "core/rule.hpp"
#include "membership_filter.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace correlation {

constexpr const char *WILDCARD_INDEX_KEY = "*";
constexpr const char *DEFAULT_EVENT_SEVERITY = "medium";

// Keys a rule registers under. Equality conditions on event_id, source,
// severity and type each contribute "<field>:<value>"; a rule category adds
// "category:<name>". A rule with no condition-derived key registers under
// "*" so it is probed for every event.
std::vector<std::string> derive_rule_keys(const Rule &rule);

// Keys probed for an event, wildcard last.
std::vector<std::string> derive_event_keys(const Event &event);

// One immutable load generation of the index
class IndexSnapshot {
public:
  IndexSnapshot(uint64_t generation, std::vector<RulePtr> rules);

  // Candidate rules for `event`, deduplicated by id, in load order
  std::vector<RulePtr> candidates_for(const Event &event) const;
  std::vector<RulePtr> candidates_for_keys(const std::vector<std::string> &keys) const;

  RulePtr find_rule(const std::string &rule_id) const;

  uint64_t generation() const { return generation_; }
  const std::vector<RulePtr> &rules() const { return rules_; }
  size_t active_rule_count() const { return rules_.size(); }
  size_t indexed_key_count() const { return buckets_.size(); }
  size_t total_index_entries() const { return total_entries_; }
  size_t membership_entries() const { return filter_->size(); }

private:
  uint64_t generation_;
  std::vector<RulePtr> rules_;
  std::unordered_map<std::string, size_t> rank_;
  std::unordered_map<std::string, std::vector<RulePtr>> buckets_;
  std::unique_ptr<IMembershipFilter> filter_;
  size_t total_entries_ = 0;
};

using IndexSnapshotPtr = std::shared_ptr<const IndexSnapshot>;

// Holds the current generation; rebuilds produce a new snapshot that is
// swapped in whole, so readers never see a half-built index.
class RuleIndex {
public:
  RuleIndex();

  // `rules` must already be in precedence order; disabled rules are skipped
  IndexSnapshotPtr rebuild(const std::vector<RulePtr> &rules);
  IndexSnapshotPtr snapshot() const;

private:
  mutable std::mutex swap_mutex_;
  IndexSnapshotPtr current_;
  uint64_t next_generation_ = 1;
};

} // namespace correlation

#endif // RULE_INDEX_HPP

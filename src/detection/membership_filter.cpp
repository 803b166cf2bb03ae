#include "membership_filter.hpp"

namespace correlation {

// '\x1f' keeps ("a-b", "c") and ("a", "b-c") distinct
std::string ExactMembershipFilter::make_entry(const std::string &index_key,
                                              const std::string &rule_id) {
  std::string entry;
  entry.reserve(index_key.size() + rule_id.size() + 1);
  entry.append(index_key);
  entry.push_back('\x1f');
  entry.append(rule_id);
  return entry;
}

void ExactMembershipFilter::add(const std::string &index_key,
                                const std::string &rule_id) {
  entries_.insert(make_entry(index_key, rule_id));
}

bool ExactMembershipFilter::contains(const std::string &index_key,
                                     const std::string &rule_id) const {
  return entries_.count(make_entry(index_key, rule_id)) > 0;
}

std::unique_ptr<IMembershipFilter> make_membership_filter() {
  return std::make_unique<ExactMembershipFilter>();
}

} // namespace correlation

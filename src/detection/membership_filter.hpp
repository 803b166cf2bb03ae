#ifndef MEMBERSHIP_FILTER_HPP
#define MEMBERSHIP_FILTER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>

namespace correlation {

// Records which (index key, rule id) registrations exist. Implementations
// must never report a registered pair as absent.
class IMembershipFilter {
public:
  virtual ~IMembershipFilter() = default;

  virtual void add(const std::string &index_key, const std::string &rule_id) = 0;
  virtual bool contains(const std::string &index_key,
                        const std::string &rule_id) const = 0;
  virtual size_t size() const = 0;
  virtual const char *get_filter_type() const = 0;
};

class ExactMembershipFilter : public IMembershipFilter {
public:
  void add(const std::string &index_key, const std::string &rule_id) override;
  bool contains(const std::string &index_key,
                const std::string &rule_id) const override;
  size_t size() const override { return entries_.size(); }
  const char *get_filter_type() const override { return "exact"; }

private:
  static std::string make_entry(const std::string &index_key,
                                const std::string &rule_id);

  std::unordered_set<std::string> entries_;
};

std::unique_ptr<IMembershipFilter> make_membership_filter();

} // namespace correlation

#endif // MEMBERSHIP_FILTER_HPP

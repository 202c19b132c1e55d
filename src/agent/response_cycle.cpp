#include "trustgate/agent/response_cycle.hpp"

namespace trustgate::agent {

TemporaryRuleScope::TemporaryRuleScope(security::PermissionManager &manager,
                                       const std::vector<security::PermissionRule> &rules,
                                       const int recursion_depth)
    : manager_(manager), owns_(recursion_depth == 0) {
  if (owns_ && !rules.empty()) {
    manager_.add_temporary_rules(rules);
  }
}

TemporaryRuleScope::~TemporaryRuleScope() {
  if (owns_) {
    manager_.clear_temporary_rules();
  }
}

common::Result<std::vector<security::PermissionRule>>
parse_allowed_tools(const std::vector<std::string> &entries) {
  std::vector<security::PermissionRule> rules;
  rules.reserve(entries.size());
  for (const auto &entry : entries) {
    auto rule = security::parse_rule(entry, security::RuleScope::Session);
    if (!rule.ok()) {
      return common::Result<std::vector<security::PermissionRule>>::failure(rule.error());
    }
    rules.push_back(rule.value());
  }
  return common::Result<std::vector<security::PermissionRule>>::success(std::move(rules));
}

} // namespace trustgate::agent

#pragma once

#include "trustgate/common/result.hpp"
#include "trustgate/security/permission_manager.hpp"

#include <string>
#include <utility>
#include <vector>

namespace trustgate::agent {

/// Grants `rules` for one top-level response cycle. Nested cycles (depth > 0) run under
/// the grant of their parent and neither add nor clear anything.
class TemporaryRuleScope {
public:
  TemporaryRuleScope(security::PermissionManager &manager,
                     const std::vector<security::PermissionRule> &rules, int recursion_depth = 0);
  /// Clears the grant and reports it to the global observer, which must not throw.
  ~TemporaryRuleScope();

  TemporaryRuleScope(const TemporaryRuleScope &) = delete;
  TemporaryRuleScope &operator=(const TemporaryRuleScope &) = delete;

  [[nodiscard]] bool owns_rules() const { return owns_; }

private:
  security::PermissionManager &manager_;
  bool owns_ = false;
};

/// Run one response cycle with temporary rules; they are cleared on return and on throw.
template <typename Fn>
auto run_response_cycle(security::PermissionManager &manager,
                        const std::vector<security::PermissionRule> &rules,
                        const int recursion_depth, Fn &&fn) -> decltype(fn()) {
  TemporaryRuleScope scope(manager, rules, recursion_depth);
  return std::forward<Fn>(fn)();
}

/// Parse an allowed-tools list (`Bash(git status)`, `Read`) into session-scoped rules.
[[nodiscard]] common::Result<std::vector<security::PermissionRule>>
parse_allowed_tools(const std::vector<std::string> &entries);

} // namespace trustgate::agent

#pragma once

#include "trustgate/security/permission_types.hpp"
#include "trustgate/security/safe_zone.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trustgate::security {

/// Base commands that never get a glob trust rule.
[[nodiscard]] const std::vector<std::string> &dangerous_commands();

/// Basename of the executable of one simple command (`/bin/rm -rf x` -> `rm`).
[[nodiscard]] std::string base_command(const std::string &simple_command);

/// True when any simple command inside `command` starts with a blacklisted executable.
[[nodiscard]] bool is_dangerous_base(const std::string &command);

/// Recurring prefix of the first simple command followed by ` *`, e.g. `npm install *`.
/// Empty for dangerous or unknown executables.
[[nodiscard]] std::optional<std::string> get_smart_pattern(const std::string &command);

/// Anchored glob match where `*` is the only wildcard and also spans newlines.
[[nodiscard]] bool glob_matches(const std::string &pattern, const std::string &subject);

/// Exact rules compare literally, glob rules match the whole subject.
[[nodiscard]] bool matches_rule(const std::string &subject, const PermissionRule &rule);

/// `pwd`, `true`, `false`, and `cd`/`ls` whose path arguments stay inside the safe zone.
[[nodiscard]] bool is_safe_command(const std::string &simple_command, const SafeZone &zone);

/// `cd`/`ls` with at least one path argument outside the safe zone.
[[nodiscard]] bool is_out_of_bounds(const std::string &simple_command, const SafeZone &zone);

/// Deny-side test: the rule matches the whole call, any simple command of a Bash call,
/// or a file tool's target path (raw or relative to the workdir).
[[nodiscard]] bool rule_applies(const PermissionRule &rule, const std::string &tool_name,
                                const ToolInput &input, const SafeZone &zone);

/// Allow-side test: for Bash every simple command must be covered by a rule or be a safe
/// command; other tools need one applying rule.
[[nodiscard]] bool rules_cover_call(const std::vector<PermissionRule> &rules,
                                    const std::string &tool_name, const ToolInput &input,
                                    const SafeZone &zone);

/// Rules an "always allow" answer would persist for this call.
[[nodiscard]] std::vector<PermissionRule> suggest_rules(const std::string &tool_name,
                                                        const ToolInput &input,
                                                        const SafeZone &zone);

} // namespace trustgate::security

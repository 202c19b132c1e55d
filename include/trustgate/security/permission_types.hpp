#pragma once

#include "trustgate/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace trustgate::security {

inline constexpr std::string_view kBashTool = "Bash";
inline constexpr std::string_view kWriteTool = "Write";
inline constexpr std::string_view kEditTool = "Edit";
inline constexpr std::string_view kMultiEditTool = "MultiEdit";
inline constexpr std::string_view kDeleteTool = "Delete";

enum class PermissionMode { Default, BypassPermissions, AcceptEdits };
enum class PermissionBehavior { Allow, Deny };
enum class RuleKind { Exact, Glob };
/// Session marks rules that are never written to disk (temporary grants).
enum class RuleScope { User, Project, Local, Session };
enum class RuleList { Allow, Deny };

using ToolInput = std::unordered_map<std::string, std::string>;

struct PermissionDecision {
  PermissionBehavior behavior = PermissionBehavior::Deny;
  std::string message;

  [[nodiscard]] static PermissionDecision allow();
  /// An empty message is replaced by a generic reason; a deny always explains itself.
  [[nodiscard]] static PermissionDecision deny(std::string message);

  [[nodiscard]] bool allowed() const { return behavior == PermissionBehavior::Allow; }
};

/// The human dismissed the prompt without answering (ESC/abort).
struct PermissionCancelled {
  std::string reason;
};

using PermissionOutcome = std::variant<PermissionDecision, PermissionCancelled>;

[[nodiscard]] bool is_allowed(const PermissionOutcome &outcome);
[[nodiscard]] bool is_cancelled(const PermissionOutcome &outcome);
/// Deny message, cancellation reason, or empty for an allow.
[[nodiscard]] std::string outcome_message(const PermissionOutcome &outcome);

struct PermissionRequest {
  std::string tool_name;
  ToolInput tool_input;
  /// Highest-precedence mode for this call only.
  std::optional<PermissionMode> mode_override;
};

/// One allow or deny entry, textual form `ToolName(pattern)` or bare `ToolName`.
struct PermissionRule {
  std::string tool_name;
  std::string pattern = "*";
  RuleKind kind = RuleKind::Glob;
  RuleScope scope = RuleScope::Session;

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] bool tool_wide() const { return kind == RuleKind::Glob && pattern == "*"; }
  /// Same tool, pattern and kind; scope is provenance and does not take part.
  [[nodiscard]] bool same_rule(const PermissionRule &other) const;
};

[[nodiscard]] common::Result<PermissionRule> parse_rule(const std::string &text,
                                                        RuleScope scope = RuleScope::Session);
/// Builds a rule whose kind follows from the pattern (`*` anywhere makes it a glob).
[[nodiscard]] PermissionRule make_rule(std::string tool_name, std::string pattern,
                                       RuleScope scope = RuleScope::Session);

[[nodiscard]] std::string mode_to_string(PermissionMode mode);
[[nodiscard]] common::Result<PermissionMode> mode_from_string(const std::string &value);
[[nodiscard]] std::string behavior_to_string(PermissionBehavior behavior);
[[nodiscard]] std::string scope_to_string(RuleScope scope);
[[nodiscard]] common::Result<RuleScope> scope_from_string(const std::string &value);
[[nodiscard]] std::string rule_list_to_string(RuleList list);

/// Tools that can ever require confirmation; everything else auto-allows.
[[nodiscard]] const std::vector<std::string> &restricted_tools();
[[nodiscard]] bool is_restricted_tool(std::string_view tool_name);
/// Restricted tools that acceptEdits mode approves inside the safe zone.
[[nodiscard]] bool is_file_edit_tool(std::string_view tool_name);
/// Tools whose rules match against a filesystem path rather than a command.
[[nodiscard]] bool is_path_tool(std::string_view tool_name);

/// Path argument of a file tool call (`file_path`, `target_file` or `path`).
[[nodiscard]] std::optional<std::string> target_path(const ToolInput &input);
/// The string a rule pattern is matched against for this call.
[[nodiscard]] std::string rule_subject(const std::string &tool_name, const ToolInput &input);

} // namespace trustgate::security

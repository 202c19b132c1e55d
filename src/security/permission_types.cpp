#include "trustgate/security/permission_types.hpp"

#include "trustgate/common/fs.hpp"

#include <algorithm>
#include <cctype>

namespace trustgate::security {

namespace {

std::string normalize_text(const std::string &value) { return common::to_lower(common::trim(value)); }

bool is_valid_tool_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '_' || ch == '-';
  });
}

bool contains_name(const std::vector<std::string> &names, std::string_view name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

PermissionDecision PermissionDecision::allow() {
  return PermissionDecision{.behavior = PermissionBehavior::Allow, .message = ""};
}

PermissionDecision PermissionDecision::deny(std::string message) {
  if (common::trim(message).empty()) {
    message = "Permission denied";
  }
  return PermissionDecision{.behavior = PermissionBehavior::Deny, .message = std::move(message)};
}

bool is_allowed(const PermissionOutcome &outcome) {
  const auto *decision = std::get_if<PermissionDecision>(&outcome);
  return decision != nullptr && decision->allowed();
}

bool is_cancelled(const PermissionOutcome &outcome) {
  return std::holds_alternative<PermissionCancelled>(outcome);
}

std::string outcome_message(const PermissionOutcome &outcome) {
  if (const auto *cancelled = std::get_if<PermissionCancelled>(&outcome); cancelled != nullptr) {
    return cancelled->reason;
  }
  return std::get<PermissionDecision>(outcome).message;
}

std::string PermissionRule::to_string() const {
  if (tool_wide()) {
    return tool_name;
  }
  return tool_name + "(" + pattern + ")";
}

bool PermissionRule::same_rule(const PermissionRule &other) const {
  return tool_name == other.tool_name && pattern == other.pattern && kind == other.kind;
}

common::Result<PermissionRule> parse_rule(const std::string &text, const RuleScope scope) {
  const std::string trimmed = common::trim(text);
  if (trimmed.empty()) {
    return common::Result<PermissionRule>::failure("empty permission rule");
  }

  const auto open = trimmed.find('(');
  if (open == std::string::npos) {
    if (trimmed.find(')') != std::string::npos || !is_valid_tool_name(trimmed)) {
      return common::Result<PermissionRule>::failure("invalid tool name in rule: " + trimmed);
    }
    return common::Result<PermissionRule>::success(make_rule(trimmed, "*", scope));
  }

  if (trimmed.back() != ')') {
    return common::Result<PermissionRule>::failure("unterminated pattern in rule: " + trimmed);
  }

  const std::string tool_name = common::trim(trimmed.substr(0, open));
  if (!is_valid_tool_name(tool_name)) {
    return common::Result<PermissionRule>::failure("invalid tool name in rule: " + trimmed);
  }

  std::string pattern = common::trim(trimmed.substr(open + 1, trimmed.size() - open - 2));
  if (pattern.empty()) {
    return common::Result<PermissionRule>::failure("empty pattern in rule: " + trimmed);
  }

  // Legacy prefix form: "git commit:*" trusts anything starting with "git commit".
  if (common::ends_with(pattern, ":*")) {
    pattern = pattern.substr(0, pattern.size() - 2) + "*";
  }

  return common::Result<PermissionRule>::success(make_rule(tool_name, std::move(pattern), scope));
}

PermissionRule make_rule(std::string tool_name, std::string pattern, const RuleScope scope) {
  PermissionRule rule;
  rule.tool_name = std::move(tool_name);
  rule.kind = pattern.find('*') == std::string::npos ? RuleKind::Exact : RuleKind::Glob;
  rule.pattern = std::move(pattern);
  rule.scope = scope;
  return rule;
}

std::string mode_to_string(const PermissionMode mode) {
  switch (mode) {
  case PermissionMode::Default:
    return "default";
  case PermissionMode::BypassPermissions:
    return "bypassPermissions";
  case PermissionMode::AcceptEdits:
    return "acceptEdits";
  }
  return "default";
}

common::Result<PermissionMode> mode_from_string(const std::string &value) {
  const std::string normalized = normalize_text(value);
  if (normalized == "default") {
    return common::Result<PermissionMode>::success(PermissionMode::Default);
  }
  if (normalized == "bypasspermissions" || normalized == "bypass-permissions" ||
      normalized == "bypass_permissions") {
    return common::Result<PermissionMode>::success(PermissionMode::BypassPermissions);
  }
  if (normalized == "acceptedits" || normalized == "accept-edits" ||
      normalized == "accept_edits") {
    return common::Result<PermissionMode>::success(PermissionMode::AcceptEdits);
  }
  return common::Result<PermissionMode>::failure("unknown permission mode: " + value);
}

std::string behavior_to_string(const PermissionBehavior behavior) {
  return behavior == PermissionBehavior::Allow ? "allow" : "deny";
}

std::string scope_to_string(const RuleScope scope) {
  switch (scope) {
  case RuleScope::User:
    return "user";
  case RuleScope::Project:
    return "project";
  case RuleScope::Local:
    return "local";
  case RuleScope::Session:
    return "session";
  }
  return "session";
}

common::Result<RuleScope> scope_from_string(const std::string &value) {
  const std::string normalized = normalize_text(value);
  if (normalized == "user") {
    return common::Result<RuleScope>::success(RuleScope::User);
  }
  if (normalized == "project") {
    return common::Result<RuleScope>::success(RuleScope::Project);
  }
  if (normalized == "local" || normalized == "project-local") {
    return common::Result<RuleScope>::success(RuleScope::Local);
  }
  return common::Result<RuleScope>::failure("unknown rule scope: " + value);
}

std::string rule_list_to_string(const RuleList list) {
  return list == RuleList::Allow ? "allow" : "deny";
}

const std::vector<std::string> &restricted_tools() {
  static const std::vector<std::string> tools = {
      std::string(kBashTool), std::string(kWriteTool), std::string(kEditTool),
      std::string(kMultiEditTool), std::string(kDeleteTool)};
  return tools;
}

bool is_restricted_tool(const std::string_view tool_name) {
  return contains_name(restricted_tools(), tool_name);
}

bool is_file_edit_tool(const std::string_view tool_name) {
  return tool_name == kWriteTool || tool_name == kEditTool || tool_name == kMultiEditTool ||
         tool_name == kDeleteTool;
}

bool is_path_tool(const std::string_view tool_name) {
  static const std::vector<std::string> tools = {"Read",          "Write",  "Edit",
                                                 "MultiEdit",     "Delete", "LS"};
  return contains_name(tools, tool_name);
}

std::optional<std::string> target_path(const ToolInput &input) {
  for (const char *key : {"file_path", "target_file", "path"}) {
    const auto it = input.find(key);
    if (it != input.end() && !common::trim(it->second).empty()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::string rule_subject(const std::string &tool_name, const ToolInput &input) {
  if (tool_name == kBashTool) {
    const auto it = input.find("command");
    return it == input.end() ? "" : common::trim(it->second);
  }
  if (is_path_tool(tool_name)) {
    return target_path(input).value_or("");
  }
  return "";
}

} // namespace trustgate::security

#include "trustgate/security/permission_manager.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/config/config.hpp"
#include "trustgate/observability/global.hpp"
#include "trustgate/security/bash_parser.hpp"
#include "trustgate/security/pattern_matcher.hpp"

#include <algorithm>
#include <exception>
#include <future>

namespace trustgate::security {

namespace {

constexpr const char *kComponent = "permission_manager";

PermissionOutcome decided(const PermissionRequest &request, PermissionDecision decision,
                          const std::string &source) {
  observability::record_permission_decision(request.tool_name,
                                            behavior_to_string(decision.behavior), source,
                                            decision.message);
  return decision;
}

std::optional<PermissionRule> first_applying(const std::vector<PermissionRule> &rules,
                                             const PermissionRequest &request,
                                             const SafeZone &zone) {
  for (const auto &rule : rules) {
    if (rule_applies(rule, request.tool_name, request.tool_input, zone)) {
      return rule;
    }
  }
  return std::nullopt;
}

PermissionDecision deny_by_rule(const std::string &tool_name, const PermissionRule &rule) {
  return PermissionDecision::deny("Access to tool '" + tool_name +
                                  "' is explicitly denied by rule: " + rule.to_string());
}

bool accept_edits_applies(const PermissionRequest &request, const SafeZone &zone) {
  if (!is_file_edit_tool(request.tool_name)) {
    return false;
  }
  const auto path = target_path(request.tool_input);
  return path.has_value() && zone.contains(*path);
}

void add_unique(std::vector<PermissionRule> &rules, const PermissionRule &rule) {
  const bool seen = std::any_of(rules.begin(), rules.end(),
                                [&rule](const PermissionRule &r) { return r.same_rule(rule); });
  if (!seen) {
    rules.push_back(rule);
  }
}

} // namespace

std::string overlap_policy_to_string(const OverlapPolicy policy) {
  return policy == OverlapPolicy::DenyWins ? "deny-wins" : "allow-wins";
}

common::Result<OverlapPolicy> overlap_policy_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "deny-wins" || normalized == "deny_wins") {
    return common::Result<OverlapPolicy>::success(OverlapPolicy::DenyWins);
  }
  if (normalized == "allow-wins" || normalized == "allow_wins") {
    return common::Result<OverlapPolicy>::success(OverlapPolicy::AllowWins);
  }
  return common::Result<OverlapPolicy>::failure("unknown overlap policy: " + value);
}

PermissionManager::PermissionManager(ManagerOptions options)
    : options_(std::move(options)),
      zone_(options_.workdir, options_.additional_directories) {}

PermissionManager::Snapshot PermissionManager::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot state;
  state.configured_default_mode = options_.configured_default_mode;
  state.cli_mode_override = options_.cli_mode_override;
  state.allowed_rules = options_.allowed_rules;
  state.denied_rules = options_.denied_rules;
  state.temporary_rules = temporary_rules_;
  state.zone = zone_;
  state.overlap_policy = options_.overlap_policy;
  state.authorizer = options_.authorizer;
  state.queue = options_.confirmation_queue;
  state.resolver = options_.resolver;
  return state;
}

PermissionOutcome PermissionManager::check_permission(const PermissionRequest &request) {
  if (!is_restricted_tool(request.tool_name)) {
    return decided(request, PermissionDecision::allow(), "unrestricted");
  }

  const Snapshot state = snapshot();
  const auto deny_rule = first_applying(state.denied_rules, request, state.zone);
  if (deny_rule.has_value() && state.overlap_policy == OverlapPolicy::DenyWins) {
    return decided(request, deny_by_rule(request.tool_name, *deny_rule), "deny-rule");
  }

  if (rules_cover_call(state.temporary_rules, request.tool_name, request.tool_input, state.zone)) {
    return decided(request, PermissionDecision::allow(), "temporary-rule");
  }
  if (rules_cover_call(state.allowed_rules, request.tool_name, request.tool_input, state.zone)) {
    return decided(request, PermissionDecision::allow(), "allow-rule");
  }
  if (deny_rule.has_value()) {
    return decided(request, deny_by_rule(request.tool_name, *deny_rule), "deny-rule");
  }

  if (state.authorizer != nullptr) {
    try {
      auto verdict = state.authorizer->authorize(request);
      if (verdict.has_value()) {
        return decided(request, std::move(*verdict), "authorizer");
      }
    } catch (const std::exception &e) {
      observability::record_error(kComponent, "authorizer '" +
                                                  std::string(state.authorizer->name()) +
                                                  "' failed: " + e.what());
      return decided(request, PermissionDecision::deny("authorization unavailable"), "authorizer");
    } catch (...) {
      observability::record_error(kComponent, "authorizer '" +
                                                  std::string(state.authorizer->name()) +
                                                  "' failed with a non-standard exception");
      return decided(request, PermissionDecision::deny("authorization unavailable"), "authorizer");
    }
  }

  PermissionMode mode = PermissionMode::Default;
  if (request.mode_override.has_value()) {
    mode = *request.mode_override;
  } else if (state.cli_mode_override.has_value()) {
    mode = *state.cli_mode_override;
  } else if (state.configured_default_mode.has_value()) {
    mode = *state.configured_default_mode;
  }

  if (mode == PermissionMode::BypassPermissions) {
    return decided(request, PermissionDecision::allow(), "mode");
  }
  if (mode == PermissionMode::AcceptEdits) {
    if (accept_edits_applies(request, state.zone)) {
      return decided(request, PermissionDecision::allow(), "mode");
    }
    if (is_file_edit_tool(request.tool_name)) {
      observability::record_warning(kComponent, "'" + request.tool_name +
                                                    "' targets a path outside the safe zone; "
                                                    "asking for confirmation");
    }
  }

  return ask_user(request, state);
}

PermissionOutcome PermissionManager::ask_user(const PermissionRequest &request,
                                              const Snapshot &state) {
  if (state.queue == nullptr) {
    observability::record_warning(kComponent, "no confirmation consumer for restricted tool " +
                                                  request.tool_name);
    return decided(request,
                   PermissionDecision::deny("Tool '" + request.tool_name +
                                            "' requires permission approval. No confirmation "
                                            "consumer configured."),
                   "no-consumer");
  }

  ConfirmationRequest confirmation =
      create_confirmation_context(request.tool_name, request.tool_input);
  const auto suggested = confirmation.suggested_rules;
  const bool persistable = !confirmation.hide_persistent_option;

  ConfirmationResult result;
  try {
    result = state.queue->enqueue(std::move(confirmation)).get();
  } catch (const std::future_error &e) {
    observability::record_error(kComponent, std::string("confirmation lost: ") + e.what());
    result = ConfirmationCancelled{.reason = "confirmation was abandoned"};
  }

  if (const auto *cancelled = std::get_if<ConfirmationCancelled>(&result); cancelled != nullptr) {
    observability::record_permission_decision(request.tool_name, "cancel", "user",
                                              cancelled->reason);
    return PermissionCancelled{.reason = cancelled->reason};
  }

  const auto &choice = std::get<ConfirmationChoice>(result);
  switch (choice.kind) {
  case ChoiceKind::AllowOnce:
    return decided(request, PermissionDecision::allow(), "user");
  case ChoiceKind::AllowAlways:
    if (persistable) {
      remember_allow_always(suggested, state.resolver);
    }
    return decided(request, PermissionDecision::allow(), "user");
  case ChoiceKind::Deny:
    return decided(request,
                   PermissionDecision::deny(
                       choice.message.empty()
                           ? "The user denied permission to use tool '" + request.tool_name + "'"
                           : choice.message),
                   "user");
  case ChoiceKind::DenyWithAlternative:
    return decided(request,
                   PermissionDecision::deny(
                       "The user declined this tool call and asked for something else instead: " +
                       choice.message),
                   "user");
  }
  return decided(request, PermissionDecision::deny(""), "user");
}

void PermissionManager::remember_allow_always(
    const std::vector<PermissionRule> &rules,
    const std::shared_ptr<config::ConfigResolver> &resolver) {
  for (auto rule : rules) {
    rule.scope = RuleScope::Local;
    if (resolver != nullptr) {
      const auto status = resolver->persist_rule(RuleScope::Local, rule, RuleList::Allow);
      if (!status.ok()) {
        observability::record_error(kComponent, "failed to persist " + rule.to_string() + ": " +
                                                    status.error());
      }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    add_unique(options_.allowed_rules, rule);
  }
}

ConfirmationRequest PermissionManager::create_confirmation_context(const std::string &tool_name,
                                                                   const ToolInput &input) const {
  const SafeZone zone = safe_zone();
  ConfirmationRequest out;
  out.tool_name = tool_name;
  out.tool_input = input;
  out.suggested_rules = suggest_rules(tool_name, input, zone);

  if (tool_name == kBashTool) {
    const std::string command = rule_subject(tool_name, input);
    const auto parts = split_bash_command(command);
    if (parts.size() == 1) {
      out.suggested_pattern = get_smart_pattern(parts.front());
    }
    // Dangerous bases still get exact rules; a `cd`/`ls` outside the zone gets none.
    const bool leaves_zone = std::any_of(parts.begin(), parts.end(), [&zone](const std::string &part) {
      return is_out_of_bounds(part, zone);
    });
    out.hide_persistent_option = leaves_zone || out.suggested_rules.empty();
  } else {
    out.hide_persistent_option = out.suggested_rules.empty();
  }
  return out;
}

void PermissionManager::add_temporary_rules(const std::vector<PermissionRule> &rules) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto rule : rules) {
      rule.scope = RuleScope::Session;
      add_unique(temporary_rules_, rule);
    }
  }
  for (const auto &rule : rules) {
    observability::record_rule_change("temporary-added", rule.to_string(), "session");
  }
}

void PermissionManager::clear_temporary_rules() {
  std::size_t cleared = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cleared = temporary_rules_.size();
    temporary_rules_.clear();
  }
  if (cleared > 0) {
    observability::record_rule_change("temporary-cleared", std::to_string(cleared) + " rule(s)",
                                      "session");
  }
}

std::vector<PermissionRule> PermissionManager::temporary_rules() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return temporary_rules_;
}

PermissionMode
PermissionManager::effective_mode_locked(const std::optional<PermissionMode> call_override) const {
  if (call_override.has_value()) {
    return *call_override;
  }
  if (options_.cli_mode_override.has_value()) {
    return *options_.cli_mode_override;
  }
  return options_.configured_default_mode.value_or(PermissionMode::Default);
}

PermissionMode
PermissionManager::current_effective_mode(const std::optional<PermissionMode> call_override) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return effective_mode_locked(call_override);
}

void PermissionManager::change_mode(const std::function<void()> &mutate) {
  ModeListener listener;
  PermissionMode before = PermissionMode::Default;
  PermissionMode after = PermissionMode::Default;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    before = effective_mode_locked(std::nullopt);
    mutate();
    after = effective_mode_locked(std::nullopt);
    listener = mode_listener_;
  }
  if (before != after && listener) {
    listener(after);
  }
}

void PermissionManager::update_configured_default_mode(const std::optional<PermissionMode> mode) {
  change_mode([this, mode]() { options_.configured_default_mode = mode; });
}

void PermissionManager::set_cli_mode_override(const std::optional<PermissionMode> mode) {
  change_mode([this, mode]() { options_.cli_mode_override = mode; });
}

void PermissionManager::set_mode_change_listener(ModeListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  mode_listener_ = std::move(listener);
}

void PermissionManager::update_allowed_rules(std::vector<PermissionRule> rules) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.allowed_rules = std::move(rules);
}

void PermissionManager::update_denied_rules(std::vector<PermissionRule> rules) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.denied_rules = std::move(rules);
}

void PermissionManager::update_additional_directories(std::vector<std::string> directories) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.additional_directories = std::move(directories);
  zone_ = SafeZone(options_.workdir, options_.additional_directories);
}

void PermissionManager::update_workdir(std::filesystem::path workdir) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.workdir = std::move(workdir);
  zone_ = SafeZone(options_.workdir, options_.additional_directories);
}

void PermissionManager::set_authorizer(std::shared_ptr<IAuthorizer> authorizer) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.authorizer = std::move(authorizer);
}

void PermissionManager::set_confirmation_queue(std::shared_ptr<ConfirmationQueue> queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.confirmation_queue = std::move(queue);
}

std::shared_ptr<ConfirmationQueue> PermissionManager::confirmation_queue() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_.confirmation_queue;
}

bool PermissionManager::is_restricted_tool(const std::string_view tool_name) const {
  return security::is_restricted_tool(tool_name);
}

std::vector<PermissionRule> PermissionManager::allowed_rules() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_.allowed_rules;
}

std::vector<PermissionRule> PermissionManager::denied_rules() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_.denied_rules;
}

SafeZone PermissionManager::safe_zone() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return zone_;
}

} // namespace trustgate::security

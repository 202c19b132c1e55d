#pragma once

#include "trustgate/security/authorizer.hpp"
#include "trustgate/security/confirmation_queue.hpp"
#include "trustgate/security/permission_types.hpp"
#include "trustgate/security/safe_zone.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustgate::config {
class ConfigResolver;
} // namespace trustgate::config

namespace trustgate::security {

/// How a call matched by both a deny rule and an allow rule is decided.
enum class OverlapPolicy { DenyWins, AllowWins };

[[nodiscard]] std::string overlap_policy_to_string(OverlapPolicy policy);
[[nodiscard]] common::Result<OverlapPolicy> overlap_policy_from_string(const std::string &value);

struct ManagerOptions {
  std::optional<PermissionMode> configured_default_mode;
  std::optional<PermissionMode> cli_mode_override;
  std::vector<PermissionRule> allowed_rules;
  std::vector<PermissionRule> denied_rules;
  std::vector<std::string> additional_directories;
  std::filesystem::path workdir;
  OverlapPolicy overlap_policy = OverlapPolicy::DenyWins;
  std::shared_ptr<IAuthorizer> authorizer;
  std::shared_ptr<ConfirmationQueue> confirmation_queue;
  /// Target for "always allow" answers; without it the grant lasts for the process only.
  std::shared_ptr<config::ConfigResolver> resolver;
};

class PermissionManager {
public:
  using ModeListener = std::function<void(PermissionMode)>;

  explicit PermissionManager(ManagerOptions options = {});

  /// Decide one tool call. Blocks only while a confirmation is pending or the authorizer runs.
  [[nodiscard]] PermissionOutcome check_permission(const PermissionRequest &request);

  void add_temporary_rules(const std::vector<PermissionRule> &rules);
  void clear_temporary_rules();
  [[nodiscard]] std::vector<PermissionRule> temporary_rules() const;

  void update_configured_default_mode(std::optional<PermissionMode> mode);
  void set_cli_mode_override(std::optional<PermissionMode> mode);
  /// Fired when a configuration or override change alters the effective mode.
  void set_mode_change_listener(ModeListener listener);
  [[nodiscard]] PermissionMode
  current_effective_mode(std::optional<PermissionMode> call_override = std::nullopt) const;

  void update_allowed_rules(std::vector<PermissionRule> rules);
  void update_denied_rules(std::vector<PermissionRule> rules);
  void update_additional_directories(std::vector<std::string> directories);
  void update_workdir(std::filesystem::path workdir);

  void set_authorizer(std::shared_ptr<IAuthorizer> authorizer);
  void set_confirmation_queue(std::shared_ptr<ConfirmationQueue> queue);
  [[nodiscard]] std::shared_ptr<ConfirmationQueue> confirmation_queue() const;

  [[nodiscard]] bool is_restricted_tool(std::string_view tool_name) const;
  [[nodiscard]] std::vector<PermissionRule> allowed_rules() const;
  [[nodiscard]] std::vector<PermissionRule> denied_rules() const;
  [[nodiscard]] SafeZone safe_zone() const;

  /// Confirmation payload for a call: suggested pattern, rules and whether the persistent
  /// option is offered at all.
  [[nodiscard]] ConfirmationRequest create_confirmation_context(const std::string &tool_name,
                                                                const ToolInput &input) const;

private:
  struct Snapshot {
    std::optional<PermissionMode> configured_default_mode;
    std::optional<PermissionMode> cli_mode_override;
    std::vector<PermissionRule> allowed_rules;
    std::vector<PermissionRule> denied_rules;
    std::vector<PermissionRule> temporary_rules;
    SafeZone zone;
    OverlapPolicy overlap_policy = OverlapPolicy::DenyWins;
    std::shared_ptr<IAuthorizer> authorizer;
    std::shared_ptr<ConfirmationQueue> queue;
    std::shared_ptr<config::ConfigResolver> resolver;
  };

  [[nodiscard]] Snapshot snapshot() const;
  [[nodiscard]] PermissionMode effective_mode_locked(std::optional<PermissionMode> call_override) const;
  [[nodiscard]] PermissionOutcome ask_user(const PermissionRequest &request, const Snapshot &state);
  void remember_allow_always(const std::vector<PermissionRule> &rules,
                             const std::shared_ptr<config::ConfigResolver> &resolver);
  void change_mode(const std::function<void()> &mutate);

  mutable std::mutex mutex_;
  ManagerOptions options_;
  std::vector<PermissionRule> temporary_rules_;
  SafeZone zone_;
  ModeListener mode_listener_;
};

} // namespace trustgate::security

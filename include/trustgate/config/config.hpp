#pragma once

#include "trustgate/common/result.hpp"
#include "trustgate/security/permission_manager.hpp"
#include "trustgate/security/permission_types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trustgate::config {

inline constexpr const char *kConfigFolder = ".trustgate";
inline constexpr const char *kSettingsFile = "settings.json";
inline constexpr const char *kLocalSettingsFile = "settings.local.json";

/// User-scope directory: override, then TRUSTGATE_CONFIG_DIR, then ~/.trustgate.
[[nodiscard]] common::Result<std::filesystem::path> user_config_dir();
void set_config_dir_override(std::optional<std::filesystem::path> path);
void clear_config_dir_override();

/// Settings file of one persistent scope. Session scope has no file.
[[nodiscard]] common::Result<std::filesystem::path> scope_config_path(security::RuleScope scope,
                                                                      const std::filesystem::path &workdir);

struct ScopeSettings {
  bool exists = false;
  bool malformed = false;
  std::optional<security::PermissionMode> default_mode;
  std::vector<security::PermissionRule> allow;
  std::vector<security::PermissionRule> deny;
  std::vector<std::string> additional_directories;
  std::vector<std::string> warnings;
};

/// Parse one settings document. Problems become warnings; nothing here fails hard.
[[nodiscard]] ScopeSettings parse_scope_settings(const std::string &json, security::RuleScope scope);
[[nodiscard]] ScopeSettings load_scope_settings(const std::filesystem::path &path,
                                                security::RuleScope scope);

struct RuleSets {
  std::vector<security::PermissionRule> allow;
  std::vector<security::PermissionRule> deny;
  std::vector<std::string> additional_directories;
};

/// Reads and writes the three settings scopes of one working directory.
class ConfigResolver {
public:
  explicit ConfigResolver(std::filesystem::path workdir);

  [[nodiscard]] const std::filesystem::path &workdir() const { return workdir_; }
  [[nodiscard]] common::Result<std::filesystem::path> scope_path(security::RuleScope scope) const;
  /// Local, project and user files in precedence order; missing files are included.
  [[nodiscard]] std::vector<std::pair<security::RuleScope, std::filesystem::path>>
  scope_paths() const;

  /// Explicit override, else the first valid mode of local, project, user, else default.
  [[nodiscard]] security::PermissionMode
  resolve_default_mode(std::optional<security::PermissionMode> override_mode = std::nullopt) const;
  [[nodiscard]] std::optional<security::PermissionMode> resolve_configured_default_mode() const;
  [[nodiscard]] RuleSets resolve_rule_sets() const;

  [[nodiscard]] common::Status persist_rule(security::RuleScope scope,
                                            const security::PermissionRule &rule,
                                            security::RuleList list = security::RuleList::Allow);
  [[nodiscard]] common::Status remove_rule(security::RuleScope scope,
                                           const security::PermissionRule &rule,
                                           security::RuleList list = security::RuleList::Allow);
  [[nodiscard]] common::Status set_default_mode(security::RuleScope scope,
                                                security::PermissionMode mode);

private:
  [[nodiscard]] std::vector<ScopeSettings> load_all() const;

  std::filesystem::path workdir_;
};

/// Manager options seeded from the resolver's merged view of all scopes.
[[nodiscard]] security::ManagerOptions
build_manager_options(const std::shared_ptr<ConfigResolver> &resolver,
                      std::optional<security::PermissionMode> cli_override = std::nullopt);

} // namespace trustgate::config

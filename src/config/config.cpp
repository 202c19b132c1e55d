#include "trustgate/config/config.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/common/json_util.hpp"
#include "trustgate/observability/global.hpp"
#include "trustgate/security/pattern_matcher.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>

namespace trustgate::config {

namespace {

constexpr const char *kComponent = "config";

std::optional<std::filesystem::path> g_config_dir_override;

std::mutex &path_mutex(const std::filesystem::path &path) {
  static std::mutex registry_mutex;
  static std::map<std::string, std::unique_ptr<std::mutex>> registry;
  std::lock_guard<std::mutex> lock(registry_mutex);
  auto &slot = registry[path.lexically_normal().string()];
  if (slot == nullptr) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

const char *list_key(const security::RuleList list) {
  return list == security::RuleList::Allow ? "allow" : "deny";
}

void parse_rule_list(const std::string &permissions, const char *key,
                     const security::RuleScope scope, std::vector<security::PermissionRule> &out,
                     std::vector<std::string> &warnings) {
  const auto raw = common::json_get_raw(permissions, key);
  if (!raw.has_value()) {
    return;
  }
  if (raw->empty() || raw->front() != '[') {
    warnings.push_back(std::string("permissions.") + key + " must be an array");
    return;
  }
  for (const auto &item : common::json_array_items(*raw)) {
    if (item.empty() || item.front() != '"') {
      warnings.push_back(std::string("ignoring non-string entry in permissions.") + key);
      continue;
    }
    const std::string text = common::json_unescape(item.substr(1, item.size() - 2));
    auto rule = security::parse_rule(text, scope);
    if (!rule.ok()) {
      warnings.push_back("ignoring malformed rule: " + rule.error());
      continue;
    }
    out.push_back(rule.value());
  }
}

// Read-merge-write of one settings file under its path lock. `mutate` returns the new
// document, or nullopt when nothing changes.
using DocumentMutator =
    std::function<common::Result<std::optional<std::string>>(const std::string &document)>;

common::Status update_document(const std::filesystem::path &path, const DocumentMutator &mutate) {
  std::lock_guard<std::mutex> lock(path_mutex(path));

  std::string document = "{}";
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto content = common::read_file(path);
    if (!content.ok()) {
      return content.status();
    }
    if (!common::trim(content.value()).empty()) {
      document = content.value();
      if (const auto valid = common::json_validate(document); !valid.ok()) {
        return common::Status::error("refusing to rewrite malformed " + path.string() + ": " +
                                     valid.error());
      }
      const std::size_t start = common::json_skip_ws(document, 0);
      if (document[start] != '{') {
        return common::Status::error("refusing to rewrite " + path.string() +
                                     ": top level is not an object");
      }
    }
  }

  auto updated = mutate(document);
  if (!updated.ok()) {
    return updated.status();
  }
  if (!updated.value().has_value()) {
    return common::Status::success();
  }

  std::string content = *updated.value();
  if (content.empty() || content.back() != '\n') {
    content += '\n';
  }
  return common::write_file_atomic(path, content);
}

common::Result<std::string> permissions_object(const std::string &document) {
  const auto raw = common::json_get_raw(document, "permissions");
  if (!raw.has_value()) {
    return common::Result<std::string>::success("{}");
  }
  if (raw->empty() || raw->front() != '{') {
    return common::Result<std::string>::failure("\"permissions\" is not an object");
  }
  return common::Result<std::string>::success(*raw);
}

bool contains_rule(const std::vector<std::string> &texts, const security::PermissionRule &rule) {
  return std::any_of(texts.begin(), texts.end(), [&rule](const std::string &text) {
    const auto parsed = security::parse_rule(text);
    return parsed.ok() && parsed.value().same_rule(rule);
  });
}

void add_unique(std::vector<security::PermissionRule> &rules, const security::PermissionRule &rule) {
  const bool seen =
      std::any_of(rules.begin(), rules.end(), [&rule](const security::PermissionRule &r) {
        return r.same_rule(rule);
      });
  if (!seen) {
    rules.push_back(rule);
  }
}

} // namespace

common::Result<std::filesystem::path> user_config_dir() {
  if (g_config_dir_override.has_value()) {
    return common::Result<std::filesystem::path>::success(*g_config_dir_override);
  }
  if (const char *env = std::getenv("TRUSTGATE_CONFIG_DIR"); env != nullptr && *env != '\0') {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(env)));
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / kConfigFolder);
}

void set_config_dir_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_dir_override = std::nullopt;
    return;
  }
  g_config_dir_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_dir_override() { g_config_dir_override = std::nullopt; }

common::Result<std::filesystem::path> scope_config_path(const security::RuleScope scope,
                                                        const std::filesystem::path &workdir) {
  switch (scope) {
  case security::RuleScope::User: {
    const auto dir = user_config_dir();
    if (!dir.ok()) {
      return common::Result<std::filesystem::path>::failure(dir.error());
    }
    return common::Result<std::filesystem::path>::success(dir.value() / kSettingsFile);
  }
  case security::RuleScope::Project:
    return common::Result<std::filesystem::path>::success(workdir / kConfigFolder / kSettingsFile);
  case security::RuleScope::Local:
    return common::Result<std::filesystem::path>::success(workdir / kConfigFolder /
                                                          kLocalSettingsFile);
  case security::RuleScope::Session:
    break;
  }
  return common::Result<std::filesystem::path>::failure("session rules are not stored on disk");
}

ScopeSettings parse_scope_settings(const std::string &json, const security::RuleScope scope) {
  ScopeSettings settings;
  settings.exists = true;
  if (common::trim(json).empty()) {
    return settings;
  }
  if (const auto valid = common::json_validate(json); !valid.ok()) {
    settings.malformed = true;
    settings.warnings.push_back(valid.error());
    return settings;
  }
  const std::size_t start = common::json_skip_ws(json, 0);
  if (json[start] != '{') {
    settings.malformed = true;
    settings.warnings.push_back("top level is not an object");
    return settings;
  }

  const std::string permissions = common::json_get_object(json, "permissions");
  if (permissions.empty() && common::json_get_raw(json, "permissions").has_value()) {
    settings.warnings.push_back("\"permissions\" is not an object; ignored");
  }

  auto mode_text = permissions.empty() ? std::nullopt
                                        : common::json_get_string(permissions, "defaultMode");
  if (!mode_text.has_value()) {
    mode_text = common::json_get_string(json, "defaultMode");
  }
  if (mode_text.has_value()) {
    auto mode = security::mode_from_string(*mode_text);
    if (mode.ok()) {
      settings.default_mode = mode.value();
    } else {
      settings.warnings.push_back(mode.error());
    }
  }

  if (!permissions.empty()) {
    parse_rule_list(permissions, "allow", scope, settings.allow, settings.warnings);
    parse_rule_list(permissions, "deny", scope, settings.deny, settings.warnings);
    settings.additional_directories =
        common::json_get_string_array(permissions, "additionalDirectories");
  }
  return settings;
}

ScopeSettings load_scope_settings(const std::filesystem::path &path,
                                  const security::RuleScope scope) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ScopeSettings{};
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    ScopeSettings settings;
    settings.exists = true;
    settings.malformed = true;
    settings.warnings.push_back(content.error());
    observability::record_warning(kComponent, path.string() + ": " + content.error());
    return settings;
  }
  auto settings = parse_scope_settings(content.value(), scope);
  for (const auto &warning : settings.warnings) {
    observability::record_warning(kComponent, path.string() + ": " + warning);
  }
  return settings;
}

ConfigResolver::ConfigResolver(std::filesystem::path workdir)
    : workdir_(common::resolve_path(workdir, {})) {}

common::Result<std::filesystem::path>
ConfigResolver::scope_path(const security::RuleScope scope) const {
  return scope_config_path(scope, workdir_);
}

std::vector<std::pair<security::RuleScope, std::filesystem::path>>
ConfigResolver::scope_paths() const {
  std::vector<std::pair<security::RuleScope, std::filesystem::path>> out;
  for (const auto scope :
       {security::RuleScope::Local, security::RuleScope::Project, security::RuleScope::User}) {
    const auto path = scope_path(scope);
    if (path.ok()) {
      out.emplace_back(scope, path.value());
    } else {
      observability::record_warning(kComponent, "skipping " + security::scope_to_string(scope) +
                                                    " settings: " + path.error());
    }
  }
  return out;
}

std::vector<ScopeSettings> ConfigResolver::load_all() const {
  std::vector<ScopeSettings> out;
  for (const auto &[scope, path] : scope_paths()) {
    out.push_back(load_scope_settings(path, scope));
  }
  return out;
}

std::optional<security::PermissionMode> ConfigResolver::resolve_configured_default_mode() const {
  for (const auto &settings : load_all()) {
    if (settings.default_mode.has_value()) {
      return settings.default_mode;
    }
  }
  return std::nullopt;
}

security::PermissionMode
ConfigResolver::resolve_default_mode(const std::optional<security::PermissionMode> override_mode) const {
  if (override_mode.has_value()) {
    return *override_mode;
  }
  return resolve_configured_default_mode().value_or(security::PermissionMode::Default);
}

RuleSets ConfigResolver::resolve_rule_sets() const {
  RuleSets sets;
  for (const auto &settings : load_all()) {
    for (const auto &rule : settings.allow) {
      add_unique(sets.allow, rule);
    }
    for (const auto &rule : settings.deny) {
      add_unique(sets.deny, rule);
    }
    for (const auto &dir : settings.additional_directories) {
      if (std::find(sets.additional_directories.begin(), sets.additional_directories.end(), dir) ==
          sets.additional_directories.end()) {
        sets.additional_directories.push_back(dir);
      }
    }
  }
  return sets;
}

common::Status ConfigResolver::persist_rule(const security::RuleScope scope,
                                            const security::PermissionRule &rule,
                                            const security::RuleList list) {
  if (list == security::RuleList::Allow && rule.tool_name == security::kBashTool &&
      rule.kind == security::RuleKind::Glob && !rule.tool_wide() &&
      security::is_dangerous_base(rule.pattern)) {
    return common::Status::error("refusing glob allow rule for dangerous command: " +
                                 rule.to_string());
  }
  const auto path = scope_path(scope);
  if (!path.ok()) {
    return path.status();
  }

  const std::string key = list_key(list);
  const auto status = update_document(
      path.value(),
      [&](const std::string &document) -> common::Result<std::optional<std::string>> {
        const auto permissions = permissions_object(document);
        if (!permissions.ok()) {
          return common::Result<std::optional<std::string>>::failure(permissions.error());
        }
        auto entries = common::json_get_string_array(permissions.value(), key);
        if (contains_rule(entries, rule)) {
          return common::Result<std::optional<std::string>>::success(std::nullopt);
        }
        entries.push_back(rule.to_string());
        const std::string updated =
            common::json_set_member(permissions.value(), key, common::json_string_array(entries));
        return common::Result<std::optional<std::string>>::success(
            common::json_set_member(document, "permissions", updated));
      });

  if (status.ok()) {
    observability::record_rule_change("persisted", std::string(key) + " " + rule.to_string(),
                                      security::scope_to_string(scope));
  } else {
    observability::record_error(kComponent, "persist " + rule.to_string() + " failed: " +
                                                status.error());
  }
  return status;
}

common::Status ConfigResolver::remove_rule(const security::RuleScope scope,
                                           const security::PermissionRule &rule,
                                           const security::RuleList list) {
  const auto path = scope_path(scope);
  if (!path.ok()) {
    return path.status();
  }
  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    return common::Status::error("no " + security::scope_to_string(scope) + " settings file");
  }

  bool removed = false;
  const std::string key = list_key(list);
  const auto status = update_document(
      path.value(),
      [&](const std::string &document) -> common::Result<std::optional<std::string>> {
        const auto permissions = permissions_object(document);
        if (!permissions.ok()) {
          return common::Result<std::optional<std::string>>::failure(permissions.error());
        }
        auto entries = common::json_get_string_array(permissions.value(), key);
        const auto before = entries.size();
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&rule](const std::string &text) {
                                       const auto parsed = security::parse_rule(text);
                                       return parsed.ok() && parsed.value().same_rule(rule);
                                     }),
                      entries.end());
        if (entries.size() == before) {
          return common::Result<std::optional<std::string>>::success(std::nullopt);
        }
        removed = true;
        const std::string updated =
            common::json_set_member(permissions.value(), key, common::json_string_array(entries));
        return common::Result<std::optional<std::string>>::success(
            common::json_set_member(document, "permissions", updated));
      });

  if (!status.ok()) {
    return status;
  }
  if (!removed) {
    return common::Status::error(rule.to_string() + " is not in the " +
                                 security::scope_to_string(scope) + " " + key + " list");
  }
  observability::record_rule_change("removed", std::string(key) + " " + rule.to_string(),
                                    security::scope_to_string(scope));
  return common::Status::success();
}

common::Status ConfigResolver::set_default_mode(const security::RuleScope scope,
                                                const security::PermissionMode mode) {
  const auto path = scope_path(scope);
  if (!path.ok()) {
    return path.status();
  }
  return update_document(
      path.value(),
      [mode](const std::string &document) -> common::Result<std::optional<std::string>> {
        const auto permissions = permissions_object(document);
        if (!permissions.ok()) {
          return common::Result<std::optional<std::string>>::failure(permissions.error());
        }
        const std::string updated = common::json_set_member(
            permissions.value(), "defaultMode", common::json_quote(security::mode_to_string(mode)));
        return common::Result<std::optional<std::string>>::success(
            common::json_set_member(document, "permissions", updated));
      });
}

security::ManagerOptions build_manager_options(const std::shared_ptr<ConfigResolver> &resolver,
                                               const std::optional<security::PermissionMode> cli_override) {
  security::ManagerOptions options;
  options.cli_mode_override = cli_override;
  if (resolver == nullptr) {
    return options;
  }
  auto rules = resolver->resolve_rule_sets();
  options.configured_default_mode = resolver->resolve_configured_default_mode();
  options.allowed_rules = std::move(rules.allow);
  options.denied_rules = std::move(rules.deny);
  options.additional_directories = std::move(rules.additional_directories);
  options.workdir = resolver->workdir();
  options.resolver = resolver;
  return options;
}

} // namespace trustgate::config

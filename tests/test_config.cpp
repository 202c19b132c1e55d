#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "trustgate/common/json_util.hpp"
#include "trustgate/config/config.hpp"
#include "trustgate/config/watcher.hpp"
#include "trustgate/security/permission_manager.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

const char *kProjectFile = ".trustgate/settings.json";
const char *kLocalFile = ".trustgate/settings.local.json";

bool has_rule(const std::vector<trustgate::security::PermissionRule> &rules,
              const std::string &text) {
  for (const auto &rule : rules) {
    if (rule.to_string() == text) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<trustgate::tests::TestCase> &tests) {
  using trustgate::tests::require;
  namespace sec = trustgate::security;
  namespace cfg = trustgate::config;
  namespace common = trustgate::common;

  tests.push_back({"json_validate_accepts_and_rejects", [] {
                     require(common::json_validate("{\"a\": [1, true, null, \"x\"]}").ok(),
                             "valid document");
                     require(common::json_validate("  {}  ").ok(), "empty object");
                     require(!common::json_validate("{\"a\": }").ok(), "missing value");
                     require(!common::json_validate("{\"a\": 1,}").ok(), "trailing comma");
                     require(!common::json_validate("{} {}").ok(), "trailing garbage");
                   }});

  tests.push_back({"json_set_member_keeps_other_members", [] {
                     const std::string doc = "{\n  \"model\": \"x\",\n  \"n\": 2\n}";
                     const auto updated = common::json_set_member(doc, "n", "3");
                     require(common::json_get_raw(updated, "n") == std::optional<std::string>("3"),
                             "member replaced");
                     require(common::json_get_string(updated, "model") == "x", "model kept");
                     const auto added = common::json_set_member(doc, "extra", "[]");
                     require(common::json_validate(added).ok(), "appended member stays valid");
                     require(common::json_get_raw(added, "extra").has_value(), "member appended");
                   }});

  tests.push_back({"json_string_array_round_trip_with_escapes", [] {
                     const std::vector<std::string> values = {"Bash(echo \"hi\")", "a\\b"};
                     const std::string doc =
                         "{\"list\": " + common::json_string_array(values) + "}";
                     require(common::json_get_string_array(doc, "list") == values,
                             "escapes survive");
                   }});

  tests.push_back({"config_scope_paths", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     require(resolver.scope_path(sec::RuleScope::User).value() ==
                                 home.path() / "settings.json",
                             "user file");
                     require(resolver.scope_path(sec::RuleScope::Project).value() ==
                                 ws.path() / ".trustgate" / "settings.json",
                             "project file");
                     require(resolver.scope_path(sec::RuleScope::Local).value() ==
                                 ws.path() / ".trustgate" / "settings.local.json",
                             "local file");
                     require(!resolver.scope_path(sec::RuleScope::Session).ok(),
                             "session has no file");
                     const auto paths = resolver.scope_paths();
                     require(paths.size() == 3 && paths[0].first == sec::RuleScope::Local &&
                                 paths[2].first == sec::RuleScope::User,
                             "precedence order local, project, user");
                   }});

  tests.push_back({"config_dir_from_environment", [] {
                     trustgate::testing::TempWorkspace home;
                     cfg::clear_config_dir_override();
                     trustgate::testing::EnvGuard env("TRUSTGATE_CONFIG_DIR", home.path().string());
                     require(cfg::user_config_dir().value() == home.path(), "env var honoured");
                     cfg::set_config_dir_override(home.path() / "other");
                     require(cfg::user_config_dir().value() == home.path() / "other",
                             "override beats env");
                     cfg::clear_config_dir_override();
                   }});

  tests.push_back({"config_default_mode_precedence", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     require(resolver.resolve_default_mode() == sec::PermissionMode::Default,
                             "nothing configured");

                     home.create_file("settings.json",
                                      R"json({"permissions": {"defaultMode": "acceptEdits"}})json");
                     require(resolver.resolve_default_mode() == sec::PermissionMode::AcceptEdits,
                             "user scope");

                     ws.create_file(kProjectFile,
                                    R"json({"permissions": {"defaultMode": "bypassPermissions"}})json");
                     require(resolver.resolve_default_mode() ==
                                 sec::PermissionMode::BypassPermissions,
                             "project beats user");

                     ws.create_file(kLocalFile, R"json({"permissions": {"defaultMode": "default"}})json");
                     require(resolver.resolve_default_mode() == sec::PermissionMode::Default,
                             "local beats project");

                     require(resolver.resolve_default_mode(sec::PermissionMode::AcceptEdits) ==
                                 sec::PermissionMode::AcceptEdits,
                             "explicit override beats files");
                   }});

  tests.push_back({"config_invalid_mode_falls_through_with_warning", [] {
                     auto observer = std::make_shared<trustgate::testing::CapturingObserver>();
                     trustgate::testing::ObserverGuard guard(observer);
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     ws.create_file(kLocalFile, R"json({"permissions": {"defaultMode": "yolo"}})json");
                     ws.create_file(kProjectFile, R"json({"defaultMode": "acceptEdits"})json");
                     cfg::ConfigResolver resolver(ws.path());
                     require(resolver.resolve_default_mode() == sec::PermissionMode::AcceptEdits,
                             "invalid local mode skipped, legacy top-level key read");
                     require(observer->warning_count() >= 1, "invalid mode is reported");
                   }});

  tests.push_back({"config_malformed_file_is_empty_with_warning", [] {
                     auto observer = std::make_shared<trustgate::testing::CapturingObserver>();
                     trustgate::testing::ObserverGuard guard(observer);
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     ws.create_file(kProjectFile, "{\"permissions\": {\"allow\": [");
                     cfg::ConfigResolver resolver(ws.path());
                     const auto sets = resolver.resolve_rule_sets();
                     require(sets.allow.empty() && sets.deny.empty(), "nothing loaded");
                     require(observer->warning_count() >= 1, "malformed file is reported");
                   }});

  tests.push_back({"config_parse_skips_bad_entries", [] {
                     const auto settings = cfg::parse_scope_settings(
                         R"json({"permissions": {"allow": ["Bash(ls)", 3, "Bash(", "Read"],
                                             "additionalDirectories": ["../shared"]}})json",
                         sec::RuleScope::Project);
                     require(settings.allow.size() == 2, "two valid rules");
                     require(settings.allow[0].scope == sec::RuleScope::Project, "scope tagged");
                     require(settings.warnings.size() == 2, "two entries rejected");
                     require(settings.additional_directories.size() == 1, "directories read");
                   }});

  tests.push_back({"config_rule_sets_union_without_duplicates", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     home.create_file("settings.json",
                                      R"json({"permissions": {"allow": ["Bash(npm test)", "Read"]}})json");
                     ws.create_file(kProjectFile,
                                    R"json({"permissions": {"allow": ["Bash(npm test)"],
                                                        "deny": ["Bash(git push *)"]}})json");
                     ws.create_file(kLocalFile,
                                    R"json({"permissions": {"allow": ["Bash(make *)"]}})json");
                     cfg::ConfigResolver resolver(ws.path());
                     const auto sets = resolver.resolve_rule_sets();
                     require(sets.allow.size() == 3, "duplicate collapsed");
                     require(has_rule(sets.allow, "Bash(make *)"), "local rule");
                     require(has_rule(sets.allow, "Read"), "user rule");
                     require(sets.deny.size() == 1 && sets.deny[0].to_string() == "Bash(git push *)",
                             "deny rule");
                     for (const auto &rule : sets.allow) {
                       if (rule.to_string() == "Bash(npm test)") {
                         require(rule.scope == sec::RuleScope::Project,
                                 "first scope in precedence order wins provenance");
                       }
                     }
                   }});

  tests.push_back({"config_persist_creates_file_and_is_idempotent", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     const auto rule = sec::make_rule("Bash", "npm install *");
                     require(resolver.persist_rule(sec::RuleScope::Local, rule).ok(), "persist");
                     require(resolver.persist_rule(sec::RuleScope::Local, rule).ok(), "again");
                     const auto content = ws.read_file(kLocalFile);
                     require(common::json_validate(content).ok(), "valid json written");
                     const auto sets = resolver.resolve_rule_sets();
                     require(sets.allow.size() == 1, "stored once");
                     require(sets.allow[0].scope == sec::RuleScope::Local, "local scope");
                   }});

  tests.push_back({"config_persist_preserves_unknown_keys", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     ws.create_file(kProjectFile,
                                    "{\n  \"model\": \"big\",\n  \"permissions\": {\n"
                                    "    \"defaultMode\": \"acceptEdits\"\n  }\n}\n");
                     cfg::ConfigResolver resolver(ws.path());
                     require(resolver
                                 .persist_rule(sec::RuleScope::Project,
                                               sec::make_rule("Bash", "git push *"),
                                               sec::RuleList::Deny)
                                 .ok(),
                             "persist deny");
                     const auto content = ws.read_file(kProjectFile);
                     require(common::json_get_string(content, "model") == "big", "model kept");
                     require(resolver.resolve_default_mode() == sec::PermissionMode::AcceptEdits,
                             "mode kept");
                     require(has_rule(resolver.resolve_rule_sets().deny, "Bash(git push *)"),
                             "deny rule stored");
                   }});

  tests.push_back({"config_persist_refuses_dangerous_glob_allow", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     require(!resolver.persist_rule(sec::RuleScope::Local, sec::make_rule("Bash", "rm *"))
                                  .ok(),
                             "glob on rm refused");
                     require(!std::filesystem::exists(ws.path() / kLocalFile), "nothing written");
                     require(resolver
                                 .persist_rule(sec::RuleScope::Local,
                                               sec::make_rule("Bash", "rm -rf ./tmp"))
                                 .ok(),
                             "exact rm accepted");
                     require(resolver
                                 .persist_rule(sec::RuleScope::Local, sec::make_rule("Bash", "rm *"),
                                               sec::RuleList::Deny)
                                 .ok(),
                             "deny glob on rm accepted");
                   }});

  tests.push_back({"config_persist_never_clobbers_malformed_file", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     const std::string broken = "{\"permissions\": [oops";
                     ws.create_file(kLocalFile, broken);
                     cfg::ConfigResolver resolver(ws.path());
                     require(!resolver.persist_rule(sec::RuleScope::Local,
                                                    sec::make_rule("Bash", "npm test"))
                                  .ok(),
                             "write refused");
                     require(ws.read_file(kLocalFile) == broken, "file untouched");
                   }});

  tests.push_back({"config_concurrent_persists_all_land", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     std::atomic<int> failures{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 16; ++i) {
                       threads.emplace_back([&resolver, &failures, i]() {
                         const auto rule =
                             sec::make_rule("Bash", "tool" + std::to_string(i) + " *");
                         if (!resolver.persist_rule(sec::RuleScope::Local, rule).ok()) {
                           ++failures;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(failures == 0, "every persist succeeds");
                     require(resolver.resolve_rule_sets().allow.size() == 16,
                             "no write is lost");
                   }});

  tests.push_back({"config_remove_rule", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     require(!resolver.remove_rule(sec::RuleScope::Local, sec::make_rule("Bash", "ls"))
                                  .ok(),
                             "missing file is an error");
                     const auto rule = sec::make_rule("Bash", "make *");
                     require(resolver.persist_rule(sec::RuleScope::Local, rule).ok(), "persist");
                     require(resolver.persist_rule(sec::RuleScope::Local, sec::make_rule("Read", "*"))
                                 .ok(),
                             "persist second");
                     require(resolver.remove_rule(sec::RuleScope::Local, rule).ok(), "remove");
                     const auto sets = resolver.resolve_rule_sets();
                     require(sets.allow.size() == 1 && sets.allow[0].to_string() == "Read",
                             "only the other rule remains");
                     require(!resolver.remove_rule(sec::RuleScope::Local, rule).ok(),
                             "absent rule is an error");
                   }});

  tests.push_back({"config_set_default_mode", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     cfg::ConfigResolver resolver(ws.path());
                     require(resolver.set_default_mode(sec::RuleScope::User,
                                                       sec::PermissionMode::AcceptEdits)
                                 .ok(),
                             "set user mode");
                     require(std::filesystem::exists(home.path() / "settings.json"),
                             "user file created");
                     require(resolver.resolve_default_mode() == sec::PermissionMode::AcceptEdits,
                             "mode read back");
                   }});

  tests.push_back({"config_build_manager_options", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     ws.create_file(kProjectFile,
                                    R"json({"permissions": {"defaultMode": "acceptEdits",
                                                        "allow": ["Bash(make *)"],
                                                        "deny": ["Write(secrets/*)"],
                                                        "additionalDirectories": ["/opt/shared"]}})json");
                     auto resolver = std::make_shared<cfg::ConfigResolver>(ws.path());
                     const auto options =
                         cfg::build_manager_options(resolver, sec::PermissionMode::Default);
                     require(options.configured_default_mode == sec::PermissionMode::AcceptEdits,
                             "configured mode");
                     require(options.cli_mode_override == sec::PermissionMode::Default,
                             "cli override carried");
                     require(options.allowed_rules.size() == 1 && options.denied_rules.size() == 1,
                             "rules");
                     require(options.additional_directories.size() == 1, "directories");
                     require(options.workdir == ws.path(), "workdir");
                     require(options.resolver == resolver, "resolver kept for persistence");
                   }});

  tests.push_back({"config_fingerprint_tracks_content", [] {
                     trustgate::testing::TempWorkspace ws;
                     require(cfg::fingerprint_file(ws.path() / "missing.json").empty(),
                             "missing file has no fingerprint");
                     ws.create_file("a.json", "{}");
                     const auto first = cfg::fingerprint_file(ws.path() / "a.json");
                     require(first.size() == 64, "hex sha-256");
                     ws.create_file("a.json", "{ }");
                     require(cfg::fingerprint_file(ws.path() / "a.json") != first,
                             "content change changes fingerprint");
                   }});

  tests.push_back({"config_watcher_applies_changes", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     auto resolver = std::make_shared<cfg::ConfigResolver>(ws.path());
                     auto manager =
                         std::make_shared<sec::PermissionManager>(cfg::build_manager_options(resolver));
                     std::vector<sec::PermissionMode> seen_modes;
                     manager->set_mode_change_listener(
                         [&seen_modes](sec::PermissionMode mode) { seen_modes.push_back(mode); });

                     cfg::ConfigWatcher watcher(resolver, manager);
                     require(!watcher.poll_once(), "nothing changed yet");

                     ws.create_file(kProjectFile,
                                    R"json({"permissions": {"defaultMode": "bypassPermissions",
                                                        "deny": ["Bash(curl *)"]}})json");
                     require(watcher.poll_once(), "change detected");
                     require(manager->current_effective_mode() ==
                                 sec::PermissionMode::BypassPermissions,
                             "mode applied");
                     require(manager->denied_rules().size() == 1, "deny rule applied");
                     require(seen_modes.size() == 1 &&
                                 seen_modes[0] == sec::PermissionMode::BypassPermissions,
                             "listener told once");
                     require(!watcher.poll_once(), "no second reload");

                     std::filesystem::remove(ws.path() / kProjectFile);
                     require(watcher.poll_once(), "deletion detected");
                     require(manager->current_effective_mode() == sec::PermissionMode::Default,
                             "back to default");
                     require(manager->denied_rules().empty(), "deny rule gone");
                   }});

  tests.push_back({"config_watcher_background_thread", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     auto resolver = std::make_shared<cfg::ConfigResolver>(ws.path());
                     auto manager =
                         std::make_shared<sec::PermissionManager>(cfg::build_manager_options(resolver));
                     cfg::ConfigWatcher watcher(resolver, manager);
                     watcher.start(std::chrono::milliseconds(10));
                     require(watcher.is_running(), "running");
                     ws.create_file(kLocalFile, R"json({"permissions": {"allow": ["Bash(make *)"]}})json");
                     bool applied = false;
                     for (int i = 0; i < 200 && !applied; ++i) {
                       applied = manager->allowed_rules().size() == 1;
                       std::this_thread::sleep_for(std::chrono::milliseconds(10));
                     }
                     watcher.stop();
                     require(applied, "background poll applied the rule");
                     require(!watcher.is_running(), "stopped");
                   }});
}

#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "trustgate/common/json_util.hpp"
#include "trustgate/config/config.hpp"
#include "trustgate/security/permission_manager.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace sec = trustgate::security;

sec::PermissionRequest bash(const std::string &command) {
  return sec::PermissionRequest{
      .tool_name = "Bash", .tool_input = {{"command", command}}, .mode_override = std::nullopt};
}

sec::PermissionRequest write(const std::string &path) {
  return sec::PermissionRequest{
      .tool_name = "Write", .tool_input = {{"file_path", path}}, .mode_override = std::nullopt};
}

sec::ManagerOptions options_for(const trustgate::testing::TempWorkspace &ws) {
  sec::ManagerOptions options;
  options.workdir = ws.path();
  return options;
}

sec::PermissionRule rule(const std::string &text) {
  return sec::parse_rule(text).value();
}

} // namespace

void register_permission_tests(std::vector<trustgate::tests::TestCase> &tests) {
  using trustgate::tests::require;
  namespace sec = trustgate::security;

  tests.push_back({"permission_unrestricted_tool_always_allowed", [] {
                     trustgate::testing::TempWorkspace ws;
                     sec::PermissionManager manager(options_for(ws));
                     const auto outcome = manager.check_permission(
                         {.tool_name = "Read", .tool_input = {{"file_path", "/etc/passwd"}},
                          .mode_override = std::nullopt});
                     require(sec::is_allowed(outcome), "read needs no confirmation");
                     require(!manager.is_restricted_tool("Grep"), "grep unrestricted");
                     require(manager.is_restricted_tool("Bash"), "bash restricted");
                   }});

  tests.push_back({"permission_no_consumer_denies", [] {
                     auto observer = std::make_shared<trustgate::testing::CapturingObserver>();
                     trustgate::testing::ObserverGuard guard(observer);
                     trustgate::testing::TempWorkspace ws;
                     sec::PermissionManager manager(options_for(ws));
                     const auto outcome = manager.check_permission(bash("npm test"));
                     require(!sec::is_allowed(outcome) && !sec::is_cancelled(outcome), "denied");
                     require(sec::outcome_message(outcome) ==
                                 "Tool 'Bash' requires permission approval. No confirmation "
                                 "consumer configured.",
                             "explains the missing consumer");
                     require(observer->has_decision("deny", "no-consumer"), "decision recorded");
                   }});

  tests.push_back({"permission_deny_rule_message", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     options.denied_rules = {rule("Bash(git push *)")};
                     options.cli_mode_override = sec::PermissionMode::BypassPermissions;
                     sec::PermissionManager manager(options);
                     const auto outcome = manager.check_permission(bash("git status && git push origin"));
                     require(!sec::is_allowed(outcome), "deny rule beats bypass mode");
                     require(sec::outcome_message(outcome) ==
                                 "Access to tool 'Bash' is explicitly denied by rule: "
                                 "Bash(git push *)",
                             "deny message names the rule");
                   }});

  tests.push_back({"permission_overlap_policy", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     options.allowed_rules = {rule("Bash(git *)")};
                     options.denied_rules = {rule("Bash(git push *)")};
                     sec::PermissionManager deny_wins(options);
                     require(!sec::is_allowed(deny_wins.check_permission(bash("git push origin"))),
                             "deny wins by default");
                     require(sec::is_allowed(deny_wins.check_permission(bash("git status"))),
                             "non-overlapping allow still works");

                     options.overlap_policy = sec::OverlapPolicy::AllowWins;
                     sec::PermissionManager allow_wins(options);
                     require(sec::is_allowed(allow_wins.check_permission(bash("git push origin"))),
                             "allow wins when configured");
                     require(!sec::is_allowed(allow_wins.check_permission(bash("git push; make"))),
                             "uncovered part leaves the deny in force");

                     require(sec::overlap_policy_from_string("allow-wins").value() ==
                                 sec::OverlapPolicy::AllowWins,
                             "parse policy");
                     require(!sec::overlap_policy_from_string("whatever").ok(), "reject policy");
                   }});

  tests.push_back({"permission_allow_and_temporary_rules", [] {
                     auto observer = std::make_shared<trustgate::testing::CapturingObserver>();
                     trustgate::testing::ObserverGuard guard(observer);
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     options.allowed_rules = {rule("Bash(npm test)")};
                     sec::PermissionManager manager(options);
                     require(sec::is_allowed(manager.check_permission(bash("npm test"))),
                             "allow rule");
                     require(observer->has_decision("allow", "allow-rule"), "allow-rule source");

                     require(!sec::is_allowed(manager.check_permission(bash("make"))),
                             "not granted yet");
                     manager.add_temporary_rules({rule("Bash(make *)"), rule("Bash(make *)")});
                     require(manager.temporary_rules().size() == 1, "deduplicated");
                     require(manager.temporary_rules()[0].scope == sec::RuleScope::Session,
                             "temporary rules are session scoped");
                     require(sec::is_allowed(manager.check_permission(bash("make all"))),
                             "temporary rule");
                     require(observer->has_decision("allow", "temporary-rule"), "temp source");
                     manager.clear_temporary_rules();
                     require(!sec::is_allowed(manager.check_permission(bash("make all"))),
                             "cleared");
                   }});

  tests.push_back({"permission_bash_wide_rule_and_safe_commands", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     sec::PermissionManager manager(options);
                     require(sec::is_allowed(manager.check_permission(bash("pwd && ls src"))),
                             "safe commands need no rule");
                     require(!sec::is_allowed(manager.check_permission(bash("ls /"))),
                             "listing outside the zone needs a rule");
                     manager.update_allowed_rules({rule("Bash")});
                     require(sec::is_allowed(manager.check_permission(bash("rm -rf build"))),
                             "bare tool rule allows everything");
                   }});

  tests.push_back({"permission_authorizer_verdicts", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     options.cli_mode_override = sec::PermissionMode::BypassPermissions;
                     sec::PermissionManager manager(options);

                     manager.set_authorizer(std::make_shared<sec::CallbackAuthorizer>(
                         [](const sec::PermissionRequest &request) -> std::optional<sec::PermissionDecision> {
                           const auto command = request.tool_input.at("command");
                           if (command == "deploy") {
                             return sec::PermissionDecision::deny("deploys are frozen");
                           }
                           if (command == "silent") {
                             return sec::PermissionDecision::deny("");
                           }
                           return std::nullopt;
                         }));
                     const auto denied = manager.check_permission(bash("deploy"));
                     require(!sec::is_allowed(denied), "authorizer runs before the mode");
                     require(sec::outcome_message(denied) == "deploys are frozen", "its message");
                     require(!sec::outcome_message(manager.check_permission(bash("silent"))).empty(),
                             "deny is never silent");
                     require(sec::is_allowed(manager.check_permission(bash("npm test"))),
                             "abstaining falls through to the mode");
                   }});

  tests.push_back({"permission_authorizer_failure_is_deny", [] {
                     auto observer = std::make_shared<trustgate::testing::CapturingObserver>();
                     trustgate::testing::ObserverGuard guard(observer);
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     options.cli_mode_override = sec::PermissionMode::BypassPermissions;
                     options.authorizer = std::make_shared<sec::CallbackAuthorizer>(
                         [](const sec::PermissionRequest &) -> std::optional<sec::PermissionDecision> {
                           throw std::runtime_error("policy service down");
                         });
                     sec::PermissionManager manager(options);
                     const auto outcome = manager.check_permission(bash("npm test"));
                     require(!sec::is_allowed(outcome), "failure denies");
                     require(sec::outcome_message(outcome) == "authorization unavailable",
                             "generic message");
                     require(observer->error_count() == 1, "error recorded");

                     auto odd_options = options_for(ws);
                     odd_options.authorizer = std::make_shared<sec::CallbackAuthorizer>(
                         [](const sec::PermissionRequest &) -> std::optional<sec::PermissionDecision> {
                           throw 42;
                         });
                     sec::PermissionManager odd_manager(odd_options);
                     const auto odd = odd_manager.check_permission(bash("git status --short"));
                     require(!sec::is_allowed(odd) && !sec::is_cancelled(odd),
                             "non-standard throw denies");
                     require(sec::outcome_message(odd) == "authorization unavailable",
                             "same generic message");
                     require(observer->error_count() == 2, "second error recorded");
                   }});

  tests.push_back({"permission_mode_precedence", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     options.configured_default_mode = sec::PermissionMode::BypassPermissions;
                     sec::PermissionManager manager(options);
                     require(manager.current_effective_mode() ==
                                 sec::PermissionMode::BypassPermissions,
                             "configured mode");
                     require(sec::is_allowed(manager.check_permission(bash("make"))),
                             "bypass allows");

                     manager.set_cli_mode_override(sec::PermissionMode::Default);
                     require(manager.current_effective_mode() == sec::PermissionMode::Default,
                             "cli override beats configured");
                     require(!sec::is_allowed(manager.check_permission(bash("make"))),
                             "default mode asks, and nothing answers");

                     auto request = bash("make");
                     request.mode_override = sec::PermissionMode::BypassPermissions;
                     require(sec::is_allowed(manager.check_permission(request)),
                             "per-call override beats cli override");
                     require(manager.current_effective_mode(sec::PermissionMode::AcceptEdits) ==
                                 sec::PermissionMode::AcceptEdits,
                             "call override reported");
                   }});

  tests.push_back({"permission_mode_listener_fires_on_change_only", [] {
                     trustgate::testing::TempWorkspace ws;
                     sec::PermissionManager manager(options_for(ws));
                     std::vector<sec::PermissionMode> modes;
                     manager.set_mode_change_listener(
                         [&modes](sec::PermissionMode mode) { modes.push_back(mode); });
                     manager.update_configured_default_mode(sec::PermissionMode::AcceptEdits);
                     manager.update_configured_default_mode(sec::PermissionMode::AcceptEdits);
                     manager.set_cli_mode_override(sec::PermissionMode::AcceptEdits);
                     manager.set_cli_mode_override(sec::PermissionMode::BypassPermissions);
                     manager.set_cli_mode_override(std::nullopt);
                     require(modes.size() == 3, "only effective changes are reported");
                     require(modes[0] == sec::PermissionMode::AcceptEdits &&
                                 modes[1] == sec::PermissionMode::BypassPermissions &&
                                 modes[2] == sec::PermissionMode::AcceptEdits,
                             "in order, dropping the override restores the configured mode");
                     manager.set_mode_change_listener(nullptr);
                     manager.update_configured_default_mode(std::nullopt);
                   }});

  tests.push_back({"permission_accept_edits_inside_zone", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace shared;
                     auto options = options_for(ws);
                     options.configured_default_mode = sec::PermissionMode::AcceptEdits;
                     options.additional_directories = {shared.path().string()};
                     sec::PermissionManager manager(options);
                     require(sec::is_allowed(manager.check_permission(write("src/main.cpp"))),
                             "relative path in workdir");
                     require(sec::is_allowed(
                                 manager.check_permission(write((shared.path() / "x.txt").string()))),
                             "additional directory");
                     require(!sec::is_allowed(manager.check_permission(write("/etc/hosts"))),
                             "outside the zone is not auto-approved");
                     require(!sec::is_allowed(manager.check_permission(write("../escape.txt"))),
                             "dot-dot escape is outside");
                     require(!sec::is_allowed(manager.check_permission(
                                 {.tool_name = "Edit", .tool_input = {}, .mode_override = std::nullopt})),
                             "edit without a path is not auto-approved");
                     require(!sec::is_allowed(manager.check_permission(bash("make"))),
                             "acceptEdits does not cover Bash");
                   }});

  tests.push_back({"permission_workdir_update_moves_zone", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace other;
                     auto options = options_for(ws);
                     options.configured_default_mode = sec::PermissionMode::AcceptEdits;
                     sec::PermissionManager manager(options);
                     const auto target = (other.path() / "a.txt").string();
                     require(!sec::is_allowed(manager.check_permission(write(target))), "outside");
                     manager.update_workdir(other.path());
                     require(sec::is_allowed(manager.check_permission(write(target))), "now inside");
                     manager.update_workdir(ws.path());
                     manager.update_additional_directories({other.path().string()});
                     require(sec::is_allowed(manager.check_permission(write(target))),
                             "inside via additional directory");
                   }});

  tests.push_back({"permission_confirmation_context", [] {
                     trustgate::testing::TempWorkspace ws;
                     sec::PermissionManager manager(options_for(ws));

                     auto ctx = manager.create_confirmation_context(
                         "Bash", {{"command", "npm install lodash"}});
                     require(ctx.suggested_pattern == "npm install *", "pattern for single command");
                     require(!ctx.hide_persistent_option, "persistent option offered");

                     ctx = manager.create_confirmation_context("Bash",
                                                               {{"command", "npm test && make"}});
                     require(!ctx.suggested_pattern.has_value(), "no pattern for compound");
                     require(ctx.suggested_rules.size() == 2, "one rule per part");

                     ctx = manager.create_confirmation_context("Bash", {{"command", "cd /etc && ls"}});
                     require(ctx.hide_persistent_option, "out of bounds hides the option");

                     ctx = manager.create_confirmation_context("Bash", {{"command", "rm -rf ./tmp"}});
                     require(!ctx.hide_persistent_option, "dangerous commands may be trusted exactly");
                     require(ctx.suggested_rules.size() == 1 &&
                                 ctx.suggested_rules[0].kind == sec::RuleKind::Exact,
                             "only an exact rule");

                     ctx = manager.create_confirmation_context("Bash", {{"command", "rm *.o"}});
                     require(ctx.hide_persistent_option, "nothing persistable hides the option");
                   }});

  tests.push_back({"permission_user_answers", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     auto queue = std::make_shared<sec::ConfirmationQueue>();
                     options.confirmation_queue = queue;
                     sec::PermissionManager manager(options);

                     trustgate::testing::QueueResponder responder(
                         queue, [](const sec::ConfirmationView &view) -> sec::ConfirmationResult {
                           const auto command = view.request.tool_input.at("command");
                           if (command == "once") {
                             return sec::ConfirmationChoice::allow_once();
                           }
                           if (command == "no") {
                             return sec::ConfirmationChoice::deny();
                           }
                           if (command == "instead") {
                             return sec::ConfirmationChoice::deny_with_alternative("use make");
                           }
                           return sec::ConfirmationCancelled{.reason = "escape pressed"};
                         });

                     require(sec::is_allowed(manager.check_permission(bash("once"))), "allow once");
                     require(manager.allowed_rules().empty(), "allow once remembers nothing");

                     const auto denied = manager.check_permission(bash("no"));
                     require(!sec::is_allowed(denied), "deny");
                     require(sec::outcome_message(denied) ==
                                 "The user denied permission to use tool 'Bash'",
                             "default deny message");

                     const auto alt = manager.check_permission(bash("instead"));
                     require(sec::outcome_message(alt) ==
                                 "The user declined this tool call and asked for something else "
                                 "instead: use make",
                             "alternative instructions");

                     const auto cancelled = manager.check_permission(bash("esc"));
                     require(sec::is_cancelled(cancelled), "cancel is distinct from deny");
                     require(sec::outcome_message(cancelled) == "escape pressed", "reason kept");
                     responder.stop();
                     require(responder.errors().empty(), "every item resolved");
                   }});

  tests.push_back({"permission_allow_always_persists_and_remembers", [] {
                     trustgate::testing::TempWorkspace ws;
                     trustgate::testing::TempWorkspace home;
                     trustgate::testing::ConfigDirGuard dir(home.path());
                     auto resolver = std::make_shared<trustgate::config::ConfigResolver>(ws.path());
                     auto options = trustgate::config::build_manager_options(resolver);
                     auto queue = std::make_shared<sec::ConfirmationQueue>();
                     options.confirmation_queue = queue;
                     sec::PermissionManager manager(options);

                     {
                       trustgate::testing::QueueResponder responder(
                           queue, trustgate::testing::QueueResponder::Respond(
                                      [](const sec::ConfirmationView &) {
                                        return trustgate::testing::always(
                                            sec::ConfirmationChoice::allow_always());
                                      }));
                       require(sec::is_allowed(manager.check_permission(bash("npm install lodash"))),
                               "allowed");
                       require(sec::is_allowed(manager.check_permission(bash("rm -rf ./tmp"))),
                               "allowed");
                       require(responder.seen().size() == 2, "both asked once");
                     }

                     const auto content = ws.read_file(".trustgate/settings.local.json");
                     require(content.find("Bash(npm install *)") != std::string::npos,
                             "smart rule persisted to local scope");
                     require(content.find("Bash(rm -rf ./tmp)") != std::string::npos,
                             "exact rule persisted for dangerous command");

                     queue->clear_listener();
                     manager.set_confirmation_queue(nullptr);
                     require(sec::is_allowed(manager.check_permission(bash("npm install express"))),
                             "remembered in memory");
                     require(sec::is_allowed(manager.check_permission(bash("rm -rf ./tmp"))),
                             "exact command remembered");
                     require(!sec::is_allowed(manager.check_permission(bash("rm -rf ./src"))),
                             "other rm still asks");
                   }});

  tests.push_back({"permission_allow_always_without_resolver_is_session_only", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     auto queue = std::make_shared<sec::ConfirmationQueue>();
                     options.confirmation_queue = queue;
                     sec::PermissionManager manager(options);
                     trustgate::testing::QueueResponder responder(
                         queue, [](const sec::ConfirmationView &) -> sec::ConfirmationResult {
                           return sec::ConfirmationChoice::allow_always();
                         });
                     require(sec::is_allowed(manager.check_permission(bash("cargo build --release"))),
                             "allowed");
                     require(manager.allowed_rules().size() == 1 &&
                                 manager.allowed_rules()[0].to_string() == "Bash(cargo build *)",
                             "rule held in memory");
                     require(!std::filesystem::exists(ws.path() / ".trustgate"),
                             "nothing written");
                   }});

  tests.push_back({"permission_allow_always_ignored_when_hidden", [] {
                     trustgate::testing::TempWorkspace ws;
                     auto options = options_for(ws);
                     auto queue = std::make_shared<sec::ConfirmationQueue>();
                     options.confirmation_queue = queue;
                     sec::PermissionManager manager(options);
                     trustgate::testing::QueueResponder responder(
                         queue, [](const sec::ConfirmationView &) -> sec::ConfirmationResult {
                           return sec::ConfirmationChoice::allow_always();
                         });
                     require(sec::is_allowed(manager.check_permission(bash("cd /etc && make"))),
                             "allowed for this call");
                     require(manager.allowed_rules().empty(), "nothing remembered");
                   }});
}

#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "trustgate/cli/commands.hpp"
#include "trustgate/observability/global.hpp"

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

// Runs the CLI against a private workspace and settings directory.
class CliHarness {
public:
  CliHarness() : dir_guard_(home_.path()), observer_guard_(trustgate::observability::get_global_observer()) {}

  CliRun run(std::vector<std::string> args, const std::string &input = "") {
    std::vector<std::string> full = {"--log", "none", "--config-dir", home_.path().string(),
                                     "--workdir", ws_.path().string()};
    full.insert(full.end(), args.begin(), args.end());
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    CliRun result;
    result.code = trustgate::cli::run_cli(std::move(full), in, out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
  }

  [[nodiscard]] const trustgate::testing::TempWorkspace &workspace() const { return ws_; }

private:
  trustgate::testing::TempWorkspace ws_;
  trustgate::testing::TempWorkspace home_;
  trustgate::testing::ConfigDirGuard dir_guard_;
  trustgate::testing::ObserverGuard observer_guard_;
};

bool contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}

} // namespace

void register_cli_tests(std::vector<trustgate::tests::TestCase> &tests) {
  using trustgate::tests::require;

  tests.push_back({"cli_help_and_unknown_command", [] {
                     CliHarness cli;
                     const auto help = cli.run({"help"});
                     require(help.code == 0 && contains(help.out, "Usage: trustgate"), "help");
                     const auto unknown = cli.run({"frobnicate"});
                     require(unknown.code == 1 && contains(unknown.err, "unknown command"),
                             "unknown command fails");
                     const auto bad_mode = cli.run({"--permission-mode", "yolo", "rules"});
                     require(bad_mode.code == 1, "bad mode rejected");
                   }});

  tests.push_back({"cli_pattern_command", [] {
                     CliHarness cli;
                     const auto npm = cli.run({"pattern", "npm", "install", "lodash"});
                     require(npm.out == "pattern: npm install *\ndangerous: no\n", npm.out);
                     const auto rm = cli.run({"pattern", "rm", "-rf", "build"});
                     require(rm.out == "pattern: (exact match only)\ndangerous: yes\n", rm.out);
                   }});

  tests.push_back({"cli_allow_rules_remove", [] {
                     CliHarness cli;
                     require(cli.run({"allow", "Bash(make *)"}).code == 0, "allow");
                     require(std::filesystem::exists(cli.workspace().path() / ".trustgate" /
                                                     "settings.local.json"),
                             "local file written by default");
                     auto rules = cli.run({"rules"});
                     require(contains(rules.out, "  Bash(make *)  [local]"), rules.out);
                     require(contains(rules.out, "mode: default"), "mode shown");

                     require(cli.run({"remove", "Bash(make *)"}).code == 0, "remove");
                     rules = cli.run({"rules"});
                     require(!contains(rules.out, "Bash(make *)"), "gone");
                     require(cli.run({"remove", "Bash(make *)"}).code == 1, "second remove fails");
                   }});

  tests.push_back({"cli_refuses_dangerous_glob", [] {
                     CliHarness cli;
                     const auto run = cli.run({"allow", "Bash(rm *)"});
                     require(run.code == 1 && contains(run.err, "refusing"), run.err);
                     require(cli.run({"allow", "Bash(rm -rf ./tmp)", "--scope", "project"}).code == 0,
                             "exact dangerous rule allowed");
                     require(cli.run({"allow", "Read", "--scope", "galaxy"}).code == 1,
                             "unknown scope");
                   }});

  tests.push_back({"cli_check_deny_rule", [] {
                     CliHarness cli;
                     require(cli.run({"deny", "Bash(git push *)", "-s", "project"}).code == 0, "deny");
                     const auto run = cli.run({"check", "Bash", "git", "push", "origin"});
                     require(run.code == 2, "denied exit code");
                     require(contains(run.out,
                                      "deny: Access to tool 'Bash' is explicitly denied by rule: "
                                      "Bash(git push *)"),
                             run.out);
                   }});

  tests.push_back({"cli_check_answers", [] {
                     CliHarness cli;
                     auto run = cli.run({"check", "Bash", "make", "all"}, "y\n");
                     require(run.code == 0 && contains(run.out, "allow\n"), "allow once");
                     require(contains(run.out, "Allow Bash: make all"), "prompt shown");

                     run = cli.run({"check", "Bash", "make", "all"}, "n\n");
                     require(run.code == 2, "deny");
                     require(contains(run.out, "deny: The user denied permission to use tool 'Bash'"),
                             run.out);

                     run = cli.run({"check", "Bash", "make", "all"}, "i run the tests first\n");
                     require(run.code == 2 && contains(run.out, "asked for something else instead: "
                                                                "run the tests first"),
                             run.out);

                     run = cli.run({"check", "Bash", "make", "all"}, "\n");
                     require(run.code == 3 && contains(run.out, "cancelled: cancelled by user"),
                             run.out);

                     run = cli.run({"check", "Bash", "make", "all"}, "");
                     require(run.code == 3 && contains(run.out, "cancelled: input closed"), run.out);
                   }});

  tests.push_back({"cli_check_allow_always_persists", [] {
                     CliHarness cli;
                     auto run = cli.run({"check", "Bash", "npm", "install", "lodash"}, "a\n");
                     require(run.code == 0, "allowed");
                     require(contains(run.out, "[a] always allow (Bash(npm install *))"),
                             "suggested rule shown");
                     require(contains(cli.workspace().read_file(".trustgate/settings.local.json"),
                                      "Bash(npm install *)"),
                             "rule persisted");
                     run = cli.run({"check", "Bash", "npm", "install", "zod"});
                     require(run.code == 0 && !contains(run.out, "Allow Bash"),
                             "second call needs no prompt");
                   }});

  tests.push_back({"cli_check_hidden_always_option", [] {
                     CliHarness cli;
                     const auto run = cli.run({"check", "Bash", "ls", "/"}, "a\n");
                     require(!contains(run.out, "[a] always allow"), "option hidden");
                     require(run.code == 2, "unoffered answer treated as deny");
                   }});

  tests.push_back({"cli_modes", [] {
                     CliHarness cli;
                     auto run = cli.run({"check", "--dangerously-skip-permissions", "Bash", "make"});
                     require(run.code == 0 && run.out == "allow\n", "bypass skips the prompt");

                     require(cli.run({"mode", "acceptEdits", "--scope", "project"}).code == 0,
                             "set mode");
                     run = cli.run({"mode"});
                     require(run.out == "acceptEdits\n", run.out);
                     run = cli.run({"--permission-mode", "bypassPermissions", "mode"});
                     require(run.out == "bypassPermissions\n", "override shown");

                     run = cli.run({"check", "Write", "src/main.cpp"});
                     require(run.code == 0, "acceptEdits approves edits in the workdir");
                     run = cli.run({"check", "Write", "/etc/hosts"}, "n\n");
                     require(run.code == 2, "edits outside still ask");
                   }});
}

#include "trustgate/cli/commands.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/config/config.hpp"
#include "trustgate/observability/factory.hpp"
#include "trustgate/observability/global.hpp"
#include "trustgate/security/confirmation_queue.hpp"
#include "trustgate/security/pattern_matcher.hpp"
#include "trustgate/security/permission_manager.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace trustgate::cli {

namespace {

constexpr int kExitAllowed = 0;
constexpr int kExitError = 1;
constexpr int kExitDenied = 2;
constexpr int kExitCancelled = 3;

struct GlobalOptions {
  std::filesystem::path workdir;
  std::optional<security::PermissionMode> mode_override;
  security::OverlapPolicy overlap_policy = security::OverlapPolicy::DenyWins;
};

std::string version_string() {
#ifdef TRUSTGATE_VERSION
  return std::string("trustgate ") + TRUSTGATE_VERSION;
#else
  return "trustgate 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool apply_global_options(std::vector<std::string> &args, GlobalOptions &options,
                          std::string &error) {
  std::string value;
  if (take_option(args, "--config-dir", "", value)) {
    config::set_config_dir_override(std::filesystem::path(value));
  }

  std::string backend = "log";
  if (const char *env = std::getenv("TRUSTGATE_LOG"); env != nullptr && *env != '\0') {
    backend = env;
  }
  if (take_option(args, "--log", "", value)) {
    backend = value;
  }
  observability::set_global_observer(observability::create_observer(backend));

  std::error_code ec;
  options.workdir = std::filesystem::current_path(ec);
  if (take_option(args, "--workdir", "-C", value)) {
    options.workdir = common::resolve_path(value, options.workdir);
  }

  if (take_option(args, "--permission-mode", "", value)) {
    auto mode = security::mode_from_string(value);
    if (!mode.ok()) {
      error = mode.error();
      return false;
    }
    options.mode_override = mode.value();
  }
  // Strongest override: wins over --permission-mode when both are given.
  if (take_flag(args, "--dangerously-skip-permissions")) {
    options.mode_override = security::PermissionMode::BypassPermissions;
  }

  if (take_option(args, "--overlap-policy", "", value)) {
    auto policy = security::overlap_policy_from_string(value);
    if (!policy.ok()) {
      error = policy.error();
      return false;
    }
    options.overlap_policy = policy.value();
  }
  return true;
}

common::Result<security::RuleScope> take_scope(std::vector<std::string> &args) {
  std::string value = "local";
  (void)take_option(args, "--scope", "-s", value);
  return security::scope_from_string(value);
}

void print_help(std::ostream &out) {
  out << version_string() << "\n\n"
      << "Usage: trustgate [global options] <command> [args]\n\n"
      << "Commands:\n"
      << "  check <tool> <command|path>   Decide one tool call, asking on stdin when needed\n"
      << "  rules                         Show merged rules and the effective mode\n"
      << "  allow <rule> [--scope S]      Persist an allow rule (default scope: local)\n"
      << "  deny <rule> [--scope S]       Persist a deny rule\n"
      << "  remove <rule> [--scope S] [--deny]\n"
      << "                                Remove a persisted rule\n"
      << "  pattern <command>             Show the trust pattern suggested for a command\n"
      << "  mode [<mode>] [--scope S]     Show or set the configured default mode\n"
      << "  version\n\n"
      << "Global options:\n"
      << "  --workdir, -C <dir>           Working directory (default: current)\n"
      << "  --config-dir <dir>            User settings directory (default: ~/.trustgate)\n"
      << "  --permission-mode <mode>      default | acceptEdits | bypassPermissions\n"
      << "  --dangerously-skip-permissions\n"
      << "  --overlap-policy <policy>     deny-wins | allow-wins\n"
      << "  --log <backend>               log | log-verbose | none\n";
}

security::ToolInput input_for(const std::string &tool, const std::string &subject) {
  security::ToolInput input;
  if (subject.empty()) {
    return input;
  }
  if (tool == security::kBashTool) {
    input["command"] = subject;
  } else if (security::is_path_tool(tool)) {
    input["file_path"] = subject;
  } else {
    input["input"] = subject;
  }
  return input;
}

void print_prompt(const security::ConfirmationView &view, std::ostream &out) {
  const auto &request = view.request;
  out << "Allow " << request.tool_name;
  const std::string subject = security::rule_subject(request.tool_name, request.tool_input);
  if (!subject.empty()) {
    out << ": " << subject;
  }
  out << "\n";
  if (view.backlog > 0) {
    out << "  (" << view.backlog << " more waiting)\n";
  }
  out << "  [y] allow once\n";
  if (!request.hide_persistent_option) {
    out << "  [a] always allow";
    if (!request.suggested_rules.empty()) {
      out << " (";
      for (std::size_t i = 0; i < request.suggested_rules.size(); ++i) {
        out << (i > 0 ? ", " : "") << request.suggested_rules[i].to_string();
      }
      out << ")";
    }
    out << "\n";
  }
  out << "  [n] deny\n"
      << "  [i <instructions>] deny and tell the agent what to do instead\n"
      << "  [empty line] cancel\n"
      << "> " << std::flush;
}

// Reads one answer for the rendered item and resolves that item only.
common::Status answer(security::ConfirmationQueue &queue, const security::ConfirmationView &view,
                      std::istream &in, std::ostream &out) {
  print_prompt(view, out);
  std::string line;
  if (!std::getline(in, line)) {
    return queue.cancel(view.id, "input closed");
  }
  const std::string reply = common::trim(line);
  const std::string lowered = common::to_lower(reply);
  if (lowered == "y" || lowered == "yes") {
    return queue.decide(view.id, security::ConfirmationChoice::allow_once());
  }
  if ((lowered == "a" || lowered == "always") && !view.request.hide_persistent_option) {
    return queue.decide(view.id, security::ConfirmationChoice::allow_always());
  }
  if (lowered == "n" || lowered == "no") {
    return queue.decide(view.id, security::ConfirmationChoice::deny());
  }
  if (common::starts_with(lowered, "i ")) {
    return queue.decide(view.id,
        security::ConfirmationChoice::deny_with_alternative(common::trim(reply.substr(2))));
  }
  if (reply.empty()) {
    return queue.cancel(view.id, "cancelled by user");
  }
  out << "unrecognised answer, treating as deny\n";
  return queue.decide(view.id, security::ConfirmationChoice::deny("The user denied permission"));
}

int run_check(std::vector<std::string> args, const GlobalOptions &global, std::istream &in,
              std::ostream &out, std::ostream &err) {
  if (args.empty()) {
    err << "usage: trustgate check <tool> <command|path>\n";
    return kExitError;
  }
  const std::string tool = args[0];
  const std::string subject = join_tokens(args, 1);

  auto resolver = std::make_shared<config::ConfigResolver>(global.workdir);
  auto options = config::build_manager_options(resolver, global.mode_override);
  options.overlap_policy = global.overlap_policy;
  auto queue = std::make_shared<security::ConfirmationQueue>();
  options.confirmation_queue = queue;
  security::PermissionManager manager(std::move(options));

  security::PermissionRequest request;
  request.tool_name = tool;
  request.tool_input = input_for(tool, subject);

  // The check blocks on the queue; this thread is the queue's consumer.
  queue->set_listener([](const std::optional<security::ConfirmationView> &) {});
  auto pending = std::async(std::launch::async,
                            [&manager, &request]() { return manager.check_permission(request); });
  while (pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
    const auto view = queue->wait_for_current(std::chrono::milliseconds(50));
    if (!view.has_value()) {
      continue;
    }
    const auto status = answer(*queue, *view, in, out);
    if (!status.ok()) {
      err << "confirmation failed: " << status.error() << "\n";
    }
  }
  queue->clear_listener();

  const auto outcome = pending.get();
  if (security::is_cancelled(outcome)) {
    out << "cancelled: " << security::outcome_message(outcome) << "\n";
    return kExitCancelled;
  }
  if (security::is_allowed(outcome)) {
    out << "allow\n";
    return kExitAllowed;
  }
  out << "deny: " << security::outcome_message(outcome) << "\n";
  return kExitDenied;
}

int run_rules(const GlobalOptions &global, std::ostream &out) {
  config::ConfigResolver resolver(global.workdir);
  const auto sets = resolver.resolve_rule_sets();
  out << "mode: " << security::mode_to_string(resolver.resolve_default_mode(global.mode_override))
      << "\n";
  out << "allow:\n";
  for (const auto &rule : sets.allow) {
    out << "  " << rule.to_string() << "  [" << security::scope_to_string(rule.scope) << "]\n";
  }
  out << "deny:\n";
  for (const auto &rule : sets.deny) {
    out << "  " << rule.to_string() << "  [" << security::scope_to_string(rule.scope) << "]\n";
  }
  if (!sets.additional_directories.empty()) {
    out << "additional directories:\n";
    for (const auto &dir : sets.additional_directories) {
      out << "  " << dir << "\n";
    }
  }
  return kExitAllowed;
}

int run_persist(std::vector<std::string> args, const GlobalOptions &global,
                const security::RuleList list, std::ostream &out, std::ostream &err) {
  auto scope = take_scope(args);
  if (!scope.ok()) {
    err << scope.error() << "\n";
    return kExitError;
  }
  if (args.empty()) {
    err << "usage: trustgate " << security::rule_list_to_string(list) << " <rule> [--scope S]\n";
    return kExitError;
  }
  auto rule = security::parse_rule(join_tokens(args), scope.value());
  if (!rule.ok()) {
    err << rule.error() << "\n";
    return kExitError;
  }
  config::ConfigResolver resolver(global.workdir);
  const auto status = resolver.persist_rule(scope.value(), rule.value(), list);
  if (!status.ok()) {
    err << status.error() << "\n";
    return kExitError;
  }
  out << security::rule_list_to_string(list) << " " << rule.value().to_string() << " -> "
      << resolver.scope_path(scope.value()).value().string() << "\n";
  return kExitAllowed;
}

int run_remove(std::vector<std::string> args, const GlobalOptions &global, std::ostream &out,
               std::ostream &err) {
  const auto list = take_flag(args, "--deny") ? security::RuleList::Deny : security::RuleList::Allow;
  auto scope = take_scope(args);
  if (!scope.ok()) {
    err << scope.error() << "\n";
    return kExitError;
  }
  if (args.empty()) {
    err << "usage: trustgate remove <rule> [--scope S] [--deny]\n";
    return kExitError;
  }
  auto rule = security::parse_rule(join_tokens(args), scope.value());
  if (!rule.ok()) {
    err << rule.error() << "\n";
    return kExitError;
  }
  config::ConfigResolver resolver(global.workdir);
  const auto status = resolver.remove_rule(scope.value(), rule.value(), list);
  if (!status.ok()) {
    err << status.error() << "\n";
    return kExitError;
  }
  out << "removed " << rule.value().to_string() << "\n";
  return kExitAllowed;
}

int run_pattern(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
  if (args.empty()) {
    err << "usage: trustgate pattern <command>\n";
    return kExitError;
  }
  const std::string command = join_tokens(args);
  const auto pattern = security::get_smart_pattern(command);
  out << "pattern: " << (pattern.has_value() ? *pattern : "(exact match only)") << "\n";
  out << "dangerous: " << (security::is_dangerous_base(command) ? "yes" : "no") << "\n";
  return kExitAllowed;
}

int run_mode(std::vector<std::string> args, const GlobalOptions &global, std::ostream &out,
             std::ostream &err) {
  auto scope = take_scope(args);
  if (!scope.ok()) {
    err << scope.error() << "\n";
    return kExitError;
  }
  config::ConfigResolver resolver(global.workdir);
  if (args.empty()) {
    out << security::mode_to_string(resolver.resolve_default_mode(global.mode_override)) << "\n";
    return kExitAllowed;
  }
  auto mode = security::mode_from_string(args[0]);
  if (!mode.ok()) {
    err << mode.error() << "\n";
    return kExitError;
  }
  const auto status = resolver.set_default_mode(scope.value(), mode.value());
  if (!status.ok()) {
    err << status.error() << "\n";
    return kExitError;
  }
  out << "defaultMode " << security::mode_to_string(mode.value()) << " ["
      << security::scope_to_string(scope.value()) << "]\n";
  return kExitAllowed;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = argc > 1 ? collect_args(argc - 1, argv + 1)
                                           : std::vector<std::string>{};
  return run_cli(std::move(args), std::cin, std::cout, std::cerr);
}

int run_cli(std::vector<std::string> args, std::istream &in, std::ostream &out, std::ostream &err) {
  GlobalOptions global;
  std::string global_error;
  if (!apply_global_options(args, global, global_error)) {
    err << global_error << "\n";
    return kExitError;
  }

  if (args.empty()) {
    print_help(out);
    return kExitAllowed;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  int code = kExitError;
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    code = kExitAllowed;
  } else if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    code = kExitAllowed;
  } else if (subcommand == "check") {
    code = run_check(std::move(args), global, in, out, err);
  } else if (subcommand == "rules") {
    code = run_rules(global, out);
  } else if (subcommand == "allow") {
    code = run_persist(std::move(args), global, security::RuleList::Allow, out, err);
  } else if (subcommand == "deny") {
    code = run_persist(std::move(args), global, security::RuleList::Deny, out, err);
  } else if (subcommand == "remove") {
    code = run_remove(std::move(args), global, out, err);
  } else if (subcommand == "pattern") {
    code = run_pattern(args, out, err);
  } else if (subcommand == "mode") {
    code = run_mode(std::move(args), global, out, err);
  } else {
    err << "unknown command: " << subcommand << "\n";
    print_help(err);
  }

  if (auto observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace trustgate::cli

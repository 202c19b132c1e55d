#include "trustgate/security/pattern_matcher.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/security/bash_parser.hpp"

#include <algorithm>

namespace trustgate::security {

namespace {

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

std::string with_wildcard(const std::string &prefix) { return prefix + " *"; }

std::optional<std::string> package_manager_pattern(const std::vector<std::string> &tokens) {
  static const std::vector<std::string> verbs = {"install", "i",     "add",   "remove", "test",
                                                 "t",       "build", "start", "dev"};
  const std::string &exe = tokens[0];
  if (tokens.size() > 1 && contains(verbs, tokens[1])) {
    return with_wildcard(exe + " " + tokens[1]);
  }
  if (tokens.size() > 2 && tokens[1] == "run") {
    return with_wildcard(exe + " run " + tokens[2]);
  }
  return with_wildcard(exe);
}

std::optional<std::string> subcommand_pattern(const std::vector<std::string> &tokens,
                                              const std::vector<std::string> &subcommands) {
  if (tokens.size() > 1 && contains(subcommands, tokens[1])) {
    return with_wildcard(tokens[0] + " " + tokens[1]);
  }
  return with_wildcard(tokens[0]);
}

std::vector<std::string> path_arguments(const std::vector<std::string> &words) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i < words.size(); ++i) {
    if (!common::starts_with(words[i], "-")) {
      out.push_back(unquote(words[i]));
    }
  }
  return out;
}

bool rule_matches_path(const PermissionRule &rule, const std::string &path, const SafeZone &zone) {
  if (matches_rule(path, rule)) {
    return true;
  }
  if (zone.workdir().empty()) {
    return false;
  }
  const auto absolute = zone.resolve(path);
  if (matches_rule(absolute.string(), rule)) {
    return true;
  }
  if (common::is_subpath(absolute, zone.workdir())) {
    const auto relative = absolute.lexically_relative(zone.workdir()).generic_string();
    return matches_rule(relative, rule);
  }
  return false;
}

// A glob other than the tool-wide `*` never trusts a dangerous base.
bool allow_rule_covers_part(const PermissionRule &rule, const std::string &part) {
  if (rule.tool_wide()) {
    return true;
  }
  if (rule.kind == RuleKind::Glob && contains(dangerous_commands(), base_command(part))) {
    return false;
  }
  return matches_rule(part, rule);
}

} // namespace

const std::vector<std::string> &dangerous_commands() {
  static const std::vector<std::string> commands = {
      "rm",   "rmdir", "mv",   "shred", "chmod", "chown", "chgrp",  "sudo", "su",
      "doas", "sh",    "bash", "zsh",   "dash",  "fish",  "eval",   "exec", "dd",
      "mkfs", "fdisk", "parted", "apt", "apt-get", "yum", "dnf"};
  return commands;
}

std::string base_command(const std::string &simple_command) {
  const auto words = tokenize_words(normalize_simple_command(simple_command));
  if (words.empty()) {
    return "";
  }
  const std::string exe = unquote(words.front());
  const auto slash = exe.find_last_of('/');
  std::string base = slash == std::string::npos ? exe : exe.substr(slash + 1);
  // mkfs.ext4 and friends share the mkfs base.
  if (common::starts_with(base, "mkfs.")) {
    base = "mkfs";
  }
  return base;
}

bool is_dangerous_base(const std::string &command) {
  for (const auto &part : split_bash_command(command)) {
    if (contains(dangerous_commands(), base_command(part))) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> get_smart_pattern(const std::string &command) {
  const auto parts = split_bash_command(command);
  if (parts.empty()) {
    return std::nullopt;
  }
  const auto tokens = tokenize_words(normalize_simple_command(parts.front()));
  if (tokens.empty()) {
    return std::nullopt;
  }

  const std::string base = base_command(parts.front());
  if (contains(dangerous_commands(), base)) {
    return std::nullopt;
  }

  // Families dispatch on the basename; patterns keep the command as typed so
  // `/usr/bin/npm install x` yields `/usr/bin/npm install *`.
  const std::string &exe = base;
  const std::string &typed = tokens[0];
  const std::string sub = tokens.size() > 1 ? tokens[1] : "";

  if (exe == "npm" || exe == "pnpm" || exe == "yarn" || exe == "deno" || exe == "bun") {
    return package_manager_pattern(tokens);
  }
  if (exe == "git") {
    return subcommand_pattern(tokens, {"commit", "push", "pull", "checkout", "add", "status",
                                       "diff", "branch", "merge", "rebase", "log", "fetch",
                                       "remote", "stash"});
  }
  if (exe == "python" || exe == "python3") {
    if (sub == "-m" && tokens.size() > 3 && tokens[2] == "pip" && tokens[3] == "install") {
      return with_wildcard(typed + " -m pip install");
    }
    return with_wildcard(typed);
  }
  if (exe == "pip" || exe == "pip3" || exe == "poetry" || exe == "conda") {
    return subcommand_pattern(tokens, {"install", "add", "remove", "test", "run"});
  }
  if (exe == "mvn" || exe == "gradle" || exe == "make") {
    if (!sub.empty() && !common::starts_with(sub, "-")) {
      return with_wildcard(typed + " " + sub);
    }
    return with_wildcard(typed);
  }
  if (exe == "java") {
    return with_wildcard(sub == "-jar" ? typed + " -jar" : typed);
  }
  if (exe == "cmake") {
    return subcommand_pattern(tokens, {"--build", "--install", "-S", "-B"});
  }
  if (exe == "cargo") {
    return subcommand_pattern(tokens, {"build", "test", "run", "add", "check"});
  }
  if (exe == "go") {
    return subcommand_pattern(tokens, {"build", "test", "run", "get", "mod"});
  }
  if (exe == "docker" || exe == "docker-compose") {
    return subcommand_pattern(tokens, {"run", "build", "ps", "exec", "up", "down"});
  }
  if (exe == "kubectl") {
    return subcommand_pattern(tokens, {"get", "describe", "apply", "logs"});
  }
  if (exe == "terraform") {
    return subcommand_pattern(tokens, {"plan", "apply", "destroy", "init"});
  }
  return std::nullopt;
}

bool glob_matches(const std::string &pattern, const std::string &subject) {
  // Anchored match where only `*` is special. On a mismatch the scan restarts one
  // character past the last star's previous anchor; constant memory.
  std::size_t p = 0;
  std::size_t s = 0;
  std::size_t star = std::string::npos;
  std::size_t anchor = 0;
  while (s < subject.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      anchor = s;
    } else if (p < pattern.size() && pattern[p] == subject[s]) {
      ++p;
      ++s;
    } else if (star != std::string::npos) {
      p = star + 1;
      s = ++anchor;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

bool matches_rule(const std::string &subject, const PermissionRule &rule) {
  if (rule.kind == RuleKind::Exact) {
    return subject == rule.pattern;
  }
  return glob_matches(rule.pattern, subject);
}

bool is_safe_command(const std::string &simple_command, const SafeZone &zone) {
  const auto words = tokenize_words(normalize_simple_command(simple_command));
  if (words.empty()) {
    return false;
  }
  const std::string &cmd = words.front();
  if (cmd == "pwd" || cmd == "true" || cmd == "false") {
    return true;
  }
  if (cmd != "cd" && cmd != "ls") {
    return false;
  }
  const auto paths = path_arguments(words);
  return std::all_of(paths.begin(), paths.end(),
                     [&zone](const std::string &path) { return zone.contains(path); });
}

bool is_out_of_bounds(const std::string &simple_command, const SafeZone &zone) {
  const auto words = tokenize_words(normalize_simple_command(simple_command));
  if (words.empty() || (words.front() != "cd" && words.front() != "ls")) {
    return false;
  }
  const auto paths = path_arguments(words);
  return std::any_of(paths.begin(), paths.end(),
                     [&zone](const std::string &path) { return !zone.contains(path); });
}

bool rule_applies(const PermissionRule &rule, const std::string &tool_name,
                  const ToolInput &input, const SafeZone &zone) {
  if (rule.tool_name != tool_name) {
    return false;
  }
  if (rule.tool_wide()) {
    return true;
  }

  const std::string subject = rule_subject(tool_name, input);
  if (subject.empty()) {
    return false;
  }
  if (tool_name == kBashTool) {
    if (matches_rule(subject, rule)) {
      return true;
    }
    const auto parts = split_bash_command(subject);
    return std::any_of(parts.begin(), parts.end(), [&rule](const std::string &part) {
      return matches_rule(normalize_simple_command(part), rule);
    });
  }
  if (is_path_tool(tool_name)) {
    return rule_matches_path(rule, subject, zone);
  }
  return false;
}

bool rules_cover_call(const std::vector<PermissionRule> &rules, const std::string &tool_name,
                      const ToolInput &input, const SafeZone &zone) {
  const bool tool_wide = std::any_of(rules.begin(), rules.end(), [&](const PermissionRule &rule) {
    return rule.tool_name == tool_name && rule.tool_wide();
  });
  if (tool_wide) {
    return true;
  }

  if (tool_name != kBashTool) {
    return std::any_of(rules.begin(), rules.end(), [&](const PermissionRule &rule) {
      return rule_applies(rule, tool_name, input, zone);
    });
  }

  const std::string command = rule_subject(tool_name, input);
  const auto parts = split_bash_command(command);
  if (parts.empty()) {
    return false;
  }
  return std::all_of(parts.begin(), parts.end(), [&](const std::string &part) {
    if (is_safe_command(part, zone)) {
      return true;
    }
    const std::string normalized = normalize_simple_command(part);
    return std::any_of(rules.begin(), rules.end(), [&](const PermissionRule &rule) {
      if (rule.tool_name != tool_name) {
        return false;
      }
      // A single command may be stored with its redirections intact.
      if (parts.size() == 1 && allow_rule_covers_part(rule, command)) {
        return true;
      }
      return allow_rule_covers_part(rule, normalized);
    });
  });
}

std::vector<PermissionRule> suggest_rules(const std::string &tool_name, const ToolInput &input,
                                          const SafeZone &zone) {
  std::vector<PermissionRule> rules;
  const auto add_unique = [&rules](PermissionRule rule) {
    const bool seen = std::any_of(rules.begin(), rules.end(), [&rule](const PermissionRule &r) {
      return r.same_rule(rule);
    });
    if (!seen) {
      rules.push_back(std::move(rule));
    }
  };

  if (tool_name == kBashTool) {
    for (const auto &part : split_bash_command(rule_subject(tool_name, input))) {
      const std::string normalized = normalize_simple_command(part);
      if (normalized.empty() || is_safe_command(normalized, zone) ||
          is_out_of_bounds(normalized, zone)) {
        continue;
      }
      const auto smart = get_smart_pattern(normalized);
      if (smart.has_value() && glob_matches(*smart, normalized)) {
        add_unique(make_rule(tool_name, *smart));
        continue;
      }
      // A literal `*` cannot be stored exactly, and a dangerous base never gets a glob.
      if (normalized.find('*') != std::string::npos &&
          contains(dangerous_commands(), base_command(normalized))) {
        continue;
      }
      add_unique(make_rule(tool_name, normalized));
    }
    return rules;
  }

  if (is_path_tool(tool_name)) {
    if (const auto path = target_path(input); path.has_value()) {
      add_unique(make_rule(tool_name, *path));
    }
  }
  return rules;
}

} // namespace trustgate::security

#pragma once

#include <string>
#include <vector>

namespace trustgate::security {

/// Split a compound shell command on unquoted `&&`, `||`, `|&`, `;`, `|` and `&`.
/// A part that is a whole `( ... )` subshell is split recursively. Parts are trimmed and
/// empty parts dropped.
[[nodiscard]] std::vector<std::string> split_bash_command(const std::string &command);

/// Remove leading `NAME=value` assignments. A command made only of assignments becomes empty.
[[nodiscard]] std::string strip_env_vars(const std::string &command);

/// Remove redirection operators and their target word, collapsing whitespace outside quotes.
[[nodiscard]] std::string strip_redirections(const std::string &command);

[[nodiscard]] std::string normalize_simple_command(const std::string &command);

/// Whitespace-separated words; quoted runs stay inside one word with their quotes.
[[nodiscard]] std::vector<std::string> tokenize_words(const std::string &command);

/// Drop one pair of matching surrounding quotes.
[[nodiscard]] std::string unquote(const std::string &word);

} // namespace trustgate::security

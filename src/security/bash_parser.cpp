#include "trustgate/security/bash_parser.hpp"

#include "trustgate/common/fs.hpp"

#include <cctype>

namespace trustgate::security {

namespace {

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_operator_char(const char ch) { return ch == '&' || ch == '|' || ch == ';'; }

std::size_t count_backslashes_before(const std::string &text, std::size_t pos) {
  std::size_t count = 0;
  while (pos > 0 && text[pos - 1] == '\\') {
    ++count;
    --pos;
  }
  return count;
}

std::size_t operator_length(const std::string &command, const std::size_t i) {
  const char ch = command[i];
  const char next = i + 1 < command.size() ? command[i + 1] : '\0';
  if ((ch == '&' && next == '&') || (ch == '|' && next == '|') || (ch == '|' && next == '&')) {
    return 2;
  }
  if (ch == ';' || ch == '|') {
    return 1;
  }
  if (ch == '&' && next != '>') {
    return 1;
  }
  return 0;
}

bool is_env_name_start(const char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_env_name_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

// Length of a leading `NAME=` or 0.
std::size_t env_assignment_prefix(const std::string &text) {
  if (text.empty() || !is_env_name_start(text[0])) {
    return 0;
  }
  std::size_t i = 1;
  while (i < text.size() && is_env_name_char(text[i])) {
    ++i;
  }
  return i < text.size() && text[i] == '=' ? i + 1 : 0;
}

// End of the redirection target word that starts at `pos` (quotes and escapes respected).
std::size_t skip_word(const std::string &command, std::size_t pos) {
  bool escaped = false;
  bool single = false;
  bool dbl = false;
  while (pos < command.size()) {
    const char c = command[pos];
    if (escaped) {
      escaped = false;
    } else if (c == '\\') {
      escaped = true;
    } else if (c == '\'' && !dbl) {
      single = !single;
    } else if (c == '"' && !single) {
      dbl = !dbl;
    } else if (!single && !dbl && is_space(c)) {
      break;
    }
    ++pos;
  }
  return pos;
}

} // namespace

std::vector<std::string> split_bash_command(const std::string &command) {
  bool in_single = false;
  bool in_double = false;
  bool escaped = false;
  int paren_level = 0;
  std::vector<std::pair<std::size_t, std::size_t>> splits;

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char ch = command[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '\'' && !in_double) {
      in_single = !in_single;
      continue;
    }
    if (ch == '"' && !in_single) {
      in_double = !in_double;
      continue;
    }
    if (in_single || in_double) {
      continue;
    }
    if (ch == '(') {
      ++paren_level;
      continue;
    }
    if (ch == ')') {
      --paren_level;
      continue;
    }
    if (paren_level > 0) {
      continue;
    }

    const std::size_t op_len = operator_length(command, i);
    if (op_len == 0) {
      continue;
    }
    // `\&&`: the first operator char is escaped, so the second is not an operator either.
    const bool after_escaped_op = i > 0 && is_operator_char(command[i - 1]) &&
                                  count_backslashes_before(command, i - 1) % 2 != 0;
    if (count_backslashes_before(command, i) % 2 == 0 && !after_escaped_op) {
      splits.emplace_back(i, i + op_len);
      i += op_len - 1;
    }
  }

  std::vector<std::string> parts;
  std::size_t last = 0;
  for (const auto &[start, end] : splits) {
    const std::string part = common::trim(command.substr(last, start - last));
    if (!part.empty()) {
      parts.push_back(part);
    }
    last = end;
  }
  const std::string tail = common::trim(command.substr(last));
  if (!tail.empty()) {
    parts.push_back(tail);
  }

  std::vector<std::string> out;
  for (const auto &part : parts) {
    const std::string stripped = normalize_simple_command(part);
    if (stripped.size() >= 2 && stripped.front() == '(' && stripped.back() == ')') {
      const std::string inner = common::trim(stripped.substr(1, stripped.size() - 2));
      if (!inner.empty()) {
        auto nested = split_bash_command(inner);
        out.insert(out.end(), nested.begin(), nested.end());
      }
    } else {
      out.push_back(part);
    }
  }
  return out;
}

std::string strip_env_vars(const std::string &command) {
  std::string result = common::trim(command);
  while (true) {
    const std::size_t name_end = env_assignment_prefix(result);
    if (name_end == 0) {
      break;
    }

    std::size_t value_end = name_end;
    if (name_end < result.size() && result[name_end] == '\'') {
      const auto close = result.find('\'', name_end + 1);
      if (close == std::string::npos) {
        break;
      }
      value_end = close + 1;
    } else if (name_end < result.size() && result[name_end] == '"') {
      bool escaped = false;
      bool found = false;
      for (std::size_t i = name_end + 1; i < result.size(); ++i) {
        if (escaped) {
          escaped = false;
        } else if (result[i] == '\\') {
          escaped = true;
        } else if (result[i] == '"') {
          value_end = i + 1;
          found = true;
          break;
        }
      }
      if (!found) {
        break;
      }
    } else {
      std::size_t space = name_end;
      while (space < result.size() && !is_space(result[space])) {
        ++space;
      }
      if (space == result.size()) {
        return "";
      }
      value_end = space;
    }

    result = common::trim(result.substr(value_end));
  }
  return result;
}

std::string strip_redirections(const std::string &command) {
  std::string result;
  bool in_single = false;
  bool in_double = false;
  bool escaped = false;

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char ch = command[i];

    if (escaped) {
      result += ch;
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      result += ch;
      escaped = true;
      continue;
    }
    if (ch == '\'' && !in_double) {
      in_single = !in_single;
      result += ch;
      continue;
    }
    if (ch == '"' && !in_single) {
      in_double = !in_double;
      result += ch;
      continue;
    }
    if (in_single || in_double) {
      result += ch;
      continue;
    }

    if (is_space(ch)) {
      if (!result.empty() && !is_space(result.back())) {
        result += ' ';
      }
      continue;
    }

    if (ch == '>' || ch == '<') {
      // `2>` and `&>`: the fd or `&` belongs to the operator when it starts a word.
      if (!result.empty() &&
          (std::isdigit(static_cast<unsigned char>(result.back())) != 0 || result.back() == '&') &&
          (result.size() == 1 || is_space(result[result.size() - 2]))) {
        result.pop_back();
      }

      std::size_t end = i + 1;
      if (end < command.size() && command[end] == ch) {
        ++end;
        if (ch == '<' && end < command.size() && command[end] == '-') {
          ++end;
        }
      } else if (end < command.size() &&
                 (command[end] == '&' || (ch == '>' && command[end] == '|'))) {
        ++end;
      }
      while (end < command.size() && is_space(command[end])) {
        ++end;
      }
      end = skip_word(command, end);

      i = end - 1;
      if (!result.empty() && !is_space(result.back())) {
        result += ' ';
      }
      continue;
    }

    result += ch;
  }

  return common::trim(result);
}

std::string normalize_simple_command(const std::string &command) {
  return strip_redirections(strip_env_vars(command));
}

std::vector<std::string> tokenize_words(const std::string &command) {
  std::vector<std::string> words;
  std::string current;
  char quote = '\0';
  for (const char ch : command) {
    if (quote != '\0') {
      current += ch;
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '\'' || ch == '"') {
      quote = ch;
      current += ch;
      continue;
    }
    if (is_space(ch)) {
      if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
      continue;
    }
    current += ch;
  }
  if (!current.empty()) {
    words.push_back(current);
  }
  return words;
}

std::string unquote(const std::string &word) {
  if (word.size() >= 2 && (word.front() == '"' || word.front() == '\'') &&
      word.back() == word.front()) {
    return word.substr(1, word.size() - 2);
  }
  return word;
}

} // namespace trustgate::security

#include "trustgate/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <sstream>

namespace trustgate::common {

namespace {

constexpr std::size_t kMaxNestingDepth = 128;

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

bool is_scalar_terminator(char ch) {
  return ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

class JsonValidator {
public:
  explicit JsonValidator(const std::string &text) : text_(text) {}

  Status run() {
    pos_ = json_skip_ws(text_, 0);
    if (pos_ >= text_.size()) {
      return fail("empty document");
    }
    if (!value(0)) {
      return fail(reason_);
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      return fail("unexpected trailing characters");
    }
    return Status::success();
  }

private:
  Status fail(const std::string &reason) const {
    return Status::error("invalid JSON at offset " + std::to_string(pos_) + ": " + reason);
  }

  bool reject(std::string reason) {
    reason_ = std::move(reason);
    return false;
  }

  bool value(std::size_t depth) {
    if (depth > kMaxNestingDepth) {
      return reject("nesting too deep");
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ >= text_.size()) {
      return reject("unexpected end of input");
    }
    const char ch = text_[pos_];
    switch (ch) {
    case '{':
      return object(depth);
    case '[':
      return array(depth);
    case '"':
      return string();
    case 't':
      return literal("true");
    case 'f':
      return literal("false");
    case 'n':
      return literal("null");
    default:
      if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        return number();
      }
      return reject(std::string("unexpected character '") + ch + "'");
    }
  }

  bool object(std::size_t depth) {
    ++pos_; // {
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return reject("expected member name");
      }
      if (!string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return reject("expected ':'");
      }
      ++pos_;
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return reject("unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return reject("expected ',' or '}'");
    }
  }

  bool array(std::size_t depth) {
    ++pos_; // [
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return reject("unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return reject("expected ',' or ']'");
    }
  }

  bool string() {
    ++pos_; // opening quote
    while (pos_ < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos_]);
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (ch < 0x20) {
        return reject("control character in string");
      }
      if (ch == '\\') {
        if (pos_ + 1 >= text_.size()) {
          break;
        }
        const char esc = text_[pos_ + 1];
        if (esc == 'u') {
          if (!parse_hex4(text_, pos_ + 2).has_value()) {
            return reject("bad unicode escape");
          }
          pos_ += 6;
          continue;
        }
        if (std::strchr("\"\\/bfnrt", esc) == nullptr) {
          return reject("bad escape sequence");
        }
        pos_ += 2;
        continue;
      }
      ++pos_;
    }
    return reject("unterminated string");
  }

  bool literal(const char *word) {
    const std::size_t len = std::strlen(word);
    if (text_.compare(pos_, len, word) != 0) {
      return reject("bad literal");
    }
    pos_ += len;
    return true;
  }

  bool number() {
    const std::size_t start = pos_;
    if (text_[pos_] == '-') {
      ++pos_;
    }
    if (pos_ >= text_.size() || std::isdigit(static_cast<unsigned char>(text_[pos_])) == 0) {
      return reject("bad number");
    }
    if (text_[pos_] == '0') {
      ++pos_;
    } else {
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
      }
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      const std::size_t digits = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
      }
      if (pos_ == digits) {
        return reject("bad fraction");
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      const std::size_t digits = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
      }
      if (pos_ == digits) {
        return reject("bad exponent");
      }
    }
    return pos_ > start;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::string reason_;
};

std::size_t find_matching(const std::string &json, std::size_t open_pos, char open_ch,
                          char close_ch) {
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    if (ch == '"') {
      in_string = true;
    } else if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static const char *hex = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(hex[(ch >> 4) & 0x0F]);
        escaped.push_back(hex[ch & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto code = parse_hex4(raw, i + 1);
      if (!code.has_value()) {
        out.push_back(esc);
        break;
      }
      i += 4;
      std::uint32_t code_point = *code;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        if (auto low = parse_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_value_end(const std::string &json, std::size_t pos) {
  pos = json_skip_ws(json, pos);
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = find_matching(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && !is_scalar_terminator(json[end])) {
    ++end;
  }
  return end > pos ? end : std::string::npos;
}

Status json_validate(const std::string &json) { return JsonValidator(json).run(); }

std::optional<JsonMember> json_find_member(const std::string &object_json, const std::string &key) {
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return std::nullopt;
  }
  ++pos;

  while (true) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size() || object_json[pos] != '"') {
      return std::nullopt;
    }
    const std::size_t key_begin = pos;
    const auto key_end = json_find_string_end(object_json, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    const std::string name = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      return std::nullopt;
    }
    const std::size_t value_begin = json_skip_ws(object_json, pos + 1);
    const std::size_t value_end = json_value_end(object_json, value_begin);
    if (value_end == std::string::npos) {
      return std::nullopt;
    }
    if (name == key) {
      return JsonMember{key_begin, value_begin, value_end};
    }

    pos = json_skip_ws(object_json, value_end);
    if (pos < object_json.size() && object_json[pos] == ',') {
      ++pos;
      continue;
    }
    return std::nullopt;
  }
}

std::optional<std::string> json_get_raw(const std::string &object_json, const std::string &key) {
  const auto member = json_find_member(object_json, key);
  if (!member.has_value()) {
    return std::nullopt;
  }
  return object_json.substr(member->value_begin, member->value_end - member->value_begin);
}

std::optional<std::string> json_get_string(const std::string &object_json,
                                           const std::string &key) {
  const auto raw = json_get_raw(object_json, key);
  if (!raw.has_value() || raw->size() < 2 || raw->front() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw->substr(1, raw->size() - 2));
}

std::string json_get_object(const std::string &object_json, const std::string &key) {
  const auto raw = json_get_raw(object_json, key);
  if (!raw.has_value() || raw->empty() || raw->front() != '{') {
    return "";
  }
  return *raw;
}

std::vector<std::string> json_array_items(const std::string &array_json) {
  std::vector<std::string> items;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return items;
  }
  ++pos;

  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    const std::size_t end = json_value_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    items.push_back(array_json.substr(pos, end - pos));
    pos = json_skip_ws(array_json, end);
    if (pos < array_json.size() && array_json[pos] == ',') {
      ++pos;
      continue;
    }
    break;
  }
  return items;
}

std::vector<std::string> json_get_string_array(const std::string &object_json,
                                               const std::string &key) {
  std::vector<std::string> out;
  const auto raw = json_get_raw(object_json, key);
  if (!raw.has_value()) {
    return out;
  }
  for (const auto &item : json_array_items(*raw)) {
    if (item.size() >= 2 && item.front() == '"') {
      out.push_back(json_unescape(item.substr(1, item.size() - 2)));
    }
  }
  return out;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << json_quote(values[i]);
  }
  out << "]";
  return out.str();
}

std::string json_set_member(const std::string &object_json, const std::string &key,
                            const std::string &raw_value) {
  if (const auto member = json_find_member(object_json, key); member.has_value()) {
    std::string out = object_json;
    out.replace(member->value_begin, member->value_end - member->value_begin, raw_value);
    return out;
  }

  const std::size_t open = json_skip_ws(object_json, 0);
  const std::size_t end = open < object_json.size() && object_json[open] == '{'
                              ? json_value_end(object_json, open)
                              : std::string::npos;
  if (end == std::string::npos) {
    return "{" + json_quote(key) + ": " + raw_value + "}";
  }

  const std::size_t close = end - 1;
  std::size_t last = close;
  while (last > open + 1 && std::isspace(static_cast<unsigned char>(object_json[last - 1])) != 0) {
    --last;
  }
  const bool empty = last == open + 1;
  const bool multiline = object_json.find('\n', open) < close;

  std::string insertion;
  if (!empty) {
    insertion += ",";
  }
  insertion += multiline ? "\n  " : (empty ? "" : " ");
  insertion += json_quote(key) + ": " + raw_value;
  if (multiline) {
    insertion += "\n";
  }

  std::string out = object_json.substr(0, last);
  out += insertion;
  out += object_json.substr(close);
  return out;
}

} // namespace trustgate::common

#pragma once

#include "trustgate/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trustgate::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal (without the surrounding quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Position one past the end of the JSON value starting at `pos`, or npos if it is malformed.
[[nodiscard]] std::size_t json_value_end(const std::string &json, std::size_t pos);

/// Strict syntax check of a complete JSON document.
[[nodiscard]] Status json_validate(const std::string &json);

/// Location of one member inside an object: [key_begin, value_end) covers `"key": value`.
struct JsonMember {
  std::size_t key_begin = 0;
  std::size_t value_begin = 0;
  std::size_t value_end = 0;
};

/// Find a direct member of the object `object_json` (nested objects are not searched).
[[nodiscard]] std::optional<JsonMember> json_find_member(const std::string &object_json,
                                                         const std::string &key);

/// Raw text of a direct member value, e.g. `"abc"`, `12`, `{...}`.
[[nodiscard]] std::optional<std::string> json_get_raw(const std::string &object_json,
                                                      const std::string &key);

/// Decoded string member; nullopt when absent or not a string.
[[nodiscard]] std::optional<std::string> json_get_string(const std::string &object_json,
                                                         const std::string &key);

/// Object member including braces; empty when absent or not an object.
[[nodiscard]] std::string json_get_object(const std::string &object_json, const std::string &key);

/// Raw text of each element of a JSON array.
[[nodiscard]] std::vector<std::string> json_array_items(const std::string &array_json);

/// String elements of an array member; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &object_json,
                                                             const std::string &key);

[[nodiscard]] std::string json_quote(const std::string &value);
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Replace or append the member `key` of `object_json` with `raw_value`, preserving the
/// rest of the document text.
[[nodiscard]] std::string json_set_member(const std::string &object_json, const std::string &key,
                                          const std::string &raw_value);

} // namespace trustgate::common

#pragma once

#include "trustgate/common/result.hpp"

#include <filesystem>
#include <string>

namespace trustgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Absolute, lexically normalised form of `path`, resolved against `base` when relative.
[[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path &path,
                                                 const std::filesystem::path &base);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Whole-file read. Missing files are an error; callers check existence first.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes through a sibling temp file and renames it over `path`, creating parents.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace trustgate::common

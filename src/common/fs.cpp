#include "trustgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <regex>
#include <sstream>

namespace trustgate::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    if (const char *var = std::getenv(match[1].str().c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

std::filesystem::path resolve_path(const std::filesystem::path &path,
                                   const std::filesystem::path &base) {
  std::filesystem::path expanded(expand_path(path.string()));
  if (expanded.is_relative() && !base.empty()) {
    expanded = base / expanded;
  }
  if (expanded.is_relative()) {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
      expanded = cwd / expanded;
    }
  }
  return expanded.lexically_normal();
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  const auto normal_candidate = candidate.lexically_normal();
  const auto normal_parent = parent.lexically_normal();

  auto c_it = normal_candidate.begin();
  for (auto p_it = normal_parent.begin(); p_it != normal_parent.end(); ++p_it, ++c_it) {
    // "/a/b/" normalises with a trailing empty element.
    if (p_it->empty() && std::next(p_it) == normal_parent.end()) {
      break;
    }
    if (c_it == normal_candidate.end() || *c_it != *p_it) {
      return false;
    }
  }
  return true;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("failed to read " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error("failed to create " + path.parent_path().string() + ": " +
                           ec.message());
    }
  }

  static thread_local std::mt19937_64 rng{std::random_device{}()};
  const auto temp_path =
      std::filesystem::path(path.string() + ".tmp-" + std::to_string(rng() % 1'000'000'000ULL));
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("failed to open " + temp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      std::filesystem::remove(temp_path, ec);
      return Status::error("failed to write " + temp_path.string());
    }
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    return Status::error("failed to replace " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace trustgate::common

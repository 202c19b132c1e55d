#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace trustgate::security {

/// The working directory plus any configured additional directories. Paths inside it are
/// trusted for `cd`/`ls` and for file edits in acceptEdits mode.
class SafeZone {
public:
  SafeZone() = default;
  SafeZone(std::filesystem::path workdir, const std::vector<std::string> &additional_directories);

  [[nodiscard]] bool contains(const std::string &path) const;
  [[nodiscard]] std::filesystem::path resolve(const std::string &path) const;

  [[nodiscard]] const std::filesystem::path &workdir() const { return workdir_; }
  [[nodiscard]] const std::vector<std::filesystem::path> &additional_directories() const {
    return additional_;
  }

private:
  std::filesystem::path workdir_;
  std::vector<std::filesystem::path> additional_;
};

} // namespace trustgate::security

#include "trustgate/security/safe_zone.hpp"

#include "trustgate/common/fs.hpp"

namespace trustgate::security {

SafeZone::SafeZone(std::filesystem::path workdir,
                   const std::vector<std::string> &additional_directories) {
  if (!workdir.empty()) {
    workdir_ = common::resolve_path(workdir, {});
  }
  for (const auto &dir : additional_directories) {
    if (common::trim(dir).empty()) {
      continue;
    }
    additional_.push_back(resolve(dir));
  }
}

std::filesystem::path SafeZone::resolve(const std::string &path) const {
  return common::resolve_path(path, workdir_);
}

bool SafeZone::contains(const std::string &path) const {
  const auto absolute = resolve(path);
  if (!workdir_.empty() && common::is_subpath(absolute, workdir_)) {
    return true;
  }
  for (const auto &dir : additional_) {
    if (common::is_subpath(absolute, dir)) {
      return true;
    }
  }
  return false;
}

} // namespace trustgate::security

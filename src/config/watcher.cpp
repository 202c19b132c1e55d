#include "trustgate/config/watcher.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/observability/global.hpp"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace trustgate::config {

std::string fingerprint_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return "";
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return "";
  }
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(content.value().data()), content.value().size(),
         digest);
  std::ostringstream out;
  for (const unsigned char byte : digest) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return out.str();
}

void apply_settings(const ConfigResolver &resolver, security::PermissionManager &manager) {
  auto rules = resolver.resolve_rule_sets();
  manager.update_allowed_rules(std::move(rules.allow));
  manager.update_denied_rules(std::move(rules.deny));
  manager.update_additional_directories(std::move(rules.additional_directories));
  manager.update_configured_default_mode(resolver.resolve_configured_default_mode());
}

ConfigWatcher::ConfigWatcher(std::shared_ptr<ConfigResolver> resolver,
                             std::shared_ptr<security::PermissionManager> manager)
    : resolver_(std::move(resolver)), manager_(std::move(manager)), last_(fingerprints()) {}

ConfigWatcher::~ConfigWatcher() { stop(); }

std::map<std::string, std::string> ConfigWatcher::fingerprints() const {
  std::map<std::string, std::string> out;
  if (resolver_ == nullptr) {
    return out;
  }
  for (const auto &[scope, path] : resolver_->scope_paths()) {
    out[path.string()] = fingerprint_file(path);
  }
  return out;
}

bool ConfigWatcher::poll_once() {
  if (resolver_ == nullptr || manager_ == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(poll_mutex_);
  auto current = fingerprints();
  if (current == last_) {
    return false;
  }
  for (const auto &[path, digest] : current) {
    const auto it = last_.find(path);
    if (it == last_.end() || it->second != digest) {
      observability::record_config_reload(path);
    }
  }
  last_ = std::move(current);
  apply_settings(*resolver_, *manager_);
  return true;
}

void ConfigWatcher::start(const std::chrono::milliseconds interval) {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this, interval]() { run_loop(interval); });
}

void ConfigWatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ConfigWatcher::is_running() const { return running_; }

void ConfigWatcher::run_loop(const std::chrono::milliseconds interval) {
  while (running_) {
    poll_once();
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, interval, [this]() { return !running_; });
  }
}

} // namespace trustgate::config

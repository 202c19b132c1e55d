#pragma once

#include "trustgate/config/config.hpp"
#include "trustgate/security/permission_manager.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace trustgate::config {

/// Hex SHA-256 of a file's bytes; empty when the file does not exist or cannot be read.
[[nodiscard]] std::string fingerprint_file(const std::filesystem::path &path);

/// Push the resolver's current view of all scopes into a running manager.
void apply_settings(const ConfigResolver &resolver, security::PermissionManager &manager);

/// Polls the settings files of a resolver and refreshes the manager when any changes.
class ConfigWatcher {
public:
  ConfigWatcher(std::shared_ptr<ConfigResolver> resolver,
                std::shared_ptr<security::PermissionManager> manager);
  ~ConfigWatcher();

  ConfigWatcher(const ConfigWatcher &) = delete;
  ConfigWatcher &operator=(const ConfigWatcher &) = delete;

  /// Returns true when a change was detected and applied.
  bool poll_once();

  void start(std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
  void stop();
  [[nodiscard]] bool is_running() const;

private:
  [[nodiscard]] std::map<std::string, std::string> fingerprints() const;
  void run_loop(std::chrono::milliseconds interval);

  std::shared_ptr<ConfigResolver> resolver_;
  std::shared_ptr<security::PermissionManager> manager_;
  std::mutex poll_mutex_;
  std::map<std::string, std::string> last_;

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::thread thread_;
};

} // namespace trustgate::config

#pragma once

#include "trustgate/tools/tool_registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace trustgate::security {
class PermissionManager;
} // namespace trustgate::security

namespace trustgate::agent {

struct ToolCallRequest {
  std::string id;
  std::string name;
  tools::ToolArgs arguments;
};

struct ToolCallResult {
  std::string id;
  std::string name;
  tools::ToolResult result;
  /// The human dismissed a confirmation in this batch; the call did not run.
  bool cancelled = false;
};

/// Runs one model turn's tool calls concurrently, consulting the permission manager before
/// any restricted tool has side effects.
class ToolExecutor {
public:
  explicit ToolExecutor(tools::ToolRegistry &registry,
                        std::shared_ptr<security::PermissionManager> permissions = nullptr);

  void set_permission_manager(std::shared_ptr<security::PermissionManager> permissions);

  [[nodiscard]] std::vector<ToolCallResult> execute(const std::vector<ToolCallRequest> &calls,
                                                    const tools::ToolContext &ctx);

private:
  tools::ToolRegistry &registry_;
  std::mutex state_mutex_;
  std::shared_ptr<security::PermissionManager> permissions_;
};

} // namespace trustgate::agent

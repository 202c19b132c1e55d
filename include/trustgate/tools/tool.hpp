#pragma once

#include "trustgate/common/result.hpp"
#include "trustgate/security/permission_types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace trustgate::tools {

using ToolArgs = security::ToolInput;

struct ToolResult {
  std::string output;
  bool success = true;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  bool restricted = false;
};

struct ToolContext {
  std::filesystem::path workspace_path;
  std::string session_id;
  /// Per-call mode handed to the permission check, e.g. a subagent running in acceptEdits.
  std::optional<security::PermissionMode> permission_mode;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  /// Argument check run before the permission check; a failure never reaches the human.
  [[nodiscard]] virtual common::Status validate(const ToolArgs &) const {
    return common::Status::success();
  }
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] ToolSpec spec() const;
};

} // namespace trustgate::tools

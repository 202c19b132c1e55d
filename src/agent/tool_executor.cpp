#include "trustgate/agent/tool_executor.hpp"

#include "trustgate/observability/global.hpp"
#include "trustgate/security/permission_manager.hpp"

#include <atomic>
#include <exception>
#include <future>

namespace trustgate::agent {

namespace {

ToolCallResult cancelled_result(ToolCallResult out, const std::string &reason) {
  out.cancelled = true;
  out.result.success = false;
  out.result.output = "Tool call cancelled: " + reason;
  out.result.metadata["cancelled"] = "true";
  return out;
}

} // namespace

ToolExecutor::ToolExecutor(tools::ToolRegistry &registry,
                           std::shared_ptr<security::PermissionManager> permissions)
    : registry_(registry), permissions_(std::move(permissions)) {}

void ToolExecutor::set_permission_manager(std::shared_ptr<security::PermissionManager> permissions) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  permissions_ = std::move(permissions);
}

std::vector<ToolCallResult> ToolExecutor::execute(const std::vector<ToolCallRequest> &calls,
                                                  const tools::ToolContext &ctx) {
  std::shared_ptr<security::PermissionManager> permissions;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    permissions = permissions_;
  }

  auto aborted = std::make_shared<std::atomic<bool>>(false);
  std::vector<std::future<ToolCallResult>> futures;
  futures.reserve(calls.size());

  for (const auto &call : calls) {
    futures.push_back(std::async(std::launch::async, [this, call, ctx, permissions, aborted]() {
      ToolCallResult out;
      out.id = call.id;
      out.name = call.name;

      if (aborted->load()) {
        return cancelled_result(std::move(out), "an earlier confirmation in this turn was cancelled");
      }

      tools::ITool *tool = registry_.get_tool(call.name);
      if (tool == nullptr) {
        out.result.success = false;
        out.result.output = "Unknown tool: " + call.name;
        return out;
      }

      const auto valid = tool->validate(call.arguments);
      if (!valid.ok()) {
        out.result.success = false;
        out.result.output = "Invalid arguments for " + call.name + ": " + valid.error();
        return out;
      }

      const std::string tool_name(tool->name());
      if (permissions != nullptr && permissions->is_restricted_tool(tool_name)) {
        security::PermissionRequest request;
        request.tool_name = tool_name;
        request.tool_input = call.arguments;
        request.mode_override = ctx.permission_mode;

        const auto outcome = permissions->check_permission(request);
        if (security::is_cancelled(outcome)) {
          aborted->store(true);
          return cancelled_result(std::move(out), security::outcome_message(outcome));
        }
        if (!security::is_allowed(outcome)) {
          out.result.success = false;
          out.result.output = security::outcome_message(outcome);
          out.result.metadata["permission"] = "denied";
          return out;
        }
      }

      try {
        auto result = tool->execute(call.arguments, ctx);
        if (result.ok()) {
          out.result = result.value();
        } else {
          out.result.success = false;
          out.result.output = result.error();
        }
      } catch (const std::exception &e) {
        observability::record_error("tool_executor", tool_name + " threw: " + e.what());
        out.result.success = false;
        out.result.output = "Tool " + tool_name + " failed: " + e.what();
      } catch (...) {
        observability::record_error("tool_executor", tool_name + " threw a non-standard exception");
        out.result.success = false;
        out.result.output = "Tool " + tool_name + " failed: unknown error";
      }
      return out;
    }));
  }

  std::vector<ToolCallResult> results;
  results.reserve(calls.size());
  for (auto &future : futures) {
    results.push_back(future.get());
  }
  return results;
}

} // namespace trustgate::agent

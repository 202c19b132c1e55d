#pragma once

#include "trustgate/tools/tool.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace trustgate::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  /// Lookup is case-insensitive; the tool's own name() is canonical for permission rules.
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace trustgate::tools

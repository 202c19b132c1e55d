#include "trustgate/tools/tool.hpp"

namespace trustgate::tools {

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .restricted = security::is_restricted_tool(name())};
}

} // namespace trustgate::tools

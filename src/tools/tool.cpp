#include "opgate/tools/tool.hpp"

namespace opgate::tools {

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .safe = is_safe(),
                  .group = std::string(group())};
}

} // namespace opgate::tools

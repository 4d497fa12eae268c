#pragma once

#include "opgate/operation/handler.hpp"
#include "opgate/tools/tool.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace opgate::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  /// Case-insensitive lookup; nullptr when absent.
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::vector<ITool *> all_tools() const;

  /// Every filesystem and shell tool, bound to one handler.
  [[nodiscard]] static ToolRegistry
  create_operation(std::shared_ptr<operation::OperationHandler> handler);

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

/// Renders the registry as a JSON array of {name, description, parameters, safe, group}.
[[nodiscard]] std::string specs_to_json(const std::vector<ToolSpec> &specs);

} // namespace opgate::tools

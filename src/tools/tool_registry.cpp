#include "opgate/tools/tool_registry.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/common/json_util.hpp"
#include "opgate/tools/builtin/bash_tools.hpp"
#include "opgate/tools/builtin/file_tools.hpp"

namespace opgate::tools {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  ITool *raw = tool.get();
  by_name_[common::to_lower(std::string(raw->name()))] = raw;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<ITool *> ToolRegistry::all_tools() const {
  std::vector<ITool *> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.push_back(tool.get());
  }
  return out;
}

ToolRegistry
ToolRegistry::create_operation(std::shared_ptr<operation::OperationHandler> handler) {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<ReadFileTool>(handler));
  registry.register_tool(std::make_unique<WriteFileTool>(handler));
  registry.register_tool(std::make_unique<EditFileTool>(handler));
  registry.register_tool(std::make_unique<ListDirectoryTool>(handler));
  registry.register_tool(std::make_unique<ExecuteBashTool>(handler));
  registry.register_tool(std::make_unique<GetBashOutputTool>(handler));
  registry.register_tool(std::make_unique<KillBashTool>(handler));
  return registry;
}

std::string specs_to_json(const std::vector<ToolSpec> &specs) {
  std::string out = "[";
  for (std::size_t i = 0; i < specs.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    common::JsonObjectWriter writer;
    writer.add("name", specs[i].name)
        .add("description", specs[i].description)
        .add_raw("parameters", specs[i].parameters_json.empty() ? "{}" : specs[i].parameters_json)
        .add("safe", specs[i].safe)
        .add("group", specs[i].group);
    out += writer.str();
  }
  out += "]";
  return out;
}

} // namespace opgate::tools

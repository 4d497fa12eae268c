#include "opgate/tools/builtin/bash_tools.hpp"

#include "args_internal.hpp"

namespace opgate::tools {

using namespace builtin::args_internal;

ExecuteBashTool::ExecuteBashTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view ExecuteBashTool::name() const { return "execute_bash"; }

std::string_view ExecuteBashTool::description() const {
  return "Run a shell command in the foreground, or in the background and poll it with "
         "get_bash_output";
}

std::string ExecuteBashTool::parameters_schema() const {
  return R"({"type":"object","required":["command"],"properties":{"command":{"type":"string"},"description":{"type":"string"},"timeout":{"type":"integer","description":"Milliseconds, capped at 600000"},"run_in_background":{"type":"boolean","default":false}}})";
}

common::Result<ToolResult> ExecuteBashTool::execute(const ToolArgs &args,
                                                    const ToolContext &ctx) {
  auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::failure(command);
  }
  auto timeout = optional_int(args, "timeout");
  if (!timeout.ok()) {
    return common::Result<ToolResult>::failure(timeout);
  }
  if (timeout.value().has_value() && *timeout.value() <= 0) {
    return common::Result<ToolResult>::failure("Argument 'timeout' must be positive",
                                               common::ErrorKind::Validation);
  }
  auto background = optional_bool(args, "run_in_background", false);
  if (!background.ok()) {
    return common::Result<ToolResult>::failure(background);
  }

  operation::ExecuteBashRequest request;
  request.command = command.value();
  request.description = optional_arg(args, "description");
  if (timeout.value().has_value()) {
    request.timeout = static_cast<std::uint64_t>(*timeout.value());
  }
  request.run_in_background = background.value();

  auto result = to_tool_result(handler_->execute_bash(request, operation_context(ctx)));
  if (result.ok() && result.value().success) {
    // A non-zero exit is still a completed call; surface it for callers that branch on it.
    const auto exit_code = common::json_get_scalar(result.value().output, "exit_code");
    if (!exit_code.empty() && exit_code != "null") {
      result.value().metadata["exit_code"] = exit_code;
    }
  }
  return result;
}

bool ExecuteBashTool::is_safe() const { return false; }

std::string_view ExecuteBashTool::group() const { return "runtime"; }

GetBashOutputTool::GetBashOutputTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view GetBashOutputTool::name() const { return "get_bash_output"; }

std::string_view GetBashOutputTool::description() const {
  return "Fetch output a background command produced since the last poll";
}

std::string GetBashOutputTool::parameters_schema() const {
  return R"({"type":"object","required":["bash_id"],"properties":{"bash_id":{"type":"string"},"filter":{"type":"string","description":"Regex applied to each new line"}}})";
}

common::Result<ToolResult> GetBashOutputTool::execute(const ToolArgs &args,
                                                      const ToolContext &) {
  auto bash_id = required_arg(args, "bash_id");
  if (!bash_id.ok()) {
    return common::Result<ToolResult>::failure(bash_id);
  }
  operation::GetBashOutputRequest request{.bash_id = bash_id.value(),
                                          .filter = optional_arg(args, "filter")};
  return to_tool_result(handler_->get_bash_output(request));
}

bool GetBashOutputTool::is_safe() const { return true; }

std::string_view GetBashOutputTool::group() const { return "runtime"; }

KillBashTool::KillBashTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view KillBashTool::name() const { return "kill_bash"; }

std::string_view KillBashTool::description() const {
  return "Terminate a background command and discard its buffered output";
}

std::string KillBashTool::parameters_schema() const {
  return R"({"type":"object","required":["bash_id"],"properties":{"bash_id":{"type":"string"}}})";
}

common::Result<ToolResult> KillBashTool::execute(const ToolArgs &args, const ToolContext &) {
  auto bash_id = required_arg(args, "bash_id");
  if (!bash_id.ok()) {
    return common::Result<ToolResult>::failure(bash_id);
  }
  return to_tool_result(handler_->kill_bash(operation::KillBashRequest{.bash_id = bash_id.value()}));
}

bool KillBashTool::is_safe() const { return false; }

std::string_view KillBashTool::group() const { return "runtime"; }

} // namespace opgate::tools

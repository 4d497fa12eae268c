#include "opgate/tools/builtin/file_tools.hpp"

#include "args_internal.hpp"

namespace opgate::tools {

using namespace builtin::args_internal;

ReadFileTool::ReadFileTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view ReadFileTool::name() const { return "read_file"; }

std::string_view ReadFileTool::description() const {
  return "Read a text file with line numbers. Reading a file is required before it can be "
         "overwritten or edited.";
}

std::string ReadFileTool::parameters_schema() const {
  return R"({"type":"object","required":["file_path"],"properties":{"file_path":{"type":"string","description":"Absolute path"},"offset":{"type":"integer","description":"1-indexed first line"},"limit":{"type":"integer","description":"Maximum number of lines"}}})";
}

common::Result<ToolResult> ReadFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path = required_arg(args, "file_path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path);
  }
  auto offset = optional_int(args, "offset");
  if (!offset.ok()) {
    return common::Result<ToolResult>::failure(offset);
  }
  auto limit = optional_int(args, "limit");
  if (!limit.ok()) {
    return common::Result<ToolResult>::failure(limit);
  }

  operation::ReadFileRequest request{
      .file_path = path.value(), .offset = offset.value(), .limit = limit.value()};
  return to_tool_result(handler_->read_file(request, operation_context(ctx)));
}

bool ReadFileTool::is_safe() const { return true; }

std::string_view ReadFileTool::group() const { return "fs"; }

WriteFileTool::WriteFileTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view WriteFileTool::name() const { return "write_file"; }

std::string_view WriteFileTool::description() const {
  return "Write a file, creating parent directories. Existing files must be read first.";
}

std::string WriteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["file_path","content"],"properties":{"file_path":{"type":"string","description":"Absolute path"},"content":{"type":"string"}}})";
}

common::Result<ToolResult> WriteFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path = required_arg(args, "file_path");
  auto content = required_arg(args, "content", true);
  if (!path.ok() || !content.ok()) {
    return common::Result<ToolResult>::failure(path.ok() ? content.error() : path.error(),
                                               common::ErrorKind::Validation);
  }

  operation::WriteFileRequest request{.file_path = path.value(), .content = content.value()};
  return to_tool_result(handler_->write_file(request, operation_context(ctx)));
}

bool WriteFileTool::is_safe() const { return false; }

std::string_view WriteFileTool::group() const { return "fs"; }

EditFileTool::EditFileTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view EditFileTool::name() const { return "edit_file"; }

std::string_view EditFileTool::description() const {
  return "Replace an exact substring in a previously read file";
}

std::string EditFileTool::parameters_schema() const {
  return R"({"type":"object","required":["file_path","old_string","new_string"],"properties":{"file_path":{"type":"string","description":"Absolute path"},"old_string":{"type":"string"},"new_string":{"type":"string"},"replace_all":{"type":"boolean","default":false}}})";
}

common::Result<ToolResult> EditFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path = required_arg(args, "file_path");
  auto old_string = required_arg(args, "old_string", true);
  auto new_string = required_arg(args, "new_string", true);
  if (!path.ok() || !old_string.ok() || !new_string.ok()) {
    return common::Result<ToolResult>::failure(
        "Missing required arguments: file_path, old_string, new_string",
        common::ErrorKind::Validation);
  }
  auto replace_all = optional_bool(args, "replace_all", false);
  if (!replace_all.ok()) {
    return common::Result<ToolResult>::failure(replace_all);
  }

  operation::EditFileRequest request{.file_path = path.value(),
                                     .old_string = old_string.value(),
                                     .new_string = new_string.value(),
                                     .replace_all = replace_all.value()};
  return to_tool_result(handler_->edit_file(request, operation_context(ctx)));
}

bool EditFileTool::is_safe() const { return false; }

std::string_view EditFileTool::group() const { return "fs"; }

ListDirectoryTool::ListDirectoryTool(std::shared_ptr<operation::OperationHandler> handler)
    : handler_(std::move(handler)) {}

std::string_view ListDirectoryTool::name() const { return "list_directory"; }

std::string_view ListDirectoryTool::description() const {
  return "List directory entries, newest first, with optional glob filter";
}

std::string ListDirectoryTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Absolute directory path"},"pattern":{"type":"string","description":"Glob such as **/*.cpp"},"recursive":{"type":"boolean","default":false}}})";
}

common::Result<ToolResult> ListDirectoryTool::execute(const ToolArgs &args,
                                                      const ToolContext &ctx) {
  auto path = required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::failure(path);
  }
  auto recursive = optional_bool(args, "recursive", false);
  if (!recursive.ok()) {
    return common::Result<ToolResult>::failure(recursive);
  }

  operation::ListDirectoryRequest request{.path = path.value(),
                                          .pattern = optional_arg(args, "pattern"),
                                          .recursive = recursive.value()};
  return to_tool_result(handler_->list_directory(request, operation_context(ctx)));
}

bool ListDirectoryTool::is_safe() const { return true; }

std::string_view ListDirectoryTool::group() const { return "fs"; }

} // namespace opgate::tools

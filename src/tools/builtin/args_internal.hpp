#pragma once

#include "opgate/common/fs.hpp"
#include "opgate/common/json_util.hpp"
#include "opgate/operation/types.hpp"
#include "opgate/tools/tool.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>

namespace opgate::tools::builtin::args_internal {

template <typename T> common::Result<T> invalid(const std::string &message) {
  return common::Result<T>::failure(message, common::ErrorKind::Validation);
}

inline common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name,
                                                const bool allow_empty = false) {
  const auto it = args.find(name);
  if (it == args.end() || (!allow_empty && it->second.empty())) {
    return invalid<std::string>("Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

inline std::optional<std::string> optional_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end() || it->second.empty() || it->second == "null") {
    return std::nullopt;
  }
  return it->second;
}

inline common::Result<std::optional<std::int64_t>> optional_int(const ToolArgs &args,
                                                                const std::string &name) {
  using IntResult = common::Result<std::optional<std::int64_t>>;
  const auto raw = optional_arg(args, name);
  if (!raw.has_value()) {
    return IntResult::success(std::nullopt);
  }
  const std::string text = common::trim(*raw);
  std::int64_t parsed = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return invalid<std::optional<std::int64_t>>("Argument '" + name + "' must be an integer");
  }
  return IntResult::success(parsed);
}

inline common::Result<bool> optional_bool(const ToolArgs &args, const std::string &name,
                                          const bool fallback) {
  const auto raw = optional_arg(args, name);
  if (!raw.has_value()) {
    return common::Result<bool>::success(fallback);
  }
  const std::string text = common::to_lower(common::trim(*raw));
  if (text == "true" || text == "1") {
    return common::Result<bool>::success(true);
  }
  if (text == "false" || text == "0") {
    return common::Result<bool>::success(false);
  }
  return invalid<bool>("Argument '" + name + "' must be a boolean");
}

inline operation::OperationContext operation_context(const ToolContext &ctx) {
  return operation::OperationContext{.conversation_id = ctx.conversation_id};
}

/// Operation failures become an unsuccessful ToolResult carrying the message.
template <typename T>
common::Result<ToolResult> to_tool_result(const common::Result<T> &result) {
  ToolResult out;
  if (result.ok()) {
    out.output = operation::to_json(result.value());
    return common::Result<ToolResult>::success(std::move(out));
  }
  out.success = false;
  out.output = result.error();
  out.metadata["error_kind"] = std::string(common::error_kind_to_string(result.kind()));
  return common::Result<ToolResult>::success(std::move(out));
}

} // namespace opgate::tools::builtin::args_internal

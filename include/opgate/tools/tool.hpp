#pragma once

#include "opgate/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace opgate::tools {

/// Arguments as decoded from a flat JSON object: strings unescaped, numbers and booleans
/// as their literal text.
using ToolArgs = std::unordered_map<std::string, std::string>;

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  bool safe = false;
  std::string group;
};

struct ToolContext {
  std::string session_id;
  std::optional<std::int64_t> conversation_id;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  /// Argument problems fail the result. Operation failures come back as a ToolResult with
  /// success=false and the error kind in metadata["error_kind"].
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual bool is_safe() const = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;
};

} // namespace opgate::tools

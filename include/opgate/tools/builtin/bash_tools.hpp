#pragma once

#include "opgate/operation/handler.hpp"
#include "opgate/tools/tool.hpp"

#include <memory>

namespace opgate::tools {

class ExecuteBashTool final : public ITool {
public:
  explicit ExecuteBashTool(std::shared_ptr<operation::OperationHandler> handler);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<operation::OperationHandler> handler_;
};

class GetBashOutputTool final : public ITool {
public:
  explicit GetBashOutputTool(std::shared_ptr<operation::OperationHandler> handler);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<operation::OperationHandler> handler_;
};

class KillBashTool final : public ITool {
public:
  explicit KillBashTool(std::shared_ptr<operation::OperationHandler> handler);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<operation::OperationHandler> handler_;
};

} // namespace opgate::tools

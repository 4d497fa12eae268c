#pragma once

#include "opgate/common/result.hpp"
#include "opgate/config/schema.hpp"
#include "opgate/operation/state.hpp"
#include "opgate/operation/types.hpp"

#include <memory>
#include <string>

namespace opgate::operation {

class BashOperations {
public:
  BashOperations(std::shared_ptr<OperationState> state, config::OperationConfig config);

  /// Foreground commands block until exit or timeout. Background commands return an id
  /// immediately; their output is collected by a detached reader.
  [[nodiscard]] common::Result<ExecuteBashResponse> execute(const ExecuteBashRequest &request);

  /// Output produced since the previous call for this id.
  [[nodiscard]] common::Result<GetBashOutputResponse>
  get_output(const GetBashOutputRequest &request);

  [[nodiscard]] common::Result<KillBashResponse> kill(const KillBashRequest &request);

  [[nodiscard]] const std::string &shell() const { return shell_; }

private:
  [[nodiscard]] common::Result<ExecuteBashResponse> run_foreground(const std::string &command,
                                                                   std::uint64_t timeout_ms);
  [[nodiscard]] common::Result<ExecuteBashResponse> run_background(const std::string &command);

  std::shared_ptr<OperationState> state_;
  config::OperationConfig config_;
  std::string shell_;
};

/// Keeps the lines of `output` matching `pattern`. Nullopt when the pattern is not a
/// valid regex.
[[nodiscard]] std::optional<std::string> filter_lines(const std::string &output,
                                                     const std::string &pattern);

} // namespace opgate::operation

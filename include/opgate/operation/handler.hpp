#pragma once

#include "opgate/common/result.hpp"
#include "opgate/config/schema.hpp"
#include "opgate/operation/bash_ops.hpp"
#include "opgate/operation/file_ops.hpp"
#include "opgate/operation/permission.hpp"
#include "opgate/operation/state.hpp"
#include "opgate/operation/types.hpp"

#include <memory>
#include <string>

namespace opgate::operation {

/// Entry point for tool calls: dispatches typed requests to the file and bash operations
/// of one session and records a tool-call event for each.
class OperationHandler {
public:
  OperationHandler(std::shared_ptr<OperationState> state,
                   std::shared_ptr<PermissionManager> permissions, config::OperationConfig config);

  /// Builds a fresh session: new state sized from `config`, a permission manager over
  /// `store`, and the given approval sink.
  [[nodiscard]] static std::shared_ptr<OperationHandler>
  create(const config::Config &config, std::shared_ptr<IAllowlistStore> store,
         ApprovalEventSink sink = {});

  [[nodiscard]] common::Result<ReadFileResponse> read_file(const ReadFileRequest &request,
                                                           const OperationContext &context = {});
  [[nodiscard]] common::Result<WriteFileResponse>
  write_file(const WriteFileRequest &request, const OperationContext &context = {});
  [[nodiscard]] common::Result<EditFileResponse> edit_file(const EditFileRequest &request,
                                                           const OperationContext &context = {});
  [[nodiscard]] common::Result<ListDirectoryResponse>
  list_directory(const ListDirectoryRequest &request, const OperationContext &context = {});
  [[nodiscard]] common::Result<ExecuteBashResponse>
  execute_bash(const ExecuteBashRequest &request, const OperationContext &context = {});
  [[nodiscard]] common::Result<GetBashOutputResponse>
  get_bash_output(const GetBashOutputRequest &request);
  [[nodiscard]] common::Result<KillBashResponse> kill_bash(const KillBashRequest &request);

  /// Resolves a pending approval. `decision` is one of allow, allow_and_save, deny.
  [[nodiscard]] common::Status confirm_permission(const std::string &request_id,
                                                  const std::string &decision);

  [[nodiscard]] const std::shared_ptr<OperationState> &state() const { return state_; }
  [[nodiscard]] const std::shared_ptr<PermissionManager> &permissions() const {
    return permissions_;
  }
  [[nodiscard]] const config::OperationConfig &config() const { return config_; }

private:
  std::shared_ptr<OperationState> state_;
  std::shared_ptr<PermissionManager> permissions_;
  config::OperationConfig config_;
  FileOperations files_;
  BashOperations bash_;
};

} // namespace opgate::operation

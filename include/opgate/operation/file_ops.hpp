#pragma once

#include "opgate/common/result.hpp"
#include "opgate/config/schema.hpp"
#include "opgate/operation/permission.hpp"
#include "opgate/operation/state.hpp"
#include "opgate/operation/types.hpp"

#include <memory>

namespace opgate::operation {

class FileOperations {
public:
  FileOperations(std::shared_ptr<OperationState> state,
                 std::shared_ptr<PermissionManager> permissions, config::OperationConfig config);

  /// Line-numbered window of a text file. Never prompts; records the read on success.
  [[nodiscard]] common::Result<ReadFileResponse> read_file(const ReadFileRequest &request);

  /// Overwriting requires a prior read; creating a new file requires approval unless the
  /// path is allow-listed.
  [[nodiscard]] common::Result<WriteFileResponse> write_file(const WriteFileRequest &request,
                                                             const OperationContext &context);

  [[nodiscard]] common::Result<EditFileResponse> edit_file(const EditFileRequest &request);

  [[nodiscard]] common::Result<ListDirectoryResponse>
  list_directory(const ListDirectoryRequest &request);

private:
  std::shared_ptr<OperationState> state_;
  std::shared_ptr<PermissionManager> permissions_;
  config::OperationConfig config_;
};

} // namespace opgate::operation

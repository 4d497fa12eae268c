#include "opgate/operation/handler.hpp"

#include "opgate/observability/global.hpp"

#include <chrono>

namespace opgate::operation {

namespace {

template <typename Fn> auto instrumented(const char *tool, Fn &&fn) {
  const auto started = std::chrono::steady_clock::now();
  auto result = fn();
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_tool_call(tool, elapsed, result.ok(), result.ok() ? "" : result.error());
  return result;
}

} // namespace

OperationHandler::OperationHandler(std::shared_ptr<OperationState> state,
                                   std::shared_ptr<PermissionManager> permissions,
                                   config::OperationConfig config)
    : state_(std::move(state)), permissions_(std::move(permissions)), config_(std::move(config)),
      files_(state_, permissions_, config_), bash_(state_, config_) {}

std::shared_ptr<OperationHandler> OperationHandler::create(const config::Config &config,
                                                           std::shared_ptr<IAllowlistStore> store,
                                                           ApprovalEventSink sink) {
  auto state = std::make_shared<OperationState>(StateLimits{
      .max_pending_approvals = config.operation.max_pending_approvals,
      .max_background_processes = config.operation.max_background_processes});
  auto permissions = std::make_shared<PermissionManager>(state, std::move(store),
                                                         config.allowlist.key, std::move(sink));
  return std::make_shared<OperationHandler>(std::move(state), std::move(permissions),
                                            config.operation);
}

common::Result<ReadFileResponse> OperationHandler::read_file(const ReadFileRequest &request,
                                                             const OperationContext &) {
  return instrumented("read_file", [&] { return files_.read_file(request); });
}

common::Result<WriteFileResponse> OperationHandler::write_file(const WriteFileRequest &request,
                                                               const OperationContext &context) {
  return instrumented("write_file", [&] { return files_.write_file(request, context); });
}

common::Result<EditFileResponse> OperationHandler::edit_file(const EditFileRequest &request,
                                                             const OperationContext &) {
  return instrumented("edit_file", [&] { return files_.edit_file(request); });
}

common::Result<ListDirectoryResponse>
OperationHandler::list_directory(const ListDirectoryRequest &request, const OperationContext &) {
  return instrumented("list_directory", [&] { return files_.list_directory(request); });
}

common::Result<ExecuteBashResponse>
OperationHandler::execute_bash(const ExecuteBashRequest &request, const OperationContext &) {
  return instrumented("execute_bash", [&] { return bash_.execute(request); });
}

common::Result<GetBashOutputResponse>
OperationHandler::get_bash_output(const GetBashOutputRequest &request) {
  return instrumented("get_bash_output", [&] { return bash_.get_output(request); });
}

common::Result<KillBashResponse> OperationHandler::kill_bash(const KillBashRequest &request) {
  return instrumented("kill_bash", [&] { return bash_.kill(request); });
}

common::Status OperationHandler::confirm_permission(const std::string &request_id,
                                                    const std::string &decision) {
  const auto parsed = decision_from_string(decision);
  if (!parsed.ok()) {
    return common::Status::error(parsed.error(), parsed.kind());
  }
  if (!permissions_->confirm(request_id, parsed.value())) {
    return common::Status::error("Permission request not found or already resolved: " +
                                     request_id,
                                 common::ErrorKind::NotFound);
  }
  return common::Status::success();
}

} // namespace opgate::operation

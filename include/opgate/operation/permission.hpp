#pragma once

#include "opgate/common/result.hpp"
#include "opgate/operation/allowlist_store.hpp"
#include "opgate/operation/state.hpp"
#include "opgate/operation/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace opgate::operation {

inline constexpr const char *kAllowedDirectoriesKey = "ALLOWED_DIRECTORIES";

/// Delivers an approval request to whoever renders prompts. Returning an error means the
/// prompt could not be shown.
using ApprovalEventSink = std::function<common::Status(const PermissionRequestEvent &)>;

class PermissionManager {
public:
  PermissionManager(std::shared_ptr<OperationState> state,
                    std::shared_ptr<IAllowlistStore> store, std::string store_key,
                    ApprovalEventSink sink = {});

  void set_event_sink(ApprovalEventSink sink);

  /// ALLOWED_DIRECTORIES entries, trimmed and non-empty. A store failure is logged and
  /// yields an empty list.
  [[nodiscard]] std::vector<std::string> load_allowlist() const;
  [[nodiscard]] bool is_path_allowed(const std::string &path) const;

  /// Blocks the calling thread until the request is resolved or cancelled. No timeout.
  [[nodiscard]] common::Result<PermissionDecision>
  request_approval(const std::string &operation, const std::string &path,
                   const OperationContext &context);

  /// Persists the parent directory of `path`; already-listed directories are left alone.
  [[nodiscard]] common::Status add_to_allowlist(const std::string &path);
  [[nodiscard]] common::Status add_allowed_directory(const std::string &directory);

  [[nodiscard]] common::Result<bool> check_and_request(const std::string &operation,
                                                       const std::string &path,
                                                       const OperationContext &context);

  [[nodiscard]] bool confirm(const std::string &request_id, PermissionDecision decision);

  [[nodiscard]] const std::shared_ptr<OperationState> &state() const { return state_; }

private:
  [[nodiscard]] ApprovalEventSink current_sink() const;

  std::shared_ptr<OperationState> state_;
  std::shared_ptr<IAllowlistStore> store_;
  std::string store_key_;

  mutable std::mutex sink_mutex_;
  ApprovalEventSink sink_;

  std::mutex allowlist_write_mutex_;
};

/// True when `path` equals or is nested under `directory` once both are canonicalized.
[[nodiscard]] bool path_within(const std::string &path, const std::string &directory);

} // namespace opgate::operation

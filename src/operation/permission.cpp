#include "opgate/operation/permission.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/common/ids.hpp"
#include "opgate/common/kv_text.hpp"
#include "opgate/observability/global.hpp"

#include <algorithm>
#include <filesystem>
#include <future>

namespace opgate::operation {

namespace {

constexpr const char *kComponent = "permission";

std::optional<std::filesystem::path> canonical_form(const std::string &raw) {
  const std::string trimmed = common::trim(raw);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(trimmed, ec);
  if (ec) {
    return std::nullopt;
  }
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return std::nullopt;
  }
  std::string text = canonical.string();
  while (text.size() > 1 && text.back() == '/') {
    text.pop_back();
  }
  return std::filesystem::path(text);
}

std::vector<std::string> split_directories(const std::string &value) {
  std::vector<std::string> dirs;
  for (const auto &line : common::split_lines(value)) {
    const std::string dir = common::trim(line);
    if (!dir.empty()) {
      dirs.push_back(dir);
    }
  }
  return dirs;
}

std::string parent_directory(const std::string &path) {
  std::filesystem::path lexical = std::filesystem::path(path).lexically_normal();
  if (!lexical.has_filename() && lexical.has_parent_path()) {
    lexical = lexical.parent_path();
  }
  const auto parent = lexical.parent_path();
  return parent.empty() ? lexical.string() : parent.string();
}

} // namespace

bool path_within(const std::string &path, const std::string &directory) {
  const auto candidate = canonical_form(path);
  const auto parent = canonical_form(directory);
  if (!candidate.has_value() || !parent.has_value()) {
    return false;
  }
  return common::is_subpath(*candidate, *parent);
}

PermissionManager::PermissionManager(std::shared_ptr<OperationState> state,
                                     std::shared_ptr<IAllowlistStore> store,
                                     std::string store_key, ApprovalEventSink sink)
    : state_(std::move(state)), store_(std::move(store)), store_key_(std::move(store_key)),
      sink_(std::move(sink)) {}

void PermissionManager::set_event_sink(ApprovalEventSink sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = std::move(sink);
}

ApprovalEventSink PermissionManager::current_sink() const {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  return sink_;
}

std::vector<std::string> PermissionManager::load_allowlist() const {
  if (store_ == nullptr) {
    return {};
  }
  const auto blob = store_->load(store_key_);
  if (!blob.ok()) {
    observability::record_warning(kComponent, "failed to load allow-list: " + blob.error());
    return {};
  }
  const auto value = common::KvText::parse(blob.value()).get(kAllowedDirectoriesKey);
  return value.has_value() ? split_directories(*value) : std::vector<std::string>{};
}

bool PermissionManager::is_path_allowed(const std::string &path) const {
  const auto allowlist = load_allowlist();
  if (allowlist.empty()) {
    return false;
  }
  const auto candidate = canonical_form(path);
  if (!candidate.has_value()) {
    return false;
  }
  return std::any_of(allowlist.begin(), allowlist.end(), [&](const std::string &entry) {
    const auto directory = canonical_form(entry);
    return directory.has_value() && common::is_subpath(*candidate, *directory);
  });
}

common::Result<PermissionDecision>
PermissionManager::request_approval(const std::string &operation, const std::string &path,
                                    const OperationContext &context) {
  const auto sink = current_sink();
  if (!sink) {
    return common::Result<PermissionDecision>::failure(
        "No approval channel available; " + operation + " on " + path + " denied",
        common::ErrorKind::PermissionDenied);
  }

  const std::string request_id = common::generate_uuid();
  std::promise<PermissionDecision> reply;
  auto decision = reply.get_future();
  if (const auto stored = state_->store_pending_approval(request_id, std::move(reply));
      !stored.ok()) {
    return common::Result<PermissionDecision>::failure(stored);
  }

  observability::record_approval_requested(request_id, operation, path);
  const PermissionRequestEvent event{.request_id = request_id,
                                     .operation = operation,
                                     .path = path,
                                     .conversation_id = context.conversation_id};
  if (const auto emitted = sink(event); !emitted.ok()) {
    (void)state_->discard_pending_approval(request_id);
    observability::record_warning(kComponent,
                                  "failed to emit approval request: " + emitted.error());
    return common::Result<PermissionDecision>::failure(
        "Failed to request permission: " + emitted.error(), common::ErrorKind::Io);
  }

  try {
    return common::Result<PermissionDecision>::success(decision.get());
  } catch (const std::future_error &) {
    observability::record_warning(kComponent, "approval " + request_id + " was cancelled");
    return common::Result<PermissionDecision>::failure("Permission request was cancelled",
                                                       common::ErrorKind::Cancelled);
  }
}

common::Status PermissionManager::add_to_allowlist(const std::string &path) {
  return add_allowed_directory(parent_directory(path));
}

common::Status PermissionManager::add_allowed_directory(const std::string &directory) {
  if (store_ == nullptr) {
    return common::Status::error("No allow-list store configured");
  }
  if (common::trim(directory).empty()) {
    return common::Status::error("Directory must not be empty", common::ErrorKind::Validation);
  }

  std::lock_guard<std::mutex> lock(allowlist_write_mutex_);
  const auto blob = store_->load(store_key_);
  if (!blob.ok()) {
    return common::Status::error(blob.error(), blob.kind());
  }

  auto kv = common::KvText::parse(blob.value());
  auto directories = split_directories(kv.get(kAllowedDirectoriesKey).value_or(""));
  const std::string entry = common::trim(directory);
  if (std::find(directories.begin(), directories.end(), entry) != directories.end()) {
    return common::Status::success();
  }
  directories.push_back(entry);

  std::string joined;
  for (const auto &dir : directories) {
    if (!joined.empty()) {
      joined.push_back('\n');
    }
    joined += dir;
  }
  kv.set(kAllowedDirectoriesKey, joined);
  return store_->save(store_key_, kv.serialize());
}

common::Result<bool> PermissionManager::check_and_request(const std::string &operation,
                                                          const std::string &path,
                                                          const OperationContext &context) {
  if (is_path_allowed(path)) {
    return common::Result<bool>::success(true);
  }

  const auto decision = request_approval(operation, path, context);
  if (!decision.ok()) {
    return common::Result<bool>::failure(decision);
  }

  switch (decision.value()) {
  case PermissionDecision::Allow:
    return common::Result<bool>::success(true);
  case PermissionDecision::AllowAndSave:
    if (const auto saved = add_to_allowlist(path); !saved.ok()) {
      observability::record_warning(kComponent, "failed to persist allow-list entry for " +
                                                    path + ": " + saved.error());
    }
    return common::Result<bool>::success(true);
  case PermissionDecision::Deny:
    break;
  }
  return common::Result<bool>::success(false);
}

bool PermissionManager::confirm(const std::string &request_id,
                                const PermissionDecision decision) {
  const bool delivered = state_->resolve_pending_approval(request_id, decision);
  observability::record_approval_resolved(request_id, std::string(to_string(decision)),
                                          delivered);
  return delivered;
}

} // namespace opgate::operation

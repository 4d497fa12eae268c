#include "opgate/operation/state.hpp"

#include "opgate/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <vector>

namespace opgate::operation {

namespace {

std::int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

std::string read_ledger_key(const std::string &path) {
  std::string normalized = std::filesystem::path(path).lexically_normal().string();
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

OperationState::OperationState(StateLimits limits) : limits_(limits) {}

OperationState::~OperationState() {
  // Waiters must see cancellation before their promises are destroyed with the map.
  cancel_pending_approvals();
}

void OperationState::record_file_read(const std::string &path) {
  const std::string key = read_ledger_key(path);
  std::lock_guard<std::mutex> lock(reads_mutex_);
  file_reads_[key] = FileReadRecord{.path = key, .read_time = unix_now()};
}

bool OperationState::has_file_been_read(const std::string &path) const {
  const std::string key = read_ledger_key(path);
  std::lock_guard<std::mutex> lock(reads_mutex_);
  return file_reads_.contains(key);
}

std::optional<FileReadRecord> OperationState::file_read_record(const std::string &path) const {
  const std::string key = read_ledger_key(path);
  std::lock_guard<std::mutex> lock(reads_mutex_);
  const auto it = file_reads_.find(key);
  if (it == file_reads_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void OperationState::clear_file_read(const std::string &path) {
  const std::string key = read_ledger_key(path);
  std::lock_guard<std::mutex> lock(reads_mutex_);
  file_reads_.erase(key);
}

void OperationState::clear_all_file_reads() {
  std::lock_guard<std::mutex> lock(reads_mutex_);
  file_reads_.clear();
}

common::Status OperationState::store_background_process(const std::string &id,
                                                        std::unique_ptr<ChildProcess> process) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(processes_mutex_);
    if (processes_.contains(id)) {
      return common::Status::error("Background process id already registered: " + id,
                                   common::ErrorKind::Validation);
    }
    if (running_count_locked() >= limits_.max_background_processes) {
      return common::Status::error("Too many background processes (limit " +
                                       std::to_string(limits_.max_background_processes) + ")",
                                   common::ErrorKind::Io);
    }
    processes_.emplace(id, BackgroundProcessEntry{.process = std::move(process)});
    count = running_count_locked();
  }
  observability::record_metric(observability::BackgroundProcessesMetric{.count = count});
  return common::Status::success();
}

void OperationState::append_output(const std::string &id, const std::string &text) {
  std::lock_guard<std::mutex> lock(processes_mutex_);
  if (const auto it = processes_.find(id); it != processes_.end()) {
    it->second.output += text;
  }
}

std::optional<IncrementalOutput> OperationState::poll_incremental_output(const std::string &id) {
  std::lock_guard<std::mutex> lock(processes_mutex_);
  const auto it = processes_.find(id);
  if (it == processes_.end()) {
    return std::nullopt;
  }
  auto &entry = it->second;
  IncrementalOutput result;
  result.delta = entry.output.substr(entry.cursor);
  entry.cursor = entry.output.size();
  result.completed = entry.completed;
  if (entry.completed) {
    result.exit_code = entry.exit_code;
  }
  return result;
}

void OperationState::mark_completed(const std::string &id, const int exit_code) {
  std::unique_ptr<ChildProcess> released;
  std::size_t running = 0;
  {
    std::lock_guard<std::mutex> lock(processes_mutex_);
    const auto it = processes_.find(id);
    if (it == processes_.end() || it->second.completed) {
      return;
    }
    it->second.completed = true;
    it->second.exit_code = exit_code;
    released = std::move(it->second.process);
    running = running_count_locked();
  }
  observability::record_metric(observability::BackgroundProcessesMetric{.count = running});
  // Destroyed outside the lock: a handle that was never reaped terminates its group.
  released.reset();
}

std::optional<int> OperationState::get_exit_code(const std::string &id) {
  std::lock_guard<std::mutex> lock(processes_mutex_);
  const auto it = processes_.find(id);
  if (it == processes_.end()) {
    return std::nullopt;
  }
  auto &entry = it->second;
  if (entry.completed) {
    return entry.exit_code;
  }
  if (entry.process != nullptr) {
    return entry.process->try_wait();
  }
  return std::nullopt;
}

std::optional<int> OperationState::remove_background_process(const std::string &id) {
  BackgroundProcessEntry removed;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(processes_mutex_);
    const auto it = processes_.find(id);
    if (it == processes_.end()) {
      return std::nullopt;
    }
    removed = std::move(it->second);
    processes_.erase(it);
    count = running_count_locked();
  }
  observability::record_metric(observability::BackgroundProcessesMetric{.count = count});

  if (removed.completed) {
    return removed.exit_code;
  }
  if (removed.process != nullptr) {
    return removed.process->terminate();
  }
  return -1;
}

bool OperationState::background_process_exists(const std::string &id) const {
  std::lock_guard<std::mutex> lock(processes_mutex_);
  return processes_.contains(id);
}

std::size_t OperationState::background_process_count() const {
  std::lock_guard<std::mutex> lock(processes_mutex_);
  return processes_.size();
}

std::size_t OperationState::running_process_count() const {
  std::lock_guard<std::mutex> lock(processes_mutex_);
  return running_count_locked();
}

std::size_t OperationState::running_count_locked() const {
  return static_cast<std::size_t>(
      std::count_if(processes_.begin(), processes_.end(),
                    [](const auto &entry) { return !entry.second.completed; }));
}

common::Status OperationState::store_pending_approval(const std::string &id,
                                                      std::promise<PermissionDecision> reply) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    if (approvals_.contains(id)) {
      return common::Status::error("Approval request id already pending: " + id,
                                   common::ErrorKind::Validation);
    }
    if (approvals_.size() >= limits_.max_pending_approvals) {
      return common::Status::error("Too many pending approvals (limit " +
                                       std::to_string(limits_.max_pending_approvals) + ")",
                                   common::ErrorKind::Io);
    }
    approvals_.emplace(id, std::move(reply));
    count = approvals_.size();
  }
  observability::record_metric(observability::PendingApprovalsMetric{.count = count});
  return common::Status::success();
}

bool OperationState::resolve_pending_approval(const std::string &id,
                                              const PermissionDecision decision) {
  std::promise<PermissionDecision> reply;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    const auto it = approvals_.find(id);
    if (it == approvals_.end()) {
      return false;
    }
    reply = std::move(it->second);
    approvals_.erase(it);
    count = approvals_.size();
  }
  observability::record_metric(observability::PendingApprovalsMetric{.count = count});
  try {
    reply.set_value(decision);
  } catch (const std::future_error &) {
    return false;
  }
  return true;
}

bool OperationState::discard_pending_approval(const std::string &id) {
  std::promise<PermissionDecision> dropped;
  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    const auto it = approvals_.find(id);
    if (it == approvals_.end()) {
      return false;
    }
    dropped = std::move(it->second);
    approvals_.erase(it);
  }
  return true;
}

void OperationState::cancel_pending_approvals() {
  std::unordered_map<std::string, std::promise<PermissionDecision>> dropped;
  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    dropped.swap(approvals_);
  }
  if (!dropped.empty()) {
    observability::record_metric(observability::PendingApprovalsMetric{.count = 0});
  }
}

std::size_t OperationState::pending_approval_count() const {
  std::lock_guard<std::mutex> lock(approvals_mutex_);
  return approvals_.size();
}

} // namespace opgate::operation

#pragma once

#include "opgate/common/result.hpp"
#include "opgate/operation/process.hpp"
#include "opgate/operation/types.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace opgate::operation {

struct FileReadRecord {
  std::string path;
  std::int64_t read_time = 0;
};

struct IncrementalOutput {
  std::string delta;
  bool completed = false;
  std::optional<int> exit_code;
};

struct StateLimits {
  std::size_t max_pending_approvals = 64;
  std::size_t max_background_processes = 32;
};

/// Session-wide shared state: the read ledger, the background process table and the
/// pending approval table. Each table has its own lock, so work on one never waits on
/// another. Share it through std::shared_ptr.
class OperationState {
public:
  explicit OperationState(StateLimits limits = {});
  ~OperationState();
  OperationState(const OperationState &) = delete;
  OperationState &operator=(const OperationState &) = delete;

  void record_file_read(const std::string &path);
  [[nodiscard]] bool has_file_been_read(const std::string &path) const;
  [[nodiscard]] std::optional<FileReadRecord> file_read_record(const std::string &path) const;
  void clear_file_read(const std::string &path);
  void clear_all_file_reads();

  [[nodiscard]] common::Status store_background_process(const std::string &id,
                                                        std::unique_ptr<ChildProcess> process);
  void append_output(const std::string &id, const std::string &text);
  [[nodiscard]] std::optional<IncrementalOutput> poll_incremental_output(const std::string &id);
  void mark_completed(const std::string &id, int exit_code);
  [[nodiscard]] std::optional<int> get_exit_code(const std::string &id);
  /// Removes the entry; a still-running process is terminated. Returns the exit code the
  /// entry ended with, or nullopt when the id is unknown.
  std::optional<int> remove_background_process(const std::string &id);
  [[nodiscard]] bool background_process_exists(const std::string &id) const;
  /// Every entry, finished ones included, until it is removed.
  [[nodiscard]] std::size_t background_process_count() const;
  /// Entries not yet marked completed; this is what max_background_processes bounds.
  [[nodiscard]] std::size_t running_process_count() const;

  [[nodiscard]] common::Status store_pending_approval(const std::string &id,
                                                      std::promise<PermissionDecision> reply);
  /// Delivers the decision. False when the id is unknown or already resolved.
  [[nodiscard]] bool resolve_pending_approval(const std::string &id, PermissionDecision decision);
  /// Drops the reply channel without a decision; the waiter observes cancellation.
  bool discard_pending_approval(const std::string &id);
  void cancel_pending_approvals();
  [[nodiscard]] std::size_t pending_approval_count() const;

  [[nodiscard]] const StateLimits &limits() const { return limits_; }

private:
  struct BackgroundProcessEntry {
    std::unique_ptr<ChildProcess> process;
    std::string output;
    std::size_t cursor = 0;
    bool completed = false;
    std::optional<int> exit_code;
  };

  [[nodiscard]] std::size_t running_count_locked() const;

  StateLimits limits_;

  mutable std::mutex reads_mutex_;
  std::unordered_map<std::string, FileReadRecord> file_reads_;

  mutable std::mutex processes_mutex_;
  std::unordered_map<std::string, BackgroundProcessEntry> processes_;

  mutable std::mutex approvals_mutex_;
  std::unordered_map<std::string, std::promise<PermissionDecision>> approvals_;
};

/// Key used by the read ledger: the lexically normalized absolute path. Symlinks are not
/// resolved.
[[nodiscard]] std::string read_ledger_key(const std::string &path);

} // namespace opgate::operation

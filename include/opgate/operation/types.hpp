#pragma once

#include "opgate/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace opgate::operation {

enum class PermissionDecision { Allow, AllowAndSave, Deny };

[[nodiscard]] std::string_view to_string(PermissionDecision decision);
[[nodiscard]] common::Result<PermissionDecision> decision_from_string(const std::string &value);

enum class BashProcessStatus { Running, Completed, Error };

[[nodiscard]] std::string_view to_string(BashProcessStatus status);

/// Caller identity forwarded with approval requests so the UI can route the prompt.
struct OperationContext {
  std::optional<std::int64_t> conversation_id;
};

/// Emitted once per newly pending approval.
struct PermissionRequestEvent {
  std::string request_id;
  std::string operation;
  std::string path;
  std::optional<std::int64_t> conversation_id;
};

struct ReadFileRequest {
  std::string file_path;
  std::optional<std::int64_t> offset;
  std::optional<std::int64_t> limit;
};

struct ReadFileResponse {
  std::string file_path;
  std::string content;
  std::size_t start_line = 0;
  std::size_t end_line = 0;
  std::size_t total_lines = 0;
  bool has_more = false;
};

struct WriteFileRequest {
  std::string file_path;
  std::string content;
};

struct WriteFileResponse {
  std::string file_path;
  std::size_t bytes_written = 0;
  bool created = false;
  std::string message;
};

struct EditFileRequest {
  std::string file_path;
  std::string old_string;
  std::string new_string;
  bool replace_all = false;
};

struct EditFileResponse {
  std::string file_path;
  std::size_t replacements_made = 0;
  std::string message;
};

struct ListDirectoryRequest {
  std::string path;
  std::optional<std::string> pattern;
  bool recursive = false;
};

struct DirectoryEntry {
  std::string name;
  std::string path;
  bool is_directory = false;
  std::optional<std::uint64_t> size;
  std::optional<std::int64_t> modified;
};

struct ListDirectoryResponse {
  std::string path;
  std::vector<DirectoryEntry> entries;
};

struct ExecuteBashRequest {
  std::string command;
  std::optional<std::string> description;
  std::optional<std::uint64_t> timeout;
  bool run_in_background = false;
};

struct ExecuteBashResponse {
  std::optional<std::string> bash_id;
  std::optional<std::string> output;
  std::optional<int> exit_code;
  bool truncated = false;
  std::string message;
};

struct GetBashOutputRequest {
  std::string bash_id;
  std::optional<std::string> filter;
};

struct GetBashOutputResponse {
  std::string bash_id;
  BashProcessStatus status = BashProcessStatus::Running;
  std::string output;
  std::optional<int> exit_code;
};

struct KillBashRequest {
  std::string bash_id;
};

struct KillBashResponse {
  std::string bash_id;
  bool was_running = false;
  std::optional<int> exit_code;
};

[[nodiscard]] std::string to_json(const PermissionRequestEvent &event);
[[nodiscard]] std::string to_json(const ReadFileResponse &response);
[[nodiscard]] std::string to_json(const WriteFileResponse &response);
[[nodiscard]] std::string to_json(const EditFileResponse &response);
[[nodiscard]] std::string to_json(const ListDirectoryResponse &response);
[[nodiscard]] std::string to_json(const ExecuteBashResponse &response);
[[nodiscard]] std::string to_json(const GetBashOutputResponse &response);
[[nodiscard]] std::string to_json(const KillBashResponse &response);

} // namespace opgate::operation

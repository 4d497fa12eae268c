#include "opgate/operation/file_ops.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/operation/glob.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace opgate::operation {

namespace {

namespace fs = std::filesystem;

constexpr std::size_t kBinaryProbeBytes = 8192;
constexpr const char *kTruncatedMarker = "...[truncated]";

template <typename T> common::Result<T> validation_error(const std::string &message) {
  return common::Result<T>::failure(message, common::ErrorKind::Validation);
}

bool is_absolute_path(const std::string &path) {
  return !path.empty() && fs::path(path).is_absolute();
}

bool is_binary_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::array<char, kBinaryProbeBytes> buffer{};
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  const auto count = static_cast<std::size_t>(in.gcount());
  return std::find(buffer.begin(), buffer.begin() + count, '\0') != buffer.begin() + count;
}

common::Result<std::string> read_whole_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure("Failed to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return common::Result<std::string>::failure("Failed to read file: " + path.string());
  }
  return common::Result<std::string>::success(buffer.str());
}

// Cuts at `limit` bytes without splitting a UTF-8 sequence.
std::string truncate_line(const std::string &line, const std::size_t limit) {
  if (line.size() <= limit) {
    return line;
  }
  std::size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return line.substr(0, cut) + kTruncatedMarker;
}

std::optional<std::int64_t> modified_seconds(const fs::directory_entry &entry) {
  std::error_code ec;
  const auto written = entry.last_write_time(ec);
  if (ec) {
    return std::nullopt;
  }
  const auto system_time = std::chrono::time_point_cast<std::chrono::seconds>(
      written - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
  return system_time.time_since_epoch().count();
}

DirectoryEntry describe(const fs::directory_entry &entry) {
  std::error_code ec;
  DirectoryEntry out;
  out.name = entry.path().filename().string();
  out.path = entry.path().string();
  out.is_directory = entry.is_directory(ec);
  if (!out.is_directory) {
    ec.clear();
    if (entry.is_regular_file(ec)) {
      const auto size = entry.file_size(ec);
      if (!ec) {
        out.size = size;
      }
    }
  }
  out.modified = modified_seconds(entry);
  return out;
}

// Everything up to the first segment containing a wildcard.
fs::path literal_prefix(const std::string &pattern) {
  fs::path prefix;
  for (const auto &part : fs::path(pattern).parent_path()) {
    const std::string segment = part.string();
    if (segment.find_first_of("*?[{") != std::string::npos) {
      break;
    }
    prefix /= part;
  }
  return prefix.empty() ? fs::path("/") : prefix;
}

void collect(const fs::path &root, const bool recursive, std::vector<fs::directory_entry> &out) {
  std::error_code ec;
  if (!recursive) {
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
      out.push_back(*it);
    }
    return;
  }
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    out.push_back(*it);
  }
}

} // namespace

FileOperations::FileOperations(std::shared_ptr<OperationState> state,
                               std::shared_ptr<PermissionManager> permissions,
                               config::OperationConfig config)
    : state_(std::move(state)), permissions_(std::move(permissions)), config_(std::move(config)) {}

common::Result<ReadFileResponse> FileOperations::read_file(const ReadFileRequest &request) {
  const std::string &path = request.file_path;
  if (!is_absolute_path(path)) {
    return validation_error<ReadFileResponse>("File path must be absolute: " + path);
  }
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return common::Result<ReadFileResponse>::failure("File not found: " + path,
                                                     common::ErrorKind::NotFound);
  }
  if (fs::is_directory(path, ec)) {
    return validation_error<ReadFileResponse>(
        "Cannot read a directory. Use list_directory instead: " + path);
  }
  if (request.limit.has_value() && *request.limit < 0) {
    return validation_error<ReadFileResponse>("limit must not be negative");
  }
  if (is_binary_file(path)) {
    return validation_error<ReadFileResponse>("Cannot read binary file: " + path);
  }

  const auto content = read_whole_file(path);
  if (!content.ok()) {
    return common::Result<ReadFileResponse>::failure(content);
  }

  const auto lines = common::split_lines(content.value());
  const std::size_t total = lines.size();
  const auto offset = static_cast<std::size_t>(std::max<std::int64_t>(request.offset.value_or(1), 1));
  const auto limit = request.limit.has_value() ? static_cast<std::size_t>(*request.limit)
                                               : config_.max_read_lines;
  const std::size_t start = std::min(offset - 1, total);
  const std::size_t end = start + std::min(limit, total - start);

  std::ostringstream out;
  for (std::size_t i = start; i < end; ++i) {
    out << std::setw(6) << (i + 1) << '\t' << truncate_line(lines[i], config_.max_line_length)
        << '\n';
  }

  state_->record_file_read(path);

  ReadFileResponse response;
  response.file_path = path;
  response.content = out.str();
  response.start_line = start + 1;
  response.end_line = end;
  response.total_lines = total;
  response.has_more = end < total;
  return common::Result<ReadFileResponse>::success(std::move(response));
}

common::Result<WriteFileResponse> FileOperations::write_file(const WriteFileRequest &request,
                                                             const OperationContext &context) {
  const std::string &path = request.file_path;
  if (!is_absolute_path(path)) {
    return validation_error<WriteFileResponse>("File path must be absolute: " + path);
  }

  const bool already_read = state_->has_file_been_read(path);
  std::error_code ec;
  const bool existed = fs::exists(path, ec);
  if (existed && fs::is_directory(path, ec)) {
    return validation_error<WriteFileResponse>("Path is a directory: " + path);
  }
  // Rejected before prompting: no answer could make an unread overwrite valid.
  if (existed && !already_read) {
    return validation_error<WriteFileResponse>(
        "Safety check failed: you must read the file before overwriting it. Use read_file "
        "to read '" +
        path + "' first, or use write_file only for new files.");
  }

  if (!already_read) {
    const auto allowed = permissions_->check_and_request("write_file", path, context);
    if (!allowed.ok()) {
      return common::Result<WriteFileResponse>::failure(allowed);
    }
    if (!allowed.value()) {
      return common::Result<WriteFileResponse>::failure("Permission denied by user",
                                                        common::ErrorKind::PermissionDenied);
    }
  }

  if (const auto parent = fs::path(path).parent_path(); !parent.empty()) {
    if (const auto ensured = common::ensure_dir(parent); !ensured.ok()) {
      return common::Result<WriteFileResponse>::failure(ensured);
    }
  }
  if (const auto written = common::write_file_atomic(path, request.content); !written.ok()) {
    return common::Result<WriteFileResponse>::failure(written);
  }
  // The caller now knows the exact contents, which is what a read proves.
  state_->record_file_read(path);

  WriteFileResponse response;
  response.file_path = path;
  response.bytes_written = request.content.size();
  response.created = !existed;
  response.message = "Successfully wrote " + std::to_string(request.content.size()) +
                     " bytes to " + path;
  return common::Result<WriteFileResponse>::success(std::move(response));
}

common::Result<EditFileResponse> FileOperations::edit_file(const EditFileRequest &request) {
  const std::string &path = request.file_path;
  if (request.old_string == request.new_string) {
    return validation_error<EditFileResponse>("old_string and new_string must be different");
  }
  if (request.old_string.empty()) {
    return validation_error<EditFileResponse>("old_string must not be empty");
  }
  if (!is_absolute_path(path)) {
    return validation_error<EditFileResponse>("File path must be absolute: " + path);
  }
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return common::Result<EditFileResponse>::failure("File not found: " + path,
                                                     common::ErrorKind::NotFound);
  }
  if (fs::is_directory(path, ec)) {
    return validation_error<EditFileResponse>("Cannot edit a directory: " + path);
  }
  if (!state_->has_file_been_read(path)) {
    return validation_error<EditFileResponse>(
        "Safety check failed: you must read the file before editing it. Use read_file to "
        "read '" +
        path + "' first.");
  }

  const auto content = read_whole_file(path);
  if (!content.ok()) {
    return common::Result<EditFileResponse>::failure(content);
  }

  const std::string &text = content.value();
  std::string updated;
  updated.reserve(text.size());
  std::size_t replacements = 0;
  std::size_t cursor = 0;
  while (true) {
    const std::size_t found = text.find(request.old_string, cursor);
    if (found == std::string::npos || (replacements > 0 && !request.replace_all)) {
      break;
    }
    updated.append(text, cursor, found - cursor);
    updated += request.new_string;
    cursor = found + request.old_string.size();
    ++replacements;
  }
  if (replacements == 0) {
    return common::Result<EditFileResponse>::failure(
        "old_string not found in file. Make sure it matches exactly, including whitespace.",
        common::ErrorKind::NotFound);
  }
  updated.append(text, cursor, std::string::npos);

  if (const auto written = common::write_file_atomic(path, updated); !written.ok()) {
    return common::Result<EditFileResponse>::failure(written);
  }

  EditFileResponse response;
  response.file_path = path;
  response.replacements_made = replacements;
  response.message =
      "Successfully made " + std::to_string(replacements) + " replacement(s) in " + path;
  return common::Result<EditFileResponse>::success(std::move(response));
}

common::Result<ListDirectoryResponse>
FileOperations::list_directory(const ListDirectoryRequest &request) {
  const std::string &path = request.path;
  if (!is_absolute_path(path)) {
    return validation_error<ListDirectoryResponse>("Path must be absolute: " + path);
  }
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return common::Result<ListDirectoryResponse>::failure("Directory not found: " + path,
                                                          common::ErrorKind::NotFound);
  }
  if (!fs::is_directory(path, ec)) {
    return validation_error<ListDirectoryResponse>("Path is not a directory: " + path);
  }

  const fs::path base(path);
  std::vector<fs::directory_entry> candidates;
  std::vector<DirectoryEntry> entries;

  const std::string pattern = common::trim(request.pattern.value_or(""));
  if (pattern.empty()) {
    collect(base, request.recursive, candidates);
    for (const auto &candidate : candidates) {
      entries.push_back(describe(candidate));
    }
  } else {
    const auto matcher = GlobMatcher::compile(pattern);
    if (!matcher.ok()) {
      return common::Result<ListDirectoryResponse>::failure(matcher);
    }
    const bool absolute = pattern.front() == '/';
    const bool multi_segment = pattern.find('/') != std::string::npos;
    const bool deep = request.recursive || multi_segment || pattern.find("**") != std::string::npos;
    const fs::path root = absolute ? literal_prefix(pattern) : base;
    collect(root, deep, candidates);

    for (const auto &candidate : candidates) {
      std::string subject;
      if (absolute) {
        subject = candidate.path().generic_string();
      } else if (!multi_segment && request.recursive) {
        subject = candidate.path().filename().generic_string();
      } else {
        subject = candidate.path().lexically_relative(base).generic_string();
      }
      if (matcher.value().matches(subject)) {
        entries.push_back(describe(candidate));
      }
    }
  }

  std::stable_sort(entries.begin(), entries.end(),
                   [](const DirectoryEntry &lhs, const DirectoryEntry &rhs) {
                     const auto l = lhs.modified.value_or(std::numeric_limits<std::int64_t>::min());
                     const auto r = rhs.modified.value_or(std::numeric_limits<std::int64_t>::min());
                     if (l != r) {
                       return l > r;
                     }
                     return lhs.path < rhs.path;
                   });

  ListDirectoryResponse response;
  response.path = path;
  response.entries = std::move(entries);
  return common::Result<ListDirectoryResponse>::success(std::move(response));
}

} // namespace opgate::operation

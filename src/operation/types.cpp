#include "opgate/operation/types.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/common/json_util.hpp"

namespace opgate::operation {

namespace {

void add_optional_string(common::JsonObjectWriter &writer, const std::string &key,
                         const std::optional<std::string> &value) {
  if (value.has_value()) {
    writer.add(key, *value);
  } else {
    writer.add_null(key);
  }
}

void add_optional_int(common::JsonObjectWriter &writer, const std::string &key,
                      const std::optional<int> &value) {
  if (value.has_value()) {
    writer.add(key, *value);
  } else {
    writer.add_null(key);
  }
}

} // namespace

std::string_view to_string(const PermissionDecision decision) {
  switch (decision) {
  case PermissionDecision::Allow:
    return "allow";
  case PermissionDecision::AllowAndSave:
    return "allow_and_save";
  case PermissionDecision::Deny:
    return "deny";
  }
  return "deny";
}

common::Result<PermissionDecision> decision_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "allow") {
    return common::Result<PermissionDecision>::success(PermissionDecision::Allow);
  }
  if (normalized == "allow_and_save") {
    return common::Result<PermissionDecision>::success(PermissionDecision::AllowAndSave);
  }
  if (normalized == "deny") {
    return common::Result<PermissionDecision>::success(PermissionDecision::Deny);
  }
  return common::Result<PermissionDecision>::failure(
      "Invalid decision '" + value + "': expected allow, allow_and_save or deny",
      common::ErrorKind::Validation);
}

std::string_view to_string(const BashProcessStatus status) {
  switch (status) {
  case BashProcessStatus::Running:
    return "running";
  case BashProcessStatus::Completed:
    return "completed";
  case BashProcessStatus::Error:
    return "error";
  }
  return "error";
}

std::string to_json(const PermissionRequestEvent &event) {
  return common::JsonObjectWriter()
      .add("request_id", event.request_id)
      .add("operation", event.operation)
      .add("path", event.path)
      .add_optional("conversation_id", event.conversation_id)
      .str();
}

std::string to_json(const ReadFileResponse &response) {
  return common::JsonObjectWriter()
      .add("file_path", response.file_path)
      .add("content", response.content)
      .add("start_line", response.start_line)
      .add("end_line", response.end_line)
      .add("total_lines", response.total_lines)
      .add("has_more", response.has_more)
      .str();
}

std::string to_json(const WriteFileResponse &response) {
  return common::JsonObjectWriter()
      .add("file_path", response.file_path)
      .add("bytes_written", response.bytes_written)
      .add("created", response.created)
      .add("message", response.message)
      .str();
}

std::string to_json(const EditFileResponse &response) {
  return common::JsonObjectWriter()
      .add("file_path", response.file_path)
      .add("replacements_made", response.replacements_made)
      .add("message", response.message)
      .str();
}

std::string to_json(const ListDirectoryResponse &response) {
  std::string entries = "[";
  for (std::size_t i = 0; i < response.entries.size(); ++i) {
    const auto &entry = response.entries[i];
    common::JsonObjectWriter writer;
    writer.add("name", entry.name).add("path", entry.path).add("is_directory", entry.is_directory);
    if (entry.size.has_value()) {
      writer.add("size", *entry.size);
    } else {
      writer.add_null("size");
    }
    writer.add_optional("modified", entry.modified);
    if (i > 0) {
      entries.push_back(',');
    }
    entries += writer.str();
  }
  entries.push_back(']');

  return common::JsonObjectWriter()
      .add("path", response.path)
      .add_raw("entries", entries)
      .add("total_count", response.entries.size())
      .str();
}

std::string to_json(const ExecuteBashResponse &response) {
  common::JsonObjectWriter writer;
  add_optional_string(writer, "bash_id", response.bash_id);
  add_optional_string(writer, "output", response.output);
  add_optional_int(writer, "exit_code", response.exit_code);
  return writer.add("truncated", response.truncated).add("message", response.message).str();
}

std::string to_json(const GetBashOutputResponse &response) {
  common::JsonObjectWriter writer;
  writer.add("bash_id", response.bash_id)
      .add("status", std::string(to_string(response.status)))
      .add("output", response.output);
  add_optional_int(writer, "exit_code", response.exit_code);
  return writer.str();
}

std::string to_json(const KillBashResponse &response) {
  common::JsonObjectWriter writer;
  writer.add("bash_id", response.bash_id).add("was_running", response.was_running);
  add_optional_int(writer, "exit_code", response.exit_code);
  return writer.str();
}

} // namespace opgate::operation

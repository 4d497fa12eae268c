#include "opgate/config/config.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/common/kv_text.hpp"
#include "opgate/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace opgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".opgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("OPGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

bool is_known_shell(const std::string &shell) {
  return shell == "auto" || shell == "bash" || shell == "zsh" || shell == "sh" ||
         (!shell.empty() && shell.front() == '/');
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir);
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed);
  }
  const auto &doc = parsed.value();

  Config config;
  auto &op = config.operation;
  op.default_shell = doc.get_string("operation.default_shell", op.default_shell);
  op.command_timeout_ms = doc.get_u64("operation.command_timeout_ms", op.command_timeout_ms);
  op.max_timeout_ms = doc.get_u64("operation.max_timeout_ms", op.max_timeout_ms);
  op.max_output_chars = doc.get_u64("operation.max_output_chars", op.max_output_chars);
  op.max_read_lines = doc.get_u64("operation.max_read_lines", op.max_read_lines);
  op.max_line_length = doc.get_u64("operation.max_line_length", op.max_line_length);
  op.max_pending_approvals =
      doc.get_u64("operation.max_pending_approvals", op.max_pending_approvals);
  op.max_background_processes =
      doc.get_u64("operation.max_background_processes", op.max_background_processes);

  config.allowlist.backend = doc.get_string("allowlist.backend", config.allowlist.backend);
  config.allowlist.db_path = doc.get_string("allowlist.db_path", config.allowlist.db_path);
  config.allowlist.key = doc.get_string("allowlist.key", config.allowlist.key);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result);
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           parsed.kind());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  const auto &op = config.operation;
  out << "[operation]\n";
  out << "default_shell = " << common::quote_toml_string(op.default_shell) << "\n";
  out << "command_timeout_ms = " << op.command_timeout_ms << "\n";
  out << "max_timeout_ms = " << op.max_timeout_ms << "\n";
  out << "max_output_chars = " << op.max_output_chars << "\n";
  out << "max_read_lines = " << op.max_read_lines << "\n";
  out << "max_line_length = " << op.max_line_length << "\n";
  out << "max_pending_approvals = " << op.max_pending_approvals << "\n";
  out << "max_background_processes = " << op.max_background_processes << "\n";

  out << "\n[allowlist]\n";
  out << "backend = " << common::quote_toml_string(config.allowlist.backend) << "\n";
  out << "db_path = " << common::quote_toml_string(config.allowlist.db_path) << "\n";
  out << "key = " << common::quote_toml_string(config.allowlist.key) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }
  if (const auto parent = path.value().parent_path(); !parent.empty()) {
    if (const auto ensured = common::ensure_dir(parent); !ensured.ok()) {
      return common::Status::error(ensured.error());
    }
  }
  return common::write_file_atomic(path.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;
  const auto &op = config.operation;

  if (!is_known_shell(op.default_shell)) {
    return Warnings::failure("Invalid operation.default_shell: " + op.default_shell,
                             common::ErrorKind::Validation);
  }
  if (op.command_timeout_ms == 0) {
    return Warnings::failure("operation.command_timeout_ms must be > 0",
                             common::ErrorKind::Validation);
  }
  if (op.max_timeout_ms < op.command_timeout_ms) {
    return Warnings::failure("operation.max_timeout_ms must be >= operation.command_timeout_ms",
                             common::ErrorKind::Validation);
  }
  if (op.max_read_lines == 0 || op.max_line_length == 0 || op.max_output_chars == 0) {
    return Warnings::failure("operation read/output limits must be > 0",
                             common::ErrorKind::Validation);
  }
  if (op.max_pending_approvals == 0) {
    return Warnings::failure("operation.max_pending_approvals must be > 0",
                             common::ErrorKind::Validation);
  }
  if (op.max_background_processes == 0) {
    warnings.push_back("operation.max_background_processes is 0: background commands are disabled");
  }

  const std::string backend = common::to_lower(config.allowlist.backend);
  if (backend != "sqlite" && backend != "memory") {
    return Warnings::failure("Invalid allowlist.backend: " + config.allowlist.backend,
                             common::ErrorKind::Validation);
  }
  if (backend == "sqlite" && common::trim(config.allowlist.db_path).empty()) {
    return Warnings::failure("allowlist.db_path is required for the sqlite backend",
                             common::ErrorKind::Validation);
  }
  if (backend == "memory") {
    warnings.push_back("allowlist.backend is memory: saved approvals are lost on exit");
  }
  if (common::trim(config.allowlist.key).empty()) {
    return Warnings::failure("allowlist.key must not be empty", common::ErrorKind::Validation);
  }

  const std::string observer = common::to_lower(config.observability.backend);
  if (observer != "log" && observer != "none" && observer != "noop") {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to none");
  }

  return Warnings::success(std::move(warnings));
}

void apply_env_overrides(Config &config) {
  if (const char *shell = env_value("OPGATE_SHELL"); shell != nullptr) {
    config.operation.default_shell = shell;
  }
  if (const char *timeout = env_value("OPGATE_COMMAND_TIMEOUT_MS"); timeout != nullptr) {
    if (const auto parsed = parse_u64(timeout); parsed.has_value()) {
      config.operation.command_timeout_ms = *parsed;
    }
  }
  if (const char *db = env_value("OPGATE_DB_PATH"); db != nullptr) {
    config.allowlist.db_path = db;
  }
  if (const char *backend = env_value("OPGATE_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }
}

void apply_store_settings(Config &config, const std::string &blob) {
  const auto kv = common::KvText::parse(blob);
  if (const auto shell = kv.get("DEFAULT_SHELL"); shell.has_value()) {
    const std::string value = common::trim(*shell);
    if (!value.empty()) {
      config.operation.default_shell = value;
    }
  }
  if (const auto lines = kv.get("MAX_READ_LINES"); lines.has_value()) {
    if (const auto parsed = parse_u64(*lines); parsed.has_value() && *parsed > 0) {
      config.operation.max_read_lines = *parsed;
    }
  }
  if (const auto timeout = kv.get("COMMAND_TIMEOUT_MS"); timeout.has_value()) {
    if (const auto parsed = parse_u64(*timeout); parsed.has_value() && *parsed > 0) {
      config.operation.command_timeout_ms = *parsed;
    }
  }
}

} // namespace opgate::config

#pragma once

#include "opgate/common/result.hpp"
#include "opgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace opgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

/// Parses TOML text on top of the defaults. Does not consult the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Applies DEFAULT_SHELL, MAX_READ_LINES and COMMAND_TIMEOUT_MS from an allow-list blob.
/// Unparseable numbers are ignored.
void apply_store_settings(Config &config, const std::string &blob);

} // namespace opgate::config

#pragma once

#include "opgate/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace opgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Splits on '\n', dropping a trailing '\r' from each line. A final newline does not
/// produce an empty trailing line.
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

/// Writes through a temporary sibling file renamed over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace opgate::common

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace opgate::common {

/// Ordered `KEY=VALUE` text blob. A line that starts with an identifier followed by '='
/// opens a key; any other non-empty, non-comment line continues the value of the
/// previous key, joined with '\n'.
class KvText {
public:
  [[nodiscard]] static KvText parse(const std::string &text);

  [[nodiscard]] std::optional<std::string> get(const std::string &key) const;
  /// Replaces the value in place, or appends the key when absent.
  void set(const std::string &key, const std::string &value);
  [[nodiscard]] bool contains(const std::string &key) const;
  [[nodiscard]] const std::vector<std::pair<std::string, std::string>> &entries() const {
    return entries_;
  }

  [[nodiscard]] std::string serialize() const;

private:
  // Index of the entry now holding `key`.
  std::size_t upsert(const std::string &key, const std::string &value);

  std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace opgate::common

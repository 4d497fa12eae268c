#pragma once

#include "opgate/common/result.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace opgate::operation {

/// Translates a shell glob into an ECMAScript regex anchored at both ends.
/// `*` and `?` stay within one path segment, `**` crosses segments, `[...]` and `{a,b}`
/// are supported.
[[nodiscard]] std::string glob_to_regex(std::string_view pattern);

class GlobMatcher {
public:
  [[nodiscard]] static common::Result<GlobMatcher> compile(const std::string &pattern);

  [[nodiscard]] bool matches(const std::string &text) const;
  [[nodiscard]] const std::string &pattern() const { return pattern_; }

private:
  GlobMatcher(std::string pattern, std::regex regex)
      : pattern_(std::move(pattern)), regex_(std::move(regex)) {}

  std::string pattern_;
  std::regex regex_;
};

} // namespace opgate::operation

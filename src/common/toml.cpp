#include "opgate/common/toml.hpp"

#include "opgate/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace opgate::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  bool escaped = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (in_quotes && !escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '"' && !escaped) {
      in_quotes = !in_quotes;
    }
    escaped = false;
    if (!in_quotes && ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

bool is_quoted(const std::string &value) {
  return value.size() >= 2 && value.front() == '"' && value.back() == '"';
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (!is_quoted(value)) {
    return value;
  }
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    char ch = value[i];
    if (ch == '\\' && i + 2 < value.size()) {
      ch = value[++i];
      if (ch == 'n') {
        ch = '\n';
      } else if (ch == 't') {
        ch = '\t';
      }
    }
    out.push_back(ch);
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  // TOML allows '_' as a digit separator: 120_000.
  std::string digits;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (digits.empty() || ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return Result<TomlDocument>::failure("Unterminated section header at line " +
                                                 std::to_string(line_number),
                                             ErrorKind::Validation);
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                                 std::to_string(line_number),
                                             ErrorKind::Validation);
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                               std::to_string(line_number),
                                           ErrorKind::Validation);
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorKind::Validation);
    }
    const std::string value = trim(clean.substr(equals + 1));
    if (!value.empty() && value.front() == '"' && !is_quoted(value)) {
      return Result<TomlDocument>::failure("Unterminated string at line " +
                                               std::to_string(line_number),
                                           ErrorKind::Validation);
    }

    document.values[section.empty() ? key : section + "." + key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace opgate::common

#include "opgate/operation/glob.hpp"

namespace opgate::operation {

namespace {

bool is_regex_special(const char ch) {
  switch (ch) {
  case '.':
  case '+':
  case '^':
  case '$':
  case '(':
  case ')':
  case '[':
  case ']':
  case '{':
  case '}':
  case '|':
  case '\\':
  case '*':
  case '?':
    return true;
  default:
    return false;
  }
}

void append_literal(std::string &out, const char ch) {
  if (is_regex_special(ch)) {
    out.push_back('\\');
  }
  out.push_back(ch);
}

// Copies a bracket expression starting at pattern[pos] == '['. Returns the index of the
// closing ']' or npos when the class is unterminated.
std::size_t append_char_class(std::string &out, std::string_view pattern, std::size_t pos) {
  std::size_t i = pos + 1;
  std::string body;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    body.push_back('^');
    ++i;
  }
  if (i < pattern.size() && pattern[i] == ']') {
    body += "\\]";
    ++i;
  }
  for (; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    if (ch == ']') {
      out += "[" + body + "]";
      return i;
    }
    if (ch == '\\' || ch == '[') {
      body.push_back('\\');
    }
    body.push_back(ch);
  }
  return std::string_view::npos;
}

} // namespace

std::string glob_to_regex(std::string_view pattern) {
  std::string out = "^";
  out.reserve(pattern.size() * 2 + 2);
  int brace_depth = 0;

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    switch (ch) {
    case '*': {
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        const bool segment_start = i == 0 || pattern[i - 1] == '/';
        i += 1;
        while (i + 1 < pattern.size() && pattern[i + 1] == '*') {
          ++i;
        }
        if (segment_start && i + 1 < pattern.size() && pattern[i + 1] == '/') {
          out += "(?:.*/)?";
          i += 1;
        } else {
          out += ".*";
        }
      } else {
        out += "[^/]*";
      }
      break;
    }
    case '?':
      out += "[^/]";
      break;
    case '[': {
      const std::size_t close = append_char_class(out, pattern, i);
      if (close == std::string_view::npos) {
        out += "\\[";
      } else {
        i = close;
      }
      break;
    }
    case '{':
      ++brace_depth;
      out += "(?:";
      break;
    case '}':
      if (brace_depth > 0) {
        --brace_depth;
        out += ")";
      } else {
        out += "\\}";
      }
      break;
    case ',':
      out += brace_depth > 0 ? "|" : ",";
      break;
    case '\\':
      if (i + 1 < pattern.size()) {
        append_literal(out, pattern[++i]);
      } else {
        out += "\\\\";
      }
      break;
    default:
      append_literal(out, ch);
      break;
    }
  }
  while (brace_depth-- > 0) {
    out += ")";
  }
  out += '$';
  return out;
}

common::Result<GlobMatcher> GlobMatcher::compile(const std::string &pattern) {
  try {
    return common::Result<GlobMatcher>::success(
        GlobMatcher(pattern, std::regex(glob_to_regex(pattern), std::regex::ECMAScript)));
  } catch (const std::regex_error &error) {
    return common::Result<GlobMatcher>::failure(
        "Invalid glob pattern '" + pattern + "': " + error.what(), common::ErrorKind::Validation);
  }
}

bool GlobMatcher::matches(const std::string &text) const { return std::regex_match(text, regex_); }

} // namespace opgate::operation

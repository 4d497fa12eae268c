#include "opgate/common/json_util.hpp"

#include <cctype>

namespace opgate::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      int code = 0;
      bool valid = i + 4 < raw.size();
      for (std::size_t k = 1; valid && k <= 4; ++k) {
        const int digit = hex_value(raw[i + k]);
        valid = digit >= 0;
        code = code * 16 + digit;
      }
      if (valid && code < 0x80) {
        out.push_back(static_cast<char>(code));
        i += 4;
      } else {
        out.push_back('u');
      }
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::size_t json_value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    const std::size_t colon = skip_ws(json, key_pos + quoted.size());
    if (colon < json.size() && json[colon] == ':') {
      const std::size_t value = skip_ws(json, colon + 1);
      return value < json.size() ? value : std::string::npos;
    }
    key_pos = json.find(quoted, key_pos + quoted.size());
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_scalar(const std::string &json, const std::string &field) {
  const auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] == '"' || json[pos] == '{' || json[pos] == '[') {
    return "";
  }
  return json.substr(pos, scalar_end(json, pos) - pos);
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  const std::size_t open = skip_ws(json, 0);
  if (open >= json.size() || json[open] != '{') {
    return result;
  }

  std::size_t pos = open + 1;
  while (pos < json.size()) {
    pos = skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      ++pos;
      continue;
    }

    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open_ch = json[pos];
      const char close_ch = open_ch == '{' ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open_ch, close_ch);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = scalar_end(json, pos);
      result[key] = json.substr(pos, end - pos);
      pos = end;
    }
  }

  return result;
}

void JsonObjectWriter::append_key(const std::string &key) {
  if (!body_.empty()) {
    body_.push_back(',');
  }
  body_ += "\"" + json_escape(key) + "\":";
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const std::string &value) {
  append_key(key);
  body_ += "\"" + json_escape(value) + "\"";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const char *value) {
  return add(key, std::string(value == nullptr ? "" : value));
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const bool value) {
  append_key(key);
  body_ += value ? "true" : "false";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const std::int64_t value) {
  append_key(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const std::uint64_t value) {
  append_key(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const int value) {
  return add(key, static_cast<std::int64_t>(value));
}

JsonObjectWriter &JsonObjectWriter::add_optional(const std::string &key,
                                                 const std::optional<std::int64_t> &value) {
  if (value.has_value()) {
    return add(key, *value);
  }
  return add_null(key);
}

JsonObjectWriter &JsonObjectWriter::add_raw(const std::string &key, const std::string &raw_json) {
  append_key(key);
  body_ += raw_json;
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_null(const std::string &key) {
  append_key(key);
  body_ += "null";
  return *this;
}

std::string JsonObjectWriter::str() const { return "{" + body_ + "}"; }

} // namespace opgate::common

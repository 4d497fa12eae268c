#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace opgate::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX for ASCII, and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Position of the first character of `field`'s value, or npos.
[[nodiscard]] std::size_t json_value_start(const std::string &json, const std::string &field);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
/// Raw scalar text of a non-string value (number, true, false, null).
[[nodiscard]] std::string json_get_scalar(const std::string &json, const std::string &field);

/// Parse a flat JSON object into a key→value map. Nested values are kept as raw JSON,
/// scalars as their literal text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Builds a single JSON object, preserving insertion order.
class JsonObjectWriter {
public:
  JsonObjectWriter &add(const std::string &key, const std::string &value);
  JsonObjectWriter &add(const std::string &key, const char *value);
  JsonObjectWriter &add(const std::string &key, bool value);
  JsonObjectWriter &add(const std::string &key, std::int64_t value);
  JsonObjectWriter &add(const std::string &key, std::uint64_t value);
  JsonObjectWriter &add(const std::string &key, int value);
  JsonObjectWriter &add_optional(const std::string &key, const std::optional<std::int64_t> &value);
  JsonObjectWriter &add_raw(const std::string &key, const std::string &raw_json);
  JsonObjectWriter &add_null(const std::string &key);

  [[nodiscard]] std::string str() const;

private:
  void append_key(const std::string &key);

  std::string body_;
};

} // namespace opgate::common

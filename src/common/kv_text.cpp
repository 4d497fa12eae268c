#include "opgate/common/kv_text.hpp"

#include "opgate/common/fs.hpp"

#include <cctype>

namespace opgate::common {

namespace {

std::size_t key_prefix_length(const std::string &line) {
  if (line.empty()) {
    return 0;
  }
  const auto first = static_cast<unsigned char>(line[0]);
  if (std::isalpha(first) == 0 && line[0] != '_') {
    return 0;
  }
  for (std::size_t i = 1; i < line.size(); ++i) {
    const auto ch = static_cast<unsigned char>(line[i]);
    if (line[i] == '=') {
      return i;
    }
    if (std::isalnum(ch) == 0 && line[i] != '_') {
      return 0;
    }
  }
  return 0;
}

} // namespace

KvText KvText::parse(const std::string &text) {
  KvText kv;
  std::optional<std::size_t> open_entry;
  for (const auto &raw_line : split_lines(text)) {
    const std::string line = trim(raw_line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (const std::size_t eq = key_prefix_length(line); eq > 0) {
      open_entry = kv.upsert(line.substr(0, eq), trim(line.substr(eq + 1)));
      continue;
    }
    if (!open_entry.has_value()) {
      continue;
    }
    // A repeated key reopens its original slot, which need not be the last entry.
    auto &value = kv.entries_[*open_entry].second;
    if (!value.empty()) {
      value.push_back('\n');
    }
    value += line;
  }
  return kv;
}

std::optional<std::string> KvText::get(const std::string &key) const {
  for (const auto &[name, value] : entries_) {
    if (name == key) {
      return value;
    }
  }
  return std::nullopt;
}

bool KvText::contains(const std::string &key) const { return get(key).has_value(); }

void KvText::set(const std::string &key, const std::string &value) { upsert(key, value); }

std::size_t KvText::upsert(const std::string &key, const std::string &value) {
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].first == key) {
      entries_[i].second = value;
      return i;
    }
  }
  entries_.emplace_back(key, value);
  return entries_.size() - 1;
}

std::string KvText::serialize() const {
  std::string out;
  for (const auto &[name, value] : entries_) {
    out += name + "=";
    out += value;
    out.push_back('\n');
  }
  return out;
}

} // namespace opgate::common

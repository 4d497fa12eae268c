#pragma once

#include <cstdint>
#include <string>

namespace opgate::config {

struct OperationConfig {
  std::string default_shell = "auto";
  std::uint64_t command_timeout_ms = 120'000;
  std::uint64_t max_timeout_ms = 600'000;
  std::size_t max_output_chars = 30'000;
  std::size_t max_read_lines = 2'000;
  std::size_t max_line_length = 2'000;
  std::size_t max_pending_approvals = 64;
  std::size_t max_background_processes = 32;
};

struct AllowlistConfig {
  std::string backend = "sqlite";
  std::string db_path = "~/.opgate/opgate.db";
  std::string key = "opgate:operation";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  OperationConfig operation;
  AllowlistConfig allowlist;
  ObservabilityConfig observability;
};

} // namespace opgate::config

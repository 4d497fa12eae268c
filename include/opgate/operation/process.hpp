#pragma once

#include "opgate/common/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace opgate::operation {

/// Owns a file descriptor; closes it on destruction.
class ScopedFd {
public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd();
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;
  ScopedFd(ScopedFd &&other) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }
  void reset();

private:
  int fd_ = -1;
};

/// Handle to a spawned child running in its own process group. Destroying a handle whose
/// process has not been reaped terminates the whole group and reaps it.
class ChildProcess {
public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {}
  ~ChildProcess();
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  [[nodiscard]] pid_t pid() const { return pid_; }

  /// Non-blocking reap. Returns the exit code once the process has exited and caches it.
  [[nodiscard]] std::optional<int> try_wait();
  /// Blocks until the process exits.
  int wait();
  /// SIGTERM to the group, a short grace period, then SIGKILL. Returns the exit code.
  int terminate();

  [[nodiscard]] bool exited() const { return exit_code_.has_value(); }

private:
  pid_t pid_;
  std::optional<int> exit_code_;
};

struct SpawnedChild {
  std::unique_ptr<ChildProcess> process;
  ScopedFd stdout_fd;
  ScopedFd stderr_fd;
};

/// Maps "auto", "bash", "zsh", "sh" or an absolute path to an executable shell.
[[nodiscard]] std::string resolve_shell(const std::string &configured);

/// Runs `<shell> -c <command>` with stdin from /dev/null and stdout/stderr piped back.
[[nodiscard]] common::Result<SpawnedChild> spawn_shell(const std::string &shell,
                                                       const std::string &command);

/// Normal exit yields the status code; death by signal N yields 128 + N.
[[nodiscard]] int decode_wait_status(int status);

/// Appends whatever is readable without blocking. Returns false once the pipe hit EOF.
bool read_available(int fd, std::string &out);

} // namespace opgate::operation

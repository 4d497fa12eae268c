#include "opgate/operation/process.hpp"

#include "opgate/common/fs.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace opgate::operation {

namespace {

constexpr int kTerminateGraceSteps = 20;
constexpr useconds_t kTerminateStepMicros = 50 * 1000;

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

bool is_executable(const std::string &path) { return access(path.c_str(), X_OK) == 0; }

} // namespace

ScopedFd::~ScopedFd() { reset(); }

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

ScopedFd &ScopedFd::operator=(ScopedFd &&other) noexcept {
  if (this != &other) {
    reset();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void ScopedFd::reset() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

ChildProcess::~ChildProcess() {
  if (!exit_code_.has_value() && pid_ > 0) {
    (void)terminate();
  }
}

std::optional<int> ChildProcess::try_wait() {
  if (exit_code_.has_value() || pid_ <= 0) {
    return exit_code_;
  }
  int status = 0;
  const pid_t done = waitpid(pid_, &status, WNOHANG);
  if (done == pid_) {
    exit_code_ = decode_wait_status(status);
  } else if (done < 0 && errno == ECHILD) {
    exit_code_ = -1;
  }
  return exit_code_;
}

int ChildProcess::wait() {
  while (!exit_code_.has_value() && pid_ > 0) {
    int status = 0;
    const pid_t done = waitpid(pid_, &status, 0);
    if (done == pid_) {
      exit_code_ = decode_wait_status(status);
    } else if (done < 0 && errno != EINTR) {
      exit_code_ = -1;
    }
  }
  return exit_code_.value_or(-1);
}

int ChildProcess::terminate() {
  if (exit_code_.has_value() || pid_ <= 0) {
    return exit_code_.value_or(-1);
  }
  kill(-pid_, SIGTERM);
  for (int i = 0; i < kTerminateGraceSteps; ++i) {
    if (try_wait().has_value()) {
      return *exit_code_;
    }
    usleep(kTerminateStepMicros);
  }
  kill(-pid_, SIGKILL);
  return wait();
}

std::string resolve_shell(const std::string &configured) {
  const std::string shell = common::trim(configured);
  if (!shell.empty() && shell.front() == '/') {
    return shell;
  }
  if (shell == "bash" || shell == "zsh" || shell == "sh") {
    for (const char *dir : {"/bin/", "/usr/bin/", "/usr/local/bin/"}) {
      const std::string candidate = std::string(dir) + shell;
      if (is_executable(candidate)) {
        return candidate;
      }
    }
    return "/bin/sh";
  }
  return is_executable("/bin/bash") ? "/bin/bash" : "/bin/sh";
}

common::Result<SpawnedChild> spawn_shell(const std::string &shell, const std::string &command) {
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    return common::Result<SpawnedChild>::failure(std::string("Failed to create pipe: ") +
                                                 std::strerror(errno));
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return common::Result<SpawnedChild>::failure(std::string("Failed to create pipe: ") +
                                                 std::strerror(errno));
  }

  const std::string argv0 = std::filesystem::path(shell).filename().string();
  const pid_t pid = fork();
  if (pid < 0) {
    for (const int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      close(fd);
    }
    return common::Result<SpawnedChild>::failure(std::string("Failed to fork: ") +
                                                 std::strerror(errno));
  }

  if (pid == 0) {
    setpgid(0, 0);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execl(shell.c_str(), argv0.c_str(), "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  // Mirror the child's setpgid so a kill to the group cannot race the exec.
  setpgid(pid, pid);
  close(out_pipe[1]);
  close(err_pipe[1]);
  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);

  SpawnedChild spawned;
  spawned.process = std::make_unique<ChildProcess>(pid);
  spawned.stdout_fd = ScopedFd(out_pipe[0]);
  spawned.stderr_fd = ScopedFd(err_pipe[0]);
  return common::Result<SpawnedChild>::success(std::move(spawned));
}

int decode_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

bool read_available(const int fd, std::string &out) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      out.append(buffer.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN means the pipe is merely empty; anything else is treated as closed.
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace opgate::operation

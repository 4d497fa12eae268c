#include "opgate/operation/bash_ops.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/common/ids.hpp"
#include "opgate/observability/global.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <regex>
#include <thread>

namespace opgate::operation {

namespace {

constexpr const char *kComponent = "bash";
constexpr int kPollIntervalMs = 50;
constexpr auto kExitPollInterval = std::chrono::milliseconds(20);

std::string truncate_output(const std::string &output, const std::size_t limit) {
  if (output.size() <= limit) {
    return output;
  }
  std::size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(output[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return output.substr(0, cut) + "...\n[Output truncated at " + std::to_string(limit) +
         " characters]";
}

// Splits complete lines off `pending`, leaving any unterminated tail in place.
template <typename Emit> void emit_complete_lines(std::string &pending, Emit &&emit) {
  std::size_t start = 0;
  for (std::size_t nl = pending.find('\n'); nl != std::string::npos;
       nl = pending.find('\n', start)) {
    std::string line = pending.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    emit(line);
    start = nl + 1;
  }
  pending.erase(0, start);
}

struct StreamPump {
  ScopedFd fd;
  std::string pending;
  std::string prefix;
  bool open = true;
};

void pump_background_output(const std::weak_ptr<OperationState> &weak_state, const std::string &id,
                            ScopedFd stdout_fd, ScopedFd stderr_fd) {
  StreamPump streams[2] = {{.fd = std::move(stdout_fd), .pending = {}, .prefix = ""},
                           {.fd = std::move(stderr_fd), .pending = {}, .prefix = "[stderr] "}};

  const auto deliver = [&](StreamPump &stream) -> bool {
    const auto state = weak_state.lock();
    if (state == nullptr) {
      return false;
    }
    emit_complete_lines(stream.pending, [&](const std::string &line) {
      state->append_output(id, stream.prefix + line + "\n");
    });
    if (!stream.open && !stream.pending.empty()) {
      state->append_output(id, stream.prefix + stream.pending + "\n");
      stream.pending.clear();
    }
    return true;
  };

  while (streams[0].open || streams[1].open) {
    pollfd fds[2];
    nfds_t count = 0;
    StreamPump *polled[2] = {nullptr, nullptr};
    for (auto &stream : streams) {
      if (stream.open) {
        fds[count] = pollfd{.fd = stream.fd.get(), .events = POLLIN, .revents = 0};
        polled[count++] = &stream;
      }
    }
    if (poll(fds, count, 100) < 0 && errno != EINTR) {
      break;
    }
    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      StreamPump &stream = *polled[i];
      stream.open = read_available(stream.fd.get(), stream.pending);
      if (!stream.open) {
        stream.fd.reset();
      }
      if (!deliver(stream)) {
        return;
      }
    }
    if (weak_state.expired()) {
      return;
    }
  }

  while (true) {
    const auto state = weak_state.lock();
    if (state == nullptr || !state->background_process_exists(id)) {
      return;
    }
    if (const auto code = state->get_exit_code(id); code.has_value()) {
      state->mark_completed(id, *code);
      observability::record_process(id, "exited", code);
      return;
    }
    std::this_thread::sleep_for(kExitPollInterval);
  }
}

} // namespace

std::optional<std::string> filter_lines(const std::string &output, const std::string &pattern) {
  std::regex re;
  try {
    re = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error &) {
    return std::nullopt;
  }
  std::string filtered;
  for (const auto &line : common::split_lines(output)) {
    if (!std::regex_search(line, re)) {
      continue;
    }
    if (!filtered.empty()) {
      filtered.push_back('\n');
    }
    filtered += line;
  }
  return filtered;
}

BashOperations::BashOperations(std::shared_ptr<OperationState> state,
                               config::OperationConfig config)
    : state_(std::move(state)), config_(std::move(config)),
      shell_(resolve_shell(config_.default_shell)) {}

common::Result<ExecuteBashResponse> BashOperations::execute(const ExecuteBashRequest &request) {
  if (common::trim(request.command).empty()) {
    return common::Result<ExecuteBashResponse>::failure("command must not be empty",
                                                        common::ErrorKind::Validation);
  }
  if (request.run_in_background) {
    return run_background(request.command);
  }
  std::uint64_t timeout_ms = request.timeout.value_or(config_.command_timeout_ms);
  timeout_ms = std::min(timeout_ms, config_.max_timeout_ms);
  return run_foreground(request.command, timeout_ms);
}

common::Result<ExecuteBashResponse> BashOperations::run_foreground(const std::string &command,
                                                                   const std::uint64_t timeout_ms) {
  auto spawned = spawn_shell(shell_, command);
  if (!spawned.ok()) {
    return common::Result<ExecuteBashResponse>::failure(spawned);
  }
  SpawnedChild child = std::move(spawned.value());

  std::string out;
  std::string err;
  bool out_open = true;
  bool err_open = true;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  const auto time_out = [&]() {
    const int code = child.process->terminate();
    observability::record_process(std::to_string(child.process->pid()), "killed", code);
    return common::Result<ExecuteBashResponse>::failure(
        "Command timed out after " + std::to_string(timeout_ms) +
            " ms. Consider using run_in_background=true for long-running commands.",
        common::ErrorKind::Io);
  };

  while (out_open || err_open) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return time_out();
    }

    pollfd fds[2] = {
        {.fd = out_open ? child.stdout_fd.get() : -1, .events = POLLIN, .revents = 0},
        {.fd = err_open ? child.stderr_fd.get() : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(fds, 2, kPollIntervalMs);
    if (out_open && fds[0].revents != 0) {
      out_open = read_available(child.stdout_fd.get(), out);
    }
    if (err_open && fds[1].revents != 0) {
      err_open = read_available(child.stderr_fd.get(), err);
    }

    // A grandchild may keep the pipes open after the shell is gone.
    if ((out_open || err_open) && child.process->try_wait().has_value()) {
      if (out_open) {
        (void)read_available(child.stdout_fd.get(), out);
      }
      if (err_open) {
        (void)read_available(child.stderr_fd.get(), err);
      }
      break;
    }
  }
  while (!child.process->try_wait().has_value()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return time_out();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs / 5));
  }
  const int exit_code = child.process->wait();

  std::string combined = std::move(out);
  if (!err.empty()) {
    combined += "\n[stderr]\n";
    combined += err;
  }

  ExecuteBashResponse response;
  response.truncated = combined.size() > config_.max_output_chars;
  response.output = truncate_output(combined, config_.max_output_chars);
  response.exit_code = exit_code;
  response.message = "Command completed with exit code " + std::to_string(exit_code);
  return common::Result<ExecuteBashResponse>::success(std::move(response));
}

common::Result<ExecuteBashResponse> BashOperations::run_background(const std::string &command) {
  if (state_->running_process_count() >= state_->limits().max_background_processes) {
    return common::Result<ExecuteBashResponse>::failure(
        "Too many background processes (limit " +
            std::to_string(state_->limits().max_background_processes) + ")",
        common::ErrorKind::Io);
  }

  auto spawned = spawn_shell(shell_, command);
  if (!spawned.ok()) {
    return common::Result<ExecuteBashResponse>::failure(spawned);
  }
  SpawnedChild child = std::move(spawned.value());

  const std::string bash_id = common::generate_uuid();
  if (const auto stored = state_->store_background_process(bash_id, std::move(child.process));
      !stored.ok()) {
    return common::Result<ExecuteBashResponse>::failure(stored);
  }
  observability::record_process(bash_id, "started");

  std::thread(pump_background_output, std::weak_ptr<OperationState>(state_), bash_id,
              std::move(child.stdout_fd), std::move(child.stderr_fd))
      .detach();

  ExecuteBashResponse response;
  response.bash_id = bash_id;
  response.message = "Command started in background. Use get_bash_output with bash_id='" +
                     bash_id + "' to check output.";
  return common::Result<ExecuteBashResponse>::success(std::move(response));
}

common::Result<GetBashOutputResponse>
BashOperations::get_output(const GetBashOutputRequest &request) {
  const auto polled = state_->poll_incremental_output(request.bash_id);
  if (!polled.has_value()) {
    return common::Result<GetBashOutputResponse>::failure(
        "Bash process not found: " + request.bash_id, common::ErrorKind::NotFound);
  }

  GetBashOutputResponse response;
  response.bash_id = request.bash_id;
  response.output = polled->delta;
  if (request.filter.has_value() && !request.filter->empty()) {
    if (auto filtered = filter_lines(polled->delta, *request.filter); filtered.has_value()) {
      response.output = std::move(*filtered);
    } else {
      observability::record_warning(kComponent, "invalid output filter '" + *request.filter +
                                                    "', returning unfiltered output");
    }
  }
  response.exit_code = polled->exit_code;
  if (!polled->completed) {
    response.status = BashProcessStatus::Running;
  } else {
    response.status = polled->exit_code == 0 ? BashProcessStatus::Completed
                                             : BashProcessStatus::Error;
  }
  return common::Result<GetBashOutputResponse>::success(std::move(response));
}

common::Result<KillBashResponse> BashOperations::kill(const KillBashRequest &request) {
  if (!state_->background_process_exists(request.bash_id)) {
    return common::Result<KillBashResponse>::failure("Bash process not found: " +
                                                         request.bash_id,
                                                     common::ErrorKind::NotFound);
  }
  const bool was_running = !state_->get_exit_code(request.bash_id).has_value();
  const auto exit_code = state_->remove_background_process(request.bash_id);
  if (!exit_code.has_value()) {
    return common::Result<KillBashResponse>::failure("Bash process not found: " +
                                                         request.bash_id,
                                                     common::ErrorKind::NotFound);
  }
  observability::record_process(request.bash_id, "killed", exit_code);

  KillBashResponse response;
  response.bash_id = request.bash_id;
  response.was_running = was_running;
  response.exit_code = exit_code;
  return common::Result<KillBashResponse>::success(std::move(response));
}

} // namespace opgate::operation

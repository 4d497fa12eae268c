#include "test_framework.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/operation/bash_ops.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>

namespace {

namespace op = opgate::operation;

struct BashFixture {
  std::shared_ptr<op::OperationState> state;
  std::unique_ptr<op::BashOperations> bash;

  explicit BashFixture(opgate::config::OperationConfig config = {}) {
    state = std::make_shared<op::OperationState>(
        op::StateLimits{.max_pending_approvals = config.max_pending_approvals,
                        .max_background_processes = config.max_background_processes});
    bash = std::make_unique<op::BashOperations>(state, config);
  }

  opgate::common::Result<op::ExecuteBashResponse> run(const std::string &command,
                                                      std::optional<std::uint64_t> timeout = {}) {
    return bash->execute(op::ExecuteBashRequest{
        .command = command, .description = {}, .timeout = timeout, .run_in_background = false});
  }

  std::string start(const std::string &command) {
    auto started = bash->execute(op::ExecuteBashRequest{
        .command = command, .description = {}, .timeout = {}, .run_in_background = true});
    if (!started.ok() || !started.value().bash_id.has_value()) {
      throw std::runtime_error("background start failed: " + started.error());
    }
    return *started.value().bash_id;
  }

  // Polls until the process reports a terminal status, concatenating every delta.
  op::GetBashOutputResponse drain(const std::string &id, std::string &collected,
                                  const std::optional<std::string> &filter = {}) {
    op::GetBashOutputResponse last;
    const bool finished = opgate::testing::wait_until([&] {
      auto polled = bash->get_output(op::GetBashOutputRequest{.bash_id = id, .filter = filter});
      if (!polled.ok()) {
        return false;
      }
      if (!collected.empty() && !polled.value().output.empty() && filter.has_value()) {
        collected.push_back('\n');
      }
      collected += polled.value().output;
      last = polled.value();
      return last.status != op::BashProcessStatus::Running;
    });
    if (!finished) {
      throw std::runtime_error("background command did not finish");
    }
    return last;
  }
};

} // namespace

void register_bash_ops_tests(std::vector<opgate::tests::TestCase> &tests) {
  using opgate::tests::require;
  using opgate::common::ErrorKind;

  tests.push_back({"bash_foreground_captures_stdout", [] {
                     BashFixture fx;
                     const auto result = fx.run("echo hello");
                     require(result.ok(), result.error());
                     require(result.value().output == "hello\n", *result.value().output);
                     require(result.value().exit_code == 0, "exit code 0");
                     require(!result.value().truncated, "not truncated");
                     require(!result.value().bash_id.has_value(), "foreground has no id");
                   }});

  tests.push_back({"bash_foreground_reports_exit_code_and_stderr", [] {
                     BashFixture fx;
                     const auto result = fx.run("echo out; echo err >&2; exit 3");
                     require(result.ok(), "non-zero exit is not an error: " + result.error());
                     require(result.value().exit_code == 3, "exit code 3");
                     require(result.value().output == "out\n\n[stderr]\nerr\n",
                             *result.value().output);

                     const auto quiet = fx.run("true");
                     require(quiet.ok() && quiet.value().output->empty(), "no output at all");
                   }});

  tests.push_back({"bash_foreground_timeout_kills_process", [] {
                     BashFixture fx;
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = fx.run("sleep 20", 200);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!result.ok(), "timeout must fail");
                     require(result.kind() == ErrorKind::Io, "io kind");
                     require(result.error().find("timed out after 200 ms") != std::string::npos,
                             result.error());
                     require(elapsed < std::chrono::seconds(5), "returned promptly");
                   }});

  tests.push_back({"bash_foreground_does_not_wait_for_orphans", [] {
                     BashFixture fx;
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = fx.run("(sleep 5 &) ; echo done");
                     require(result.ok(), result.error());
                     require(result.value().output->find("done") != std::string::npos,
                             *result.value().output);
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(3),
                             "should not wait on the orphaned sleep");
                   }});

  tests.push_back({"bash_foreground_truncates_long_output", [] {
                     opgate::config::OperationConfig config;
                     config.max_output_chars = 100;
                     BashFixture fx(config);
                     const auto result = fx.run("i=0; while [ $i -lt 200 ]; do echo x; i=$((i+1)); done");
                     require(result.ok(), result.error());
                     require(result.value().truncated, "flagged as truncated");
                     const std::string &output = *result.value().output;
                     require(output.rfind("[Output truncated at 100 characters]") !=
                                 std::string::npos,
                             output);
                     std::string expected_prefix;
                     for (int i = 0; i < 50; ++i) {
                       expected_prefix += "x\n";
                     }
                     require(output.substr(0, 100) == expected_prefix, "prefix kept");
                   }});

  tests.push_back({"bash_rejects_empty_command", [] {
                     BashFixture fx;
                     const auto result = fx.run("   ");
                     require(!result.ok() && result.kind() == ErrorKind::Validation, "validation");
                   }});

  tests.push_back({"bash_background_output_is_incremental", [] {
                     BashFixture fx;
                     const std::string id = fx.start("echo one; sleep 0.3; echo two >&2; echo three");
                     require(fx.state->background_process_exists(id), "registered");

                     std::string first;
                     require(opgate::testing::wait_until([&] {
                               auto polled = fx.bash->get_output(
                                   op::GetBashOutputRequest{.bash_id = id, .filter = {}});
                               first += polled.value().output;
                               return first.find("one\n") != std::string::npos;
                             }),
                             "first line should arrive before the command ends");

                     std::string rest;
                     const auto final_poll = fx.drain(id, rest);
                     require(final_poll.status == op::BashProcessStatus::Completed, "completed");
                     require(final_poll.exit_code == 0, "exit code 0");
                     require(first + rest == "one\n[stderr] two\nthree\n", first + rest);

                     const auto again = fx.bash->get_output(
                         op::GetBashOutputRequest{.bash_id = id, .filter = {}});
                     require(again.ok() && again.value().output.empty(),
                             "delivered output is not repeated");
                   }});

  tests.push_back({"bash_background_failure_and_filter", [] {
                     BashFixture fx;
                     const std::string id =
                         fx.start("printf 'apple\\nbanana\\napricot\\n'; exit 2");
                     std::string filtered;
                     const auto final_poll = fx.drain(id, filtered, std::string("^ap"));
                     require(final_poll.status == op::BashProcessStatus::Error, "error status");
                     require(final_poll.exit_code == 2, "exit code 2");
                     const auto lines = opgate::common::split_lines(filtered);
                     require(lines == std::vector<std::string>({"apple", "apricot"}), filtered);
                   }});

  tests.push_back({"bash_invalid_filter_returns_everything", [] {
                     require(!op::filter_lines("a\nb", "(").has_value(), "bad regex");
                     require(op::filter_lines("a1\nb2\na3\n", "^a") == "a1\na3", "filtered");

                     BashFixture fx;
                     const std::string id = fx.start("echo kept");
                     std::string collected;
                     (void)fx.drain(id, collected, std::string("(["));
                     require(collected.find("kept") != std::string::npos, collected);
                   }});

  tests.push_back({"bash_kill_terminates_and_forgets", [] {
                     BashFixture fx;
                     const std::string id = fx.start("sleep 30");
                     const auto killed = fx.bash->kill(op::KillBashRequest{.bash_id = id});
                     require(killed.ok(), killed.error());
                     require(killed.value().was_running, "was running");
                     require(killed.value().exit_code.has_value() && *killed.value().exit_code >= 128,
                             "terminated by signal");
                     require(!fx.state->background_process_exists(id), "entry removed");

                     const auto output = fx.bash->get_output(
                         op::GetBashOutputRequest{.bash_id = id, .filter = {}});
                     require(!output.ok() && output.kind() == ErrorKind::NotFound,
                             "killed id is unknown");
                     const auto again = fx.bash->kill(op::KillBashRequest{.bash_id = id});
                     require(!again.ok() && again.kind() == ErrorKind::NotFound, "second kill");
                   }});

  tests.push_back({"bash_kill_after_exit_reports_not_running", [] {
                     BashFixture fx;
                     const std::string id = fx.start("exit 0");
                     require(opgate::testing::wait_until(
                                 [&] { return fx.state->get_exit_code(id).has_value(); }),
                             "process should exit");
                     const auto killed = fx.bash->kill(op::KillBashRequest{.bash_id = id});
                     require(killed.ok(), killed.error());
                     require(!killed.value().was_running, "already finished");
                     require(killed.value().exit_code == 0, "exit code kept");
                   }});

  tests.push_back({"bash_background_bound_is_enforced", [] {
                     opgate::config::OperationConfig config;
                     config.max_background_processes = 1;
                     BashFixture fx(config);
                     const std::string id = fx.start("sleep 30");
                     const auto second = fx.bash->execute(op::ExecuteBashRequest{
                         .command = "sleep 30", .description = {}, .timeout = {},
                         .run_in_background = true});
                     require(!second.ok() && second.kind() == ErrorKind::Io, "bound reached");
                     require(fx.bash->kill(op::KillBashRequest{.bash_id = id}).ok(), "cleanup");
                   }});

  tests.push_back({"bash_finished_jobs_do_not_hold_background_slots", [] {
                     opgate::config::OperationConfig config;
                     config.max_background_processes = 2;
                     BashFixture fx(config);
                     for (int i = 0; i < 5; ++i) {
                       const std::string id = fx.start("echo job" + std::to_string(i));
                       std::string collected;
                       const auto last = fx.drain(id, collected);
                       require(last.status == op::BashProcessStatus::Completed,
                               "job " + std::to_string(i) + " completed");
                       require(collected == "job" + std::to_string(i) + "\n", collected);
                     }
                     require(fx.state->background_process_count() == 5, "output still pollable");
                     require(fx.state->running_process_count() == 0, "nothing running");
                   }});
}

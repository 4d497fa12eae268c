#pragma once

#include "opgate/operation/handler.hpp"
#include "opgate/tools/tool_registry.hpp"

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace opgate::cli {

/// JSON-lines front end for one session. Calls run on their own threads so a call blocked
/// on approval does not stop the confirm line that resolves it from being read.
class StdioBridge {
public:
  StdioBridge(std::shared_ptr<operation::OperationHandler> handler, std::ostream &out);
  ~StdioBridge();
  StdioBridge(const StdioBridge &) = delete;
  StdioBridge &operator=(const StdioBridge &) = delete;

  /// Reads until EOF, then cancels outstanding approvals and waits for in-flight calls.
  void run(std::istream &in);

  void handle_line(const std::string &line);
  void shutdown();

  /// Joins calls that have finished. Returns how many are still running.
  std::size_t reap_workers();

  /// Approval sink to install on the handler's permission manager.
  [[nodiscard]] operation::ApprovalEventSink approval_sink();

private:
  void dispatch_call(const std::string &id, const std::string &tool, const std::string &args_json,
                     const std::string &conversation_id);
  void run_call(const std::string &id, const std::string &tool, const tools::ToolArgs &args,
                const tools::ToolContext &ctx);
  void handle_confirm(const std::string &request_id, const std::string &decision);
  void emit(const std::string &line);

  std::shared_ptr<operation::OperationHandler> handler_;
  tools::ToolRegistry registry_;
  std::ostream &out_;
  std::mutex out_mutex_;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::atomic<bool> closing_{false};
  std::mutex workers_mutex_;
  std::vector<Worker> workers_;
};

} // namespace opgate::cli

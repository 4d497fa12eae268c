#include "opgate/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace opgate::observability {

namespace {

std::mutex g_log_mutex;

void log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolCallEvent>) {
          std::string line = "tool.call name=" + evt.tool +
                             " duration_ms=" + std::to_string(evt.duration.count()) +
                             " success=" + bool_text(evt.success);
          if (!evt.error.empty()) {
            line += " error=\"" + evt.error + "\"";
          }
          log_line(evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, ApprovalRequestedEvent>) {
          log_line("INFO", "approval.requested id=" + evt.request_id + " operation=" +
                               evt.operation + " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, ApprovalResolvedEvent>) {
          log_line(evt.delivered ? "INFO" : "WARN",
                   "approval.resolved id=" + evt.request_id + " decision=" + evt.decision +
                       " delivered=" + bool_text(evt.delivered));
        } else if constexpr (std::is_same_v<T, ProcessEvent>) {
          std::string line = "process." + evt.phase + " id=" + evt.bash_id;
          if (evt.exit_code.has_value()) {
            line += " exit_code=" + std::to_string(*evt.exit_code);
          }
          log_line("DEBUG", line);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PendingApprovalsMetric>) {
          log_line("DEBUG", "metric.pending_approvals=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, BackgroundProcessesMetric>) {
          log_line("DEBUG", "metric.background_processes=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace opgate::observability

#include "opgate/observability/global.hpp"

#include <mutex>

namespace opgate::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

// Shared ownership keeps an observer alive for callers on detached reader threads
// while another thread swaps it out.
void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success, const std::string &error) {
  record_event(
      ToolCallEvent{.tool = tool, .duration = duration, .success = success, .error = error});
}

void record_approval_requested(const std::string &request_id, const std::string &operation,
                               const std::string &path) {
  record_event(
      ApprovalRequestedEvent{.request_id = request_id, .operation = operation, .path = path});
}

void record_approval_resolved(const std::string &request_id, const std::string &decision,
                              const bool delivered) {
  record_event(ApprovalResolvedEvent{
      .request_id = request_id, .decision = decision, .delivered = delivered});
}

void record_process(const std::string &bash_id, const std::string &phase,
                    const std::optional<int> exit_code) {
  record_event(ProcessEvent{.bash_id = bash_id, .phase = phase, .exit_code = exit_code});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace opgate::observability

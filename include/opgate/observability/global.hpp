#pragma once

#include "opgate/observability/observer.hpp"

#include <memory>

namespace opgate::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success,
                      const std::string &error = "");
void record_approval_requested(const std::string &request_id, const std::string &operation,
                               const std::string &path);
void record_approval_resolved(const std::string &request_id, const std::string &decision,
                              bool delivered);
void record_process(const std::string &bash_id, const std::string &phase,
                    std::optional<int> exit_code = std::nullopt);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace opgate::observability

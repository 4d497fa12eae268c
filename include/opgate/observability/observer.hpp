#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace opgate::observability {

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string error;
};

struct ApprovalRequestedEvent {
  std::string request_id;
  std::string operation;
  std::string path;
};

struct ApprovalResolvedEvent {
  std::string request_id;
  std::string decision;
  bool delivered = false;
};

struct ProcessEvent {
  std::string bash_id;
  std::string phase; // started | exited | killed
  std::optional<int> exit_code;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ToolCallEvent, ApprovalRequestedEvent, ApprovalResolvedEvent,
                                   ProcessEvent, WarningEvent, ErrorEvent>;

struct PendingApprovalsMetric {
  std::uint64_t count = 0;
};

struct BackgroundProcessesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<PendingApprovalsMetric, BackgroundProcessesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace opgate::observability

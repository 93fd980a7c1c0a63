#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tapbridge::observability {

struct MachineStatusEvent {
  std::string machine_id;
  std::string status;
};

struct AggregateStatusEvent {
  std::string status;
  std::uint64_t tracked_machines = 0;
};

struct ApprovalRequestedEvent {
  std::string request_id;
  std::string session_id;
  std::string machine_id;
  std::string risk_tier;
};

struct ApprovalResolvedEvent {
  std::string request_id;
  std::string state;
  std::string resolved_by;
};

struct NotificationEvent {
  std::string session_id;
  std::string request_id;
};

struct CommandDispatchedEvent {
  std::string machine_id;
  std::string command;
  bool success = false;
};

struct EventDroppedEvent {
  std::string machine_id;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<MachineStatusEvent, AggregateStatusEvent, ApprovalRequestedEvent,
                 ApprovalResolvedEvent, NotificationEvent, CommandDispatchedEvent,
                 EventDroppedEvent, ErrorEvent>;

struct PendingApprovalsMetric {
  std::uint64_t count = 0;
};

struct ConnectedMachinesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<PendingApprovalsMetric, ConnectedMachinesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tapbridge::observability

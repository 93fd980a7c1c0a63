#include "tapbridge/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace tapbridge::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogObserver::LogObserver(const LogLevel min_level, std::ostream *out)
    : min_level_(min_level), out_(out != nullptr ? out : &std::cerr) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MachineStatusEvent>) {
          log_line(LogLevel::Info, "machine.status id=" + evt.machine_id + " status=" + evt.status);
        } else if constexpr (std::is_same_v<T, AggregateStatusEvent>) {
          log_line(LogLevel::Debug, "bridge.status status=" + evt.status +
                                        " machines=" + std::to_string(evt.tracked_machines));
        } else if constexpr (std::is_same_v<T, ApprovalRequestedEvent>) {
          log_line(LogLevel::Info, "approval.requested id=" + evt.request_id +
                                       " session=" + evt.session_id + " tier=" + evt.risk_tier);
        } else if constexpr (std::is_same_v<T, ApprovalResolvedEvent>) {
          log_line(LogLevel::Info, "approval.resolved id=" + evt.request_id + " state=" + evt.state +
                                       " by=" + evt.resolved_by);
        } else if constexpr (std::is_same_v<T, NotificationEvent>) {
          log_line(LogLevel::Info,
                   "notify session=" + evt.session_id + " request=" + evt.request_id);
        } else if constexpr (std::is_same_v<T, CommandDispatchedEvent>) {
          log_line(evt.success ? LogLevel::Debug : LogLevel::Warn,
                   "command machine=" + evt.machine_id + " name=" + evt.command +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, EventDroppedEvent>) {
          log_line(LogLevel::Warn, "event.dropped machine=" + evt.machine_id + " " + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PendingApprovalsMetric>) {
          log_line(LogLevel::Debug, "metric.pending_approvals=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ConnectedMachinesMetric>) {
          log_line(LogLevel::Debug, "metric.connected_machines=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace tapbridge::observability

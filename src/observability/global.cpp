#include "tapbridge/observability/global.hpp"

#include <mutex>

namespace tapbridge::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Recording holds a reference so a concurrent set_global_observer cannot free the target.
void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_machine_status(const std::string &machine_id, const std::string &status) {
  record_event(MachineStatusEvent{.machine_id = machine_id, .status = status});
}

void record_aggregate_status(const std::string &status, const std::uint64_t tracked_machines) {
  record_event(AggregateStatusEvent{.status = status, .tracked_machines = tracked_machines});
}

void record_approval_requested(const std::string &request_id, const std::string &session_id,
                               const std::string &machine_id, const std::string &risk_tier) {
  record_event(ApprovalRequestedEvent{.request_id = request_id,
                                      .session_id = session_id,
                                      .machine_id = machine_id,
                                      .risk_tier = risk_tier});
}

void record_approval_resolved(const std::string &request_id, const std::string &state,
                              const std::string &resolved_by) {
  record_event(
      ApprovalResolvedEvent{.request_id = request_id, .state = state, .resolved_by = resolved_by});
}

void record_notification(const std::string &session_id, const std::string &request_id) {
  record_event(NotificationEvent{.session_id = session_id, .request_id = request_id});
}

void record_command(const std::string &machine_id, const std::string &command,
                    const bool success) {
  record_event(
      CommandDispatchedEvent{.machine_id = machine_id, .command = command, .success = success});
}

void record_event_dropped(const std::string &machine_id, const std::string &reason) {
  record_event(EventDroppedEvent{.machine_id = machine_id, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tapbridge::observability

#pragma once

#include "tapbridge/observability/observer.hpp"

#include <memory>

namespace tapbridge::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_machine_status(const std::string &machine_id, const std::string &status);
void record_aggregate_status(const std::string &status, std::uint64_t tracked_machines);
void record_approval_requested(const std::string &request_id, const std::string &session_id,
                               const std::string &machine_id, const std::string &risk_tier);
void record_approval_resolved(const std::string &request_id, const std::string &state,
                              const std::string &resolved_by);
void record_notification(const std::string &session_id, const std::string &request_id);
void record_command(const std::string &machine_id, const std::string &command, bool success);
void record_event_dropped(const std::string &machine_id, const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace tapbridge::observability

#include "tapbridge/connection/status.hpp"

#include <algorithm>

namespace tapbridge::connection {

std::string_view connection_status_name(const ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::Disconnected:
    return "disconnected";
  case ConnectionStatus::Connecting:
    return "connecting";
  case ConnectionStatus::Connected:
    return "connected";
  case ConnectionStatus::Error:
    return "error";
  }
  return "disconnected";
}

std::optional<ConnectionStatus> connection_status_from_string(const std::string_view value) {
  if (value == "disconnected") {
    return ConnectionStatus::Disconnected;
  }
  if (value == "connecting") {
    return ConnectionStatus::Connecting;
  }
  if (value == "connected") {
    return ConnectionStatus::Connected;
  }
  if (value == "error") {
    return ConnectionStatus::Error;
  }
  return std::nullopt;
}

ConnectionStatus derive_aggregate_status(const MachineStatusMap &machines) {
  const auto any = [&machines](const ConnectionStatus wanted) {
    return std::any_of(machines.begin(), machines.end(),
                       [wanted](const auto &entry) { return entry.second == wanted; });
  };
  if (any(ConnectionStatus::Connected)) {
    return ConnectionStatus::Connected;
  }
  if (any(ConnectionStatus::Connecting)) {
    return ConnectionStatus::Connecting;
  }
  if (any(ConnectionStatus::Error)) {
    return ConnectionStatus::Error;
  }
  return ConnectionStatus::Disconnected;
}

} // namespace tapbridge::connection

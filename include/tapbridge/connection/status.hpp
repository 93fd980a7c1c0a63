#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tapbridge::connection {

enum class ConnectionStatus { Disconnected, Connecting, Connected, Error };

[[nodiscard]] std::string_view connection_status_name(ConnectionStatus status);
[[nodiscard]] std::optional<ConnectionStatus> connection_status_from_string(std::string_view value);

using MachineStatusMap = std::map<std::string, ConnectionStatus>;

/// Strict priority over the whole map: connected, then connecting, then error.
/// An empty map is disconnected. Entry counts never matter.
[[nodiscard]] ConnectionStatus derive_aggregate_status(const MachineStatusMap &machines);

struct ConnectionSnapshot {
  ConnectionStatus status = ConnectionStatus::Disconnected;
  MachineStatusMap machines;
  std::map<std::string, std::string> machine_errors;
  std::optional<std::string> error;
  std::optional<std::chrono::system_clock::time_point> last_connected;
  std::uint64_t revision = 0;
};

} // namespace tapbridge::connection

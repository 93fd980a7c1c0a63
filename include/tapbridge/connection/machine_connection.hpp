#pragma once

#include "tapbridge/common/result.hpp"
#include "tapbridge/connection/status.hpp"
#include "tapbridge/protocol/messages.hpp"
#include "tapbridge/transport/transport.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tapbridge::connection {

struct MachineConnectionOptions {
  std::string token;
  std::string ws_path = "/ws";
};

/// One transport connection to one machine. Failures surface as status transitions
/// reported through the status callback, never as exceptions. Every connect starts a
/// new generation; callbacks belonging to an older generation are ignored.
class MachineConnection {
public:
  using StatusCallback = std::function<void(const std::string &machine_id, ConnectionStatus status,
                                            const std::string &error)>;
  using MessageCallback = std::function<void(const std::string &machine_id,
                                             const protocol::ServerMessage &message)>;

  MachineConnection(std::string machine_id, std::unique_ptr<transport::ITransport> transport,
                    MachineConnectionOptions options, StatusCallback on_status,
                    MessageCallback on_message);
  ~MachineConnection();

  MachineConnection(const MachineConnection &) = delete;
  MachineConnection &operator=(const MachineConnection &) = delete;

  void connect(const std::string &tunnel_url);
  void disconnect();

  /// NotConnected unless the machine has completed authentication.
  [[nodiscard]] common::Status send(const protocol::ClientMessage &message);

  [[nodiscard]] const std::string &machine_id() const { return machine_id_; }
  [[nodiscard]] ConnectionStatus status() const;
  [[nodiscard]] std::string machine_name() const;
  [[nodiscard]] std::uint64_t generation() const;

private:
  void handle_open(std::uint64_t generation);
  void handle_text(std::uint64_t generation, const std::string &text);
  void transition(std::uint64_t generation, ConnectionStatus status, const std::string &error = "");
  [[nodiscard]] bool is_current(std::uint64_t generation) const;

  std::string machine_id_;
  std::unique_ptr<transport::ITransport> transport_;
  MachineConnectionOptions options_;
  StatusCallback on_status_;
  MessageCallback on_message_;

  // Serializes transitions and their callbacks so one machine's changes are totally ordered.
  std::mutex transition_mutex_;
  mutable std::mutex mutex_;
  ConnectionStatus status_ = ConnectionStatus::Disconnected;
  std::uint64_t generation_ = 0;
  std::string machine_name_;
};

} // namespace tapbridge::connection

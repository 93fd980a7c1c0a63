#pragma once

#include "tapbridge/connection/machine_connection.hpp"
#include "tapbridge/connection/status.hpp"
#include "tapbridge/directory/machine.hpp"
#include "tapbridge/transport/transport.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tapbridge::connection {

/// Owns the per-machine connections and the `machine id -> status` map. The aggregate
/// status is re-derived from the full map after every mutation. All state changes go
/// through `mutex_`; listeners run after it is released, in mutation order, and must
/// not mutate the registry themselves.
class ConnectionRegistry {
public:
  using StatusListener = std::function<void(const ConnectionSnapshot &snapshot)>;
  using MachineStatusListener =
      std::function<void(const std::string &machine_id, ConnectionStatus status)>;

  ConnectionRegistry(transport::TransportFactory transport_factory,
                     MachineConnectionOptions options,
                     MachineConnection::MessageCallback on_message);
  ~ConnectionRegistry();

  ConnectionRegistry(const ConnectionRegistry &) = delete;
  ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

  /// `Disconnected` removes the machine's entry; any other value upserts it.
  void set_machine_status(const std::string &machine_id, ConnectionStatus status,
                          const std::string &error = "");
  /// Forces the aggregate to `error` and stores the message whatever the map holds.
  /// Passing an empty message clears the text but leaves the status at `error`; only
  /// a later transition moves it away.
  void set_error(const std::string &message);
  /// Forced aggregate status. `Connected` stamps last_connected and clears the error.
  void set_status(ConnectionStatus status);
  /// Empties the map and clears the error; status becomes `disconnected`.
  void reset();

  [[nodiscard]] ConnectionSnapshot snapshot() const;
  [[nodiscard]] ConnectionStatus status() const;
  [[nodiscard]] ConnectionStatus machine_status(const std::string &machine_id) const;

  std::size_t add_listener(StatusListener listener);
  void remove_listener(std::size_t id);
  void set_machine_status_listener(MachineStatusListener listener);

  /// Connects every connectable machine in `machines` that is not already connected or
  /// connecting, and drops connections to machines no longer in the connectable set.
  /// Returns the number of connection attempts started.
  std::size_t connect_all(const std::vector<directory::Machine> &machines);
  void disconnect_all();

  [[nodiscard]] std::shared_ptr<MachineConnection> connection(const std::string &machine_id) const;
  [[nodiscard]] std::vector<std::shared_ptr<MachineConnection>> connections() const;
  [[nodiscard]] std::vector<directory::Machine> known_machines() const;

private:
  void publish(const ConnectionSnapshot &snapshot);
  void on_connection_status(const std::string &machine_id, ConnectionStatus status,
                            const std::string &error);
  [[nodiscard]] std::shared_ptr<MachineConnection> make_connection(const std::string &machine_id);

  transport::TransportFactory transport_factory_;
  MachineConnectionOptions options_;
  MachineConnection::MessageCallback on_message_;

  mutable std::mutex mutex_;
  ConnectionSnapshot state_;
  std::map<std::string, std::shared_ptr<MachineConnection>> connections_;
  std::map<std::string, directory::Machine> machines_;

  // Held across a mutation and its notification so listeners observe mutation order.
  std::mutex publish_mutex_;
  std::mutex listener_mutex_;
  std::map<std::size_t, StatusListener> listeners_;
  MachineStatusListener machine_listener_;
  std::size_t next_listener_id_ = 1;
};

} // namespace tapbridge::connection

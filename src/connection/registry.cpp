#include "tapbridge/connection/registry.hpp"

#include "tapbridge/observability/global.hpp"

#include <set>

namespace tapbridge::connection {

namespace {

void apply_derived(ConnectionSnapshot &state) {
  state.status = derive_aggregate_status(state.machines);
  if (state.status == ConnectionStatus::Connected) {
    state.last_connected = std::chrono::system_clock::now();
    state.error.reset();
  }
}

std::uint64_t connected_count(const MachineStatusMap &machines) {
  std::uint64_t count = 0;
  for (const auto &[id, status] : machines) {
    if (status == ConnectionStatus::Connected) {
      ++count;
    }
  }
  return count;
}

} // namespace

ConnectionRegistry::ConnectionRegistry(transport::TransportFactory transport_factory,
                                       MachineConnectionOptions options,
                                       MachineConnection::MessageCallback on_message)
    : transport_factory_(std::move(transport_factory)), options_(std::move(options)),
      on_message_(std::move(on_message)) {}

ConnectionRegistry::~ConnectionRegistry() {
  std::map<std::string, std::shared_ptr<MachineConnection>> connections;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections.swap(connections_);
  }
  // Destroying a connection closes its transport; no status callback follows.
  connections.clear();
}

void ConnectionRegistry::set_machine_status(const std::string &machine_id,
                                            const ConnectionStatus status,
                                            const std::string &error) {
  std::lock_guard<std::mutex> ordered(publish_mutex_);
  ConnectionSnapshot snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status == ConnectionStatus::Disconnected) {
      state_.machines.erase(machine_id);
    } else {
      state_.machines[machine_id] = status;
    }
    if (status == ConnectionStatus::Error) {
      state_.machine_errors[machine_id] = error;
    } else {
      state_.machine_errors.erase(machine_id);
    }
    apply_derived(state_);
    ++state_.revision;
    snapshot = state_;
  }
  publish(snapshot);
}

void ConnectionRegistry::set_error(const std::string &message) {
  std::lock_guard<std::mutex> ordered(publish_mutex_);
  ConnectionSnapshot snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // An empty message clears the text only; the status stays `error`.
    if (message.empty()) {
      state_.error.reset();
    } else {
      state_.error = message;
    }
    state_.status = ConnectionStatus::Error;
    ++state_.revision;
    snapshot = state_;
  }
  if (!message.empty()) {
    observability::record_error("registry", message);
  }
  publish(snapshot);
}

void ConnectionRegistry::set_status(const ConnectionStatus status) {
  std::lock_guard<std::mutex> ordered(publish_mutex_);
  ConnectionSnapshot snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.status = status;
    if (status == ConnectionStatus::Connected) {
      state_.last_connected = std::chrono::system_clock::now();
      state_.error.reset();
    }
    ++state_.revision;
    snapshot = state_;
  }
  publish(snapshot);
}

void ConnectionRegistry::reset() {
  std::lock_guard<std::mutex> ordered(publish_mutex_);
  ConnectionSnapshot snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.machines.clear();
    state_.machine_errors.clear();
    state_.error.reset();
    state_.status = ConnectionStatus::Disconnected;
    ++state_.revision;
    snapshot = state_;
  }
  publish(snapshot);
}

ConnectionSnapshot ConnectionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

ConnectionStatus ConnectionRegistry::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.status;
}

ConnectionStatus ConnectionRegistry::machine_status(const std::string &machine_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = state_.machines.find(machine_id);
  return it == state_.machines.end() ? ConnectionStatus::Disconnected : it->second;
}

std::size_t ConnectionRegistry::add_listener(StatusListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const std::size_t id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void ConnectionRegistry::remove_listener(const std::size_t id) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(id);
}

void ConnectionRegistry::set_machine_status_listener(MachineStatusListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  machine_listener_ = std::move(listener);
}

std::size_t ConnectionRegistry::connect_all(const std::vector<directory::Machine> &machines) {
  struct Attempt {
    std::shared_ptr<MachineConnection> connection;
    std::string tunnel_url;
  };
  std::vector<Attempt> attempts;
  std::vector<std::shared_ptr<MachineConnection>> unlinked;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> connectable;
    for (const auto &machine : machines) {
      if (!machine.connectable()) {
        continue;
      }
      connectable.insert(machine.id);
      machines_[machine.id] = machine;
    }

    for (auto it = connections_.begin(); it != connections_.end();) {
      if (!connectable.contains(it->first)) {
        unlinked.push_back(it->second);
        machines_.erase(it->first);
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }

    for (const auto &id : connectable) {
      auto &connection = connections_[id];
      if (connection == nullptr) {
        connection = make_connection(id);
      }
      const auto status = connection->status();
      if (status == ConnectionStatus::Connected || status == ConnectionStatus::Connecting) {
        continue;
      }
      attempts.push_back(Attempt{.connection = connection, .tunnel_url = *machines_[id].tunnel_url});
    }
  }

  for (auto &connection : unlinked) {
    connection->disconnect();
  }
  unlinked.clear();

  for (auto &attempt : attempts) {
    attempt.connection->connect(attempt.tunnel_url);
  }
  return attempts.size();
}

void ConnectionRegistry::disconnect_all() {
  for (auto &connection : connections()) {
    connection->disconnect();
  }
  reset();
}

std::shared_ptr<MachineConnection>
ConnectionRegistry::connection(const std::string &machine_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = connections_.find(machine_id);
  return it == connections_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<MachineConnection>> ConnectionRegistry::connections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<MachineConnection>> out;
  out.reserve(connections_.size());
  for (const auto &[id, connection] : connections_) {
    out.push_back(connection);
  }
  return out;
}

std::vector<directory::Machine> ConnectionRegistry::known_machines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<directory::Machine> out;
  out.reserve(machines_.size());
  for (const auto &[id, machine] : machines_) {
    out.push_back(machine);
  }
  return out;
}

void ConnectionRegistry::publish(const ConnectionSnapshot &snapshot) {
  observability::record_aggregate_status(std::string(connection_status_name(snapshot.status)),
                                         snapshot.machines.size());
  observability::record_metric(
      observability::ConnectedMachinesMetric{.count = connected_count(snapshot.machines)});

  std::vector<StatusListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners.reserve(listeners_.size());
    for (const auto &[id, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }
  for (const auto &listener : listeners) {
    listener(snapshot);
  }
}

void ConnectionRegistry::on_connection_status(const std::string &machine_id,
                                              const ConnectionStatus status,
                                              const std::string &error) {
  set_machine_status(machine_id, status, error);
  MachineStatusListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = machine_listener_;
  }
  if (listener) {
    listener(machine_id, status);
  }
}

std::shared_ptr<MachineConnection> ConnectionRegistry::make_connection(const std::string &machine_id) {
  return std::make_shared<MachineConnection>(
      machine_id, transport_factory_(), options_,
      [this](const std::string &id, const ConnectionStatus status, const std::string &error) {
        on_connection_status(id, status, error);
      },
      on_message_);
}

} // namespace tapbridge::connection

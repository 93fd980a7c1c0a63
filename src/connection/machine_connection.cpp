#include "tapbridge/connection/machine_connection.hpp"

#include "tapbridge/observability/global.hpp"
#include "tapbridge/transport/endpoint.hpp"

namespace tapbridge::connection {

MachineConnection::MachineConnection(std::string machine_id,
                                     std::unique_ptr<transport::ITransport> transport,
                                     MachineConnectionOptions options, StatusCallback on_status,
                                     MessageCallback on_message)
    : machine_id_(std::move(machine_id)), transport_(std::move(transport)),
      options_(std::move(options)), on_status_(std::move(on_status)),
      on_message_(std::move(on_message)) {}

MachineConnection::~MachineConnection() {
  if (transport_ != nullptr) {
    transport_->close();
  }
}

void MachineConnection::connect(const std::string &tunnel_url) {
  // close() guarantees the previous generation makes no further callbacks.
  transport_->close();

  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    generation = ++generation_;
  }

  // A malformed tunnel URL fails the attempt like any other: connecting, then error.
  transition(generation, ConnectionStatus::Connecting);
  auto endpoint = transport::endpoint_from_tunnel_url(tunnel_url, options_.ws_path);
  if (!endpoint.ok()) {
    transition(generation, ConnectionStatus::Error, endpoint.error());
    return;
  }

  transport::TransportCallbacks callbacks;
  callbacks.on_open = [this, generation] { handle_open(generation); };
  callbacks.on_text = [this, generation](const std::string &text) {
    handle_text(generation, text);
  };
  callbacks.on_error = [this, generation](const std::string &message) {
    transition(generation, ConnectionStatus::Error, message);
  };
  callbacks.on_close = [this, generation] {
    transition(generation, ConnectionStatus::Disconnected);
  };

  const auto opened = transport_->open(endpoint.value(), std::move(callbacks));
  if (!opened.ok()) {
    transition(generation, ConnectionStatus::Error, opened.error());
  }
}

void MachineConnection::disconnect() {
  transport_->close();
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    generation = ++generation_;
  }
  transition(generation, ConnectionStatus::Disconnected);
}

common::Status MachineConnection::send(const protocol::ClientMessage &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ConnectionStatus::Connected) {
      return common::Status::error(common::ErrorCode::NotConnected,
                                   "machine " + machine_id_ + " is not connected");
    }
  }
  return transport_->send_text(protocol::to_json(message));
}

ConnectionStatus MachineConnection::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::string MachineConnection::machine_name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return machine_name_;
}

std::uint64_t MachineConnection::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

void MachineConnection::handle_open(const std::uint64_t generation) {
  if (!is_current(generation)) {
    return;
  }
  const auto sent = transport_->send_text(protocol::to_json(protocol::auth_message(options_.token)));
  if (!sent.ok()) {
    transition(generation, ConnectionStatus::Error, sent.error());
  }
}

void MachineConnection::handle_text(const std::uint64_t generation, const std::string &text) {
  if (!is_current(generation)) {
    return;
  }
  auto parsed = protocol::parse_server_message(text);
  if (!parsed.ok()) {
    observability::record_event_dropped(machine_id_, parsed.error());
    return;
  }
  const auto &message = parsed.value();

  switch (message.type) {
  case protocol::ServerMessageType::AuthSuccess: {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      machine_name_ = message.machine_name;
    }
    transition(generation, ConnectionStatus::Connected);
    break;
  }
  case protocol::ServerMessageType::AuthError:
    transition(generation, ConnectionStatus::Error,
               message.message.empty() ? "authentication failed" : message.message);
    transport_->close();
    return;
  case protocol::ServerMessageType::Pong:
    return;
  default:
    break;
  }

  if (status() != ConnectionStatus::Connected) {
    observability::record_event_dropped(machine_id_, "message before authentication: " +
                                                         message.type_name);
    return;
  }
  if (on_message_) {
    on_message_(machine_id_, message);
  }
}

void MachineConnection::transition(const std::uint64_t generation, const ConnectionStatus status,
                                   const std::string &error) {
  std::lock_guard<std::mutex> ordered(transition_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || status_ == status) {
      return;
    }
    status_ = status;
  }
  observability::record_machine_status(machine_id_, std::string(connection_status_name(status)));
  if (!error.empty()) {
    observability::record_error("connection:" + machine_id_, error);
  }
  if (on_status_) {
    on_status_(machine_id_, status, error);
  }
}

bool MachineConnection::is_current(const std::uint64_t generation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation == generation_;
}

} // namespace tapbridge::connection

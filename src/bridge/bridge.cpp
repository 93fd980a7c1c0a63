#include "tapbridge/bridge/bridge.hpp"

#include "tapbridge/observability/global.hpp"

namespace tapbridge::bridge {

namespace {

BridgeDependencies with_defaults(BridgeDependencies deps) {
  if (deps.directory == nullptr) {
    deps.directory = std::make_shared<directory::StaticMachineDirectory>(
        std::vector<directory::Machine>{});
  }
  if (deps.preferences == nullptr) {
    deps.preferences =
        std::make_shared<directory::StaticPreferencesStore>(security::AutoApprovalPreferences{});
  }
  if (deps.notifier == nullptr) {
    deps.notifier = std::make_shared<notify::NoopNotificationDispatcher>();
  }
  return deps;
}

void journal_resolution(security::IApprovalJournal *journal,
                        const std::optional<security::ApprovalRequest> &request) {
  if (journal == nullptr || !request.has_value()) {
    return;
  }
  if (const auto recorded = journal->record(*request); !recorded.ok()) {
    observability::record_error("journal", recorded.error());
  }
}

} // namespace

Bridge::Bridge(BridgeDependencies dependencies)
    : deps_(with_defaults(std::move(dependencies))), hub_(std::make_shared<SubscriptionHub>()),
      engine_(store_, *deps_.preferences, *deps_.notifier,
              [this](const security::ApprovalRequest &request) { return dispatch_decision(request); },
              deps_.journal.get()) {
  registry_ = std::make_unique<connection::ConnectionRegistry>(
      deps_.transport_factory, deps_.connection_options,
      [this](const std::string &machine_id, const protocol::ServerMessage &message) {
        handle_server_message(machine_id, message);
      });
  registry_->set_machine_status_listener(
      [this](const std::string &machine_id, const connection::ConnectionStatus status) {
        on_machine_status(machine_id, status);
      });
}

Bridge::~Bridge() {
  registry_.reset();
  hub_->close_all();
}

common::Result<std::size_t> Bridge::connect_all() {
  auto machines = deps_.directory->list();
  if (!machines.ok()) {
    registry_->set_error(machines.error());
    return common::Result<std::size_t>::failure(machines.code(), machines.error());
  }
  return common::Result<std::size_t>::success(registry_->connect_all(machines.value()));
}

void Bridge::disconnect_all() { registry_->disconnect_all(); }

common::Result<std::size_t> Bridge::refresh_all() {
  if (const auto refreshed = deps_.preferences->refresh(); !refreshed.ok()) {
    observability::record_error("preferences", refreshed.error());
  }
  disconnect_all();
  return connect_all();
}

std::size_t Bridge::keepalive() {
  std::size_t sent = 0;
  for (const auto &connection : registry_->connections()) {
    if (connection->status() != connection::ConnectionStatus::Connected) {
      continue;
    }
    if (const auto status = connection->send(protocol::ping_message()); status.ok()) {
      ++sent;
    } else {
      observability::record_error("keepalive", connection->machine_id() + ": " + status.error());
    }
  }
  return sent;
}

common::Result<SessionSubscription> Bridge::subscribe_to_session(const std::string &session_id) {
  const auto session = store_.session(session_id);
  if (!session.has_value()) {
    return common::Result<SessionSubscription>::failure(common::ErrorCode::UnknownSession,
                                                        "unknown session: " + session_id);
  }

  if (session->ended) {
    return common::Result<SessionSubscription>::success(hub_->ended(session_id));
  }

  std::lock_guard<std::mutex> lock(subscribe_mutex_);
  const bool first = !hub_->has_subscribers(session_id);
  SessionSubscription subscription = hub_->open(session_id);
  // The session-end event may have been published between the lookup and the open.
  if (const auto current = store_.session(session_id); current.has_value() && current->ended) {
    subscription.close();
    return common::Result<SessionSubscription>::success(hub_->ended(session_id));
  }
  if (first && registry_->machine_status(session->machine_id) ==
                   connection::ConnectionStatus::Connected) {
    request_history(session_id, session->machine_id);
  }
  return common::Result<SessionSubscription>::success(std::move(subscription));
}

common::Status Bridge::unsubscribe(const std::string &session_id) {
  const auto session = store_.session(session_id);
  if (!session.has_value()) {
    return common::Status::error(common::ErrorCode::UnknownSession,
                                 "unknown session: " + session_id);
  }

  std::lock_guard<std::mutex> lock(subscribe_mutex_);
  hub_->close_session(session_id);
  auto connection = connected_machine(session->machine_id);
  if (!connection.ok()) {
    return common::Status::success();
  }
  return connection.value()->send(protocol::unsubscribe_message({session_id}));
}

common::Status Bridge::send_message(const std::string &session_id, const std::string &text) {
  return send_to_session(session_id, protocol::send_message_command(session_id, text),
                         "send_message");
}

common::Status Bridge::approve_tool_call(const std::string &request_id) {
  return resolve_by_user(request_id, true, "");
}

common::Status Bridge::deny_tool_call(const std::string &request_id, const std::string &reason) {
  return resolve_by_user(request_id, false, reason);
}

common::Status Bridge::cancel_session(const std::string &session_id) {
  return send_to_session(session_id, protocol::cancel_command(session_id), "cancel");
}

common::Status Bridge::terminate_session(const std::string &session_id) {
  return send_to_session(session_id, protocol::terminate_session_message(session_id),
                         "terminate_session");
}

void Bridge::handle_server_message(const std::string &machine_id,
                                   const protocol::ServerMessage &message) {
  switch (message.type) {
  case protocol::ServerMessageType::SessionsList:
    store_.set_sessions_for_machine(machine_id, message.sessions);
    return;
  case protocol::ServerMessageType::AcpEvent: {
    auto decoded = protocol::parse_acp_event(message.event_json, machine_id);
    if (!decoded.ok()) {
      observability::record_event_dropped(machine_id, decoded.error());
      return;
    }
    if (decoded.value().has_value()) {
      ingest(*decoded.value());
    }
    return;
  }
  case protocol::ServerMessageType::HistoryComplete:
    for (const auto &replayed : store_.complete_history_loading(message.session_id)) {
      deliver(replayed.event, replayed.result);
    }
    return;
  case protocol::ServerMessageType::Error: {
    std::string text = message.message;
    if (!message.code.empty()) {
      text += " (" + message.code + ")";
    }
    observability::record_error("machine " + machine_id, text);
    return;
  }
  case protocol::ServerMessageType::AuthSuccess:
  case protocol::ServerMessageType::AuthError:
  case protocol::ServerMessageType::Pong:
  case protocol::ServerMessageType::Other:
    return;
  }
}

connection::ConnectionSnapshot Bridge::connection_snapshot() const { return registry_->snapshot(); }

std::vector<directory::Machine> Bridge::machines() const { return registry_->known_machines(); }

std::vector<sessions::Session> Bridge::sessions() const { return store_.sessions(); }

std::optional<sessions::Session> Bridge::session(const std::string &session_id) const {
  return store_.session(session_id);
}

std::vector<sessions::TranscriptMessage> Bridge::transcript(const std::string &session_id) const {
  return store_.transcript(session_id);
}

std::vector<sessions::ToolCallRecord> Bridge::tool_calls(const std::string &session_id) const {
  return store_.tool_calls(session_id);
}

std::vector<security::ApprovalRequest> Bridge::pending_approvals() const {
  return store_.pending_approvals();
}

std::optional<security::ApprovalRequest> Bridge::approval(const std::string &request_id) const {
  return store_.approval(request_id);
}

std::size_t
Bridge::add_status_listener(connection::ConnectionRegistry::StatusListener listener) {
  return registry_->add_listener(std::move(listener));
}

void Bridge::remove_status_listener(const std::size_t id) { registry_->remove_listener(id); }

void Bridge::ingest(const protocol::InboundEvent &event) { deliver(event, store_.apply(event)); }

void Bridge::deliver(const protocol::InboundEvent &event, const sessions::ApplyResult &result) {
  if (result.buffered || result.duplicate) {
    return;
  }
  if (result.created_request_id.has_value()) {
    const auto evaluation = engine_.evaluate(*result.created_request_id);
    if (!evaluation.dispatch.ok()) {
      observability::record_error("policy", *result.created_request_id + ": " +
                                                evaluation.dispatch.error());
    }
  }
  hub_->publish(event);
}

void Bridge::on_machine_status(const std::string &machine_id,
                               const connection::ConnectionStatus status) {
  if (status != connection::ConnectionStatus::Connected) {
    if (status != connection::ConnectionStatus::Connecting) {
      store_.discard_buffers_for_machine(machine_id);
    }
    return;
  }

  store_.discard_buffers_for_machine(machine_id);
  std::vector<std::string> resubscribe;
  for (const auto &session_id : hub_->subscribed_sessions()) {
    const auto session = store_.session(session_id);
    if (session.has_value() && session->machine_id == machine_id) {
      resubscribe.push_back(session_id);
    }
  }
  // Whatever was queued before the reconnect is stale; history is fetched again.
  hub_->discard_undelivered(resubscribe);
  for (const auto &session_id : resubscribe) {
    request_history(session_id, machine_id);
  }
}

void Bridge::request_history(const std::string &session_id, const std::string &machine_id) {
  auto connection = registry_->connection(machine_id);
  if (connection == nullptr) {
    return;
  }
  store_.start_history_loading(session_id, machine_id);
  if (const auto sent = connection->send(protocol::subscribe_message({session_id})); !sent.ok()) {
    observability::record_error("subscribe", session_id + ": " + sent.error());
  }
}

common::Status Bridge::dispatch_decision(const security::ApprovalRequest &request) {
  const bool approve = request.state == security::ApprovalState::Approved ||
                       request.state == security::ApprovalState::AutoApproved;
  const std::string command = approve ? "approve_tool_call" : "deny_tool_call";
  auto connection = connected_machine(request.machine_id);
  if (!connection.ok()) {
    observability::record_command(request.machine_id, command, false);
    return connection.status();
  }
  const auto message =
      approve ? protocol::approve_command(request.session_id, request.request_id,
                                          request.tool_call_id)
              : protocol::deny_command(request.session_id, request.request_id,
                                       request.tool_call_id, "");
  const auto sent = connection.value()->send(message);
  observability::record_command(request.machine_id, command, sent.ok());
  return sent;
}

common::Status Bridge::resolve_by_user(const std::string &request_id, const bool approve,
                                       const std::string &reason) {
  const auto request = store_.approval(request_id);
  if (!request.has_value()) {
    return common::Status::error(common::ErrorCode::UnknownRequest,
                                 "unknown approval request: " + request_id);
  }
  if (security::is_terminal(request->state)) {
    return common::Status::success();
  }
  auto connection = connected_machine(request->machine_id);
  if (!connection.ok()) {
    return connection.status();
  }

  const auto state = approve ? security::ApprovalState::Approved : security::ApprovalState::Denied;
  if (!store_.try_resolve(request_id, state, security::ResolvedBy::User)) {
    return common::Status::success();
  }

  const auto message =
      approve ? protocol::approve_command(request->session_id, request_id, request->tool_call_id)
              : protocol::deny_command(request->session_id, request_id, request->tool_call_id,
                                       reason);
  const std::string command = approve ? "approve_tool_call" : "deny_tool_call";
  const auto sent = connection.value()->send(message);
  observability::record_command(request->machine_id, command, sent.ok());
  if (!sent.ok()) {
    // The machine never heard the decision, so the request stays open for a retry.
    store_.revert_resolution(request_id, state, security::ResolvedBy::User);
    return common::Status::error(common::ErrorCode::TransportError,
                                 command + " for " + request_id + " failed: " + sent.error());
  }

  observability::record_approval_resolved(
      request_id, std::string(security::approval_state_name(state)),
      std::string(security::resolved_by_name(security::ResolvedBy::User)));
  journal_resolution(deps_.journal.get(), store_.approval(request_id));
  return common::Status::success();
}

common::Status Bridge::send_to_session(const std::string &session_id,
                                       const protocol::ClientMessage &message,
                                       const std::string &command) {
  const auto session = store_.session(session_id);
  if (!session.has_value()) {
    return common::Status::error(common::ErrorCode::UnknownSession,
                                 "unknown session: " + session_id);
  }
  auto connection = connected_machine(session->machine_id);
  if (!connection.ok()) {
    return connection.status();
  }
  const auto sent = connection.value()->send(message);
  observability::record_command(session->machine_id, command, sent.ok());
  if (!sent.ok()) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 command + " failed: " + sent.error());
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<connection::MachineConnection>>
Bridge::connected_machine(const std::string &machine_id) const {
  using ConnectionResult = common::Result<std::shared_ptr<connection::MachineConnection>>;
  auto connection = registry_->connection(machine_id);
  if (connection == nullptr || connection->status() != connection::ConnectionStatus::Connected) {
    return ConnectionResult::failure(common::ErrorCode::NotConnected,
                                     "machine " + machine_id + " is not connected");
  }
  return ConnectionResult::success(std::move(connection));
}

} // namespace tapbridge::bridge

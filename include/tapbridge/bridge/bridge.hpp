#pragma once

#include "tapbridge/bridge/event_stream.hpp"
#include "tapbridge/common/result.hpp"
#include "tapbridge/connection/registry.hpp"
#include "tapbridge/directory/directory.hpp"
#include "tapbridge/directory/preferences.hpp"
#include "tapbridge/notify/notifier.hpp"
#include "tapbridge/protocol/messages.hpp"
#include "tapbridge/security/journal.hpp"
#include "tapbridge/security/policy.hpp"
#include "tapbridge/sessions/store.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tapbridge::bridge {

struct BridgeDependencies {
  transport::TransportFactory transport_factory;
  connection::MachineConnectionOptions connection_options;
  std::shared_ptr<directory::IMachineDirectory> directory;
  std::shared_ptr<directory::IPreferencesStore> preferences;
  std::shared_ptr<notify::INotificationDispatcher> notifier;
  /// Optional; without it decisions only live as long as the process.
  std::shared_ptr<security::IApprovalJournal> journal;
};

/// Single entry point for the presentation layer. Commands are routed to the connection
/// that owns the target session's machine; reads are snapshots of the session store and
/// the connection registry. Safe to call from any thread.
class Bridge {
public:
  explicit Bridge(BridgeDependencies dependencies);
  ~Bridge();

  Bridge(const Bridge &) = delete;
  Bridge &operator=(const Bridge &) = delete;

  /// Lists the directory and connects every reachable machine. A directory failure is
  /// stored as the registry error and returned. Returns the number of attempts started.
  common::Result<std::size_t> connect_all();
  void disconnect_all();
  /// Re-reads preferences, then disconnects and connects again.
  common::Result<std::size_t> refresh_all();
  /// Sends a ping on every connected machine. Returns the number of pings sent.
  std::size_t keepalive();

  /// Opens an event stream for a known session. History is requested now when the
  /// machine is connected, otherwise as soon as it connects.
  [[nodiscard]] common::Result<SessionSubscription>
  subscribe_to_session(const std::string &session_id);
  /// Ends every stream of the session and tells the machine to stop sending its events.
  common::Status unsubscribe(const std::string &session_id);

  common::Status send_message(const std::string &session_id, const std::string &text);
  common::Status approve_tool_call(const std::string &request_id);
  common::Status deny_tool_call(const std::string &request_id, const std::string &reason = "");
  /// Interrupts the agent's current turn.
  common::Status cancel_session(const std::string &session_id);
  /// Stops the session's agent process on the machine.
  common::Status terminate_session(const std::string &session_id);

  /// Entry point for decoded daemon messages; connections deliver here.
  void handle_server_message(const std::string &machine_id, const protocol::ServerMessage &message);

  [[nodiscard]] connection::ConnectionSnapshot connection_snapshot() const;
  [[nodiscard]] std::vector<directory::Machine> machines() const;
  [[nodiscard]] std::vector<sessions::Session> sessions() const;
  [[nodiscard]] std::optional<sessions::Session> session(const std::string &session_id) const;
  [[nodiscard]] std::vector<sessions::TranscriptMessage>
  transcript(const std::string &session_id) const;
  [[nodiscard]] std::vector<sessions::ToolCallRecord>
  tool_calls(const std::string &session_id) const;
  [[nodiscard]] std::vector<security::ApprovalRequest> pending_approvals() const;
  [[nodiscard]] std::optional<security::ApprovalRequest>
  approval(const std::string &request_id) const;

  std::size_t add_status_listener(connection::ConnectionRegistry::StatusListener listener);
  void remove_status_listener(std::size_t id);

  [[nodiscard]] connection::ConnectionRegistry &registry() { return *registry_; }
  [[nodiscard]] sessions::SessionStore &store() { return store_; }

private:
  void ingest(const protocol::InboundEvent &event);
  void deliver(const protocol::InboundEvent &event, const sessions::ApplyResult &result);
  void on_machine_status(const std::string &machine_id, connection::ConnectionStatus status);
  void request_history(const std::string &session_id, const std::string &machine_id);
  [[nodiscard]] common::Status dispatch_decision(const security::ApprovalRequest &request);
  [[nodiscard]] common::Status resolve_by_user(const std::string &request_id, bool approve,
                                               const std::string &reason);
  [[nodiscard]] common::Status send_to_session(const std::string &session_id,
                                               const protocol::ClientMessage &message,
                                               const std::string &command);
  [[nodiscard]] common::Result<std::shared_ptr<connection::MachineConnection>>
  connected_machine(const std::string &machine_id) const;

  BridgeDependencies deps_;
  sessions::SessionStore store_;
  std::shared_ptr<SubscriptionHub> hub_;
  // Serializes subscribe and unsubscribe so history is requested once per first subscriber.
  std::mutex subscribe_mutex_;
  security::ApprovalPolicyEngine engine_;
  // Declared last so its connections stop before the members they call into go away.
  std::unique_ptr<connection::ConnectionRegistry> registry_;
};

} // namespace tapbridge::bridge

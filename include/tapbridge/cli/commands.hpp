#pragma once

#include "tapbridge/bridge/bridge.hpp"
#include "tapbridge/connection/status.hpp"
#include "tapbridge/protocol/event.hpp"
#include "tapbridge/security/approval.hpp"
#include "tapbridge/sessions/session.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace tapbridge::cli {

[[nodiscard]] std::string format_snapshot(const connection::ConnectionSnapshot &snapshot);
[[nodiscard]] std::string format_session(const sessions::Session &session);
[[nodiscard]] std::string format_approval(const security::ApprovalRequest &request);
[[nodiscard]] std::string format_tool_call(const sessions::ToolCallRecord &call);
[[nodiscard]] std::string format_event(const protocol::InboundEvent &event);

/// Line oriented front end of `tapbridge watch`.
class WatchShell {
public:
  WatchShell(bridge::Bridge &bridge, std::ostream &out);

  /// Runs one input line. Returns false once the user asked to quit.
  bool execute(const std::string &line);
  /// Prints whatever the open subscriptions have queued. Returns the number printed.
  std::size_t drain_events();
  [[nodiscard]] std::size_t open_subscriptions() const;

private:
  void print_help();
  void print_sessions();
  void print_pending();
  void print_tool_calls(const std::string &session_id);
  void subscribe(const std::string &session_id);
  void unsubscribe(const std::string &session_id);
  void report(const common::Status &status, const std::string &what);

  bridge::Bridge &bridge_;
  std::ostream &out_;
  mutable std::mutex mutex_;
  std::map<std::string, bridge::SessionSubscription> subscriptions_;
};

int run_cli(int argc, char **argv);

} // namespace tapbridge::cli

#pragma once

#include "tapbridge/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tapbridge::protocol {

enum class ClientMessageType {
  Auth,
  Ping,
  Subscribe,
  Unsubscribe,
  SendMessage,
  ApproveToolCall,
  DenyToolCall,
  Cancel,
  TerminateSession,
};

/// One client to daemon frame. Only the fields relevant to `type` are encoded.
struct ClientMessage {
  ClientMessageType type = ClientMessageType::Ping;
  std::string token;
  std::vector<std::string> session_ids;
  std::string session_id;
  std::string text;
  std::string request_id;
  std::string tool_call_id;
  std::string reason;
};

[[nodiscard]] std::string_view client_message_name(ClientMessageType type);

[[nodiscard]] ClientMessage auth_message(std::string token);
[[nodiscard]] ClientMessage ping_message();
[[nodiscard]] ClientMessage subscribe_message(std::vector<std::string> session_ids);
[[nodiscard]] ClientMessage unsubscribe_message(std::vector<std::string> session_ids);
[[nodiscard]] ClientMessage send_message_command(std::string session_id, std::string text);
[[nodiscard]] ClientMessage approve_command(std::string session_id, std::string request_id,
                                            std::string tool_call_id);
[[nodiscard]] ClientMessage deny_command(std::string session_id, std::string request_id,
                                         std::string tool_call_id, std::string reason);
[[nodiscard]] ClientMessage cancel_command(std::string session_id);
[[nodiscard]] ClientMessage terminate_session_message(std::string session_id);

[[nodiscard]] std::string to_json(const ClientMessage &message);

/// Session metadata as announced by a daemon in `sessions_list`.
struct SessionInfo {
  std::string id;
  std::string machine_id;
  std::string agent;
  std::string project_path;
  std::string project_name;
  std::string status;
  std::optional<std::string> last_message;
  std::optional<std::string> session_name;
  std::optional<std::string> model;
  std::optional<std::chrono::system_clock::time_point> last_activity;
};

enum class ServerMessageType {
  AuthSuccess,
  AuthError,
  SessionsList,
  AcpEvent,
  HistoryComplete,
  Error,
  Pong,
  Other,
};

struct ServerMessage {
  ServerMessageType type = ServerMessageType::Other;
  std::string type_name;
  std::string machine_id;
  std::string machine_name;
  std::string message;
  std::string code;
  std::string session_id;
  std::vector<SessionInfo> sessions;
  /// Raw JSON object of an `acp_event`, decoded separately by parse_acp_event.
  std::string event_json;
};

/// Fails with MalformedEvent when the frame is not an object with a string `type`, or
/// when a known type lacks its required members. Unknown types decode as `Other`.
[[nodiscard]] common::Result<ServerMessage> parse_server_message(const std::string &json);

} // namespace tapbridge::protocol

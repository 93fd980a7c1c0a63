#include "tapbridge/protocol/messages.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/json_util.hpp"

namespace tapbridge::protocol {

namespace {

std::string string_array_json(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += common::json_quote(values[i]);
  }
  out += "]";
  return out;
}

std::string command_envelope(const std::string &session_id, const std::string &command_json) {
  return R"({"type":"command","sessionId":)" + common::json_quote(session_id) +
         R"(,"command":)" + command_json + "}";
}

common::Result<ServerMessage> malformed(const std::string &message) {
  return common::Result<ServerMessage>::failure(common::ErrorCode::MalformedEvent, message);
}

SessionInfo parse_session_info(const std::string &json) {
  SessionInfo info;
  info.id = common::json_get_string(json, "id");
  info.machine_id = common::json_get_string(json, "machineId");
  info.agent = common::json_get_string(json, "agent");
  info.project_path = common::json_get_string(json, "projectPath");
  info.project_name = common::json_get_string(json, "projectName");
  info.status = common::json_get_string(json, "status");
  info.last_message = common::json_get_optional_string(json, "lastMessage");
  info.session_name = common::json_get_optional_string(json, "sessionName");
  info.model = common::json_get_optional_string(json, "model");
  if (const auto activity = common::json_get_optional_string(json, "lastActivity");
      activity.has_value()) {
    info.last_activity = common::parse_iso8601(*activity);
  }
  return info;
}

} // namespace

std::string_view client_message_name(const ClientMessageType type) {
  switch (type) {
  case ClientMessageType::Auth:
    return "auth";
  case ClientMessageType::Ping:
    return "ping";
  case ClientMessageType::Subscribe:
    return "subscribe";
  case ClientMessageType::Unsubscribe:
    return "unsubscribe";
  case ClientMessageType::SendMessage:
    return "send_message";
  case ClientMessageType::ApproveToolCall:
    return "approve_tool_call";
  case ClientMessageType::DenyToolCall:
    return "deny_tool_call";
  case ClientMessageType::Cancel:
    return "cancel";
  case ClientMessageType::TerminateSession:
    return "terminate_session";
  }
  return "unknown";
}

ClientMessage auth_message(std::string token) {
  return ClientMessage{.type = ClientMessageType::Auth, .token = std::move(token)};
}

ClientMessage ping_message() { return ClientMessage{.type = ClientMessageType::Ping}; }

ClientMessage subscribe_message(std::vector<std::string> session_ids) {
  return ClientMessage{.type = ClientMessageType::Subscribe, .session_ids = std::move(session_ids)};
}

ClientMessage unsubscribe_message(std::vector<std::string> session_ids) {
  return ClientMessage{.type = ClientMessageType::Unsubscribe,
                       .session_ids = std::move(session_ids)};
}

ClientMessage send_message_command(std::string session_id, std::string text) {
  return ClientMessage{.type = ClientMessageType::SendMessage,
                       .session_id = std::move(session_id),
                       .text = std::move(text)};
}

ClientMessage approve_command(std::string session_id, std::string request_id,
                              std::string tool_call_id) {
  return ClientMessage{.type = ClientMessageType::ApproveToolCall,
                       .session_id = std::move(session_id),
                       .request_id = std::move(request_id),
                       .tool_call_id = std::move(tool_call_id)};
}

ClientMessage deny_command(std::string session_id, std::string request_id,
                           std::string tool_call_id, std::string reason) {
  return ClientMessage{.type = ClientMessageType::DenyToolCall,
                       .session_id = std::move(session_id),
                       .request_id = std::move(request_id),
                       .tool_call_id = std::move(tool_call_id),
                       .reason = std::move(reason)};
}

ClientMessage cancel_command(std::string session_id) {
  return ClientMessage{.type = ClientMessageType::Cancel, .session_id = std::move(session_id)};
}

ClientMessage terminate_session_message(std::string session_id) {
  return ClientMessage{.type = ClientMessageType::TerminateSession,
                       .session_id = std::move(session_id)};
}

std::string to_json(const ClientMessage &message) {
  switch (message.type) {
  case ClientMessageType::Auth:
    return R"({"type":"auth","token":)" + common::json_quote(message.token) + "}";
  case ClientMessageType::Ping:
    return R"({"type":"ping"})";
  case ClientMessageType::Subscribe:
    return R"({"type":"subscribe","sessionIds":)" + string_array_json(message.session_ids) + "}";
  case ClientMessageType::Unsubscribe:
    return R"({"type":"unsubscribe","sessionIds":)" + string_array_json(message.session_ids) +
           "}";
  case ClientMessageType::SendMessage:
    return command_envelope(message.session_id, R"({"command":"send_message","message":)" +
                                                    common::json_quote(message.text) + "}");
  case ClientMessageType::ApproveToolCall:
    return command_envelope(message.session_id,
                            R"({"command":"approve_tool_call","requestId":)" +
                                common::json_quote(message.request_id) + R"(,"toolCallId":)" +
                                common::json_quote(message.tool_call_id) + "}");
  case ClientMessageType::DenyToolCall: {
    std::string command = R"({"command":"deny_tool_call","requestId":)" +
                          common::json_quote(message.request_id) + R"(,"toolCallId":)" +
                          common::json_quote(message.tool_call_id);
    if (!message.reason.empty()) {
      command += R"(,"reason":)" + common::json_quote(message.reason);
    }
    command += "}";
    return command_envelope(message.session_id, command);
  }
  case ClientMessageType::Cancel:
    return command_envelope(message.session_id, R"({"command":"cancel"})");
  case ClientMessageType::TerminateSession:
    return R"({"type":"terminate_session","sessionId":)" + common::json_quote(message.session_id) +
           "}";
  }
  return R"({"type":"ping"})";
}

common::Result<ServerMessage> parse_server_message(const std::string &json) {
  const auto type = common::json_get_optional_string(json, "type");
  if (!type.has_value() || type->empty()) {
    return malformed("frame has no type");
  }

  ServerMessage message;
  message.type_name = *type;

  if (*type == "auth_success") {
    message.type = ServerMessageType::AuthSuccess;
    message.machine_id = common::json_get_string(json, "machineId");
    message.machine_name = common::json_get_string(json, "machineName");
  } else if (*type == "auth_error") {
    message.type = ServerMessageType::AuthError;
    message.message = common::json_get_string(json, "message");
  } else if (*type == "sessions_list") {
    message.type = ServerMessageType::SessionsList;
    const std::string sessions = common::json_get_array(json, "sessions");
    if (sessions.empty()) {
      return malformed("sessions_list without sessions array");
    }
    for (const auto &entry : common::json_split_top_level_objects(sessions)) {
      SessionInfo info = parse_session_info(entry);
      if (info.id.empty()) {
        continue;
      }
      message.sessions.push_back(std::move(info));
    }
  } else if (*type == "acp_event") {
    message.type = ServerMessageType::AcpEvent;
    message.event_json = common::json_get_object(json, "event");
    if (message.event_json.empty()) {
      return malformed("acp_event without event object");
    }
  } else if (*type == "history_complete") {
    message.type = ServerMessageType::HistoryComplete;
    message.session_id = common::json_get_string(json, "sessionId");
    if (message.session_id.empty()) {
      return malformed("history_complete without sessionId");
    }
  } else if (*type == "error") {
    message.type = ServerMessageType::Error;
    message.message = common::json_get_string(json, "message");
    message.code = common::json_get_string(json, "code");
  } else if (*type == "pong") {
    message.type = ServerMessageType::Pong;
  } else {
    message.type = ServerMessageType::Other;
  }
  return common::Result<ServerMessage>::success(std::move(message));
}

} // namespace tapbridge::protocol

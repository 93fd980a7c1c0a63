#include "tapbridge/protocol/event.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/json_util.hpp"

#include <cstdlib>

namespace tapbridge::protocol {

namespace {

using ParseResult = common::Result<std::optional<InboundEvent>>;

ParseResult malformed(const std::string &type, const std::string &detail) {
  return ParseResult::failure(common::ErrorCode::MalformedEvent, type + ": " + detail);
}

std::optional<MessageRole> parse_role(const std::string &value) {
  if (value == "user") {
    return MessageRole::User;
  }
  if (value == "assistant") {
    return MessageRole::Assistant;
  }
  if (value == "system") {
    return MessageRole::System;
  }
  return std::nullopt;
}

std::int64_t parse_int(const std::string &text, const std::int64_t fallback) {
  if (text.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str()) {
    return fallback;
  }
  return static_cast<std::int64_t>(value);
}

std::string joined_text_content(const std::string &event_json) {
  std::string text;
  const std::string content = common::json_get_array(event_json, "content");
  for (const auto &block : common::json_split_top_level_objects(content)) {
    if (common::json_get_string(block, "type") == "text") {
      text += common::json_get_string(block, "text");
    }
  }
  return text;
}

std::string format_preview(const std::string &preview_json) {
  if (preview_json.empty()) {
    return "";
  }
  const std::string type = common::json_get_string(preview_json, "type");
  if (type == "diff") {
    return common::json_get_string(preview_json, "path") + "\n" +
           common::json_get_string(preview_json, "diff");
  }
  if (type == "command") {
    std::string out = "$ " + common::json_get_string(preview_json, "command");
    const std::string dir = common::json_get_string(preview_json, "workingDir");
    if (!dir.empty()) {
      out += "  (in " + dir + ")";
    }
    return out;
  }
  return common::json_get_string(preview_json, "text");
}

ParseResult parse_message(const std::string &json, const std::string &type, MessagePhase phase,
                          InboundEvent event) {
  MessagePayload payload;
  payload.phase = phase;
  payload.message_id = common::json_get_string(json, "messageId");
  if (payload.message_id.empty()) {
    return malformed(type, "missing messageId");
  }
  const auto role = parse_role(common::json_get_string(json, "role"));
  if (!role.has_value()) {
    return malformed(type, "missing or unknown role");
  }
  payload.role = *role;
  if (phase == MessagePhase::Delta) {
    const auto delta = common::json_get_optional_string(json, "delta");
    if (!delta.has_value()) {
      return malformed(type, "missing delta");
    }
    payload.text = *delta;
  } else if (phase == MessagePhase::Complete) {
    payload.text = joined_text_content(json);
  }
  event.payload = std::move(payload);
  return ParseResult::success(std::move(event));
}

ParseResult parse_approval_requested(const std::string &json, InboundEvent event) {
  ToolCallPayload payload;
  payload.request_id = common::json_get_string(json, "requestId");
  payload.tool_call_id = common::json_get_string(json, "toolCallId");
  if (payload.request_id.empty() || payload.tool_call_id.empty()) {
    return malformed(event.type_name, "missing requestId or toolCallId");
  }
  payload.tool_name = common::json_get_string(json, "toolName");
  payload.description = common::json_get_string(json, "description");
  payload.risk_level = common::json_get_string(json, "riskLevel");
  payload.tool_input_json = common::json_get_object(json, "toolInput");
  payload.preview = format_preview(common::json_get_object(json, "preview"));
  if (const auto expires = common::json_get_optional_string(json, "expiresAt");
      expires.has_value()) {
    payload.expires_at = common::parse_iso8601(*expires);
  }
  event.payload = std::move(payload);
  return ParseResult::success(std::move(event));
}

ParseResult parse_approval_resolved(const std::string &json, InboundEvent event) {
  ApprovalResolvedPayload payload;
  payload.request_id = common::json_get_string(json, "requestId");
  payload.tool_call_id = common::json_get_string(json, "toolCallId");
  const auto approved = common::json_get_bool(json, "approved");
  if (payload.request_id.empty() || !approved.has_value()) {
    return malformed(event.type_name, "missing requestId or approved");
  }
  payload.approved = *approved;
  payload.resolved_by = common::json_get_string(json, "resolvedBy");
  payload.reason = common::json_get_string(json, "reason");
  event.payload = std::move(payload);
  return ParseResult::success(std::move(event));
}

ParseResult parse_tool_outcome(const std::string &json, const bool success, InboundEvent event) {
  ToolResultPayload payload;
  payload.tool_call_id = common::json_get_string(json, "toolCallId");
  if (payload.tool_call_id.empty()) {
    return malformed(event.type_name, "missing toolCallId");
  }
  payload.tool_name = common::json_get_string(json, "name");
  payload.success = success;
  if (success) {
    payload.output = common::json_get_string(json, "output");
  } else {
    payload.output = common::json_get_string(common::json_get_object(json, "error"), "message");
  }
  const std::int64_t duration = parse_int(common::json_get_number(json, "duration"), 0);
  payload.duration_ms = duration > 0 ? static_cast<std::uint64_t>(duration) : 0;
  event.payload = std::move(payload);
  return ParseResult::success(std::move(event));
}

ParseResult parse_tool_progress(const std::string &json, InboundEvent event) {
  ToolProgressPayload payload;
  payload.phase = event.type_name == "tool:start" ? ToolPhase::Start : ToolPhase::Executing;
  payload.tool_call_id = common::json_get_string(json, "toolCallId");
  if (payload.tool_call_id.empty()) {
    return malformed(event.type_name, "missing toolCallId");
  }
  payload.tool_name = common::json_get_string(json, "name");
  if (payload.phase == ToolPhase::Start) {
    payload.category = common::json_get_string(json, "category");
    payload.description = common::json_get_string(json, "description");
  } else {
    payload.input_json = common::json_get_object(json, "input");
    payload.risk_level = common::json_get_string(json, "riskLevel");
    payload.requires_approval = common::json_get_bool(json, "requiresApproval").value_or(false);
  }
  event.payload = std::move(payload);
  return ParseResult::success(std::move(event));
}

} // namespace

std::string_view event_kind_name(const EventKind kind) {
  switch (kind) {
  case EventKind::MessageDelta:
    return "message-delta";
  case EventKind::ToolCall:
    return "tool-call";
  case EventKind::ToolResult:
    return "tool-result";
  case EventKind::SessionEnd:
    return "session-end";
  case EventKind::ApprovalResolved:
    return "approval-resolved";
  case EventKind::SessionStatus:
    return "session-status";
  case EventKind::ToolProgress:
    return "tool-progress";
  }
  return "unknown";
}

std::string_view message_role_name(const MessageRole role) {
  switch (role) {
  case MessageRole::User:
    return "user";
  case MessageRole::Assistant:
    return "assistant";
  case MessageRole::System:
    return "system";
  }
  return "assistant";
}

EventKind InboundEvent::kind() const {
  switch (payload.index()) {
  case 0:
    return EventKind::MessageDelta;
  case 1:
    return EventKind::ToolCall;
  case 2:
    return EventKind::ToolResult;
  case 3:
    return EventKind::SessionEnd;
  case 4:
    return EventKind::ApprovalResolved;
  case 5:
    return EventKind::SessionStatus;
  default:
    return EventKind::ToolProgress;
  }
}

common::Result<std::optional<InboundEvent>> parse_acp_event(const std::string &event_json,
                                                            const std::string &machine_id) {
  const auto type = common::json_get_optional_string(event_json, "type");
  if (!type.has_value() || type->empty()) {
    return ParseResult::failure(common::ErrorCode::MalformedEvent, "event has no type");
  }

  InboundEvent event;
  event.machine_id = machine_id;
  event.type_name = *type;
  event.session_id = common::json_get_string(event_json, "sessionId");
  event.seq = parse_int(common::json_get_number(event_json, "seq"), 0);
  event.timestamp = common::parse_iso8601(common::json_get_string(event_json, "timestamp"))
                        .value_or(std::chrono::system_clock::now());

  const std::string &name = *type;
  const bool modelled = name == "message:start" || name == "message:delta" ||
                        name == "message:complete" || name == "approval:requested" ||
                        name == "approval:resolved" || name == "tool:start" ||
                        name == "tool:executing" || name == "tool:result" ||
                        name == "tool:error" || name == "session:completed" ||
                        name == "session:error" || name == "session:status_changed" ||
                        name == "session:started";
  if (!modelled) {
    return ParseResult::success(std::nullopt);
  }
  if (event.session_id.empty()) {
    return malformed(name, "missing sessionId");
  }

  if (name == "message:start") {
    return parse_message(event_json, name, MessagePhase::Start, std::move(event));
  }
  if (name == "message:delta") {
    return parse_message(event_json, name, MessagePhase::Delta, std::move(event));
  }
  if (name == "message:complete") {
    return parse_message(event_json, name, MessagePhase::Complete, std::move(event));
  }
  if (name == "approval:requested") {
    return parse_approval_requested(event_json, std::move(event));
  }
  if (name == "approval:resolved") {
    return parse_approval_resolved(event_json, std::move(event));
  }
  if (name == "tool:start" || name == "tool:executing") {
    return parse_tool_progress(event_json, std::move(event));
  }
  if (name == "tool:result") {
    return parse_tool_outcome(event_json, true, std::move(event));
  }
  if (name == "tool:error") {
    return parse_tool_outcome(event_json, false, std::move(event));
  }
  if (name == "session:completed" || name == "session:error") {
    SessionEndPayload payload;
    payload.failed = name == "session:error";
    if (payload.failed) {
      payload.error_message =
          common::json_get_string(common::json_get_object(event_json, "error"), "message");
    }
    event.payload = std::move(payload);
    return ParseResult::success(std::move(event));
  }

  SessionStatusPayload payload;
  if (name == "session:started") {
    payload.to = "running";
    payload.agent = common::json_get_string(event_json, "agent");
    payload.project_name = common::json_get_string(event_json, "projectName");
  } else {
    payload.from = common::json_get_string(event_json, "from");
    payload.to = common::json_get_string(event_json, "to");
    if (payload.to.empty()) {
      return malformed(name, "missing to");
    }
  }
  event.payload = std::move(payload);
  return ParseResult::success(std::move(event));
}

} // namespace tapbridge::protocol

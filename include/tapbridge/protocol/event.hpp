#pragma once

#include "tapbridge/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tapbridge::protocol {

enum class EventKind {
  MessageDelta,
  ToolCall,
  ToolResult,
  SessionEnd,
  ApprovalResolved,
  SessionStatus,
  ToolProgress,
};

enum class MessagePhase { Start, Delta, Complete };
enum class MessageRole { User, Assistant, System };
enum class ToolPhase { Start, Executing };

[[nodiscard]] std::string_view event_kind_name(EventKind kind);
[[nodiscard]] std::string_view message_role_name(MessageRole role);

/// `message:start`, `message:delta` and `message:complete`. For a completed message
/// `text` is the concatenation of every text content block.
struct MessagePayload {
  MessagePhase phase = MessagePhase::Delta;
  std::string message_id;
  MessageRole role = MessageRole::Assistant;
  std::string text;
};

/// `approval:requested`: a tool call waiting on a decision.
struct ToolCallPayload {
  std::string request_id;
  std::string tool_call_id;
  std::string tool_name;
  std::string description;
  std::string risk_level;
  std::string tool_input_json;
  std::string preview;
  std::optional<std::chrono::system_clock::time_point> expires_at;
};

/// `tool:result` and `tool:error`.
struct ToolResultPayload {
  std::string tool_call_id;
  std::string tool_name;
  bool success = true;
  std::string output;
  std::uint64_t duration_ms = 0;
};

/// `session:completed` and `session:error`.
struct SessionEndPayload {
  bool failed = false;
  std::string error_message;
};

/// `approval:resolved` as reported by the daemon.
struct ApprovalResolvedPayload {
  std::string request_id;
  std::string tool_call_id;
  bool approved = false;
  std::string resolved_by;
  std::string reason;
};

/// `session:status_changed` and `session:started`.
struct SessionStatusPayload {
  std::string from;
  std::string to;
  std::string agent;
  std::string project_name;
};

/// `tool:start` announces a tool call; `tool:executing` carries its input once it runs.
struct ToolProgressPayload {
  ToolPhase phase = ToolPhase::Start;
  std::string tool_call_id;
  std::string tool_name;
  std::string category;
  std::string description;
  std::string input_json;
  std::string risk_level;
  bool requires_approval = false;
};

using EventPayload =
    std::variant<MessagePayload, ToolCallPayload, ToolResultPayload, SessionEndPayload,
                 ApprovalResolvedPayload, SessionStatusPayload, ToolProgressPayload>;

/// A normalized event tagged with the machine that delivered it.
struct InboundEvent {
  std::string machine_id;
  std::string session_id;
  std::string type_name;
  std::int64_t seq = 0;
  std::chrono::system_clock::time_point timestamp{};
  EventPayload payload;

  [[nodiscard]] EventKind kind() const;
};

/// Decodes one ACP event object. Returns nullopt for event types the bridge does not
/// model, and a MalformedEvent failure when a modelled event lacks a required member.
[[nodiscard]] common::Result<std::optional<InboundEvent>>
parse_acp_event(const std::string &event_json, const std::string &machine_id);

} // namespace tapbridge::protocol

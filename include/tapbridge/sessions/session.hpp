#pragma once

#include "tapbridge/protocol/event.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tapbridge::sessions {

enum class HistoryState { NotRequested, Loading, Loaded };
enum class ToolCallStatus { Pending, Running, Completed, Error, Denied };

[[nodiscard]] std::string_view history_state_name(HistoryState state);
[[nodiscard]] std::string_view tool_call_status_name(ToolCallStatus status);

struct TranscriptMessage {
  std::string message_id;
  protocol::MessageRole role = protocol::MessageRole::Assistant;
  std::string content;
  bool partial = false;
  std::chrono::system_clock::time_point timestamp{};
};

/// One tool invocation of a session, from `tool:start` to its result or error.
struct ToolCallRecord {
  std::string tool_call_id;
  std::string session_id;
  std::string name;
  std::string category;
  std::string description;
  std::string input_json;
  std::string risk_level;
  ToolCallStatus status = ToolCallStatus::Pending;
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::chrono::system_clock::time_point started_at{};
  std::optional<std::chrono::system_clock::time_point> completed_at;
};

struct Session {
  std::string session_id;
  std::string machine_id;
  std::string agent;
  std::string project_name;
  std::string project_path;
  std::optional<std::string> session_name;
  std::string status = "running";
  std::optional<std::string> last_message;
  std::chrono::system_clock::time_point last_activity{};
  HistoryState history = HistoryState::NotRequested;
  bool ended = false;

  /// "Not loaded yet" as opposed to "loaded and empty".
  [[nodiscard]] bool is_loading_history() const { return history == HistoryState::Loading; }
};

/// Removes IDE and harness tags (`<system-reminder>...</system-reminder>` and friends)
/// together with their content, including a trailing unterminated tag.
[[nodiscard]] std::string strip_system_tags(const std::string &text);

/// Title derived from a user message: tags stripped, trimmed, at most 100 characters
/// followed by "..." when longer. nullopt when nothing remains.
[[nodiscard]] std::optional<std::string> extract_session_title(const std::string &text);

} // namespace tapbridge::sessions

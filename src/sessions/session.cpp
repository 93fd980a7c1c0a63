#include "tapbridge/sessions/session.hpp"

#include "tapbridge/common/fs.hpp"

#include <regex>

namespace tapbridge::sessions {

namespace {

constexpr std::size_t kMaxTitleLength = 100;

const std::string &tag_names() {
  static const std::string names =
      "system-reminder|ide_opened_file|ide_selection|ide_context|gitStatus|command-name|claudeMd";
  return names;
}

} // namespace

std::string_view history_state_name(const HistoryState state) {
  switch (state) {
  case HistoryState::NotRequested:
    return "not_requested";
  case HistoryState::Loading:
    return "loading";
  case HistoryState::Loaded:
    return "loaded";
  }
  return "not_requested";
}

std::string_view tool_call_status_name(const ToolCallStatus status) {
  switch (status) {
  case ToolCallStatus::Pending:
    return "pending";
  case ToolCallStatus::Running:
    return "running";
  case ToolCallStatus::Completed:
    return "completed";
  case ToolCallStatus::Error:
    return "error";
  case ToolCallStatus::Denied:
    return "denied";
  }
  return "pending";
}

std::string strip_system_tags(const std::string &text) {
  static const std::regex paired("<(?:" + tag_names() + ")>[\\s\\S]*?</(?:" + tag_names() + ")>");
  static const std::regex orphan("<(?:" + tag_names() + ")>[\\s\\S]*");
  std::string cleaned = std::regex_replace(text, paired, "");
  cleaned = std::regex_replace(cleaned, orphan, "");
  return common::trim(cleaned);
}

std::optional<std::string> extract_session_title(const std::string &text) {
  const std::string cleaned = strip_system_tags(text);
  if (cleaned.empty()) {
    return std::nullopt;
  }
  if (cleaned.size() > kMaxTitleLength) {
    std::size_t cut = kMaxTitleLength;
    // Never split a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0u) == 0x80u) {
      --cut;
    }
    return cleaned.substr(0, cut) + "...";
  }
  return cleaned;
}

} // namespace tapbridge::sessions

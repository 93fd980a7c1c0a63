#include "tapbridge/sessions/store.hpp"

#include "tapbridge/observability/global.hpp"

#include <algorithm>
#include <variant>

namespace tapbridge::sessions {

namespace {

constexpr const char *kWaitingForApproval = "waiting_for_approval";

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

TranscriptMessage &upsert_message(std::vector<TranscriptMessage> &messages,
                                  const std::string &message_id) {
  const auto it = std::find_if(messages.begin(), messages.end(), [&](const TranscriptMessage &m) {
    return m.message_id == message_id;
  });
  if (it != messages.end()) {
    return *it;
  }
  messages.push_back(TranscriptMessage{.message_id = message_id});
  return messages.back();
}

security::ApprovalState remote_state(const protocol::ApprovalResolvedPayload &payload) {
  if (payload.resolved_by == "user") {
    return payload.approved ? security::ApprovalState::Approved : security::ApprovalState::Denied;
  }
  return payload.approved ? security::ApprovalState::AutoApproved
                          : security::ApprovalState::AutoDenied;
}

} // namespace

ApplyResult SessionStore::apply(const protocol::InboundEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto buffer = history_buffers_.find(event.session_id); buffer != history_buffers_.end()) {
    buffer->second.push_back(event);
    return ApplyResult{.buffered = true};
  }
  return apply_locked(event);
}

void SessionStore::start_history_loading(const std::string &session_id,
                                         const std::string &machine_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &session = ensure_session(session_id, machine_id);
  session.history = HistoryState::Loading;
  history_buffers_[session_id].clear();
}

std::vector<BufferedApply> SessionStore::complete_history_loading(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<protocol::InboundEvent> buffered;
  if (auto it = history_buffers_.find(session_id); it != history_buffers_.end()) {
    buffered = std::move(it->second);
    history_buffers_.erase(it);
  }
  if (auto it = sessions_.find(session_id); it != sessions_.end()) {
    it->second.history = HistoryState::Loaded;
  }

  std::vector<BufferedApply> results;
  results.reserve(buffered.size());
  for (auto &event : buffered) {
    ApplyResult result = apply_locked(event);
    results.push_back(BufferedApply{.event = std::move(event), .result = std::move(result)});
  }
  return results;
}

bool SessionStore::is_loading_history(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  return it != sessions_.end() && it->second.is_loading_history();
}

std::vector<std::string> SessionStore::discard_buffers_for_machine(const std::string &machine_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> discarded;
  for (auto &[id, session] : sessions_) {
    if (session.machine_id != machine_id || !session.is_loading_history()) {
      continue;
    }
    history_buffers_.erase(id);
    session.history = HistoryState::NotRequested;
    discarded.push_back(id);
  }
  return discarded;
}

void SessionStore::set_sessions_for_machine(const std::string &machine_id,
                                            const std::vector<protocol::SessionInfo> &sessions) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::map<std::string, Session> previous;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.machine_id == machine_id) {
      previous.insert(std::move(*it));
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }

  for (const auto &info : sessions) {
    if (info.id.empty() || sessions_.contains(info.id)) {
      continue;
    }
    Session session;
    if (auto it = previous.find(info.id); it != previous.end()) {
      session = it->second;
    }
    session.session_id = info.id;
    session.machine_id = machine_id;
    session.agent = info.agent;
    session.project_name = info.project_name;
    session.project_path = info.project_path;
    if (!info.status.empty()) {
      session.status = info.status;
    }
    if (info.last_message.has_value()) {
      session.last_message = info.last_message;
    }
    if (info.last_activity.has_value()) {
      session.last_activity = *info.last_activity;
    }
    std::optional<std::string> incoming_name;
    if (info.session_name.has_value()) {
      incoming_name = extract_session_title(*info.session_name);
    }
    if (incoming_name.has_value()) {
      session.session_name = incoming_name;
    }
    sessions_.emplace(info.id, std::move(session));
  }

  for (const auto &[id, session] : previous) {
    if (!sessions_.contains(id)) {
      history_buffers_.erase(id);
    }
  }
}

void SessionStore::clear_session(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  transcripts_.erase(session_id);
  tool_calls_.erase(session_id);
  history_buffers_.erase(session_id);
  if (auto it = sessions_.find(session_id); it != sessions_.end()) {
    it->second.history = HistoryState::NotRequested;
  }
}

bool SessionStore::try_resolve(const std::string &request_id, const security::ApprovalState state,
                               const security::ResolvedBy resolved_by) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = approvals_.find(request_id);
  if (it == approvals_.end()) {
    return false;
  }
  if (!resolve_locked(it->second, state, resolved_by)) {
    return false;
  }
  refresh_waiting_status(it->second.session_id);
  return true;
}

bool SessionStore::revert_resolution(const std::string &request_id,
                                     const security::ApprovalState state,
                                     const security::ResolvedBy resolved_by) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = approvals_.find(request_id);
  if (it == approvals_.end() || it->second.state != state ||
      it->second.resolved_by != resolved_by) {
    return false;
  }
  it->second.state = security::ApprovalState::Pending;
  it->second.resolved_by = security::ResolvedBy::None;
  it->second.resolved_at.reset();
  // A call waiting on approval was already executing.
  if (ToolCallRecord *record = find_tool_call(it->second.session_id, it->second.tool_call_id);
      record != nullptr && record->status == ToolCallStatus::Denied) {
    record->status = ToolCallStatus::Running;
  }
  if (auto session = sessions_.find(it->second.session_id); session != sessions_.end() &&
                                                            !session->second.ended &&
                                                            session->second.status == "running") {
    session->second.status = kWaitingForApproval;
  }
  return true;
}

std::optional<security::ApprovalRequest>
SessionStore::claim_evaluation(const std::string &request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = approvals_.find(request_id);
  if (it == approvals_.end() || security::is_terminal(it->second.state) ||
      claimed_.contains(request_id)) {
    return std::nullopt;
  }
  claimed_.insert(request_id);
  return it->second;
}

bool SessionStore::mark_evaluated(const std::string &request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = approvals_.find(request_id);
  if (it == approvals_.end() || security::is_terminal(it->second.state) || it->second.evaluated) {
    return false;
  }
  it->second.evaluated = true;
  return true;
}

std::vector<Session> SessionStore::sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Session> out;
  out.reserve(sessions_.size());
  for (const auto &[id, session] : sessions_) {
    out.push_back(session);
  }
  std::stable_sort(out.begin(), out.end(), [](const Session &a, const Session &b) {
    return a.last_activity > b.last_activity;
  });
  return out;
}

std::optional<Session> SessionStore::session(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TranscriptMessage> SessionStore::transcript(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = transcripts_.find(session_id);
  return it == transcripts_.end() ? std::vector<TranscriptMessage>{} : it->second;
}

std::vector<ToolCallRecord> SessionStore::tool_calls(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tool_calls_.find(session_id);
  return it == tool_calls_.end() ? std::vector<ToolCallRecord>{} : it->second;
}

std::vector<security::ApprovalRequest> SessionStore::pending_approvals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<security::ApprovalRequest> out;
  for (const auto &id : approval_order_) {
    const auto &request = approvals_.at(id);
    if (request.evaluated && request.state == security::ApprovalState::Pending) {
      out.push_back(request);
    }
  }
  return out;
}

std::size_t SessionStore::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(approvals_.begin(), approvals_.end(), [](const auto &entry) {
        return entry.second.evaluated && entry.second.state == security::ApprovalState::Pending;
      }));
}

std::optional<security::ApprovalRequest>
SessionStore::approval(const std::string &request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = approvals_.find(request_id);
  if (it == approvals_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<security::ApprovalRequest>
SessionStore::approvals_for_session(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<security::ApprovalRequest> out;
  for (const auto &id : approval_order_) {
    const auto &request = approvals_.at(id);
    if (request.session_id == session_id) {
      out.push_back(request);
    }
  }
  return out;
}

ApplyResult SessionStore::apply_locked(const protocol::InboundEvent &event) {
  Session &session = ensure_session(event.session_id, event.machine_id);

  return std::visit(
      Overloaded{
          [&](const protocol::MessagePayload &payload) {
            apply_message(session, event, payload);
            return ApplyResult{.applied = true};
          },
          [&](const protocol::ToolCallPayload &payload) {
            return apply_tool_call(session, event, payload);
          },
          [&](const protocol::ToolResultPayload &payload) {
            return ApplyResult{.applied = apply_tool_result(event, payload)};
          },
          [&](const protocol::SessionEndPayload &payload) {
            session.ended = true;
            session.status = payload.failed ? "error" : "completed";
            session.last_activity = std::chrono::system_clock::now();
            return ApplyResult{.applied = true};
          },
          [&](const protocol::ApprovalResolvedPayload &payload) {
            return ApplyResult{.applied = apply_remote_resolution(payload)};
          },
          [&](const protocol::ToolProgressPayload &payload) {
            return ApplyResult{.applied = apply_tool_progress(event, payload)};
          },
          [&](const protocol::SessionStatusPayload &payload) {
            session.status = payload.to;
            session.last_activity = std::chrono::system_clock::now();
            if (!payload.agent.empty()) {
              session.agent = payload.agent;
            }
            if (!payload.project_name.empty()) {
              session.project_name = payload.project_name;
            }
            return ApplyResult{.applied = true};
          },
      },
      event.payload);
}

Session &SessionStore::ensure_session(const std::string &session_id,
                                      const std::string &machine_id) {
  auto [it, inserted] = sessions_.try_emplace(session_id);
  if (inserted) {
    it->second.session_id = session_id;
    it->second.machine_id = machine_id;
    it->second.last_activity = std::chrono::system_clock::now();
  } else if (it->second.machine_id.empty()) {
    it->second.machine_id = machine_id;
  }
  return it->second;
}

void SessionStore::apply_message(Session &session, const protocol::InboundEvent &event,
                                 const protocol::MessagePayload &payload) {
  auto &messages = transcripts_[session.session_id];
  TranscriptMessage &message = upsert_message(messages, payload.message_id);
  message.role = payload.role;
  message.timestamp = event.timestamp;

  switch (payload.phase) {
  case protocol::MessagePhase::Start:
    message.content.clear();
    message.partial = true;
    break;
  case protocol::MessagePhase::Delta:
    message.content += payload.text;
    message.partial = true;
    session.last_activity = std::chrono::system_clock::now();
    break;
  case protocol::MessagePhase::Complete:
    message.content = payload.text;
    message.partial = false;
    if (payload.text.empty()) {
      break;
    }
    if (payload.role == protocol::MessageRole::User && !session.session_name.has_value()) {
      session.session_name = extract_session_title(payload.text);
    } else if (payload.role == protocol::MessageRole::Assistant) {
      session.last_message = payload.text;
      session.last_activity = std::chrono::system_clock::now();
    }
    break;
  }
}

ApplyResult SessionStore::apply_tool_call(Session &session, const protocol::InboundEvent &event,
                                          const protocol::ToolCallPayload &payload) {
  if (approvals_.contains(payload.request_id)) {
    return ApplyResult{.duplicate = true};
  }

  security::ApprovalRequest request;
  request.request_id = payload.request_id;
  request.tool_call_id = payload.tool_call_id;
  request.session_id = session.session_id;
  request.machine_id = event.machine_id;
  request.risk_tier = security::risk_tier_from_string(payload.risk_level);
  request.tool_name = payload.tool_name;
  request.description = payload.description;
  request.preview = payload.preview;
  request.created_at = event.timestamp;
  request.expires_at = payload.expires_at;

  approvals_.emplace(request.request_id, request);
  approval_order_.push_back(request.request_id);
  session.status = kWaitingForApproval;
  session.last_activity = std::chrono::system_clock::now();
  return ApplyResult{.applied = true, .created_request_id = request.request_id};
}

bool SessionStore::apply_tool_progress(const protocol::InboundEvent &event,
                                       const protocol::ToolProgressPayload &payload) {
  ToolCallRecord *record = find_tool_call(event.session_id, payload.tool_call_id);
  if (payload.phase == protocol::ToolPhase::Start) {
    // History replays resend tool:start for calls already known.
    if (record != nullptr) {
      return false;
    }
    tool_calls_[event.session_id].push_back(ToolCallRecord{
        .tool_call_id = payload.tool_call_id,
        .session_id = event.session_id,
        .name = payload.tool_name,
        .category = payload.category,
        .description = payload.description,
        .started_at = event.timestamp,
    });
    return true;
  }

  if (record == nullptr) {
    return false;
  }
  record->input_json = payload.input_json;
  record->risk_level = payload.risk_level;
  if (record->status == ToolCallStatus::Pending) {
    record->status = ToolCallStatus::Running;
  }
  return true;
}

bool SessionStore::apply_tool_result(const protocol::InboundEvent &event,
                                     const protocol::ToolResultPayload &payload) {
  bool applied = false;
  if (ToolCallRecord *record = find_tool_call(event.session_id, payload.tool_call_id);
      record != nullptr) {
    if (payload.success) {
      record->status = ToolCallStatus::Completed;
      record->output = payload.output;
    } else {
      record->status = ToolCallStatus::Error;
      record->error = payload.output;
    }
    record->completed_at = event.timestamp;
    applied = true;
  }

  for (const auto &id : approval_order_) {
    auto &request = approvals_.at(id);
    if (request.tool_call_id != payload.tool_call_id || request.session_id != event.session_id) {
      continue;
    }
    if (!security::is_terminal(request.state)) {
      observability::record_event_dropped(event.machine_id,
                                          "tool result for unresolved request " + id);
      return applied;
    }
    request.outcome = security::ToolOutcome{.success = payload.success, .output = payload.output};
    return true;
  }
  return applied;
}

ToolCallRecord *SessionStore::find_tool_call(const std::string &session_id,
                                             const std::string &tool_call_id) {
  const auto it = tool_calls_.find(session_id);
  if (it == tool_calls_.end()) {
    return nullptr;
  }
  const auto record =
      std::find_if(it->second.begin(), it->second.end(),
                   [&](const ToolCallRecord &r) { return r.tool_call_id == tool_call_id; });
  return record == it->second.end() ? nullptr : &*record;
}

bool SessionStore::apply_remote_resolution(const protocol::ApprovalResolvedPayload &payload) {
  const auto it = approvals_.find(payload.request_id);
  if (it == approvals_.end()) {
    return false;
  }
  if (!resolve_locked(it->second, remote_state(payload), security::ResolvedBy::Remote)) {
    return false;
  }
  refresh_waiting_status(it->second.session_id);
  return true;
}

void SessionStore::refresh_waiting_status(const std::string &session_id) {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second.status != kWaitingForApproval) {
    return;
  }
  if (!has_pending_locked(session_id)) {
    it->second.status = "running";
  }
}

bool SessionStore::has_pending_locked(const std::string &session_id) const {
  return std::any_of(approvals_.begin(), approvals_.end(), [&](const auto &entry) {
    return entry.second.session_id == session_id &&
           entry.second.state == security::ApprovalState::Pending;
  });
}

bool SessionStore::resolve_locked(security::ApprovalRequest &request,
                                  const security::ApprovalState state,
                                  const security::ResolvedBy resolved_by) {
  if (security::is_terminal(request.state) || !security::is_terminal(state)) {
    return false;
  }
  request.state = state;
  request.resolved_by = resolved_by;
  request.resolved_at = std::chrono::system_clock::now();
  request.evaluated = true;
  claimed_.insert(request.request_id);
  if (state == security::ApprovalState::Denied || state == security::ApprovalState::AutoDenied) {
    if (ToolCallRecord *record = find_tool_call(request.session_id, request.tool_call_id);
        record != nullptr) {
      record->status = ToolCallStatus::Denied;
    }
  }
  return true;
}

} // namespace tapbridge::sessions

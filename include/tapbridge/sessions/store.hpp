#pragma once

#include "tapbridge/protocol/event.hpp"
#include "tapbridge/protocol/messages.hpp"
#include "tapbridge/security/approval.hpp"
#include "tapbridge/sessions/session.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tapbridge::sessions {

struct ApplyResult {
  /// The event changed store state now (false when buffered or ignored).
  bool applied = false;
  /// Held back because the session's history is loading.
  bool buffered = false;
  /// A replayed approval request that is already known.
  bool duplicate = false;
  /// A new approval request that must go through the policy engine before it is visible.
  std::optional<std::string> created_request_id;
};

struct BufferedApply {
  protocol::InboundEvent event;
  ApplyResult result;
};

/// In-memory state for every session the client has seen. All access is serialized on
/// one mutex; approval resolution is a compare-and-swap under that lock.
class SessionStore {
public:
  SessionStore() = default;

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  ApplyResult apply(const protocol::InboundEvent &event);

  /// Events for the session are buffered from now until complete_history_loading.
  void start_history_loading(const std::string &session_id, const std::string &machine_id);
  /// Applies the buffered events in arrival order as one batch.
  std::vector<BufferedApply> complete_history_loading(const std::string &session_id);
  [[nodiscard]] bool is_loading_history(const std::string &session_id) const;
  /// Drops history buffers of every session on the machine; loading restarts on reconnect.
  std::vector<std::string> discard_buffers_for_machine(const std::string &machine_id);

  /// Replaces the machine's session metadata with `sessions`. Other machines' sessions are
  /// kept, duplicate ids collapse to the first entry, and a client side name survives when
  /// the incoming entry carries none.
  void set_sessions_for_machine(const std::string &machine_id,
                                const std::vector<protocol::SessionInfo> &sessions);
  /// Forgets transcript, history state and buffered events of one session.
  void clear_session(const std::string &session_id);

  /// Compare-and-swap from `pending` to `state`. Returns true only for the call that won.
  [[nodiscard]] bool try_resolve(const std::string &request_id, security::ApprovalState state,
                                 security::ResolvedBy resolved_by);
  /// Puts a request back to `pending` when its decision never reached the machine. Only
  /// the resolution described by `state` and `resolved_by` is undone; false otherwise.
  bool revert_resolution(const std::string &request_id, security::ApprovalState state,
                         security::ResolvedBy resolved_by);
  /// Claims the single policy evaluation of a pending request. nullopt when the request
  /// is unknown, already resolved, or already claimed.
  [[nodiscard]] std::optional<security::ApprovalRequest>
  claim_evaluation(const std::string &request_id);
  /// Makes a still pending request visible to the presentation layer.
  bool mark_evaluated(const std::string &request_id);

  [[nodiscard]] std::vector<Session> sessions() const;
  [[nodiscard]] std::optional<Session> session(const std::string &session_id) const;
  [[nodiscard]] std::vector<TranscriptMessage> transcript(const std::string &session_id) const;
  /// Tool calls of the session in start order.
  [[nodiscard]] std::vector<ToolCallRecord> tool_calls(const std::string &session_id) const;
  /// Evaluated requests still pending, in arrival order.
  [[nodiscard]] std::vector<security::ApprovalRequest> pending_approvals() const;
  [[nodiscard]] std::size_t pending_count() const;
  [[nodiscard]] std::optional<security::ApprovalRequest>
  approval(const std::string &request_id) const;
  [[nodiscard]] std::vector<security::ApprovalRequest>
  approvals_for_session(const std::string &session_id) const;

private:
  ApplyResult apply_locked(const protocol::InboundEvent &event);
  Session &ensure_session(const std::string &session_id, const std::string &machine_id);
  void apply_message(Session &session, const protocol::InboundEvent &event,
                     const protocol::MessagePayload &payload);
  ApplyResult apply_tool_call(Session &session, const protocol::InboundEvent &event,
                              const protocol::ToolCallPayload &payload);
  bool apply_tool_progress(const protocol::InboundEvent &event,
                           const protocol::ToolProgressPayload &payload);
  bool apply_tool_result(const protocol::InboundEvent &event,
                         const protocol::ToolResultPayload &payload);
  [[nodiscard]] ToolCallRecord *find_tool_call(const std::string &session_id,
                                               const std::string &tool_call_id);
  bool apply_remote_resolution(const protocol::ApprovalResolvedPayload &payload);
  void refresh_waiting_status(const std::string &session_id);
  [[nodiscard]] bool has_pending_locked(const std::string &session_id) const;
  [[nodiscard]] bool resolve_locked(security::ApprovalRequest &request,
                                    security::ApprovalState state,
                                    security::ResolvedBy resolved_by);

  mutable std::mutex mutex_;
  std::map<std::string, Session> sessions_;
  std::unordered_map<std::string, std::vector<TranscriptMessage>> transcripts_;
  std::unordered_map<std::string, std::vector<ToolCallRecord>> tool_calls_;
  std::unordered_map<std::string, std::vector<protocol::InboundEvent>> history_buffers_;
  std::vector<std::string> approval_order_;
  std::unordered_map<std::string, security::ApprovalRequest> approvals_;
  std::set<std::string> claimed_;
};

} // namespace tapbridge::sessions

#pragma once

#include "tapbridge/common/result.hpp"
#include "tapbridge/directory/preferences.hpp"
#include "tapbridge/notify/notifier.hpp"
#include "tapbridge/security/approval.hpp"
#include "tapbridge/security/journal.hpp"
#include "tapbridge/sessions/store.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace tapbridge::security {

/// True only when preferences are loaded and the flag for `tier` is set.
[[nodiscard]] bool should_auto_approve(RiskTier tier, const AutoApprovalPreferences &preferences);

enum class EvaluationOutcome {
  AutoApproved,
  Surfaced,
  Replayed,
  Skipped,
};

[[nodiscard]] std::string_view evaluation_outcome_name(EvaluationOutcome outcome);

struct Evaluation {
  EvaluationOutcome outcome = EvaluationOutcome::Skipped;
  /// Result of sending the decision for an auto-approval or a journal replay. When the
  /// send fails the request goes back to pending and is surfaced instead.
  common::Status dispatch = common::Status::success();
};

/// Runs once per approval request, before it becomes visible. A decision already in the
/// journal is sent to the originating machine again, since a machine that asks again is
/// still waiting. Auto-approval sends the approval; everything else is surfaced and handed
/// to the notification dispatcher. The engine never denies on its own.
class ApprovalPolicyEngine {
public:
  /// Sends the decision held in `request.state` to the request's machine.
  using DecisionDispatcher = std::function<common::Status(const ApprovalRequest &request)>;

  ApprovalPolicyEngine(sessions::SessionStore &store, directory::IPreferencesStore &preferences,
                       notify::INotificationDispatcher &notifier, DecisionDispatcher dispatch,
                       IApprovalJournal *journal = nullptr);

  Evaluation evaluate(const std::string &request_id);

private:
  [[nodiscard]] AutoApprovalPreferences current_preferences();
  /// Resolves, sends and on success journals. A failed send reverts and surfaces.
  Evaluation resolve_and_dispatch(const ApprovalRequest &request, ApprovalState state,
                                  ResolvedBy resolved_by, EvaluationOutcome outcome);
  Evaluation surface(const ApprovalRequest &request);
  void journal_decision(const std::string &request_id);

  sessions::SessionStore &store_;
  directory::IPreferencesStore &preferences_;
  notify::INotificationDispatcher &notifier_;
  DecisionDispatcher dispatch_;
  IApprovalJournal *journal_;
};

} // namespace tapbridge::security

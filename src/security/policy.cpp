#include "tapbridge/security/policy.hpp"

#include "tapbridge/observability/global.hpp"

namespace tapbridge::security {

bool should_auto_approve(const RiskTier tier, const AutoApprovalPreferences &preferences) {
  if (!preferences.loaded) {
    return false;
  }
  switch (tier) {
  case RiskTier::Low:
    return preferences.auto_approve_low;
  case RiskTier::Medium:
    return preferences.auto_approve_medium;
  case RiskTier::High:
    return preferences.auto_approve_high;
  case RiskTier::Critical:
    return preferences.auto_approve_critical;
  }
  return false;
}

std::string_view evaluation_outcome_name(const EvaluationOutcome outcome) {
  switch (outcome) {
  case EvaluationOutcome::AutoApproved:
    return "auto_approved";
  case EvaluationOutcome::Surfaced:
    return "surfaced";
  case EvaluationOutcome::Replayed:
    return "replayed";
  case EvaluationOutcome::Skipped:
    return "skipped";
  }
  return "skipped";
}

ApprovalPolicyEngine::ApprovalPolicyEngine(sessions::SessionStore &store,
                                           directory::IPreferencesStore &preferences,
                                           notify::INotificationDispatcher &notifier,
                                           DecisionDispatcher dispatch, IApprovalJournal *journal)
    : store_(store), preferences_(preferences), notifier_(notifier), dispatch_(std::move(dispatch)),
      journal_(journal) {}

Evaluation ApprovalPolicyEngine::evaluate(const std::string &request_id) {
  auto claimed = store_.claim_evaluation(request_id);
  if (!claimed.has_value()) {
    return Evaluation{};
  }
  const ApprovalRequest &request = *claimed;
  observability::record_approval_requested(request.request_id, request.session_id,
                                           request.machine_id,
                                           std::string(risk_tier_name(request.risk_tier)));

  if (journal_ != nullptr) {
    auto previous = journal_->find(request_id);
    if (!previous.ok()) {
      observability::record_error("journal", previous.error());
    } else if (previous.value().has_value()) {
      return resolve_and_dispatch(request, previous.value()->state, ResolvedBy::Journal,
                                  EvaluationOutcome::Replayed);
    }
  }

  if (should_auto_approve(request.risk_tier, current_preferences())) {
    return resolve_and_dispatch(request, ApprovalState::AutoApproved, ResolvedBy::Policy,
                                EvaluationOutcome::AutoApproved);
  }
  return surface(request);
}

Evaluation ApprovalPolicyEngine::resolve_and_dispatch(const ApprovalRequest &request,
                                                      const ApprovalState state,
                                                      const ResolvedBy resolved_by,
                                                      const EvaluationOutcome outcome) {
  if (!store_.try_resolve(request.request_id, state, resolved_by)) {
    return Evaluation{.outcome = outcome};
  }
  observability::record_approval_resolved(request.request_id,
                                          std::string(approval_state_name(state)),
                                          std::string(resolved_by_name(resolved_by)));

  Evaluation evaluation{.outcome = outcome};
  if (dispatch_) {
    auto resolved = store_.approval(request.request_id).value_or(request);
    evaluation.dispatch = dispatch_(resolved);
  }
  if (evaluation.dispatch.ok()) {
    journal_decision(request.request_id);
    return evaluation;
  }

  if (!store_.revert_resolution(request.request_id, state, resolved_by)) {
    return evaluation;
  }
  auto surfaced = surface(request);
  surfaced.dispatch = evaluation.dispatch;
  return surfaced;
}

Evaluation ApprovalPolicyEngine::surface(const ApprovalRequest &request) {
  // A reverted resolution already left the request visible; only a resolved one is skipped.
  if (!store_.mark_evaluated(request.request_id)) {
    const auto current = store_.approval(request.request_id);
    if (!current.has_value() || current->state != ApprovalState::Pending) {
      return Evaluation{};
    }
  }
  notifier_.notify(request.session_id, request.request_id);
  observability::record_metric(observability::PendingApprovalsMetric{
      .count = static_cast<std::uint64_t>(store_.pending_count())});
  return Evaluation{.outcome = EvaluationOutcome::Surfaced};
}

AutoApprovalPreferences ApprovalPolicyEngine::current_preferences() {
  auto preferences = preferences_.get();
  if (!preferences.ok()) {
    observability::record_error("preferences", preferences.error());
    return AutoApprovalPreferences{};
  }
  return preferences.value();
}

void ApprovalPolicyEngine::journal_decision(const std::string &request_id) {
  if (journal_ == nullptr) {
    return;
  }
  const auto request = store_.approval(request_id);
  if (!request.has_value()) {
    return;
  }
  if (const auto recorded = journal_->record(*request); !recorded.ok()) {
    observability::record_error("journal", recorded.error());
  }
}

} // namespace tapbridge::security

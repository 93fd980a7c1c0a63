#include "tapbridge/security/approval.hpp"

#include "tapbridge/common/fs.hpp"

namespace tapbridge::security {

std::string_view risk_tier_name(const RiskTier tier) {
  switch (tier) {
  case RiskTier::Low:
    return "low";
  case RiskTier::Medium:
    return "medium";
  case RiskTier::High:
    return "high";
  case RiskTier::Critical:
    return "critical";
  }
  return "critical";
}

std::string_view approval_state_name(const ApprovalState state) {
  switch (state) {
  case ApprovalState::Pending:
    return "pending";
  case ApprovalState::Approved:
    return "approved";
  case ApprovalState::Denied:
    return "denied";
  case ApprovalState::AutoApproved:
    return "auto_approved";
  case ApprovalState::AutoDenied:
    return "auto_denied";
  }
  return "pending";
}

std::string_view resolved_by_name(const ResolvedBy value) {
  switch (value) {
  case ResolvedBy::None:
    return "none";
  case ResolvedBy::User:
    return "user";
  case ResolvedBy::Policy:
    return "policy";
  case ResolvedBy::Remote:
    return "remote";
  case ResolvedBy::Journal:
    return "journal";
  }
  return "none";
}

RiskTier risk_tier_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "low") {
    return RiskTier::Low;
  }
  if (normalized == "medium") {
    return RiskTier::Medium;
  }
  if (normalized == "high") {
    return RiskTier::High;
  }
  return RiskTier::Critical;
}

common::Result<ApprovalState> approval_state_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "pending") {
    return common::Result<ApprovalState>::success(ApprovalState::Pending);
  }
  if (normalized == "approved") {
    return common::Result<ApprovalState>::success(ApprovalState::Approved);
  }
  if (normalized == "denied") {
    return common::Result<ApprovalState>::success(ApprovalState::Denied);
  }
  if (normalized == "auto_approved") {
    return common::Result<ApprovalState>::success(ApprovalState::AutoApproved);
  }
  if (normalized == "auto_denied") {
    return common::Result<ApprovalState>::success(ApprovalState::AutoDenied);
  }
  return common::Result<ApprovalState>::failure(common::ErrorCode::InvalidArgument,
                                                "unknown approval state: " + value);
}

common::Result<ResolvedBy> resolved_by_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "none") {
    return common::Result<ResolvedBy>::success(ResolvedBy::None);
  }
  if (normalized == "user") {
    return common::Result<ResolvedBy>::success(ResolvedBy::User);
  }
  if (normalized == "policy") {
    return common::Result<ResolvedBy>::success(ResolvedBy::Policy);
  }
  if (normalized == "remote") {
    return common::Result<ResolvedBy>::success(ResolvedBy::Remote);
  }
  if (normalized == "journal") {
    return common::Result<ResolvedBy>::success(ResolvedBy::Journal);
  }
  return common::Result<ResolvedBy>::failure(common::ErrorCode::InvalidArgument,
                                             "unknown resolver: " + value);
}

bool is_terminal(const ApprovalState state) { return state != ApprovalState::Pending; }

} // namespace tapbridge::security

#pragma once

#include "tapbridge/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tapbridge::security {

enum class RiskTier { Low, Medium, High, Critical };
enum class ApprovalState { Pending, Approved, Denied, AutoApproved, AutoDenied };
enum class ResolvedBy { None, User, Policy, Remote, Journal };

[[nodiscard]] std::string_view risk_tier_name(RiskTier tier);
[[nodiscard]] std::string_view approval_state_name(ApprovalState state);
[[nodiscard]] std::string_view resolved_by_name(ResolvedBy value);

/// Unknown or missing tiers are treated as critical so they are never auto-approved
/// by a lower tier's preference.
[[nodiscard]] RiskTier risk_tier_from_string(const std::string &value);
[[nodiscard]] common::Result<ApprovalState> approval_state_from_string(const std::string &value);
[[nodiscard]] common::Result<ResolvedBy> resolved_by_from_string(const std::string &value);

[[nodiscard]] bool is_terminal(ApprovalState state);

struct ToolOutcome {
  bool success = true;
  std::string output;
};

struct ApprovalRequest {
  std::string request_id;
  std::string tool_call_id;
  std::string session_id;
  std::string machine_id;
  RiskTier risk_tier = RiskTier::Critical;
  std::string tool_name;
  std::string description;
  std::string preview;
  ApprovalState state = ApprovalState::Pending;
  ResolvedBy resolved_by = ResolvedBy::None;
  std::chrono::system_clock::time_point created_at{};
  std::optional<std::chrono::system_clock::time_point> resolved_at;
  std::optional<std::chrono::system_clock::time_point> expires_at;
  /// Set once the policy engine has run; only evaluated requests are visible as pending.
  bool evaluated = false;
  std::optional<ToolOutcome> outcome;
};

struct AutoApprovalPreferences {
  bool auto_approve_low = false;
  bool auto_approve_medium = false;
  bool auto_approve_high = false;
  bool auto_approve_critical = false;
  bool loaded = false;
};

} // namespace tapbridge::security

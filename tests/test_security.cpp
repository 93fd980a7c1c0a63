#include "test_framework.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/security/approval.hpp"
#include "tapbridge/security/journal.hpp"
#include "tapbridge/security/policy.hpp"
#include "tapbridge/sessions/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <thread>

namespace {

namespace sec = tapbridge::security;
namespace ss = tapbridge::sessions;
namespace th = tapbridge::testing;

// Store, preferences and notifier wired to a policy engine that records dispatches.
struct PolicyFixture {
  ss::SessionStore store;
  th::FakePreferences preferences;
  th::RecordingNotifier notifier;
  th::MemoryJournal journal;
  std::vector<std::string> dispatched;
  std::vector<sec::ApprovalState> dispatched_states;
  bool fail_dispatch = false;
  sec::ApprovalPolicyEngine engine;

  explicit PolicyFixture(bool with_journal = false)
      : engine(store, preferences, notifier,
               [this](const sec::ApprovalRequest &request) {
                 dispatched.push_back(request.request_id);
                 dispatched_states.push_back(request.state);
                 if (fail_dispatch) {
                   return tapbridge::common::Status::error(
                       tapbridge::common::ErrorCode::TransportError, "broken pipe");
                 }
                 return tapbridge::common::Status::success();
               },
               with_journal ? &journal : nullptr) {}

  std::string add_request(const std::string &request_id, const std::string &risk) {
    (void)store.apply(th::decode_event(
        th::approval_requested_event("s1", request_id, "tc-" + request_id, risk)));
    return request_id;
  }
};

sec::ApprovalRequest resolved_request(const std::string &id, sec::ApprovalState state) {
  sec::ApprovalRequest request;
  request.request_id = id;
  request.session_id = "s1";
  request.machine_id = "m1";
  request.risk_tier = sec::RiskTier::High;
  request.state = state;
  request.resolved_by = sec::ResolvedBy::User;
  request.resolved_at = tapbridge::common::from_unix_millis(1772359200000LL);
  return request;
}

} // namespace

void register_security_tests(std::vector<tapbridge::tests::TestCase> &tests) {
  using tapbridge::tests::require;

  tests.push_back({"risk_tiers_parse_with_critical_fallback", [] {
                     require(sec::risk_tier_from_string(" HIGH ") == sec::RiskTier::High, "high");
                     require(sec::risk_tier_from_string("") == sec::RiskTier::Critical, "empty");
                     require(sec::risk_tier_from_string("extreme") == sec::RiskTier::Critical,
                             "unknown");
                     require(!sec::approval_state_from_string("maybe").ok(), "bad state");
                     require(sec::is_terminal(sec::ApprovalState::AutoDenied), "terminal");
                     require(!sec::is_terminal(sec::ApprovalState::Pending), "pending");
                   }});

  tests.push_back({"auto_approve_requires_loaded_preferences", [] {
                     sec::AutoApprovalPreferences prefs;
                     prefs.auto_approve_low = true;
                     require(!sec::should_auto_approve(sec::RiskTier::Low, prefs),
                             "unloaded preferences never approve");
                     prefs.loaded = true;
                     require(sec::should_auto_approve(sec::RiskTier::Low, prefs), "low approved");
                     require(!sec::should_auto_approve(sec::RiskTier::Medium, prefs),
                             "tiers are independent");
                     prefs.auto_approve_critical = true;
                     require(sec::should_auto_approve(sec::RiskTier::Critical, prefs), "critical");
                   }});

  tests.push_back({"policy_auto_approves_enabled_tier", [] {
                     PolicyFixture fx;
                     fx.preferences.set(sec::AutoApprovalPreferences{.auto_approve_low = true});
                     const auto evaluation = fx.engine.evaluate(fx.add_request("r1", "low"));
                     require(evaluation.outcome == sec::EvaluationOutcome::AutoApproved,
                             "auto approved");
                     require(evaluation.dispatch.ok(), "dispatched");
                     require(fx.dispatched == std::vector<std::string>{"r1"}, "one approve sent");
                     const auto request = fx.store.approval("r1");
                     require(request->state == sec::ApprovalState::AutoApproved &&
                                 request->resolved_by == sec::ResolvedBy::Policy,
                             "resolved by policy");
                     require(fx.notifier.calls().empty(), "no notification");
                     require(fx.store.pending_approvals().empty(), "never visible as pending");
                   }});

  tests.push_back({"policy_surfaces_and_notifies_other_tiers", [] {
                     PolicyFixture fx;
                     fx.preferences.set(sec::AutoApprovalPreferences{.auto_approve_low = true});
                     const auto evaluation = fx.engine.evaluate(fx.add_request("r1", "critical"));
                     require(evaluation.outcome == sec::EvaluationOutcome::Surfaced, "surfaced");
                     require(fx.dispatched.empty(), "nothing sent");
                     require(fx.notifier.calls().size() == 1 &&
                                 fx.notifier.calls()[0].second == "r1",
                             "notified once");
                     require(fx.store.pending_approvals().size() == 1, "visible");
                   }});

  tests.push_back({"policy_failing_preferences_surface_request", [] {
                     PolicyFixture fx;
                     fx.preferences.set_error("api down");
                     const auto evaluation = fx.engine.evaluate(fx.add_request("r1", "low"));
                     require(evaluation.outcome == sec::EvaluationOutcome::Surfaced,
                             "unknown preferences are treated as disabled");
                   }});

  tests.push_back({"policy_evaluates_each_request_once", [] {
                     PolicyFixture fx;
                     fx.preferences.set(sec::AutoApprovalPreferences{.auto_approve_high = true});
                     const auto id = fx.add_request("r1", "high");
                     (void)fx.engine.evaluate(id);
                     const auto again = fx.engine.evaluate(id);
                     require(again.outcome == sec::EvaluationOutcome::Skipped, "second run skipped");
                     require(fx.dispatched.size() == 1, "approval sent exactly once");
                     require(fx.engine.evaluate("unknown").outcome == sec::EvaluationOutcome::Skipped,
                             "unknown request skipped");
                   }});

  tests.push_back({"policy_failed_dispatch_surfaces_request", [] {
                     PolicyFixture fx(true);
                     fx.fail_dispatch = true;
                     fx.preferences.set(sec::AutoApprovalPreferences{.auto_approve_medium = true});
                     const auto evaluation = fx.engine.evaluate(fx.add_request("r1", "medium"));
                     require(evaluation.outcome == sec::EvaluationOutcome::Surfaced,
                             "undelivered approval falls back to the user");
                     require(!evaluation.dispatch.ok(), "dispatch failure reported");
                     const auto request = fx.store.approval("r1");
                     require(request->state == sec::ApprovalState::Pending &&
                                 request->resolved_by == sec::ResolvedBy::None,
                             "request back to pending");
                     require(fx.store.pending_approvals().size() == 1, "visible for a retry");
                     require(fx.notifier.calls().size() == 1, "user notified");
                     require(fx.journal.find("r1").value() == std::nullopt,
                             "undelivered decision not journaled");
                     require(fx.store.try_resolve("r1", sec::ApprovalState::Approved,
                                                  sec::ResolvedBy::User),
                             "user can still decide");
                   }});

  tests.push_back({"policy_replays_journaled_decision", [] {
                     PolicyFixture fx(true);
                     fx.preferences.set(sec::AutoApprovalPreferences{.auto_approve_low = true});
                     fx.journal.put(sec::JournalEntry{.request_id = "r1",
                                                      .session_id = "s1",
                                                      .machine_id = "m1",
                                                      .risk_tier = sec::RiskTier::Low,
                                                      .state = sec::ApprovalState::Denied,
                                                      .resolved_by = sec::ResolvedBy::User});
                     const auto evaluation = fx.engine.evaluate(fx.add_request("r1", "low"));
                     require(evaluation.outcome == sec::EvaluationOutcome::Replayed, "replayed");
                     require(evaluation.dispatch.ok(), "decision delivered");
                     require(fx.dispatched == std::vector<std::string>{"r1"} &&
                                 fx.dispatched_states ==
                                     std::vector<sec::ApprovalState>{sec::ApprovalState::Denied},
                             "journaled denial sent to the machine once");
                     require(fx.notifier.calls().empty(), "not prompted");
                     const auto request = fx.store.approval("r1");
                     require(request->state == sec::ApprovalState::Denied &&
                                 request->resolved_by == sec::ResolvedBy::Journal,
                             "journal decision applied");
                   }});

  tests.push_back({"policy_replay_send_failure_reopens_request", [] {
                     PolicyFixture fx(true);
                     fx.fail_dispatch = true;
                     fx.journal.put(sec::JournalEntry{.request_id = "r1",
                                                      .session_id = "s1",
                                                      .machine_id = "m1",
                                                      .risk_tier = sec::RiskTier::High,
                                                      .state = sec::ApprovalState::Approved,
                                                      .resolved_by = sec::ResolvedBy::User});
                     const auto evaluation = fx.engine.evaluate(fx.add_request("r1", "high"));
                     require(evaluation.outcome == sec::EvaluationOutcome::Surfaced &&
                                 !evaluation.dispatch.ok(),
                             "surfaced with the send error");
                     require(fx.store.approval("r1")->state == sec::ApprovalState::Pending,
                             "pending again");
                   }});

  tests.push_back({"revert_only_undoes_the_matching_resolution", [] {
                     ss::SessionStore store;
                     (void)store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "high")));
                     require(store.try_resolve("r1", sec::ApprovalState::Denied,
                                               sec::ResolvedBy::Remote),
                             "resolved remotely");
                     require(!store.revert_resolution("r1", sec::ApprovalState::Denied,
                                                      sec::ResolvedBy::User),
                             "another resolver's decision stays");
                     require(store.revert_resolution("r1", sec::ApprovalState::Denied,
                                                     sec::ResolvedBy::Remote),
                             "own decision reverted");
                     require(!store.revert_resolution("r1", sec::ApprovalState::Denied,
                                                      sec::ResolvedBy::Remote),
                             "nothing left to revert");
                     require(store.session("s1")->status == "waiting_for_approval",
                             "session waits again");
                   }});

  tests.push_back({"policy_journals_auto_approval", [] {
                     PolicyFixture fx(true);
                     fx.preferences.set(sec::AutoApprovalPreferences{.auto_approve_low = true});
                     (void)fx.engine.evaluate(fx.add_request("r1", "low"));
                     const auto entry = fx.journal.find("r1");
                     require(entry.ok() && entry.value().has_value(), "decision journaled");
                     require(entry.value()->state == sec::ApprovalState::AutoApproved, "state");
                   }});

  tests.push_back({"concurrent_resolution_has_one_winner", [] {
                     ss::SessionStore store;
                     (void)store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "high")));
                     std::atomic<int> winners{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 8; ++i) {
                       threads.emplace_back([&store, &winners, i] {
                         const auto state = i % 2 == 0 ? sec::ApprovalState::Approved
                                                       : sec::ApprovalState::Denied;
                         if (store.try_resolve("r1", state, sec::ResolvedBy::User)) {
                           ++winners;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(winners.load() == 1, "exactly one winner");
                   }});

  tests.push_back({"sqlite_journal_keeps_first_decision", [] {
                     th::TempWorkspace workspace;
                     sec::SqliteApprovalJournal journal(workspace.path() / "nested" / "approvals.db");
                     require(journal.status().ok(), journal.status().error());

                     require(journal.record(resolved_request("r1", sec::ApprovalState::Approved)).ok(),
                             "first record");
                     require(journal.record(resolved_request("r1", sec::ApprovalState::Denied)).ok(),
                             "second record is ignored, not an error");
                     const auto pending =
                         journal.record(resolved_request("r2", sec::ApprovalState::Pending));
                     require(pending.code() == tapbridge::common::ErrorCode::InvalidArgument,
                             "pending requests are not journaled");

                     const auto found = journal.find("r1");
                     require(found.ok() && found.value().has_value(), found.error());
                     require(found.value()->state == sec::ApprovalState::Approved,
                             "first decision wins");
                     require(found.value()->risk_tier == sec::RiskTier::High, "tier stored");
                     require(tapbridge::common::to_unix_millis(found.value()->resolved_at) ==
                                 1772359200000LL,
                             "timestamp stored in millis");
                     const auto missing = journal.find("nope");
                     require(missing.ok() && !missing.value().has_value(), "missing id");
                   }});

  tests.push_back({"sqlite_journal_survives_reopen_and_orders_recent", [] {
                     th::TempWorkspace workspace;
                     const auto path = workspace.path() / "approvals.db";
                     {
                       sec::SqliteApprovalJournal journal(path);
                       auto older = resolved_request("old", sec::ApprovalState::Denied);
                       auto newer = resolved_request("new", sec::ApprovalState::AutoApproved);
                       newer.resolved_at = tapbridge::common::from_unix_millis(1772359300000LL);
                       require(journal.record(older).ok() && journal.record(newer).ok(), "records");
                     }
                     sec::SqliteApprovalJournal reopened(path);
                     const auto recent = reopened.recent(10);
                     require(recent.ok(), recent.error());
                     require(recent.value().size() == 2, "both survive the restart");
                     require(recent.value()[0].request_id == "new", "most recent first");
                     const auto limited = reopened.recent(1);
                     require(limited.ok() && limited.value().size() == 1, "limit honoured");
                   }});

  tests.push_back({"sqlite_journal_reports_unopenable_path", [] {
                     th::TempWorkspace workspace;
                     workspace.create_file("blocker", "not a directory");
                     sec::SqliteApprovalJournal journal(workspace.path() / "blocker" / "db.sqlite");
                     require(!journal.status().ok(), "open failure reported");
                     const auto found = journal.find("r1");
                     require(!found.ok() &&
                                 found.code() == tapbridge::common::ErrorCode::StorageError,
                             "operations fail with storage error");
                   }});
}

#include "test_framework.hpp"

#include "tapbridge/sessions/session.hpp"
#include "tapbridge/sessions/store.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace ss = tapbridge::sessions;
namespace sec = tapbridge::security;
namespace th = tapbridge::testing;

tapbridge::protocol::SessionInfo info(const std::string &id, const std::string &project) {
  tapbridge::protocol::SessionInfo out;
  out.id = id;
  out.agent = "claude-code";
  out.project_name = project;
  out.project_path = "/work/" + project;
  out.status = "running";
  return out;
}

} // namespace

void register_sessions_tests(std::vector<tapbridge::tests::TestCase> &tests) {
  using tapbridge::tests::require;

  tests.push_back({"strip_system_tags_removes_tagged_content", [] {
                     require(ss::strip_system_tags(
                                 "<system-reminder>ignore me</system-reminder>Fix the build") ==
                                 "Fix the build",
                             "paired tag removed");
                     require(ss::strip_system_tags("Refactor <ide_selection>lines 1-4") == "Refactor",
                             "unterminated tag removed to the end");
                     require(ss::strip_system_tags("a <b>bold</b> plan") == "a <b>bold</b> plan",
                             "unrelated tags kept");
                   }});

  tests.push_back({"session_title_is_truncated_to_one_hundred_characters", [] {
                     const std::string long_text(150, 'a');
                     const auto title = ss::extract_session_title(long_text);
                     require(title.has_value() && title->size() == 103, "100 chars plus ellipsis");
                     require(title->substr(100) == "...", "ellipsis");
                     require(!ss::extract_session_title("<gitStatus>clean</gitStatus>   ").has_value(),
                             "nothing left means no title");
                     require(ss::extract_session_title("  short  ") == std::optional<std::string>("short"),
                             "trimmed");
                   }});

  tests.push_back({"message_deltas_accumulate_until_complete", [] {
                     ss::SessionStore store;
                     (void)store.apply(th::decode_event(th::message_delta_event("s1", "msg", "Hel")));
                     (void)store.apply(th::decode_event(th::message_delta_event("s1", "msg", "lo")));
                     auto transcript = store.transcript("s1");
                     require(transcript.size() == 1 && transcript[0].content == "Hello" &&
                                 transcript[0].partial,
                             "partial message accumulated");

                     (void)store.apply(th::decode_event(
                         th::message_complete_event("s1", "msg", "assistant", "Hello there")));
                     transcript = store.transcript("s1");
                     require(transcript.size() == 1 && transcript[0].content == "Hello there" &&
                                 !transcript[0].partial,
                             "complete replaces the partial text");
                     require(store.session("s1")->last_message ==
                                 std::optional<std::string>("Hello there"),
                             "assistant message becomes last message");
                   }});

  tests.push_back({"first_user_message_names_the_session", [] {
                     ss::SessionStore store;
                     (void)store.apply(th::decode_event(th::message_complete_event(
                         "s1", "u1", "user", "<system-reminder>x</system-reminder>Add login page")));
                     (void)store.apply(
                         th::decode_event(th::message_complete_event("s1", "u2", "user", "Also tests")));
                     require(store.session("s1")->session_name ==
                                 std::optional<std::string>("Add login page"),
                             "first user message wins");
                   }});

  tests.push_back({"sessions_list_replaces_only_that_machine", [] {
                     ss::SessionStore store;
                     store.set_sessions_for_machine("m1", {info("a", "alpha"), info("b", "beta")});
                     store.set_sessions_for_machine("m2", {info("c", "gamma")});
                     store.set_sessions_for_machine("m1", {info("b", "beta2"), info("b", "dup")});

                     const auto all = store.sessions();
                     require(all.size() == 2, "a dropped, c kept, duplicate b collapsed");
                     require(!store.session("a").has_value(), "a gone");
                     require(store.session("b")->project_name == "beta2", "first duplicate wins");
                     require(store.session("c")->machine_id == "m2", "other machine untouched");
                   }});

  tests.push_back({"client_side_name_survives_sessions_list", [] {
                     ss::SessionStore store;
                     store.set_sessions_for_machine("m1", {info("s1", "app")});
                     (void)store.apply(
                         th::decode_event(th::message_complete_event("s1", "u1", "user", "Ship it")));
                     store.set_sessions_for_machine("m1", {info("s1", "app")});
                     require(store.session("s1")->session_name == std::optional<std::string>("Ship it"),
                             "name kept when the list carries none");

                     auto named = info("s1", "app");
                     named.session_name = "Renamed";
                     store.set_sessions_for_machine("m1", {named});
                     require(store.session("s1")->session_name == std::optional<std::string>("Renamed"),
                             "incoming name wins");
                   }});

  tests.push_back({"history_buffer_holds_events_until_complete", [] {
                     ss::SessionStore store;
                     store.start_history_loading("s1", "m1");
                     require(store.is_loading_history("s1"), "loading");
                     const auto held = store.apply(
                         th::decode_event(th::message_complete_event("s1", "m", "assistant", "old")));
                     require(held.buffered && !held.applied, "buffered");
                     require(store.transcript("s1").empty(), "nothing visible while loading");

                     (void)store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "low")));
                     const auto batch = store.complete_history_loading("s1");
                     require(batch.size() == 2, "both events applied");
                     require(batch[1].result.created_request_id ==
                                 std::optional<std::string>("r1"),
                             "request creation reported from the batch");
                     require(!store.is_loading_history("s1"), "loaded");
                     require(store.session("s1")->history == ss::HistoryState::Loaded, "state");
                     require(store.transcript("s1").size() == 1, "transcript visible");
                   }});

  tests.push_back({"discarding_buffers_resets_history_state", [] {
                     ss::SessionStore store;
                     store.start_history_loading("s1", "m1");
                     store.start_history_loading("s2", "m2");
                     (void)store.apply(th::decode_event(th::message_delta_event("s1", "m", "x"), "m1"));
                     const auto dropped = store.discard_buffers_for_machine("m1");
                     require(dropped == std::vector<std::string>{"s1"}, "only m1 sessions");
                     require(store.session("s1")->history == ss::HistoryState::NotRequested,
                             "history must be requested again");
                     require(store.is_loading_history("s2"), "other machine still loading");
                     require(store.complete_history_loading("s1").empty(), "buffer was dropped");
                   }});

  tests.push_back({"approval_request_waits_for_evaluation", [] {
                     ss::SessionStore store;
                     const auto applied = store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "medium")));
                     require(applied.created_request_id == std::optional<std::string>("r1"),
                             "created");
                     require(store.pending_approvals().empty(), "not visible before evaluation");
                     require(store.session("s1")->status == "waiting_for_approval", "waiting");

                     const auto claimed = store.claim_evaluation("r1");
                     require(claimed.has_value() && claimed->risk_tier == sec::RiskTier::Medium,
                             "claimed once");
                     require(!store.claim_evaluation("r1").has_value(), "second claim refused");
                     require(store.mark_evaluated("r1"), "marked");
                     require(store.pending_approvals().size() == 1 && store.pending_count() == 1,
                             "visible after evaluation");

                     const auto replay = store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "medium")));
                     require(replay.duplicate && !replay.created_request_id.has_value(),
                             "replayed request is a duplicate");
                   }});

  tests.push_back({"try_resolve_is_compare_and_swap", [] {
                     ss::SessionStore store;
                     (void)store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "high")));
                     require(store.try_resolve("r1", sec::ApprovalState::Denied, sec::ResolvedBy::User),
                             "first resolve wins");
                     require(!store.try_resolve("r1", sec::ApprovalState::Approved,
                                                sec::ResolvedBy::User),
                             "second resolve loses");
                     require(!store.try_resolve("r1", sec::ApprovalState::Pending,
                                                sec::ResolvedBy::User),
                             "pending is not a resolution");
                     require(!store.try_resolve("missing", sec::ApprovalState::Approved,
                                                sec::ResolvedBy::User),
                             "unknown request");
                     const auto request = store.approval("r1");
                     require(request->state == sec::ApprovalState::Denied &&
                                 request->resolved_by == sec::ResolvedBy::User &&
                                 request->resolved_at.has_value(),
                             "first decision stored");
                     require(store.session("s1")->status == "running", "no longer waiting");
                   }});

  tests.push_back({"remote_resolution_and_tool_result", [] {
                     ss::SessionStore store;
                     (void)store.apply(
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "low")));
                     const auto early =
                         store.apply(th::decode_event(th::tool_result_event("s1", "tc1", "done")));
                     require(!early.applied, "result for an unresolved request is ignored");

                     (void)store.apply(
                         th::decode_event(th::approval_resolved_event("s1", "r1", true, "user")));
                     auto request = store.approval("r1");
                     require(request->state == sec::ApprovalState::Approved &&
                                 request->resolved_by == sec::ResolvedBy::Remote,
                             "remote decision applied");

                     const auto result =
                         store.apply(th::decode_event(th::tool_result_event("s1", "tc1", "done")));
                     require(result.applied, "result attached");
                     request = store.approval("r1");
                     require(request->outcome.has_value() && request->outcome->output == "done",
                             "outcome stored");

                     const auto late = store.apply(
                         th::decode_event(th::approval_resolved_event("s1", "r1", false, "policy")));
                     require(!late.applied, "later remote decision does not overwrite");
                   }});

  tests.push_back({"session_end_marks_session", [] {
                     ss::SessionStore store;
                     (void)store.apply(th::decode_event(th::session_completed_event("s1")));
                     const auto session = store.session("s1");
                     require(session->ended && session->status == "completed", "ended");

                     store.set_sessions_for_machine("m1", {info("s2", "x")});
                     (void)store.apply(th::decode_event(th::message_delta_event("s2", "m", "hi")));
                     store.clear_session("s2");
                     require(store.transcript("s2").empty(), "transcript cleared");
                     require(store.session("s2").has_value(), "metadata kept");
                   }});
}

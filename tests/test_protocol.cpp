#include "test_framework.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/json_util.hpp"
#include "tapbridge/protocol/event.hpp"
#include "tapbridge/protocol/messages.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_protocol_tests(std::vector<tapbridge::tests::TestCase> &tests) {
  using tapbridge::tests::require;
  namespace proto = tapbridge::protocol;
  namespace common = tapbridge::common;
  namespace th = tapbridge::testing;

  tests.push_back({"client_frames_encode_daemon_wire_format", [] {
                     require(proto::to_json(proto::auth_message("tok\"en")) ==
                                 R"({"type":"auth","token":"tok\"en"})",
                             "auth frame");
                     require(proto::to_json(proto::ping_message()) == R"({"type":"ping"})",
                             "ping frame");
                     require(proto::to_json(proto::subscribe_message({"s1", "s2"})) ==
                                 R"({"type":"subscribe","sessionIds":["s1","s2"]})",
                             "subscribe frame");
                     require(proto::to_json(proto::terminate_session_message("s1")) ==
                                 R"({"type":"terminate_session","sessionId":"s1"})",
                             "terminate frame");
                   }});

  tests.push_back({"commands_use_session_envelope", [] {
                     const std::string send =
                         proto::to_json(proto::send_message_command("s1", "run the tests"));
                     require(common::json_get_string(send, "type") == "command", "envelope type");
                     require(common::json_get_string(send, "sessionId") == "s1", "envelope session");
                     const std::string inner = common::json_get_object(send, "command");
                     require(common::json_get_string(inner, "command") == "send_message",
                             "command name");
                     require(common::json_get_string(inner, "message") == "run the tests",
                             "message text");

                     const std::string approve =
                         proto::to_json(proto::approve_command("s1", "r1", "tc1"));
                     const std::string approve_inner = common::json_get_object(approve, "command");
                     require(common::json_get_string(approve_inner, "requestId") == "r1" &&
                                 common::json_get_string(approve_inner, "toolCallId") == "tc1",
                             "approve ids");

                     const std::string deny_plain =
                         proto::to_json(proto::deny_command("s1", "r1", "tc1", ""));
                     require(!common::json_has(common::json_get_object(deny_plain, "command"),
                                               "reason"),
                             "empty reason omitted");
                     const std::string deny =
                         proto::to_json(proto::deny_command("s1", "r1", "tc1", "too risky"));
                     require(common::json_get_string(common::json_get_object(deny, "command"),
                                                     "reason") == "too risky",
                             "reason included");

                     const std::string cancel = proto::to_json(proto::cancel_command("s1"));
                     require(cancel == R"({"type":"command","sessionId":"s1","command":{"command":"cancel"}})",
                             "cancel frame: " + cancel);
                   }});

  tests.push_back({"server_sessions_list_decodes_metadata", [] {
                     const std::string frame =
                         R"({"type":"sessions_list","sessions":[)"
                         R"({"id":"s1","machineId":"m1","agent":"claude-code","projectPath":"/w/app",)"
                         R"("projectName":"app","status":"waiting_for_approval","lastMessage":"hi",)"
                         R"("model":"opus","lastActivity":"2026-03-01T10:00:00Z"},)"
                         R"({"agent":"no-id"}]})";
                     const auto parsed = proto::parse_server_message(frame);
                     require(parsed.ok(), parsed.error());
                     const auto &message = parsed.value();
                     require(message.type == proto::ServerMessageType::SessionsList, "type");
                     require(message.sessions.size() == 1, "entry without id skipped");
                     const auto &info = message.sessions.front();
                     require(info.project_name == "app" && info.status == "waiting_for_approval",
                             "metadata");
                     require(info.last_message == std::optional<std::string>("hi"), "last message");
                     require(!info.session_name.has_value(), "missing session name stays empty");
                     require(info.last_activity.has_value() &&
                                 common::to_unix_millis(*info.last_activity) == 1772359200000LL,
                             "last activity");
                   }});

  tests.push_back({"server_frames_require_type_and_members", [] {
                     require(!proto::parse_server_message("[1,2]").ok(), "array rejected");
                     require(!proto::parse_server_message(R"({"kind":"x"})").ok(), "no type");
                     require(!proto::parse_server_message(R"({"type":"acp_event"})").ok(),
                             "acp_event without event");
                     require(!proto::parse_server_message(R"({"type":"history_complete"})").ok(),
                             "history_complete without session");

                     const auto other = proto::parse_server_message(R"({"type":"welcome"})");
                     require(other.ok() && other.value().type == proto::ServerMessageType::Other,
                             "unknown type tolerated");
                     const auto error = proto::parse_server_message(
                         R"({"type":"error","message":"no such session","code":"NOT_FOUND"})");
                     require(error.ok() && error.value().code == "NOT_FOUND", "error frame");
                     const auto acp = proto::parse_server_message(
                         th::acp_frame(th::session_completed_event("s1")));
                     require(acp.ok() && !acp.value().event_json.empty(), "acp event json kept");
                   }});

  tests.push_back({"message_events_decode_phases", [] {
                     const auto delta = th::decode_event(th::message_delta_event("s1", "msg", "Hel"));
                     require(delta.kind() == proto::EventKind::MessageDelta, "delta kind");
                     const auto &payload = std::get<proto::MessagePayload>(delta.payload);
                     require(payload.phase == proto::MessagePhase::Delta && payload.text == "Hel",
                             "delta text");

                     const auto complete = th::decode_event(
                         th::message_complete_event("s1", "msg", "user", "Hello"));
                     const auto &done = std::get<proto::MessagePayload>(complete.payload);
                     require(done.phase == proto::MessagePhase::Complete, "complete phase");
                     require(done.role == proto::MessageRole::User && done.text == "Hello",
                             "complete text");
                     require(common::to_unix_millis(complete.timestamp) == 1772359200000LL,
                             "timestamp parsed");

                     const auto malformed = proto::parse_acp_event(
                         R"({"type":"message:delta","sessionId":"s1","messageId":"m","role":"robot","delta":"x"})",
                         "m1");
                     require(!malformed.ok() &&
                                 malformed.code() == common::ErrorCode::MalformedEvent,
                             "unknown role rejected");
                   }});

  tests.push_back({"approval_requested_decodes_tool_call", [] {
                     const auto event =
                         th::decode_event(th::approval_requested_event("s1", "r1", "tc1", "high"), "m9");
                     require(event.kind() == proto::EventKind::ToolCall, "tool call kind");
                     require(event.machine_id == "m9", "machine tag");
                     const auto &call = std::get<proto::ToolCallPayload>(event.payload);
                     require(call.request_id == "r1" && call.tool_call_id == "tc1", "ids");
                     require(call.risk_level == "high" && call.tool_name == "Bash", "risk and tool");
                     require(call.preview == "$ make test  (in /work)", "preview: " + call.preview);
                     require(common::json_get_string(call.tool_input_json, "command") == "make test",
                             "tool input");

                     const auto missing = proto::parse_acp_event(
                         R"({"type":"approval:requested","sessionId":"s1","toolCallId":"tc"})", "m1");
                     require(!missing.ok(), "approval without request id rejected");
                   }});

  tests.push_back({"tool_and_session_events_decode", [] {
                     const auto result = th::decode_event(th::tool_result_event("s1", "tc1", "ok"));
                     const auto &tool = std::get<proto::ToolResultPayload>(result.payload);
                     require(tool.success && tool.output == "ok" && tool.duration_ms == 12,
                             "tool result");

                     const auto error = th::decode_event(
                         R"({"type":"tool:error","sessionId":"s1","toolCallId":"tc2","name":"Edit","error":{"message":"denied"}})");
                     const auto &failed = std::get<proto::ToolResultPayload>(error.payload);
                     require(!failed.success && failed.output == "denied", "tool error");

                     const auto end = th::decode_event(
                         R"({"type":"session:error","sessionId":"s1","error":{"message":"crashed"}})");
                     require(end.kind() == proto::EventKind::SessionEnd, "session end kind");
                     require(std::get<proto::SessionEndPayload>(end.payload).error_message ==
                                 "crashed",
                             "session error message");

                     const auto status = th::decode_event(
                         R"({"type":"session:status_changed","sessionId":"s1","from":"running","to":"idle"})");
                     require(std::get<proto::SessionStatusPayload>(status.payload).to == "idle",
                             "status change");

                     const auto resolved =
                         th::decode_event(th::approval_resolved_event("s1", "r1", false, "mobile"));
                     const auto &decision = std::get<proto::ApprovalResolvedPayload>(resolved.payload);
                     require(!decision.approved && decision.resolved_by == "mobile", "resolved");
                   }});

  tests.push_back({"tool_progress_events_decode", [] {
                     const auto start = th::decode_event(th::tool_start_event("s1", "tc1", "Bash"));
                     require(start.kind() == proto::EventKind::ToolProgress, "progress kind");
                     const auto &started = std::get<proto::ToolProgressPayload>(start.payload);
                     require(started.phase == proto::ToolPhase::Start &&
                                 started.tool_name == "Bash" && started.category == "shell",
                             "start fields");

                     const auto executing =
                         th::decode_event(th::tool_executing_event("s1", "tc1", "high"));
                     const auto &running = std::get<proto::ToolProgressPayload>(executing.payload);
                     require(running.phase == proto::ToolPhase::Executing &&
                                 running.risk_level == "high" && running.requires_approval,
                             "executing fields");
                     require(common::json_get_string(running.input_json, "command") == "make test",
                             "input kept");

                     require(!proto::parse_acp_event(
                                  R"({"type":"tool:start","sessionId":"s1","name":"Bash"})", "m1")
                                  .ok(),
                             "tool event without id rejected");
                     require(proto::event_kind_name(proto::EventKind::ToolProgress) ==
                                 "tool-progress",
                             "kind name");
                   }});

  tests.push_back({"unmodelled_and_untyped_events", [] {
                     const auto thinking = proto::parse_acp_event(
                         R"({"type":"thinking:delta","sessionId":"s1","delta":"hmm"})", "m1");
                     require(thinking.ok() && !thinking.value().has_value(),
                             "unmodelled event skipped without error");
                     require(!proto::parse_acp_event(R"({"sessionId":"s1"})", "m1").ok(),
                             "untyped event rejected");
                     require(!proto::parse_acp_event(R"({"type":"session:completed"})", "m1").ok(),
                             "modelled event without session rejected");
                     require(proto::event_kind_name(proto::EventKind::ApprovalResolved) ==
                                 "approval-resolved",
                             "kind name");
                   }});
}

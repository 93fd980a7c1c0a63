#include "bench_common.hpp"

#include "tapbridge/protocol/event.hpp"
#include "tapbridge/protocol/messages.hpp"
#include "tapbridge/transport/websocket_frame.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace {

std::string sessions_list(int count) {
  std::string sessions;
  for (int i = 0; i < count; ++i) {
    if (!sessions.empty()) {
      sessions += ",";
    }
    sessions += R"({"id":"s)" + std::to_string(i) +
                R"(","agent":"claude-code","projectPath":"/work/app","projectName":"app",)"
                R"("status":"running","lastActivity":"2026-03-01T10:00:00Z"})";
  }
  return R"({"type":"sessions_list","sessions":[)" + sessions + "]}";
}

} // namespace

void run_protocol_benchmark() {
  std::cout << "\n=== Protocol Benchmarks ===\n";

  const std::string list = sessions_list(50);
  tapbridge::bench::run_bench("sessions_list_parse_50", 2000, [&] {
    (void)tapbridge::protocol::parse_server_message(list);
  });

  const std::string approval =
      R"({"type":"approval:requested","sessionId":"s1","requestId":"r1","toolCallId":"tc1",)"
      R"("toolName":"Bash","description":"Run tests","riskLevel":"medium",)"
      R"("toolInput":{"command":"make test"},)"
      R"("preview":{"type":"command","command":"make test","workingDir":"/work"}})";
  tapbridge::bench::run_bench("acp_event_decode", 10000, [&] {
    (void)tapbridge::protocol::parse_acp_event(approval, "m1");
  });

  tapbridge::bench::run_bench("command_encode", 10000, [] {
    (void)tapbridge::protocol::to_json(
        tapbridge::protocol::deny_command("s1", "r1", "tc1", "not on the main branch"));
  });

  const std::string payload(4096, 'x');
  const std::array<std::uint8_t, 4> mask{0x12, 0x34, 0x56, 0x78};
  tapbridge::bench::run_bench("ws_client_frame_encode_4k", 10000, [&] {
    (void)tapbridge::transport::encode_client_frame(tapbridge::transport::Opcode::Text, payload,
                                                    mask);
  });

  // Unmasked server text frame with a 16-bit extended length.
  std::vector<std::uint8_t> server_frame{0x81, 126, static_cast<std::uint8_t>(payload.size() >> 8),
                                         static_cast<std::uint8_t>(payload.size() & 0xff)};
  server_frame.insert(server_frame.end(), payload.begin(), payload.end());
  tapbridge::bench::run_bench("ws_server_frame_decode_4k", 10000, [&] {
    (void)tapbridge::transport::decode_server_frame(server_frame.data(), server_frame.size());
  });
}

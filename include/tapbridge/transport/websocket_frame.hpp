#pragma once

#include "tapbridge/common/result.hpp"
#include "tapbridge/transport/endpoint.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tapbridge::transport {

enum class Opcode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

inline constexpr std::size_t kMaxFramePayloadBytes = 16 * 1024 * 1024;

struct DecodedFrame {
  bool fin = true;
  Opcode opcode = Opcode::Text;
  std::string payload;
  std::size_t consumed = 0;
};

/// Sec-WebSocket-Accept value for a client key (RFC 6455 section 4.2.2).
[[nodiscard]] std::string websocket_accept_key(const std::string &client_key);

/// Random 16 byte nonce, base64 encoded.
[[nodiscard]] std::string generate_client_key();

[[nodiscard]] std::array<std::uint8_t, 4> generate_mask();

/// Client frames are always masked.
[[nodiscard]] std::vector<std::uint8_t> encode_client_frame(Opcode opcode,
                                                            const std::string &payload,
                                                            const std::array<std::uint8_t, 4> &mask);

/// Decodes one server frame from the front of `data`. An empty optional means more
/// bytes are needed; a failure is a protocol violation (masked or oversized frame).
[[nodiscard]] common::Result<std::optional<DecodedFrame>> decode_server_frame(const std::uint8_t *data,
                                                                              std::size_t size);

[[nodiscard]] std::string build_handshake_request(const Endpoint &endpoint,
                                                  const std::string &client_key);

/// Checks the 101 status line and the accept header of a handshake response.
[[nodiscard]] common::Status validate_handshake_response(const std::string &response,
                                                         const std::string &client_key);

} // namespace tapbridge::transport

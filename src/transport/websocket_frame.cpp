#include "tapbridge/transport/websocket_frame.hpp"

#include "tapbridge/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <limits>
#include <random>
#include <sstream>
#include <string_view>
#include <unordered_map>

namespace tapbridge::transport {

namespace {

constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string base64_encode(const unsigned char *data, const std::size_t size) {
  const int output_len = 4 * static_cast<int>((size + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), data, static_cast<int>(size));
  return output;
}

void fill_random(unsigned char *out, const std::size_t size) {
  if (RAND_bytes(out, static_cast<int>(size)) == 1) {
    return;
  }
  // RAND_bytes only fails when the CSPRNG is unseeded; masking keys tolerate a weaker source.
  static thread_local std::mt19937 rng{std::random_device{}()};
  for (std::size_t i = 0; i < size; ++i) {
    out[i] = static_cast<unsigned char>(rng() & 0xFFu);
  }
}

std::unordered_map<std::string, std::string> parse_headers(const std::string &response,
                                                           std::string &status_line) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(response);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      status_line = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }
  return headers;
}

} // namespace

std::string websocket_accept_key(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());
  return base64_encode(digest.data(), digest.size());
}

std::string generate_client_key() {
  std::array<unsigned char, 16> nonce{};
  fill_random(nonce.data(), nonce.size());
  return base64_encode(nonce.data(), nonce.size());
}

std::array<std::uint8_t, 4> generate_mask() {
  std::array<std::uint8_t, 4> mask{};
  fill_random(mask.data(), mask.size());
  return mask;
}

std::vector<std::uint8_t> encode_client_frame(const Opcode opcode, const std::string &payload,
                                              const std::array<std::uint8_t, 4> &mask) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (static_cast<std::uint8_t>(opcode) & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(0x80u | size));
  } else if (size <= 65535u) {
    frame.push_back(0x80u | 126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(0x80u | 127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(size) >>
                                                 static_cast<std::uint64_t>(shift)) &
                                                0xFFu));
    }
  }

  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<std::uint8_t>(payload[i]) ^ mask[i % mask.size()]);
  }
  return frame;
}

common::Result<std::optional<DecodedFrame>> decode_server_frame(const std::uint8_t *data,
                                                                const std::size_t size) {
  using DecodeResult = common::Result<std::optional<DecodedFrame>>;
  if (size < 2) {
    return DecodeResult::success(std::nullopt);
  }

  DecodedFrame frame;
  frame.fin = (data[0] & 0x80u) != 0;
  if ((data[0] & 0x70u) != 0) {
    return DecodeResult::failure(common::ErrorCode::TransportError,
                                 "reserved bits set in server frame");
  }
  frame.opcode = static_cast<Opcode>(data[0] & 0x0Fu);
  if ((data[1] & 0x80u) != 0) {
    return DecodeResult::failure(common::ErrorCode::TransportError, "server frames must not be masked");
  }

  std::size_t offset = 2;
  std::uint64_t payload_len = static_cast<std::uint64_t>(data[1] & 0x7Fu);
  if (payload_len == 126u) {
    if (size < offset + 2) {
      return DecodeResult::success(std::nullopt);
    }
    payload_len = (static_cast<std::uint64_t>(data[2]) << 8u) | static_cast<std::uint64_t>(data[3]);
    offset += 2;
  } else if (payload_len == 127u) {
    if (size < offset + 8) {
      return DecodeResult::success(std::nullopt);
    }
    payload_len = 0;
    for (std::size_t i = 0; i < 8; ++i) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(data[offset + i]);
    }
    offset += 8;
  }

  if (payload_len > kMaxFramePayloadBytes ||
      payload_len > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return DecodeResult::failure(common::ErrorCode::TransportError,
                                 "server frame exceeds " + std::to_string(kMaxFramePayloadBytes) +
                                     " bytes");
  }
  const auto length = static_cast<std::size_t>(payload_len);
  if (size < offset + length) {
    return DecodeResult::success(std::nullopt);
  }

  frame.payload.assign(reinterpret_cast<const char *>(data + offset), length);
  frame.consumed = offset + length;
  return DecodeResult::success(std::move(frame));
}

std::string build_handshake_request(const Endpoint &endpoint, const std::string &client_key) {
  std::ostringstream request;
  request << "GET " << endpoint.path << " HTTP/1.1\r\n";
  request << "Host: " << endpoint.host_header() << "\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Sec-WebSocket-Key: " << client_key << "\r\n";
  request << "Sec-WebSocket-Version: 13\r\n";
  request << "User-Agent: TapBridge/0.1\r\n";
  request << "\r\n";
  return request.str();
}

common::Status validate_handshake_response(const std::string &response,
                                           const std::string &client_key) {
  std::string status_line;
  const auto headers = parse_headers(response, status_line);
  std::istringstream status_stream(status_line);
  std::string version;
  int status = 0;
  status_stream >> version >> status;
  if (!common::starts_with(version, "HTTP/1.") || status != 101) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "websocket upgrade rejected: " + status_line);
  }

  const auto upgrade = headers.find("upgrade");
  if (upgrade == headers.end() || common::to_lower(upgrade->second) != "websocket") {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "websocket upgrade header missing");
  }
  const auto accept = headers.find("sec-websocket-accept");
  if (accept == headers.end() || accept->second != websocket_accept_key(client_key)) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "websocket accept key mismatch");
  }
  return common::Status::success();
}

} // namespace tapbridge::transport

#include "test_framework.hpp"

#include "tapbridge/transport/endpoint.hpp"
#include "tapbridge/transport/websocket_client.hpp"
#include "tapbridge/transport/websocket_frame.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

namespace tr = tapbridge::transport;

std::vector<std::uint8_t> server_frame(const tr::Opcode opcode, const std::string &payload,
                                       const bool fin = true) {
  std::vector<std::uint8_t> frame;
  frame.push_back(static_cast<std::uint8_t>((fin ? 0x80u : 0x00u) |
                                            static_cast<std::uint8_t>(opcode)));
  if (payload.size() <= 125) {
    frame.push_back(static_cast<std::uint8_t>(payload.size()));
  } else {
    frame.push_back(126);
    frame.push_back(static_cast<std::uint8_t>((payload.size() >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(payload.size() & 0xFFu));
  }
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

// Minimal single-connection websocket peer on 127.0.0.1 for exercising the client.
class LoopbackServer {
public:
  LoopbackServer() {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    (void)bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    (void)listen(listen_fd_, 1);
    socklen_t len = sizeof(addr);
    (void)getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackServer() {
    if (client_fd_ >= 0) {
      ::close(client_fd_);
    }
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
  }

  [[nodiscard]] std::uint16_t port() const { return port_; }

  /// Accepts the client and answers its upgrade. Returns the raw request.
  std::string accept_and_upgrade() {
    client_fd_ = accept(listen_fd_, nullptr, nullptr);
    timeval tv{.tv_sec = 5, .tv_usec = 0};
    (void)setsockopt(client_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    std::string request;
    char buf[512];
    while (request.find("\r\n\r\n") == std::string::npos) {
      const ssize_t n = recv(client_fd_, buf, sizeof(buf), 0);
      if (n <= 0) {
        return request;
      }
      request.append(buf, static_cast<std::size_t>(n));
    }
    const std::string marker = "Sec-WebSocket-Key: ";
    const auto start = request.find(marker) + marker.size();
    const std::string key = request.substr(start, request.find("\r\n", start) - start);
    const std::string response = "HTTP/1.1 101 Switching Protocols\r\n"
                                 "Upgrade: websocket\r\n"
                                 "Connection: Upgrade\r\n"
                                 "Sec-WebSocket-Accept: " +
                                 tr::websocket_accept_key(key) + "\r\n\r\n";
    (void)send(client_fd_, response.data(), response.size(), MSG_NOSIGNAL);
    return request;
  }

  void send_frame(const std::vector<std::uint8_t> &frame) {
    (void)send(client_fd_, frame.data(), frame.size(), MSG_NOSIGNAL);
  }

  /// Reads one masked client frame and returns its opcode and unmasked payload.
  std::pair<std::uint8_t, std::string> read_client_frame() {
    std::uint8_t header[2];
    read_exact(header, 2);
    std::size_t length = header[1] & 0x7Fu;
    if (length == 126) {
      std::uint8_t ext[2];
      read_exact(ext, 2);
      length = (static_cast<std::size_t>(ext[0]) << 8u) | ext[1];
    }
    std::uint8_t mask[4];
    read_exact(mask, 4);
    std::string payload(length, '\0');
    read_exact(reinterpret_cast<std::uint8_t *>(payload.data()), length);
    for (std::size_t i = 0; i < length; ++i) {
      payload[i] = static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]);
    }
    return {static_cast<std::uint8_t>(header[0] & 0x0Fu), payload};
  }

private:
  void read_exact(std::uint8_t *out, std::size_t size) {
    std::size_t got = 0;
    while (got < size) {
      const ssize_t n = recv(client_fd_, out + got, size - got, 0);
      if (n <= 0) {
        throw std::runtime_error("loopback peer closed early");
      }
      got += static_cast<std::size_t>(n);
    }
  }

  int listen_fd_ = -1;
  int client_fd_ = -1;
  std::uint16_t port_ = 0;
};

struct CallbackLog {
  std::mutex mutex;
  std::condition_variable cv;
  bool opened = false;
  bool closed = false;
  std::vector<std::string> texts;
  std::vector<std::string> errors;

  tr::TransportCallbacks callbacks() {
    return tr::TransportCallbacks{
        .on_open =
            [this] {
              std::lock_guard<std::mutex> lock(mutex);
              opened = true;
              cv.notify_all();
            },
        .on_text =
            [this](const std::string &text) {
              std::lock_guard<std::mutex> lock(mutex);
              texts.push_back(text);
              cv.notify_all();
            },
        .on_error =
            [this](const std::string &message) {
              std::lock_guard<std::mutex> lock(mutex);
              errors.push_back(message);
              cv.notify_all();
            },
        .on_close =
            [this] {
              std::lock_guard<std::mutex> lock(mutex);
              closed = true;
              cv.notify_all();
            },
    };
  }

  template <typename Pred> bool wait_for(Pred pred) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, std::chrono::seconds(5), pred);
  }
};

} // namespace

void register_transport_tests(std::vector<tapbridge::tests::TestCase> &tests) {
  using tapbridge::tests::require;

  tests.push_back({"accept_key_matches_rfc_example", [] {
                     require(tr::websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ==") ==
                                 "s3pPLMBiTxaQ9kYGJzPo+YGOPhs=",
                             "RFC 6455 sample accept key");
                     const std::string key = tr::generate_client_key();
                     require(key.size() == 24, "16 byte nonce encodes to 24 chars");
                   }});

  tests.push_back({"client_frames_are_masked", [] {
                     const std::array<std::uint8_t, 4> mask{0x01, 0x02, 0x03, 0x04};
                     const auto frame = tr::encode_client_frame(tr::Opcode::Text, "Hi", mask);
                     require(frame.size() == 2 + 4 + 2, "header, mask and payload");
                     require(frame[0] == 0x81, "fin and text opcode");
                     require(frame[1] == (0x80 | 2), "mask bit and length");
                     require(frame[6] == ('H' ^ 0x01) && frame[7] == ('i' ^ 0x02),
                             "payload masked");

                     const std::string medium(300, 'x');
                     const auto extended = tr::encode_client_frame(tr::Opcode::Text, medium, mask);
                     require(extended[1] == (0x80 | 126), "16 bit length marker");
                     require(extended[2] == 0x01 && extended[3] == 0x2C, "length 300");
                   }});

  tests.push_back({"decode_server_frame_waits_for_complete_frame", [] {
                     const auto frame = server_frame(tr::Opcode::Text, "hello");
                     const auto partial = tr::decode_server_frame(frame.data(), 4);
                     require(partial.ok() && !partial.value().has_value(), "needs more bytes");

                     const auto full = tr::decode_server_frame(frame.data(), frame.size());
                     require(full.ok() && full.value().has_value(), "complete frame decodes");
                     require(full.value()->payload == "hello", "payload");
                     require(full.value()->consumed == frame.size(), "consumed");
                     require(full.value()->opcode == tr::Opcode::Text, "opcode");
                   }});

  tests.push_back({"decode_server_frame_rejects_masked_and_oversized", [] {
                     std::vector<std::uint8_t> masked{0x81, 0x82, 0, 0, 0, 0, 'a', 'b'};
                     const auto rejected = tr::decode_server_frame(masked.data(), masked.size());
                     require(!rejected.ok(), "masked server frame rejected");
                     require(rejected.code() == tapbridge::common::ErrorCode::TransportError,
                             "transport error code");

                     std::vector<std::uint8_t> huge{0x82, 127, 0, 0, 0, 0, 0x7F, 0, 0, 0};
                     require(!tr::decode_server_frame(huge.data(), huge.size()).ok(),
                             "oversized frame rejected before payload arrives");
                   }});

  tests.push_back({"tunnel_urls_map_to_websocket_endpoints", [] {
                     const auto secure = tr::endpoint_from_tunnel_url("https://abc.tunnel.dev", "/ws");
                     require(secure.ok(), secure.error());
                     require(secure.value().secure && secure.value().port == 443, "wss default port");
                     require(secure.value().url() == "wss://abc.tunnel.dev/ws",
                             "url: " + secure.value().url());

                     const auto plain =
                         tr::endpoint_from_tunnel_url("http://10.0.0.5:9000/agent/", "bridge");
                     require(plain.ok(), plain.error());
                     require(!plain.value().secure && plain.value().port == 9000, "port kept");
                     require(plain.value().path == "/agent/bridge", "path: " + plain.value().path);

                     const auto ws = tr::endpoint_from_tunnel_url("ws://host:81", "/ws");
                     require(ws.ok() && ws.value().url() == "ws://host:81/ws", "ws kept plain");

                     require(!tr::endpoint_from_tunnel_url("ftp://host", "/ws").ok(),
                             "unsupported scheme");
                     require(!tr::endpoint_from_tunnel_url("not a url", "/ws").ok(),
                             "missing scheme");
                   }});

  tests.push_back({"parse_endpoint_handles_ipv6_and_bad_ports", [] {
                     const auto v6 = tr::parse_endpoint("ws://[::1]:8080/ws");
                     require(v6.ok(), v6.error());
                     require(v6.value().host == "::1" && v6.value().port == 8080, "ipv6 host");
                     require(v6.value().host_header() == "[::1]:8080", "bracketed host header");
                     require(!tr::parse_endpoint("ws://host:99999/").ok(), "port out of range");
                     require(!tr::parse_endpoint("ws://user@host/").ok(), "credentials rejected");
                   }});

  tests.push_back({"handshake_request_and_response_validation", [] {
                     const auto endpoint = tr::parse_endpoint("wss://abc.tunnel.dev/ws").value();
                     const std::string key = "dGhlIHNhbXBsZSBub25jZQ==";
                     const std::string request = tr::build_handshake_request(endpoint, key);
                     require(request.rfind("GET /ws HTTP/1.1\r\n", 0) == 0, "request line");
                     require(request.find("Host: abc.tunnel.dev\r\n") != std::string::npos, "host");
                     require(request.find("Sec-WebSocket-Key: " + key) != std::string::npos, "key");

                     const std::string good = "HTTP/1.1 101 Switching Protocols\r\n"
                                              "upgrade: WebSocket\r\n"
                                              "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGJzPo+YGOPhs=\r\n"
                                              "\r\n";
                     require(tr::validate_handshake_response(good, key).ok(), "valid upgrade");
                     require(!tr::validate_handshake_response(
                                  "HTTP/1.1 403 Forbidden\r\n\r\n", key)
                                  .ok(),
                             "rejected status");
                     const std::string wrong_key = "HTTP/1.1 101 Switching Protocols\r\n"
                                                   "Upgrade: websocket\r\n"
                                                   "Sec-WebSocket-Accept: nope\r\n\r\n";
                     require(!tr::validate_handshake_response(wrong_key, key).ok(),
                             "accept mismatch");
                   }});

  tests.push_back({"websocket_transport_send_before_open_fails", [] {
                     tr::WebSocketTransport transport;
                     const auto sent = transport.send_text("{}");
                     require(!sent.ok(), "send without a connection fails");
                     require(sent.code() == tapbridge::common::ErrorCode::NotConnected,
                             "not connected code");
                   }});

  tests.push_back({"websocket_transport_reports_refused_connection", [] {
                     std::uint16_t port = 0;
                     {
                       LoopbackServer closed_server;
                       port = closed_server.port();
                     }
                     CallbackLog log;
                     tr::WebSocketTransport transport({.verify_tls = true, .connect_timeout_ms = 2000});
                     const auto endpoint =
                         tr::parse_endpoint("ws://127.0.0.1:" + std::to_string(port) + "/ws");
                     require(endpoint.ok(), endpoint.error());
                     require(transport.open(endpoint.value(), log.callbacks()).ok(), "open starts");
                     require(log.wait_for([&] { return !log.errors.empty(); }),
                             "error callback fires");
                     std::lock_guard<std::mutex> lock(log.mutex);
                     require(!log.opened && !log.closed, "no other callback fired");
                   }});

  tests.push_back({"websocket_transport_exchanges_text_with_peer", [] {
                     LoopbackServer server;
                     std::string request;
                     std::pair<std::uint8_t, std::string> received;
                     std::string peer_error;
                     std::thread peer([&] {
                       try {
                         request = server.accept_and_upgrade();
                         server.send_frame(
                             server_frame(tr::Opcode::Text, "{\"type\":\"hel", false));
                         server.send_frame(server_frame(tr::Opcode::Continuation, "lo\"}"));
                         received = server.read_client_frame();
                         server.send_frame(
                             server_frame(tr::Opcode::Close, std::string("\x03\xe8", 2)));
                         (void)server.read_client_frame();
                       } catch (const std::exception &ex) {
                         peer_error = ex.what();
                       }
                     });

                     CallbackLog log;
                     tr::WebSocketTransport transport;
                     const auto endpoint = tr::parse_endpoint(
                         "ws://127.0.0.1:" + std::to_string(server.port()) + "/ws");
                     require(transport.open(endpoint.value(), log.callbacks()).ok(), "open starts");
                     const bool got_text = log.wait_for([&] { return !log.texts.empty(); });
                     if (got_text) {
                       (void)transport.send_text("{\"type\":\"ping\"}");
                     }
                     const bool closed = log.wait_for([&] { return log.closed; });
                     peer.join();
                     transport.close();

                     require(peer_error.empty(), "peer failed: " + peer_error);
                     require(got_text, "reassembled text delivered");
                     require(log.texts.front() == "{\"type\":\"hello\"}", "fragments joined");
                     require(request.find("GET /ws HTTP/1.1") != std::string::npos, "upgrade path");
                     require(received.first == 0x1 && received.second == "{\"type\":\"ping\"}",
                             "client frame unmasked by peer");
                     require(closed && log.errors.empty(), "clean close reported once");
                   }});
}

#include "tapbridge/transport/websocket_client.hpp"

#include "tapbridge/transport/websocket_frame.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

namespace tapbridge::transport {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;
constexpr std::size_t kReadChunkBytes = 16 * 1024;

ssize_t write_bytes(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_write(ssl, data, static_cast<int>(size)));
  }
  return send(fd, data, size, MSG_NOSIGNAL);
}

ssize_t read_bytes(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_read(ssl, data, static_cast<int>(size)));
  }
  return recv(fd, data, size, 0);
}

bool send_all(const int fd, SSL *ssl, const std::uint8_t *data, std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = write_bytes(fd, ssl, data + sent, size - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

void set_receive_timeout(const int fd, const std::uint64_t timeout_ms) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout_ms / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout_ms % 1000) * 1000);
  (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by timeout_ms; returns the connected socket or -1.
int connect_with_timeout(const addrinfo *addr, const std::uint64_t timeout_ms, std::string &error) {
  const int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
  if (fd < 0) {
    error = std::strerror(errno);
    return -1;
  }

  const int flags = fcntl(fd, F_GETFL, 0);
  (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  int rc = connect(fd, addr->ai_addr, addr->ai_addrlen);
  if (rc != 0 && errno == EINPROGRESS) {
    pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
    rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc == 0) {
      error = "connect timed out";
      ::close(fd);
      return -1;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (rc < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
      error = std::strerror(so_error != 0 ? so_error : errno);
      ::close(fd);
      return -1;
    }
  } else if (rc != 0) {
    error = std::strerror(errno);
    ::close(fd);
    return -1;
  }
  (void)fcntl(fd, F_SETFL, flags);
  return fd;
}

} // namespace

WebSocketTransport::WebSocketTransport(WebSocketClientOptions options)
    : options_(std::move(options)) {}

WebSocketTransport::~WebSocketTransport() {
  close();
  // Only reached when a callback dropped the last owner, which callers must not do: the
  // detached reader still unwinds through `this`.
  if (worker_.joinable()) {
    worker_.detach();
  }
  teardown();
}

common::Status WebSocketTransport::open(const Endpoint &endpoint, TransportCallbacks callbacks) {
  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id()) {
      return common::Status::error(common::ErrorCode::TransportError,
                                   "cannot reopen a transport from its own callback");
    }
    close();
  }
  closing_ = false;
  open_ = false;
  callbacks_ = std::move(callbacks);
  worker_ = std::thread([this, endpoint]() { run(endpoint); });
  return common::Status::success();
}

void WebSocketTransport::close() {
  closing_ = true;
  if (open_.exchange(false)) {
    (void)send_frame(static_cast<std::uint8_t>(Opcode::Close), std::string("\x03\xe8", 2));
  }
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (fd_ >= 0) {
      shutdown(fd_, SHUT_RDWR);
    }
  }
  join_worker();
}

common::Status WebSocketTransport::send_text(const std::string &payload) {
  if (!open_) {
    return common::Status::error(common::ErrorCode::NotConnected, "websocket is not open");
  }
  if (!send_frame(static_cast<std::uint8_t>(Opcode::Text), payload)) {
    return common::Status::error(common::ErrorCode::TransportError, "websocket write failed");
  }
  return common::Status::success();
}

void WebSocketTransport::run(Endpoint endpoint) {
  const auto established = establish(endpoint);
  if (!established.ok()) {
    teardown();
    if (!closing_ && callbacks_.on_error) {
      callbacks_.on_error(established.error());
    }
    return;
  }

  open_ = true;
  if (!closing_ && callbacks_.on_open) {
    callbacks_.on_open();
  }

  const auto outcome = read_loop();
  open_ = false;
  teardown();
  if (closing_) {
    return;
  }
  if (outcome.ok()) {
    if (callbacks_.on_close) {
      callbacks_.on_close();
    }
  } else if (callbacks_.on_error) {
    callbacks_.on_error(outcome.error());
  }
}

common::Status WebSocketTransport::establish(const Endpoint &endpoint) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *resolved = nullptr;
  const std::string port = std::to_string(endpoint.port);
  const int gai = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &resolved);
  if (gai != 0) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "resolve " + endpoint.host + ": " + gai_strerror(gai));
  }

  int fd = -1;
  std::string connect_error = "no addresses";
  for (const addrinfo *addr = resolved; addr != nullptr && fd < 0; addr = addr->ai_next) {
    fd = connect_with_timeout(addr, options_.connect_timeout_ms, connect_error);
  }
  freeaddrinfo(resolved);
  if (fd < 0) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "connect " + endpoint.host + ":" + port + ": " + connect_error);
  }

  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    fd_ = fd;
  }
  if (closing_) {
    return common::Status::error(common::ErrorCode::TransportError, "closed while connecting");
  }
  set_receive_timeout(fd, options_.connect_timeout_ms);

  if (endpoint.secure) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    tls_ctx_ = SSL_CTX_new(TLS_client_method());
    if (tls_ctx_ == nullptr) {
      return common::Status::error(common::ErrorCode::TransportError,
                                   "failed to initialize TLS context: " + openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);
    if (options_.verify_tls) {
      SSL_CTX_set_default_verify_paths(tls_ctx_);
      SSL_CTX_set_verify(tls_ctx_, SSL_VERIFY_PEER, nullptr);
    }
    ssl_ = SSL_new(tls_ctx_);
    if (ssl_ == nullptr) {
      return common::Status::error(common::ErrorCode::TransportError,
                                   "failed to create TLS session: " + openssl_error_string());
    }
    SSL_set_tlsext_host_name(ssl_, endpoint.host.c_str());
    if (options_.verify_tls) {
      SSL_set1_host(ssl_, endpoint.host.c_str());
    }
    SSL_set_fd(ssl_, fd_);
    if (SSL_connect(ssl_) <= 0) {
      return common::Status::error(common::ErrorCode::TransportError,
                                   "TLS handshake with " + endpoint.host +
                                       " failed: " + openssl_error_string());
    }
  }

  const std::string key = generate_client_key();
  const std::string request = build_handshake_request(endpoint, key);
  if (!send_all(fd_, ssl_, reinterpret_cast<const std::uint8_t *>(request.data()),
                request.size())) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "failed to send websocket upgrade");
  }

  std::string response;
  std::array<char, 1024> buf{};
  std::size_t header_end = std::string::npos;
  while (response.size() < kMaxHandshakeBytes) {
    const ssize_t n =
        read_bytes(fd_, ssl_, reinterpret_cast<std::uint8_t *>(buf.data()), buf.size());
    if (n <= 0) {
      return common::Status::error(common::ErrorCode::TransportError,
                                   "connection closed during websocket upgrade");
    }
    response.append(buf.data(), static_cast<std::size_t>(n));
    header_end = response.find("\r\n\r\n");
    if (header_end != std::string::npos) {
      break;
    }
  }
  if (header_end == std::string::npos) {
    return common::Status::error(common::ErrorCode::TransportError,
                                 "websocket upgrade response too large");
  }

  const auto accepted = validate_handshake_response(response.substr(0, header_end + 4), key);
  if (!accepted.ok()) {
    return accepted;
  }

  // Frames sent immediately after the upgrade arrive in the same read.
  const std::string leftover = response.substr(header_end + 4);
  pending_.assign(leftover.begin(), leftover.end());
  set_receive_timeout(fd_, 0);
  return common::Status::success();
}

common::Status WebSocketTransport::read_loop() {
  std::vector<std::uint8_t> buffer = std::move(pending_);
  pending_.clear();
  std::string message;
  bool assembling = false;
  std::array<std::uint8_t, kReadChunkBytes> chunk{};

  while (!closing_) {
    auto decoded = decode_server_frame(buffer.data(), buffer.size());
    if (!decoded.ok()) {
      return decoded.status();
    }
    if (!decoded.value().has_value()) {
      const ssize_t n = read_bytes(fd_, ssl_, chunk.data(), chunk.size());
      if (n == 0) {
        return common::Status::success();
      }
      if (n < 0) {
        if (closing_) {
          return common::Status::success();
        }
        return common::Status::error(common::ErrorCode::TransportError, "websocket read failed");
      }
      buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + n);
      continue;
    }

    DecodedFrame frame = std::move(*decoded.value());
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<long>(frame.consumed));

    switch (frame.opcode) {
    case Opcode::Ping:
      (void)send_frame(static_cast<std::uint8_t>(Opcode::Pong), frame.payload);
      break;
    case Opcode::Pong:
      break;
    case Opcode::Close:
      (void)send_frame(static_cast<std::uint8_t>(Opcode::Close), frame.payload.substr(0, 2));
      return common::Status::success();
    case Opcode::Text:
    case Opcode::Binary:
      if (frame.fin) {
        if (callbacks_.on_text && !closing_) {
          callbacks_.on_text(frame.payload);
        }
      } else {
        message = std::move(frame.payload);
        assembling = true;
      }
      break;
    case Opcode::Continuation:
      if (!assembling) {
        return common::Status::error(common::ErrorCode::TransportError,
                                     "unexpected continuation frame");
      }
      message += frame.payload;
      if (message.size() > kMaxFramePayloadBytes) {
        return common::Status::error(common::ErrorCode::TransportError,
                                     "fragmented message too large");
      }
      if (frame.fin) {
        assembling = false;
        if (callbacks_.on_text && !closing_) {
          callbacks_.on_text(message);
        }
        message.clear();
      }
      break;
    default:
      return common::Status::error(common::ErrorCode::TransportError, "unknown websocket opcode");
    }
  }
  return common::Status::success();
}

bool WebSocketTransport::send_frame(const std::uint8_t opcode, const std::string &payload) {
  const auto frame = encode_client_frame(static_cast<Opcode>(opcode), payload, generate_mask());
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (fd_ < 0) {
    return false;
  }
  return send_all(fd_, ssl_, frame.data(), frame.size());
}

void WebSocketTransport::teardown() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (ssl_ != nullptr) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void WebSocketTransport::join_worker() {
  if (!worker_.joinable()) {
    return;
  }
  // A callback may close its own transport; the reader exits once the callback returns.
  if (worker_.get_id() == std::this_thread::get_id()) {
    return;
  }
  worker_.join();
}

} // namespace tapbridge::transport

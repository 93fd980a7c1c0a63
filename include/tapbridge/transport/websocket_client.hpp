#pragma once

#include "tapbridge/transport/transport.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tapbridge::transport {

struct WebSocketClientOptions {
  bool verify_tls = true;
  std::uint64_t connect_timeout_ms = 10'000;
};

/// RFC 6455 client over a blocking socket with an optional TLS layer. One reader
/// thread per open connection; no retries. Callbacks run on the reader thread and must
/// not release the last reference to the transport.
class WebSocketTransport final : public ITransport {
public:
  explicit WebSocketTransport(WebSocketClientOptions options = {});
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  [[nodiscard]] common::Status open(const Endpoint &endpoint, TransportCallbacks callbacks) override;
  void close() override;
  [[nodiscard]] common::Status send_text(const std::string &payload) override;

  [[nodiscard]] bool is_open() const { return open_.load(); }

private:
  void run(Endpoint endpoint);
  [[nodiscard]] common::Status establish(const Endpoint &endpoint);
  [[nodiscard]] common::Status read_loop();
  [[nodiscard]] bool send_frame(std::uint8_t opcode, const std::string &payload);
  void teardown();
  void join_worker();

  WebSocketClientOptions options_;
  TransportCallbacks callbacks_;

  std::atomic<bool> open_{false};
  std::atomic<bool> closing_{false};
  std::thread worker_;

  std::mutex io_mutex_;
  int fd_ = -1;
  SSL_CTX *tls_ctx_ = nullptr;
  SSL *ssl_ = nullptr;
  std::vector<std::uint8_t> pending_;
};

} // namespace tapbridge::transport

#pragma once

#include "tapbridge/common/result.hpp"
#include "tapbridge/transport/endpoint.hpp"

#include <functional>
#include <memory>
#include <string>

namespace tapbridge::transport {

/// Callbacks fire from the transport's own thread. After a terminal callback
/// (`on_error` or `on_close`) or a local `close()`, no further callbacks are made.
struct TransportCallbacks {
  std::function<void()> on_open;
  std::function<void(const std::string &)> on_text;
  std::function<void(const std::string &)> on_error;
  std::function<void()> on_close;
};

class ITransport {
public:
  virtual ~ITransport() = default;

  /// Starts connecting and returns immediately; the outcome arrives through callbacks.
  [[nodiscard]] virtual common::Status open(const Endpoint &endpoint,
                                            TransportCallbacks callbacks) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual common::Status send_text(const std::string &payload) = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

} // namespace tapbridge::transport

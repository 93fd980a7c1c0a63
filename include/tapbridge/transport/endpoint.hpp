#pragma once

#include "tapbridge/common/result.hpp"

#include <cstdint>
#include <string>

namespace tapbridge::transport {

struct Endpoint {
  bool secure = false;
  std::string host;
  std::uint16_t port = 0;
  std::string path = "/";

  [[nodiscard]] std::string url() const;
  /// Value for the HTTP Host header; the port is omitted when it is the scheme default.
  [[nodiscard]] std::string host_header() const;
};

/// Parses a `ws://` or `wss://` URL.
[[nodiscard]] common::Result<Endpoint> parse_endpoint(const std::string &url);

/// Maps a machine tunnel URL to its daemon socket: http becomes ws, https becomes wss,
/// and `ws_path` is appended to whatever path the tunnel URL carries.
[[nodiscard]] common::Result<Endpoint> endpoint_from_tunnel_url(const std::string &tunnel_url,
                                                                const std::string &ws_path = "/ws");

} // namespace tapbridge::transport

#include "tapbridge/transport/endpoint.hpp"

#include "tapbridge/common/fs.hpp"

#include <charconv>

namespace tapbridge::transport {

namespace {

struct UrlParts {
  std::string scheme;
  std::string authority;
  std::string path;
};

common::Result<UrlParts> split_url(const std::string &raw) {
  const std::string url = common::trim(raw);
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return common::Result<UrlParts>::failure(common::ErrorCode::InvalidArgument,
                                             "missing URL scheme: " + raw);
  }

  UrlParts parts;
  parts.scheme = common::to_lower(url.substr(0, scheme_end));
  const std::string rest = url.substr(scheme_end + 3);
  const auto authority_end = rest.find_first_of("/?#");
  parts.authority = rest.substr(0, authority_end);
  if (authority_end != std::string::npos) {
    std::string tail = rest.substr(authority_end);
    const auto fragment = tail.find('#');
    if (fragment != std::string::npos) {
      tail.erase(fragment);
    }
    if (!tail.empty() && tail.front() != '/') {
      tail.insert(tail.begin(), '/');
    }
    parts.path = tail;
  }

  if (parts.authority.empty()) {
    return common::Result<UrlParts>::failure(common::ErrorCode::InvalidArgument,
                                             "missing host: " + raw);
  }
  if (parts.authority.find('@') != std::string::npos) {
    return common::Result<UrlParts>::failure(common::ErrorCode::InvalidArgument,
                                             "credentials in URL are not supported: " + raw);
  }
  return common::Result<UrlParts>::success(std::move(parts));
}

common::Status split_authority(const std::string &authority, const bool secure, Endpoint &out) {
  std::string host;
  std::string port_text;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "unterminated IPv6 host: " + authority);
    }
    host = authority.substr(1, close - 1);
    const std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return common::Status::error(common::ErrorCode::InvalidArgument,
                                     "invalid authority: " + authority);
      }
      port_text = after.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (host.empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "missing host: " + authority);
  }

  out.host = host;
  out.port = secure ? 443 : 80;
  if (!port_text.empty()) {
    unsigned int port = 0;
    const auto *first = port_text.data();
    const auto *last = first + port_text.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0 || port > 65535) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "invalid port: " + port_text);
    }
    out.port = static_cast<std::uint16_t>(port);
  }
  return common::Status::success();
}

} // namespace

std::string Endpoint::url() const {
  return std::string(secure ? "wss://" : "ws://") + host_header() + path;
}

std::string Endpoint::host_header() const {
  const bool default_port = (secure && port == 443) || (!secure && port == 80);
  const std::string bracketed = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return default_port ? bracketed : bracketed + ":" + std::to_string(port);
}

common::Result<Endpoint> parse_endpoint(const std::string &url) {
  auto parts = split_url(url);
  if (!parts.ok()) {
    return common::Result<Endpoint>::failure(parts.code(), parts.error());
  }

  Endpoint endpoint;
  if (parts.value().scheme == "wss") {
    endpoint.secure = true;
  } else if (parts.value().scheme != "ws") {
    return common::Result<Endpoint>::failure(common::ErrorCode::InvalidArgument,
                                             "unsupported scheme: " + parts.value().scheme);
  }

  if (auto status = split_authority(parts.value().authority, endpoint.secure, endpoint);
      !status.ok()) {
    return common::Result<Endpoint>::failure(status.code(), status.error());
  }
  endpoint.path = parts.value().path.empty() ? "/" : parts.value().path;
  return common::Result<Endpoint>::success(std::move(endpoint));
}

common::Result<Endpoint> endpoint_from_tunnel_url(const std::string &tunnel_url,
                                                  const std::string &ws_path) {
  auto parts = split_url(tunnel_url);
  if (!parts.ok()) {
    return common::Result<Endpoint>::failure(parts.code(), parts.error());
  }

  const std::string &scheme = parts.value().scheme;
  std::string ws_scheme;
  if (scheme == "http" || scheme == "ws") {
    ws_scheme = "ws";
  } else if (scheme == "https" || scheme == "wss") {
    ws_scheme = "wss";
  } else {
    return common::Result<Endpoint>::failure(common::ErrorCode::InvalidArgument,
                                             "unsupported tunnel scheme: " + scheme);
  }

  std::string path = parts.value().path;
  const auto query = path.find('?');
  if (query != std::string::npos) {
    path.erase(query);
  }
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  std::string suffix = ws_path.empty() ? "/ws" : ws_path;
  if (suffix.front() != '/') {
    suffix.insert(suffix.begin(), '/');
  }

  return parse_endpoint(ws_scheme + "://" + parts.value().authority + path + suffix);
}

} // namespace tapbridge::transport

#pragma once

#include "tapbridge/bridge/bridge.hpp"
#include "tapbridge/common/http.hpp"
#include "tapbridge/config/schema.hpp"

#include <memory>

namespace tapbridge::bridge {

/// Collaborators for `config`: WebSocket transports, the configured machine directory,
/// preferences store and notifier, and the approval journal when enabled. `http` may be
/// null, in which case a curl client is created.
[[nodiscard]] BridgeDependencies make_dependencies(const config::Config &config,
                                                   std::shared_ptr<common::HttpClient> http = nullptr);

[[nodiscard]] std::unique_ptr<Bridge> create_bridge(const config::Config &config);

} // namespace tapbridge::bridge

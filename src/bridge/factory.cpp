#include "tapbridge/bridge/factory.hpp"

#include "tapbridge/config/config.hpp"
#include "tapbridge/observability/global.hpp"
#include "tapbridge/transport/websocket_client.hpp"

namespace tapbridge::bridge {

namespace {

std::shared_ptr<security::IApprovalJournal> open_journal(const config::Config &config) {
  if (!config.journal.enabled) {
    return nullptr;
  }
  auto journal = std::make_shared<security::SqliteApprovalJournal>(
      config::expand_config_path(config.journal.path));
  if (const auto status = journal->status(); !status.ok()) {
    // Decisions still resolve at most once in memory; they are just not persisted.
    observability::record_error("journal", status.error());
    return nullptr;
  }
  return journal;
}

} // namespace

BridgeDependencies make_dependencies(const config::Config &config,
                                     std::shared_ptr<common::HttpClient> http) {
  if (http == nullptr) {
    http = std::make_shared<common::CurlHttpClient>();
  }

  const transport::WebSocketClientOptions ws_options{
      .verify_tls = config.transport.verify_tls,
      .connect_timeout_ms = config.transport.connect_timeout_ms,
  };

  BridgeDependencies deps;
  deps.transport_factory = [ws_options]() -> std::unique_ptr<transport::ITransport> {
    return std::make_unique<transport::WebSocketTransport>(ws_options);
  };
  deps.connection_options = connection::MachineConnectionOptions{
      .token = config.api.token,
      .ws_path = config.transport.ws_path,
  };
  deps.directory = directory::create_machine_directory(config, http);
  deps.preferences = directory::create_preferences_store(config, http);
  deps.notifier = notify::create_notifier(config);
  deps.journal = open_journal(config);
  return deps;
}

std::unique_ptr<Bridge> create_bridge(const config::Config &config) {
  return std::make_unique<Bridge>(make_dependencies(config));
}

} // namespace tapbridge::bridge

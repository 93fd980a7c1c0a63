#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tapbridge::config {

struct ApiConfig {
  std::string base_url = "https://api.agentap.dev";
  std::string token;
  std::uint64_t timeout_ms = 10'000;
};

struct DirectoryConfig {
  std::string source = "api"; // "api" or "static"
};

struct StaticMachineConfig {
  std::string id;
  std::string name;
  std::string tunnel_url;
  bool online = true;
};

struct PreferencesConfig {
  std::string source = "api"; // "api" or "static"
  bool auto_approve_low = false;
  bool auto_approve_medium = false;
  bool auto_approve_high = false;
  bool auto_approve_critical = false;
};

struct TransportConfig {
  std::string ws_path = "/ws";
  bool verify_tls = true;
  std::uint64_t connect_timeout_ms = 10'000;
};

struct NotificationsConfig {
  std::string backend = "log";
};

struct JournalConfig {
  bool enabled = true;
  std::string path = "~/.tapbridge/approvals.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ApiConfig api;
  DirectoryConfig directory;
  std::vector<StaticMachineConfig> machines;
  PreferencesConfig preferences;
  TransportConfig transport;
  NotificationsConfig notifications;
  JournalConfig journal;
  ObservabilityConfig observability;
};

} // namespace tapbridge::config

#include "tapbridge/config/config.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace tapbridge::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tapbridge";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TAPBRIDGE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TAPBRIDGE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

void load_machines(Config &config, const common::TomlDocument &doc) {
  for (const auto &id : doc.child_tables("machines")) {
    const std::string prefix = "machines." + id + ".";
    StaticMachineConfig machine;
    machine.id = id;
    machine.name = doc.get_string(prefix + "name", id);
    machine.tunnel_url = expand_config_value(doc.get_string(prefix + "tunnel_url"));
    machine.online = doc.get_bool(prefix + "online", true);
    config.machines.push_back(std::move(machine));
  }
}

bool is_http_url(const std::string &url) {
  const std::string lowered = common::to_lower(common::trim(url));
  return common::starts_with(lowered, "http://") || common::starts_with(lowered, "https://");
}

bool is_tunnel_url(const std::string &url) {
  const std::string lowered = common::to_lower(common::trim(url));
  return is_http_url(lowered) || common::starts_with(lowered, "ws://") ||
         common::starts_with(lowered, "wss://");
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::ConfigError, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *url = std::getenv("TAPBRIDGE_API_URL"); url != nullptr && *url) {
    config.api.base_url = url;
  }
  if (const char *token = std::getenv("TAPBRIDGE_TOKEN"); token != nullptr && *token) {
    config.api.token = token;
  }
  if (const char *backend = std::getenv("TAPBRIDGE_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError, parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.api.base_url = expand_config_value(doc.get_string("api.base_url", config.api.base_url));
  config.api.token = expand_config_value(doc.get_string("api.token", config.api.token));
  config.api.timeout_ms = doc.get_u64("api.timeout_ms", config.api.timeout_ms);

  config.directory.source = doc.get_string("directory.source", config.directory.source);
  load_machines(config, doc);

  config.preferences.source = doc.get_string("preferences.source", config.preferences.source);
  config.preferences.auto_approve_low =
      doc.get_bool("preferences.auto_approve_low", config.preferences.auto_approve_low);
  config.preferences.auto_approve_medium =
      doc.get_bool("preferences.auto_approve_medium", config.preferences.auto_approve_medium);
  config.preferences.auto_approve_high =
      doc.get_bool("preferences.auto_approve_high", config.preferences.auto_approve_high);
  config.preferences.auto_approve_critical =
      doc.get_bool("preferences.auto_approve_critical", config.preferences.auto_approve_critical);

  config.transport.ws_path = doc.get_string("transport.ws_path", config.transport.ws_path);
  config.transport.verify_tls = doc.get_bool("transport.verify_tls", config.transport.verify_tls);
  config.transport.connect_timeout_ms =
      doc.get_u64("transport.connect_timeout_ms", config.transport.connect_timeout_ms);

  config.notifications.backend =
      doc.get_string("notifications.backend", config.notifications.backend);

  config.journal.enabled = doc.get_bool("journal.enabled", config.journal.enabled);
  config.journal.path = expand_config_path(doc.get_string("journal.path", config.journal.path));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.journal.path = expand_config_path(config.journal.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           path.string() + ": " + parsed.error());
  }

  apply_env_overrides(parsed.value());
  return parsed;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorCode::StorageError,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorCode::StorageError,
                                 "Unable to write temporary config file");
  }

  file << "[api]\n";
  file << "base_url = " << common::quote_toml_string(config.api.base_url) << "\n";
  if (!config.api.token.empty()) {
    file << "token = " << common::quote_toml_string(config.api.token) << "\n";
  }
  file << "timeout_ms = " << config.api.timeout_ms << "\n";

  file << "\n[directory]\n";
  file << "source = " << common::quote_toml_string(config.directory.source) << "\n";

  for (const auto &machine : config.machines) {
    file << "\n[machines." << machine.id << "]\n";
    file << "name = " << common::quote_toml_string(machine.name) << "\n";
    file << "tunnel_url = " << common::quote_toml_string(machine.tunnel_url) << "\n";
    file << "online = " << bool_to_toml(machine.online) << "\n";
  }

  file << "\n[preferences]\n";
  file << "source = " << common::quote_toml_string(config.preferences.source) << "\n";
  file << "auto_approve_low = " << bool_to_toml(config.preferences.auto_approve_low) << "\n";
  file << "auto_approve_medium = " << bool_to_toml(config.preferences.auto_approve_medium) << "\n";
  file << "auto_approve_high = " << bool_to_toml(config.preferences.auto_approve_high) << "\n";
  file << "auto_approve_critical = " << bool_to_toml(config.preferences.auto_approve_critical)
       << "\n";

  file << "\n[transport]\n";
  file << "ws_path = " << common::quote_toml_string(config.transport.ws_path) << "\n";
  file << "verify_tls = " << bool_to_toml(config.transport.verify_tls) << "\n";
  file << "connect_timeout_ms = " << config.transport.connect_timeout_ms << "\n";

  file << "\n[notifications]\n";
  file << "backend = " << common::quote_toml_string(config.notifications.backend) << "\n";

  file << "\n[journal]\n";
  file << "enabled = " << bool_to_toml(config.journal.enabled) << "\n";
  file << "path = " << common::quote_toml_string(config.journal.path) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error(common::ErrorCode::StorageError,
                                 "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::StorageError,
                                 "Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string directory_source = common::to_lower(common::trim(config.directory.source));
  if (directory_source != "api" && directory_source != "static") {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "Invalid directory.source: " + config.directory.source);
  }

  const std::string preferences_source = common::to_lower(common::trim(config.preferences.source));
  if (preferences_source != "api" && preferences_source != "static") {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "Invalid preferences.source: " + config.preferences.source);
  }

  const bool uses_api = directory_source == "api" || preferences_source == "api";
  if (uses_api && !is_http_url(config.api.base_url)) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "api.base_url must be an http(s) URL: " + config.api.base_url);
  }
  if (config.api.timeout_ms == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError, "api.timeout_ms must be > 0");
  }

  std::unordered_set<std::string> seen_ids;
  for (const auto &machine : config.machines) {
    if (!seen_ids.insert(machine.id).second) {
      return Warnings::failure(common::ErrorCode::ConfigError,
                               "Duplicate machine id: " + machine.id);
    }
    if (!machine.tunnel_url.empty() && !is_tunnel_url(machine.tunnel_url)) {
      return Warnings::failure(common::ErrorCode::ConfigError,
                               "machines." + machine.id + ".tunnel_url is not a URL: " +
                                   machine.tunnel_url);
    }
    if (machine.tunnel_url.empty()) {
      warnings.push_back("machines." + machine.id + " has no tunnel_url and will be skipped");
    }
  }
  if (directory_source == "static" && config.machines.empty()) {
    warnings.push_back("directory.source is static but no [machines.<id>] tables are defined");
  }

  if (config.transport.ws_path.empty() || config.transport.ws_path.front() != '/') {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "transport.ws_path must start with '/': " + config.transport.ws_path);
  }
  if (config.transport.connect_timeout_ms == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "transport.connect_timeout_ms must be > 0");
  }
  if (!config.transport.verify_tls) {
    warnings.push_back("transport.verify_tls is disabled; wss:// peers are not authenticated");
  }

  const std::string notify_backend = common::to_lower(common::trim(config.notifications.backend));
  if (notify_backend != "log" && notify_backend != "none") {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "Invalid notifications.backend: " + config.notifications.backend);
  }

  if (config.journal.enabled && common::trim(config.journal.path).empty()) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "journal.path is required when the journal is enabled");
  }

  bool token_missing = common::trim(config.api.token).empty();
  if (token_missing && std::getenv("TAPBRIDGE_TOKEN") != nullptr) {
    token_missing = false;
  }
  if (token_missing) {
    warnings.push_back("api.token is missing (config api.token or TAPBRIDGE_TOKEN)");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace tapbridge::config

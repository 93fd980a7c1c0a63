#include "tapbridge/cli/commands.hpp"

#include "tapbridge/bridge/factory.hpp"
#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/http.hpp"
#include "tapbridge/config/config.hpp"
#include "tapbridge/directory/directory.hpp"
#include "tapbridge/observability/factory.hpp"
#include "tapbridge/observability/global.hpp"
#include "tapbridge/security/journal.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace tapbridge::cli {

namespace {

constexpr auto kSettleTimeout = std::chrono::seconds(5);
constexpr auto kKeepaliveInterval = std::chrono::seconds(30);
constexpr auto kDrainInterval = std::chrono::milliseconds(200);
constexpr std::size_t kPreviewLimit = 160;

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string version_string() {
#ifdef TAPBRIDGE_VERSION
  std::string version = TAPBRIDGE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "tapbridge " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::vector<std::string> split_words(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> words;
  std::string word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

// Everything after the first `skip` words, with its original spacing.
std::string rest_of_line(const std::string &line, const std::size_t skip) {
  std::size_t pos = 0;
  for (std::size_t i = 0; i < skip; ++i) {
    pos = line.find_first_not_of(" \t", pos);
    if (pos == std::string::npos) {
      return "";
    }
    pos = line.find_first_of(" \t", pos);
    if (pos == std::string::npos) {
      return "";
    }
  }
  return common::trim(line.substr(pos));
}

std::string shorten(const std::string &text) {
  std::string flat = text;
  for (auto &ch : flat) {
    if (ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  }
  if (flat.size() <= kPreviewLimit) {
    return flat;
  }
  return flat.substr(0, kPreviewLimit) + "...";
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.code(), validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

// Waits until no machine is still connecting, or the timeout passes.
void wait_for_settle(bridge::Bridge &bridge, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto snapshot = bridge.connection_snapshot();
    bool pending = false;
    for (const auto &[id, status] : snapshot.machines) {
      if (status == connection::ConnectionStatus::Connecting) {
        pending = true;
      }
    }
    if (!pending) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

int run_status() {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto bridge = bridge::create_bridge(cfg.value());
  const auto attempts = bridge->connect_all();
  if (!attempts.ok()) {
    std::cerr << "machine directory: " << attempts.error() << "\n";
    std::cout << format_snapshot(bridge->connection_snapshot());
    return 1;
  }
  wait_for_settle(*bridge, kSettleTimeout);
  // Give connected machines a moment to announce their sessions.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  std::cout << format_snapshot(bridge->connection_snapshot());
  const auto sessions = bridge->sessions();
  std::cout << "Sessions: " << sessions.size() << "\n";
  for (const auto &session : sessions) {
    std::cout << "  " << format_session(session) << "\n";
  }
  bridge->disconnect_all();
  return 0;
}

int run_machines() {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto directory = directory::create_machine_directory(
      cfg.value(), std::make_shared<common::CurlHttpClient>());
  auto machines = directory->list();
  if (!machines.ok()) {
    std::cerr << "machine directory (" << directory->name() << "): " << machines.error() << "\n";
    return 1;
  }
  if (machines.value().empty()) {
    std::cout << "No machines linked.\n";
    return 0;
  }
  for (const auto &machine : machines.value()) {
    std::cout << machine.id << "  " << (machine.name.empty() ? "-" : machine.name) << "  "
              << (machine.is_online ? "online" : "offline") << "  "
              << machine.tunnel_url.value_or("(no tunnel)")
              << (machine.connectable() ? "" : "  [skipped]") << "\n";
  }
  return 0;
}

int run_watch() {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto bridge = bridge::create_bridge(cfg.value());
  WatchShell shell(*bridge, std::cout);

  const auto listener = bridge->add_status_listener([](const connection::ConnectionSnapshot &s) {
    std::cerr << "[status] " << connection::connection_status_name(s.status) << " ("
              << s.machines.size() << " tracked)\n";
  });
  const auto attempts = bridge->connect_all();
  if (!attempts.ok()) {
    std::cerr << "machine directory: " << attempts.error() << "\n";
  } else {
    std::cout << "Connecting to " << attempts.value() << " machine(s). Type 'help' for commands.\n";
  }

  std::atomic<bool> running{true};
  std::thread pump([&] {
    auto last_ping = std::chrono::steady_clock::now();
    while (running.load()) {
      shell.drain_events();
      if (std::chrono::steady_clock::now() - last_ping >= kKeepaliveInterval) {
        bridge->keepalive();
        last_ping = std::chrono::steady_clock::now();
      }
      std::this_thread::sleep_for(kDrainInterval);
    }
  });

  std::string line;
  while (std::getline(std::cin, line)) {
    if (!shell.execute(line)) {
      break;
    }
  }

  running.store(false);
  pump.join();
  bridge->remove_status_listener(listener);
  bridge->disconnect_all();
  return 0;
}

int run_journal(const std::vector<std::string> &args) {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::size_t limit = 20;
  if (!args.empty()) {
    try {
      limit = static_cast<std::size_t>(std::stoul(args[0]));
    } catch (const std::exception &) {
      std::cerr << "usage: tapbridge journal [limit]\n";
      return 1;
    }
  }

  security::SqliteApprovalJournal journal(config::expand_config_path(cfg.value().journal.path));
  if (const auto status = journal.status(); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  auto entries = journal.recent(limit);
  if (!entries.ok()) {
    std::cerr << entries.error() << "\n";
    return 1;
  }
  for (const auto &entry : entries.value()) {
    std::cout << common::format_iso8601(entry.resolved_at) << "  " << entry.request_id << "  "
              << security::approval_state_name(entry.state) << " by "
              << security::resolved_by_name(entry.resolved_by) << "  ["
              << security::risk_tier_name(entry.risk_tier) << "]  " << entry.machine_id << "/"
              << entry.session_id << "\n";
  }
  return 0;
}

int run_config(const std::vector<std::string> &args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (!args.empty() && args[0] == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config OK\n";
    return 0;
  }

  if (args.empty() || args[0] == "show") {
    const auto &c = cfg.value();
    std::cout << "API: " << c.api.base_url << (c.api.token.empty() ? " (no token)" : "") << "\n";
    std::cout << "Directory: " << c.directory.source << "\n";
    std::cout << "Static machines: " << c.machines.size() << "\n";
    std::cout << "Preferences: " << c.preferences.source << "\n";
    std::cout << "WebSocket path: " << c.transport.ws_path
              << (c.transport.verify_tls ? "" : " (TLS verification off)") << "\n";
    std::cout << "Notifications: " << c.notifications.backend << "\n";
    std::cout << "Journal: " << (c.journal.enabled ? c.journal.path : "disabled") << "\n";
    std::cout << "Observability: " << c.observability.backend << "\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: tapbridge [--config PATH] <command> [options]\n\n";
  std::cout << "  status            Connect, then show connection state and sessions\n";
  std::cout << "  machines          List linked machines from the directory\n";
  std::cout << "  watch             Interactive session: follow sessions, approve, deny\n";
  std::cout << "  journal [N]       Show the N most recent approval decisions\n";
  std::cout << "  config show       Display the current configuration\n";
  std::cout << "  config validate   Check the configuration file\n";
  std::cout << "  config path       Print the configuration file path\n";
  std::cout << "  version           Show version\n";
}

} // namespace

std::string format_snapshot(const connection::ConnectionSnapshot &snapshot) {
  std::ostringstream out;
  out << "Status: " << connection::connection_status_name(snapshot.status) << "\n";
  if (snapshot.error.has_value()) {
    out << "Error: " << *snapshot.error << "\n";
  }
  if (snapshot.last_connected.has_value()) {
    out << "Last connected: " << common::format_iso8601(*snapshot.last_connected) << "\n";
  }
  for (const auto &[id, status] : snapshot.machines) {
    out << "  " << id << ": " << connection::connection_status_name(status);
    if (const auto it = snapshot.machine_errors.find(id);
        it != snapshot.machine_errors.end() && !it->second.empty()) {
      out << " (" << it->second << ")";
    }
    out << "\n";
  }
  return out.str();
}

std::string format_session(const sessions::Session &session) {
  std::ostringstream out;
  out << session.session_id << "  [" << session.status << "]  "
      << session.session_name.value_or("(untitled)");
  if (!session.project_name.empty()) {
    out << "  " << session.project_name;
  }
  out << "  @" << session.machine_id;
  if (session.is_loading_history()) {
    out << "  (loading history)";
  }
  return out.str();
}

std::string format_approval(const security::ApprovalRequest &request) {
  std::ostringstream out;
  out << request.request_id << "  [" << security::risk_tier_name(request.risk_tier) << "]  "
      << (request.tool_name.empty() ? "tool" : request.tool_name);
  if (!request.description.empty()) {
    out << ": " << shorten(request.description);
  }
  out << "  (session " << request.session_id << ", "
      << security::approval_state_name(request.state) << ")";
  return out.str();
}

std::string format_tool_call(const sessions::ToolCallRecord &call) {
  std::string line = call.tool_call_id + "  " + (call.name.empty() ? "tool" : call.name) + "  [" +
                     std::string(sessions::tool_call_status_name(call.status)) + "]";
  if (call.error.has_value()) {
    line += "  " + shorten(*call.error);
  } else if (call.output.has_value()) {
    line += "  " + shorten(*call.output);
  } else if (!call.description.empty()) {
    line += "  " + shorten(call.description);
  }
  return line;
}

std::string format_event(const protocol::InboundEvent &event) {
  const std::string prefix = "[" + event.session_id + "] ";
  return std::visit(
      Overloaded{
          [&](const protocol::MessagePayload &p) {
            const std::string role(protocol::message_role_name(p.role));
            switch (p.phase) {
            case protocol::MessagePhase::Start:
              return prefix + role + " is writing...";
            case protocol::MessagePhase::Delta:
              return prefix + role + "+ " + shorten(p.text);
            case protocol::MessagePhase::Complete:
              break;
            }
            return prefix + role + ": " + shorten(p.text);
          },
          [&](const protocol::ToolCallPayload &p) {
            std::string line = prefix + "approval requested " + p.request_id + " [" +
                               (p.risk_level.empty() ? "critical" : p.risk_level) + "] " +
                               p.tool_name;
            if (!p.preview.empty()) {
              line += "\n    " + shorten(p.preview);
            }
            return line;
          },
          [&](const protocol::ToolResultPayload &p) {
            return prefix + (p.success ? "tool ok " : "tool failed ") + p.tool_name + ": " +
                   shorten(p.output);
          },
          [&](const protocol::SessionEndPayload &p) {
            return prefix + (p.failed ? "session failed: " + p.error_message : "session completed");
          },
          [&](const protocol::ApprovalResolvedPayload &p) {
            return prefix + p.request_id + (p.approved ? " approved" : " denied") + " by " +
                   (p.resolved_by.empty() ? "daemon" : p.resolved_by);
          },
          [&](const protocol::ToolProgressPayload &p) {
            if (p.phase == protocol::ToolPhase::Start) {
              return prefix + "tool started " + p.tool_name;
            }
            return prefix + "tool running " + p.tool_name +
                   (p.risk_level.empty() ? "" : " [" + p.risk_level + "]");
          },
          [&](const protocol::SessionStatusPayload &p) {
            return prefix + "status " + (p.from.empty() ? "" : p.from + " -> ") + p.to;
          },
      },
      event.payload);
}

WatchShell::WatchShell(bridge::Bridge &bridge, std::ostream &out) : bridge_(bridge), out_(out) {}

bool WatchShell::execute(const std::string &line) {
  const auto words = split_words(line);
  if (words.empty()) {
    return true;
  }
  const std::string &command = words[0];

  if (command == "quit" || command == "exit") {
    return false;
  }
  if (command == "help") {
    print_help();
    return true;
  }
  if (command == "status") {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << format_snapshot(bridge_.connection_snapshot());
    return true;
  }
  if (command == "sessions") {
    print_sessions();
    return true;
  }
  if (command == "pending") {
    print_pending();
    return true;
  }
  if (command == "ping") {
    const auto sent = bridge_.keepalive();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "ping sent to " << sent << " machine(s)\n";
    return true;
  }
  if (command == "refresh") {
    const auto attempts = bridge_.refresh_all();
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempts.ok()) {
      out_ << "reconnecting " << attempts.value() << " machine(s)\n";
    } else {
      out_ << "error: " << attempts.error() << "\n";
    }
    return true;
  }

  if (words.size() < 2) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "usage: " << command << " <id>\n";
    return true;
  }
  const std::string &target = words[1];

  if (command == "follow" || command == "subscribe") {
    subscribe(target);
  } else if (command == "unfollow" || command == "unsubscribe") {
    unsubscribe(target);
  } else if (command == "approve") {
    report(bridge_.approve_tool_call(target), "approved " + target);
  } else if (command == "deny") {
    report(bridge_.deny_tool_call(target, rest_of_line(line, 2)), "denied " + target);
  } else if (command == "send") {
    const std::string text = rest_of_line(line, 2);
    if (text.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      out_ << "usage: send <session> <text>\n";
      return true;
    }
    report(bridge_.send_message(target, text), "sent");
  } else if (command == "tools") {
    print_tool_calls(target);
  } else if (command == "cancel") {
    report(bridge_.cancel_session(target), "cancel requested");
  } else if (command == "terminate") {
    report(bridge_.terminate_session(target), "terminate requested");
  } else {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "unknown command: " << command << " (try 'help')\n";
  }
  return true;
}

std::size_t WatchShell::drain_events() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t printed = 0;
  for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
    while (auto event = it->second.try_next()) {
      out_ << format_event(*event) << "\n";
      ++printed;
    }
    if (!it->second.is_open()) {
      out_ << "[" << it->first << "] stream ended\n";
      it = subscriptions_.erase(it);
    } else {
      ++it;
    }
  }
  out_.flush();
  return printed;
}

std::size_t WatchShell::open_subscriptions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

void WatchShell::print_help() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "  status | sessions | pending | ping | refresh | quit\n";
  out_ << "  follow <session>          stream a session's events\n";
  out_ << "  unfollow <session>\n";
  out_ << "  approve <request>\n";
  out_ << "  deny <request> [reason]\n";
  out_ << "  send <session> <text>\n";
  out_ << "  tools <session>           list the session's tool calls\n";
  out_ << "  cancel <session>          interrupt the current turn\n";
  out_ << "  terminate <session>       stop the agent\n";
}

void WatchShell::print_sessions() {
  const auto sessions = bridge_.sessions();
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions.empty()) {
    out_ << "no sessions\n";
    return;
  }
  for (const auto &session : sessions) {
    out_ << format_session(session) << (subscriptions_.contains(session.session_id) ? "  *" : "")
         << "\n";
  }
}

void WatchShell::print_pending() {
  const auto pending = bridge_.pending_approvals();
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending.empty()) {
    out_ << "no pending approvals\n";
    return;
  }
  for (const auto &request : pending) {
    out_ << format_approval(request) << "\n";
    if (!request.preview.empty()) {
      out_ << "    " << shorten(request.preview) << "\n";
    }
  }
}

void WatchShell::print_tool_calls(const std::string &session_id) {
  const auto calls = bridge_.tool_calls(session_id);
  std::lock_guard<std::mutex> lock(mutex_);
  if (calls.empty()) {
    out_ << "no tool calls for " << session_id << "\n";
    return;
  }
  for (const auto &call : calls) {
    out_ << format_tool_call(call) << "\n";
  }
}

void WatchShell::subscribe(const std::string &session_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscriptions_.contains(session_id)) {
      out_ << "already following " << session_id << "\n";
      return;
    }
  }
  auto subscription = bridge_.subscribe_to_session(session_id);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!subscription.ok()) {
    out_ << "error: " << subscription.error() << "\n";
    return;
  }
  subscriptions_.emplace(session_id, std::move(subscription.value()));
  out_ << "following " << session_id << "\n";
}

void WatchShell::unsubscribe(const std::string &session_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(session_id);
  }
  report(bridge_.unsubscribe(session_id), "stopped following " + session_id);
}

void WatchShell::report(const common::Status &status, const std::string &what) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status.ok()) {
    out_ << what << "\n";
  } else {
    out_ << "error (" << common::error_code_name(status.code()) << "): " << status.error() << "\n";
  }
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "machines") {
    return run_machines();
  }
  if (subcommand == "watch") {
    return run_watch();
  }
  if (subcommand == "journal") {
    return run_journal(args);
  }
  if (subcommand == "config") {
    return run_config(args);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tapbridge::cli

#include "tests/helpers/test_helpers.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/json_util.hpp"

#include <algorithm>
#include <fstream>
#include <random>
#include <stdexcept>

namespace tapbridge::testing {

config::Config mock_config() {
  config::Config config;
  config.api.base_url = "https://api.example.test";
  config.api.token = "test-token";
  config.directory.source = "static";
  config.preferences.source = "static";
  config.notifications.backend = "none";
  config.journal.enabled = false;
  config.observability.backend = "none";
  return config;
}

transport::TransportCallbacks FakeLink::callbacks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_;
}

void FakeLink::fire_open() {
  const auto cb = callbacks();
  if (cb.on_open) {
    cb.on_open();
  }
}

void FakeLink::fire_text(const std::string &text) {
  const auto cb = callbacks();
  if (cb.on_text) {
    cb.on_text(text);
  }
}

void FakeLink::fire_error(const std::string &message) {
  transport::TransportCallbacks cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = std::move(callbacks_);
    callbacks_ = {};
    open_ = false;
  }
  if (cb.on_error) {
    cb.on_error(message);
  }
}

void FakeLink::fire_close() {
  transport::TransportCallbacks cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = std::move(callbacks_);
    callbacks_ = {};
    open_ = false;
  }
  if (cb.on_close) {
    cb.on_close();
  }
}

void FakeLink::authenticate(const std::string &machine_name) {
  fire_open();
  fire_text(auth_success_frame(machine_name));
}

std::vector<std::string> FakeLink::sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sent_;
}

std::vector<std::string> FakeLink::sent_containing(const std::string &fragment) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &frame : sent_) {
    if (frame.find(fragment) != std::string::npos) {
      out.push_back(frame);
    }
  }
  return out;
}

void FakeLink::clear_sent() {
  std::lock_guard<std::mutex> lock(mutex_);
  sent_.clear();
}

void FakeLink::fail_sends(const bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_sends_ = fail;
}

void FakeLink::fail_open(const bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_open_ = fail;
}

bool FakeLink::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

std::size_t FakeLink::open_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_count_;
}

std::size_t FakeLink::close_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return close_count_;
}

std::optional<transport::Endpoint> FakeLink::endpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoint_;
}

FakeTransport::FakeTransport(std::shared_ptr<FakeLink> link) : link_(std::move(link)) {}

common::Status FakeTransport::open(const transport::Endpoint &endpoint,
                                   transport::TransportCallbacks callbacks) {
  std::lock_guard<std::mutex> lock(link_->mutex_);
  link_->endpoint_ = endpoint;
  ++link_->open_count_;
  if (link_->fail_open_) {
    return common::Status::error(common::ErrorCode::TransportError, "connection refused");
  }
  link_->callbacks_ = std::move(callbacks);
  link_->open_ = true;
  return common::Status::success();
}

void FakeTransport::close() {
  std::lock_guard<std::mutex> lock(link_->mutex_);
  link_->callbacks_ = {};
  if (link_->open_) {
    ++link_->close_count_;
  }
  link_->open_ = false;
}

common::Status FakeTransport::send_text(const std::string &payload) {
  std::lock_guard<std::mutex> lock(link_->mutex_);
  if (!link_->open_) {
    return common::Status::error(common::ErrorCode::TransportError, "socket is not open");
  }
  if (link_->fail_sends_) {
    return common::Status::error(common::ErrorCode::TransportError, "broken pipe");
  }
  link_->sent_.push_back(payload);
  return common::Status::success();
}

transport::TransportFactory FakeNetwork::factory() {
  auto mutex = mutex_;
  auto links = links_;
  return [mutex, links]() -> std::unique_ptr<transport::ITransport> {
    auto link = std::make_shared<FakeLink>();
    {
      std::lock_guard<std::mutex> lock(*mutex);
      links->push_back(link);
    }
    return std::make_unique<FakeTransport>(link);
  };
}

std::shared_ptr<FakeLink> FakeNetwork::link_for(const std::string &host) const {
  std::lock_guard<std::mutex> lock(*mutex_);
  for (auto it = links_->rbegin(); it != links_->rend(); ++it) {
    const auto endpoint = (*it)->endpoint();
    if (endpoint.has_value() && endpoint->host == host) {
      return *it;
    }
  }
  return nullptr;
}

std::size_t FakeNetwork::created() const {
  std::lock_guard<std::mutex> lock(*mutex_);
  return links_->size();
}

void FakeDirectory::set_machines(std::vector<directory::Machine> machines) {
  std::lock_guard<std::mutex> lock(mutex_);
  machines_ = std::move(machines);
  error_.reset();
}

void FakeDirectory::set_error(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_ = std::move(message);
}

common::Result<std::vector<directory::Machine>> FakeDirectory::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_.has_value()) {
    return common::Result<std::vector<directory::Machine>>::failure(common::ErrorCode::NetworkError,
                                                                    *error_);
  }
  return common::Result<std::vector<directory::Machine>>::success(machines_);
}

void FakePreferences::set(security::AutoApprovalPreferences preferences) {
  std::lock_guard<std::mutex> lock(mutex_);
  preferences_ = preferences;
  preferences_.loaded = true;
  error_.reset();
}

void FakePreferences::set_error(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_ = std::move(message);
}

common::Result<security::AutoApprovalPreferences> FakePreferences::get() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_.has_value()) {
    return common::Result<security::AutoApprovalPreferences>::failure(
        common::ErrorCode::NetworkError, *error_);
  }
  return common::Result<security::AutoApprovalPreferences>::success(preferences_);
}

common::Status FakePreferences::refresh() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++refreshes_;
  return common::Status::success();
}

std::size_t FakePreferences::refresh_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return refreshes_;
}

void RecordingNotifier::notify(const std::string &session_id, const std::string &request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.emplace_back(session_id, request_id);
}

std::vector<std::pair<std::string, std::string>> RecordingNotifier::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

common::Status MemoryJournal::record(const security::ApprovalRequest &request) {
  if (!security::is_terminal(request.state)) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "request is not resolved");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.emplace(request.request_id,
                   security::JournalEntry{
                       .request_id = request.request_id,
                       .session_id = request.session_id,
                       .machine_id = request.machine_id,
                       .risk_tier = request.risk_tier,
                       .state = request.state,
                       .resolved_by = request.resolved_by,
                       .resolved_at = request.resolved_at.value_or(std::chrono::system_clock::now()),
                   });
  return common::Status::success();
}

common::Result<std::optional<security::JournalEntry>>
MemoryJournal::find(const std::string &request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(request_id);
  if (it == entries_.end()) {
    return common::Result<std::optional<security::JournalEntry>>::success(std::nullopt);
  }
  return common::Result<std::optional<security::JournalEntry>>::success(it->second);
}

common::Result<std::vector<security::JournalEntry>> MemoryJournal::recent(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<security::JournalEntry> out;
  for (const auto &[id, entry] : entries_) {
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
    return a.resolved_at > b.resolved_at;
  });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return common::Result<std::vector<security::JournalEntry>>::success(std::move(out));
}

void MemoryJournal::put(security::JournalEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string id = entry.request_id;
  entries_[id] = std::move(entry);
}

std::size_t MemoryJournal::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void FakeHttpClient::respond(const std::string &url, common::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  responses_[url] = std::move(response);
}

common::HttpResponse FakeHttpClient::get(const std::string &url, const common::HttpHeaders &headers,
                                         std::uint64_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  urls_.push_back(url);
  last_headers_ = headers;
  const auto it = responses_.find(url);
  if (it == responses_.end()) {
    common::HttpResponse missing;
    missing.status = 404;
    missing.body = R"({"error":"not found"})";
    return missing;
  }
  return it->second;
}

std::vector<std::string> FakeHttpClient::requested_urls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return urls_;
}

std::optional<common::HttpHeaders> FakeHttpClient::last_headers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_headers_;
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> CapturingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("tapbridge-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

directory::Machine online_machine(const std::string &id, const std::string &host) {
  directory::Machine machine;
  machine.id = id;
  machine.name = id;
  machine.is_online = true;
  machine.tunnel_url = "https://" + host;
  return machine;
}

std::string auth_success_frame(const std::string &machine_name) {
  return R"({"type":"auth_success","machineName":)" + common::json_quote(machine_name) + "}";
}

std::string sessions_list_frame(const std::vector<std::string> &session_ids,
                                const std::string &project) {
  std::string sessions;
  for (const auto &id : session_ids) {
    if (!sessions.empty()) {
      sessions += ",";
    }
    sessions += R"({"id":)" + common::json_quote(id) +
                R"(,"agent":"claude-code","projectPath":"/work/)" + project +
                R"(","projectName":)" + common::json_quote(project) + R"(,"status":"running"})";
  }
  return R"({"type":"sessions_list","sessions":[)" + sessions + "]}";
}

std::string acp_frame(const std::string &event_json) {
  return R"({"type":"acp_event","event":)" + event_json + "}";
}

std::string history_complete_frame(const std::string &session_id) {
  return R"({"type":"history_complete","sessionId":)" + common::json_quote(session_id) + "}";
}

std::string message_complete_event(const std::string &session_id, const std::string &message_id,
                                   const std::string &role, const std::string &text) {
  return R"({"type":"message:complete","sessionId":)" + common::json_quote(session_id) +
         R"(,"messageId":)" + common::json_quote(message_id) + R"(,"role":)" +
         common::json_quote(role) + R"(,"content":[{"type":"text","text":)" +
         common::json_quote(text) + R"(}],"timestamp":"2026-03-01T10:00:00.000Z"})";
}

std::string message_delta_event(const std::string &session_id, const std::string &message_id,
                                const std::string &delta) {
  return R"({"type":"message:delta","sessionId":)" + common::json_quote(session_id) +
         R"(,"messageId":)" + common::json_quote(message_id) + R"(,"role":"assistant","delta":)" +
         common::json_quote(delta) + "}";
}

std::string approval_requested_event(const std::string &session_id, const std::string &request_id,
                                     const std::string &tool_call_id, const std::string &risk) {
  return R"({"type":"approval:requested","sessionId":)" + common::json_quote(session_id) +
         R"(,"requestId":)" + common::json_quote(request_id) + R"(,"toolCallId":)" +
         common::json_quote(tool_call_id) +
         R"(,"toolName":"Bash","description":"Run tests","riskLevel":)" +
         common::json_quote(risk) +
         R"(,"toolInput":{"command":"make test"},"preview":{"type":"command","command":"make test","workingDir":"/work"}})";
}

std::string approval_resolved_event(const std::string &session_id, const std::string &request_id,
                                    const bool approved, const std::string &resolved_by) {
  return R"({"type":"approval:resolved","sessionId":)" + common::json_quote(session_id) +
         R"(,"requestId":)" + common::json_quote(request_id) + R"(,"approved":)" +
         (approved ? "true" : "false") + R"(,"resolvedBy":)" + common::json_quote(resolved_by) +
         "}";
}

std::string tool_start_event(const std::string &session_id, const std::string &tool_call_id,
                             const std::string &name) {
  return R"({"type":"tool:start","sessionId":)" + common::json_quote(session_id) +
         R"(,"toolCallId":)" + common::json_quote(tool_call_id) + R"(,"name":)" +
         common::json_quote(name) + R"(,"category":"shell","description":"Run the test suite"})";
}

std::string tool_executing_event(const std::string &session_id, const std::string &tool_call_id,
                                 const std::string &risk) {
  return R"({"type":"tool:executing","sessionId":)" + common::json_quote(session_id) +
         R"(,"toolCallId":)" + common::json_quote(tool_call_id) +
         R"(,"name":"Bash","input":{"command":"make test"},"riskLevel":)" +
         common::json_quote(risk) + R"(,"requiresApproval":true})";
}

std::string tool_result_event(const std::string &session_id, const std::string &tool_call_id,
                              const std::string &output) {
  return R"({"type":"tool:result","sessionId":)" + common::json_quote(session_id) +
         R"(,"toolCallId":)" + common::json_quote(tool_call_id) + R"(,"name":"Bash","output":)" +
         common::json_quote(output) + R"(,"duration":12})";
}

std::string session_completed_event(const std::string &session_id) {
  return R"({"type":"session:completed","sessionId":)" + common::json_quote(session_id) + "}";
}

protocol::InboundEvent decode_event(const std::string &event_json, const std::string &machine_id) {
  auto decoded = protocol::parse_acp_event(event_json, machine_id);
  if (!decoded.ok()) {
    throw std::runtime_error("event did not decode: " + decoded.error());
  }
  if (!decoded.value().has_value()) {
    throw std::runtime_error("event type is not modelled: " + event_json);
  }
  return *decoded.value();
}

} // namespace tapbridge::testing

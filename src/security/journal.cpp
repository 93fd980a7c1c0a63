#include "tapbridge/security/journal.hpp"

#include "tapbridge/common/fs.hpp"

namespace tapbridge::security {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::StorageError, message);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? "" : text;
}

common::Status not_open(const std::string &open_error) {
  return common::Status::error(common::ErrorCode::StorageError,
                               "approval journal not open: " + open_error);
}

} // namespace

SqliteApprovalJournal::SqliteApprovalJournal(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  if (db_path_.has_parent_path()) {
    const auto dir = common::ensure_dir(db_path_.parent_path());
    if (!dir.ok()) {
      open_error_ = dir.error();
      return;
    }
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  if (const auto schema = init_schema(); !schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteApprovalJournal::~SqliteApprovalJournal() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteApprovalJournal::status() const {
  if (db_ == nullptr) {
    return not_open(open_error_);
  }
  return common::Status::success();
}

common::Status SqliteApprovalJournal::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS approval_decisions (
  request_id TEXT PRIMARY KEY,
  session_id TEXT NOT NULL,
  machine_id TEXT NOT NULL,
  risk_tier TEXT NOT NULL,
  state TEXT NOT NULL,
  resolved_by TEXT NOT NULL,
  resolved_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS approval_decisions_resolved_at
  ON approval_decisions(resolved_at);
)");
}

common::Status SqliteApprovalJournal::record(const ApprovalRequest &request) {
  if (!is_terminal(request.state)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "only resolved requests are journaled: " + request.request_id);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return not_open(open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR IGNORE INTO approval_decisions(request_id, session_id, machine_id, "
                    "risk_tier, state, resolved_by, resolved_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorCode::StorageError, sqlite3_errmsg(db_));
  }

  const std::string tier(risk_tier_name(request.risk_tier));
  const std::string state(approval_state_name(request.state));
  const std::string resolved_by(resolved_by_name(request.resolved_by));
  const auto resolved_at = common::to_unix_millis(
      request.resolved_at.value_or(std::chrono::system_clock::now()));

  sqlite3_bind_text(stmt, 1, request.request_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, request.session_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, request.machine_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, tier.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, state.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, resolved_by.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(resolved_at));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorCode::StorageError, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::optional<JournalEntry>>
SqliteApprovalJournal::find(const std::string &request_id) {
  using FindResult = common::Result<std::optional<JournalEntry>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return FindResult::failure(common::ErrorCode::StorageError,
                               "approval journal not open: " + open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT request_id, session_id, machine_id, risk_tier, state, resolved_by, "
                    "resolved_at FROM approval_decisions WHERE request_id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return FindResult::failure(common::ErrorCode::StorageError, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, request_id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return FindResult::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    const std::string message = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return FindResult::failure(common::ErrorCode::StorageError, message);
  }
  auto entry = row_to_entry(stmt);
  sqlite3_finalize(stmt);
  if (!entry.ok()) {
    return FindResult::failure(common::ErrorCode::StorageError, entry.error());
  }
  return FindResult::success(std::move(entry.value()));
}

common::Result<std::vector<JournalEntry>> SqliteApprovalJournal::recent(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<JournalEntry>>::failure(
        common::ErrorCode::StorageError, "approval journal not open: " + open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT request_id, session_id, machine_id, risk_tier, state, resolved_by, "
                    "resolved_at FROM approval_decisions ORDER BY resolved_at DESC LIMIT ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<JournalEntry>>::failure(common::ErrorCode::StorageError,
                                                              sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<JournalEntry> out;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    auto entry = row_to_entry(stmt);
    if (!entry.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<JournalEntry>>::failure(common::ErrorCode::StorageError,
                                                                entry.error());
    }
    out.push_back(std::move(entry.value()));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<JournalEntry>>::success(std::move(out));
}

common::Result<JournalEntry> SqliteApprovalJournal::row_to_entry(sqlite3_stmt *stmt) {
  JournalEntry entry;
  entry.request_id = column_text(stmt, 0);
  entry.session_id = column_text(stmt, 1);
  entry.machine_id = column_text(stmt, 2);
  entry.risk_tier = risk_tier_from_string(column_text(stmt, 3));
  auto state = approval_state_from_string(column_text(stmt, 4));
  if (!state.ok()) {
    return common::Result<JournalEntry>::failure(state.error());
  }
  entry.state = state.value();
  auto resolved_by = resolved_by_from_string(column_text(stmt, 5));
  if (!resolved_by.ok()) {
    return common::Result<JournalEntry>::failure(resolved_by.error());
  }
  entry.resolved_by = resolved_by.value();
  entry.resolved_at = common::from_unix_millis(sqlite3_column_int64(stmt, 6));
  return common::Result<JournalEntry>::success(std::move(entry));
}

} // namespace tapbridge::security

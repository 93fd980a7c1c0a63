#pragma once

#include "tapbridge/common/result.hpp"
#include "tapbridge/security/approval.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace tapbridge::security {

struct JournalEntry {
  std::string request_id;
  std::string session_id;
  std::string machine_id;
  RiskTier risk_tier = RiskTier::Critical;
  ApprovalState state = ApprovalState::Pending;
  ResolvedBy resolved_by = ResolvedBy::None;
  std::chrono::system_clock::time_point resolved_at{};
};

/// Persistent record of terminal approval decisions. A request found here is never
/// prompted or dispatched again, including after a restart.
class IApprovalJournal {
public:
  virtual ~IApprovalJournal() = default;

  /// Records a resolved request; the first decision for an id wins.
  [[nodiscard]] virtual common::Status record(const ApprovalRequest &request) = 0;
  [[nodiscard]] virtual common::Result<std::optional<JournalEntry>>
  find(const std::string &request_id) = 0;
  /// Most recent decisions first.
  [[nodiscard]] virtual common::Result<std::vector<JournalEntry>> recent(std::size_t limit) = 0;
};

class SqliteApprovalJournal final : public IApprovalJournal {
public:
  explicit SqliteApprovalJournal(std::filesystem::path db_path);
  ~SqliteApprovalJournal() override;

  SqliteApprovalJournal(const SqliteApprovalJournal &) = delete;
  SqliteApprovalJournal &operator=(const SqliteApprovalJournal &) = delete;

  /// Failure when the database could not be opened or its schema created.
  [[nodiscard]] common::Status status() const;

  [[nodiscard]] common::Status record(const ApprovalRequest &request) override;
  [[nodiscard]] common::Result<std::optional<JournalEntry>>
  find(const std::string &request_id) override;
  [[nodiscard]] common::Result<std::vector<JournalEntry>> recent(std::size_t limit) override;

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] static common::Result<JournalEntry> row_to_entry(sqlite3_stmt *stmt);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace tapbridge::security

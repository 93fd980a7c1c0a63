#pragma once

#include "tapbridge/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace tapbridge::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Writes one `[LEVEL] message` line per event; lines below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream *out = nullptr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace tapbridge::observability

#pragma once

#include "tapbridge/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace tapbridge::notify {

/// Told about every approval request that is still pending after policy evaluation.
/// Delivery to a device is the implementation's concern.
class INotificationDispatcher {
public:
  virtual ~INotificationDispatcher() = default;

  virtual void notify(const std::string &session_id, const std::string &request_id) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Records a notification event on the global observer.
class LogNotificationDispatcher final : public INotificationDispatcher {
public:
  void notify(const std::string &session_id, const std::string &request_id) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

class NoopNotificationDispatcher final : public INotificationDispatcher {
public:
  void notify(const std::string &, const std::string &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

/// `notifications.backend`: "log" or "none".
[[nodiscard]] std::unique_ptr<INotificationDispatcher> create_notifier(const config::Config &config);

} // namespace tapbridge::notify

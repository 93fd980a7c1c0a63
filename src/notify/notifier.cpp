#include "tapbridge/notify/notifier.hpp"

#include "tapbridge/observability/global.hpp"

namespace tapbridge::notify {

void LogNotificationDispatcher::notify(const std::string &session_id,
                                       const std::string &request_id) {
  observability::record_notification(session_id, request_id);
}

std::unique_ptr<INotificationDispatcher> create_notifier(const config::Config &config) {
  if (config.notifications.backend == "none") {
    return std::make_unique<NoopNotificationDispatcher>();
  }
  return std::make_unique<LogNotificationDispatcher>();
}

} // namespace tapbridge::notify

#pragma once

#include "tapbridge/protocol/event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace tapbridge::bridge {

/// Unbounded FIFO of one subscriber's events. Closing wakes waiters; events already
/// queued can still be drained afterwards.
class EventQueue {
public:
  /// False when the queue is closed and the event was not queued.
  bool push(protocol::InboundEvent event);
  [[nodiscard]] std::optional<protocol::InboundEvent> pop(std::chrono::milliseconds timeout);
  [[nodiscard]] std::optional<protocol::InboundEvent> try_pop();
  void close();
  /// Drops everything queued but not yet taken.
  std::size_t clear();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] bool drained() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<protocol::InboundEvent> queue_;
  bool closed_ = false;
};

class SubscriptionHub;

/// Handle on a live session event stream. The stream ends after the session-end event
/// is delivered or when the handle is closed. Destroying the handle closes it.
class SessionSubscription {
public:
  SessionSubscription(std::string session_id, std::shared_ptr<EventQueue> queue,
                      std::weak_ptr<SubscriptionHub> hub);
  ~SessionSubscription();

  SessionSubscription(SessionSubscription &&other) noexcept;
  SessionSubscription &operator=(SessionSubscription &&other) noexcept;
  SessionSubscription(const SessionSubscription &) = delete;
  SessionSubscription &operator=(const SessionSubscription &) = delete;

  /// Waits up to `timeout` for the next event. nullopt on timeout or once the stream ended.
  [[nodiscard]] std::optional<protocol::InboundEvent> next(std::chrono::milliseconds timeout);
  [[nodiscard]] std::optional<protocol::InboundEvent> try_next();
  void close();

  /// False once closed, or once the stream ended and every event was taken.
  [[nodiscard]] bool is_open() const;
  [[nodiscard]] const std::string &session_id() const { return session_id_; }

private:
  std::string session_id_;
  std::shared_ptr<EventQueue> queue_;
  std::weak_ptr<SubscriptionHub> hub_;
};

/// Fans events out to every open subscription of their session.
class SubscriptionHub : public std::enable_shared_from_this<SubscriptionHub> {
public:
  [[nodiscard]] SessionSubscription open(const std::string &session_id);
  /// A stream that has already ended, for sessions that are over before anyone subscribed.
  [[nodiscard]] SessionSubscription ended(const std::string &session_id);
  void remove(const std::string &session_id, const EventQueue *queue);

  /// Queues `event` for the session's subscribers. A session-end event closes their
  /// streams after it is queued. Returns the number of subscribers reached.
  std::size_t publish(const protocol::InboundEvent &event);
  /// Drops undelivered events of the given sessions; the streams stay open.
  std::size_t discard_undelivered(const std::vector<std::string> &session_ids);
  void close_session(const std::string &session_id);
  void close_all();

  [[nodiscard]] bool has_subscribers(const std::string &session_id) const;
  [[nodiscard]] std::vector<std::string> subscribed_sessions() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<std::shared_ptr<EventQueue>>> queues_;
};

} // namespace tapbridge::bridge

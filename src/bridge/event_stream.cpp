#include "tapbridge/bridge/event_stream.hpp"

#include <algorithm>

namespace tapbridge::bridge {

bool EventQueue::push(protocol::InboundEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  queue_.push(std::move(event));
  cv_.notify_one();
  return true;
}

std::optional<protocol::InboundEvent> EventQueue::pop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop();
  return event;
}

std::optional<protocol::InboundEvent> EventQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::size_t EventQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t dropped = queue_.size();
  std::queue<protocol::InboundEvent>().swap(queue_);
  return dropped;
}

bool EventQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool EventQueue::drained() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_ && queue_.empty();
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

SessionSubscription::SessionSubscription(std::string session_id, std::shared_ptr<EventQueue> queue,
                                         std::weak_ptr<SubscriptionHub> hub)
    : session_id_(std::move(session_id)), queue_(std::move(queue)), hub_(std::move(hub)) {}

SessionSubscription::~SessionSubscription() { close(); }

SessionSubscription::SessionSubscription(SessionSubscription &&other) noexcept
    : session_id_(std::move(other.session_id_)), queue_(std::move(other.queue_)),
      hub_(std::move(other.hub_)) {}

SessionSubscription &SessionSubscription::operator=(SessionSubscription &&other) noexcept {
  if (this != &other) {
    close();
    session_id_ = std::move(other.session_id_);
    queue_ = std::move(other.queue_);
    hub_ = std::move(other.hub_);
  }
  return *this;
}

std::optional<protocol::InboundEvent>
SessionSubscription::next(const std::chrono::milliseconds timeout) {
  if (queue_ == nullptr) {
    return std::nullopt;
  }
  return queue_->pop(timeout);
}

std::optional<protocol::InboundEvent> SessionSubscription::try_next() {
  if (queue_ == nullptr) {
    return std::nullopt;
  }
  return queue_->try_pop();
}

void SessionSubscription::close() {
  if (queue_ == nullptr) {
    return;
  }
  queue_->close();
  if (auto hub = hub_.lock()) {
    hub->remove(session_id_, queue_.get());
  }
  queue_.reset();
  hub_.reset();
}

bool SessionSubscription::is_open() const { return queue_ != nullptr && !queue_->drained(); }

SessionSubscription SubscriptionHub::open(const std::string &session_id) {
  auto queue = std::make_shared<EventQueue>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[session_id].push_back(queue);
  }
  return SessionSubscription(session_id, std::move(queue), weak_from_this());
}

SessionSubscription SubscriptionHub::ended(const std::string &session_id) {
  auto queue = std::make_shared<EventQueue>();
  queue->close();
  return SessionSubscription(session_id, std::move(queue), std::weak_ptr<SubscriptionHub>{});
}

void SubscriptionHub::remove(const std::string &session_id, const EventQueue *queue) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = queues_.find(session_id);
  if (it == queues_.end()) {
    return;
  }
  auto &list = it->second;
  list.erase(std::remove_if(list.begin(), list.end(),
                            [queue](const std::shared_ptr<EventQueue> &q) { return q.get() == queue; }),
             list.end());
  if (list.empty()) {
    queues_.erase(it);
  }
}

std::size_t SubscriptionHub::publish(const protocol::InboundEvent &event) {
  std::vector<std::shared_ptr<EventQueue>> targets;
  const bool ends = event.kind() == protocol::EventKind::SessionEnd;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(event.session_id);
    if (it == queues_.end()) {
      return 0;
    }
    targets = it->second;
    if (ends) {
      queues_.erase(it);
    }
  }

  std::size_t reached = 0;
  for (const auto &queue : targets) {
    if (queue->push(event)) {
      ++reached;
    }
    if (ends) {
      queue->close();
    }
  }
  return reached;
}

std::size_t SubscriptionHub::discard_undelivered(const std::vector<std::string> &session_ids) {
  std::vector<std::shared_ptr<EventQueue>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &id : session_ids) {
      if (const auto it = queues_.find(id); it != queues_.end()) {
        targets.insert(targets.end(), it->second.begin(), it->second.end());
      }
    }
  }
  std::size_t dropped = 0;
  for (const auto &queue : targets) {
    dropped += queue->clear();
  }
  return dropped;
}

void SubscriptionHub::close_session(const std::string &session_id) {
  std::vector<std::shared_ptr<EventQueue>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(session_id);
    if (it == queues_.end()) {
      return;
    }
    targets = std::move(it->second);
    queues_.erase(it);
  }
  for (const auto &queue : targets) {
    queue->close();
  }
}

void SubscriptionHub::close_all() {
  std::map<std::string, std::vector<std::shared_ptr<EventQueue>>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    all.swap(queues_);
  }
  for (const auto &[id, list] : all) {
    for (const auto &queue : list) {
      queue->close();
    }
  }
}

bool SubscriptionHub::has_subscribers(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queues_.contains(session_id);
}

std::vector<std::string> SubscriptionHub::subscribed_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(queues_.size());
  for (const auto &[id, list] : queues_) {
    out.push_back(id);
  }
  return out;
}

} // namespace tapbridge::bridge

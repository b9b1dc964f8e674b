#include "internal/broadcast/subscriber_queue.hpp"

namespace linecheck::broadcast {

SubscriberQueue::SubscriberQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool SubscriberQueue::Offer(const linecheck::v1::LineEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (events_.size() >= capacity_) {
      events_.pop_front();
      ++dropped_;
    }
    events_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

std::optional<linecheck::v1::LineEvent> SubscriberQueue::Pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

void SubscriberQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool SubscriberQueue::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

uint64_t SubscriberQueue::Dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::size_t SubscriberQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

} // namespace linecheck::broadcast

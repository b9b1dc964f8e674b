#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "linecheck/v1/events.pb.h"

namespace linecheck::broadcast {

/*
  Bounded FIFO owned by one subscriber.

  Offer() never blocks: a full queue drops its oldest event. A closed
  queue rejects offers and wakes any waiter.
*/
class SubscriberQueue {
 public:
  explicit SubscriberQueue(std::size_t capacity);

  // false once closed.
  bool Offer(const linecheck::v1::LineEvent& event);

  // nullopt on timeout, or when closed and drained.
  std::optional<linecheck::v1::LineEvent> Pop(std::chrono::milliseconds timeout);

  void Close();

  bool        Closed() const;
  uint64_t    Dropped() const;
  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex                   mutex_;
  std::condition_variable              cv_;
  std::deque<linecheck::v1::LineEvent> events_;
  uint64_t                             dropped_ = 0;
  bool                                 closed_  = false;
};

} // namespace linecheck::broadcast

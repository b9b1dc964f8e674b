#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/broadcast/subscriber_queue.hpp"
#include "internal/util/time.hpp"
#include "linecheck/v1/events.pb.h"

namespace linecheck::broadcast {

/*
  BroadcastHub

  Fan-out of LineEvents to independent bounded subscriber queues.
  Publish() stamps a hub-wide sequence number and never blocks on a slow
  subscriber. Subscriptions may be dropped concurrently with a publish.
*/
class BroadcastHub {
  struct Registry;

 public:
  class Subscription {
   public:
    ~Subscription();

    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

    uint64_t Id() const {
      return id_;
    }

    std::optional<linecheck::v1::LineEvent> Next(std::chrono::milliseconds timeout);

    uint64_t Dropped() const;
    bool     Closed() const;

    // Idempotent; also run by the destructor.
    void Unsubscribe();

   private:
    friend class BroadcastHub;
    Subscription(uint64_t id, std::shared_ptr<SubscriberQueue> queue, std::weak_ptr<Registry> registry);

    uint64_t                         id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::weak_ptr<Registry>          registry_;
  };

  explicit BroadcastHub(std::size_t queue_capacity = 50, std::shared_ptr<util::TimeSource> clock = nullptr);
  ~BroadcastHub();

  BroadcastHub(const BroadcastHub&)            = delete;
  BroadcastHub& operator=(const BroadcastHub&) = delete;

  // After Shutdown() the subscription comes back already closed.
  std::unique_ptr<Subscription> Subscribe();

  // Returns the sequence assigned to the event.
  uint64_t Publish(linecheck::v1::LineEvent event);

  std::size_t SubscriberCount() const;
  uint64_t    LastSequence() const;

  // Closes every queue; pending Next() calls return. Idempotent.
  void Shutdown();

 private:
  struct Registry {
    std::mutex                                             mutex;
    std::map<uint64_t, std::shared_ptr<SubscriberQueue>> queues;
    uint64_t                                               next_id   = 1;
    bool                                                   shut_down = false;

    void Remove(uint64_t id);
  };

  const std::size_t                 capacity_;
  std::shared_ptr<util::TimeSource> clock_;
  std::shared_ptr<Registry>         registry_;

  // serializes publishers so per-subscriber order follows sequence order
  mutable std::mutex publish_mutex_;
  uint64_t           sequence_ = 0;
};

} // namespace linecheck::broadcast

#include "internal/broadcast/broadcast_hub.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace linecheck::broadcast {

using observability::IntField;

void BroadcastHub::Registry::Remove(uint64_t id) {
  std::shared_ptr<SubscriberQueue> queue;
  std::size_t                      remaining = 0;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto                        it = queues.find(id);
    if (it == queues.end()) {
      return;
    }
    queue = std::move(it->second);
    queues.erase(it);
    remaining = queues.size();
  }
  queue->Close();
  observability::LineMetrics::Instance().SetSubscriberCount(static_cast<std::int64_t>(remaining));
  LINECHECK_LOG_INFO("subscriber removed", {IntField("subscriber_id", static_cast<int64_t>(id)), IntField("dropped", static_cast<int64_t>(queue->Dropped())),
                                            IntField("subscribers", static_cast<int64_t>(remaining))});
}

BroadcastHub::Subscription::Subscription(uint64_t id, std::shared_ptr<SubscriberQueue> queue, std::weak_ptr<Registry> registry)
    : id_(id), queue_(std::move(queue)), registry_(std::move(registry)) {
}

BroadcastHub::Subscription::~Subscription() {
  Unsubscribe();
}

std::optional<linecheck::v1::LineEvent> BroadcastHub::Subscription::Next(std::chrono::milliseconds timeout) {
  return queue_->Pop(timeout);
}

uint64_t BroadcastHub::Subscription::Dropped() const {
  return queue_->Dropped();
}

bool BroadcastHub::Subscription::Closed() const {
  return queue_->Closed();
}

void BroadcastHub::Subscription::Unsubscribe() {
  if (auto registry = registry_.lock()) {
    registry->Remove(id_);
  }
  registry_.reset();
  queue_->Close();
}

BroadcastHub::BroadcastHub(std::size_t queue_capacity, std::shared_ptr<util::TimeSource> clock)
    : capacity_(queue_capacity == 0 ? 1 : queue_capacity),
      clock_(clock ? std::move(clock) : std::make_shared<util::SystemTimeSource>()),
      registry_(std::make_shared<Registry>()) {
}

BroadcastHub::~BroadcastHub() {
  Shutdown();
}

std::unique_ptr<BroadcastHub::Subscription> BroadcastHub::Subscribe() {
  auto        queue = std::make_shared<SubscriberQueue>(capacity_);
  uint64_t    id    = 0;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    id = registry_->next_id++;
    if (registry_->shut_down) {
      queue->Close();
      return std::unique_ptr<Subscription>(new Subscription(id, std::move(queue), {}));
    }
    registry_->queues[id] = queue;
    count                 = registry_->queues.size();
  }
  observability::LineMetrics::Instance().SetSubscriberCount(static_cast<std::int64_t>(count));
  LINECHECK_LOG_INFO("subscriber registered", {IntField("subscriber_id", static_cast<int64_t>(id)), IntField("subscribers", static_cast<int64_t>(count))});
  return std::unique_ptr<Subscription>(new Subscription(id, std::move(queue), registry_));
}

uint64_t BroadcastHub::Publish(linecheck::v1::LineEvent event) {
  std::lock_guard<std::mutex> publish_lock(publish_mutex_);
  event.set_sequence(++sequence_);
  *event.mutable_published_at() = util::ToProto(clock_->Now());

  std::vector<std::shared_ptr<SubscriberQueue>> targets;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    targets.reserve(registry_->queues.size());
    for (const auto& [_, queue] : registry_->queues) {
      targets.push_back(queue);
    }
  }

  for (const auto& queue : targets) {
    const auto dropped_before = queue->Dropped();
    if (queue->Offer(event) && queue->Dropped() != dropped_before) {
      observability::LineMetrics::Instance().RecordBroadcastDrop();
    }
  }
  return event.sequence();
}

std::size_t BroadcastHub::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  return registry_->queues.size();
}

uint64_t BroadcastHub::LastSequence() const {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  return sequence_;
}

void BroadcastHub::Shutdown() {
  std::map<uint64_t, std::shared_ptr<SubscriberQueue>> queues;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->shut_down = true;
    queues.swap(registry_->queues);
  }
  for (auto& [_, queue] : queues) {
    queue->Close();
  }
}

} // namespace linecheck::broadcast

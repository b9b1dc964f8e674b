#include "internal/broadcast/broadcast_hub.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

using linecheck::broadcast::BroadcastHub;
using linecheck::v1::LineEvent;

constexpr std::chrono::milliseconds kWait{200};

LineEvent ShiftEvent(uint64_t shippers) {
  LineEvent event;
  event.mutable_shift_update()->set_total_shippers(shippers);
  return event;
}

void TestEverySubscriberSeesEveryEventInOrder() {
  BroadcastHub hub(8);
  auto         a = hub.Subscribe();
  auto         b = hub.Subscribe();
  assert(hub.SubscriberCount() == 2);

  assert(hub.Publish(ShiftEvent(1)) == 1);
  assert(hub.Publish(ShiftEvent(2)) == 2);

  for (auto* sub : {a.get(), b.get()}) {
    auto first  = sub->Next(kWait);
    auto second = sub->Next(kWait);
    assert(first && second);
    assert(first->sequence() == 1 && first->shift_update().total_shippers() == 1);
    assert(second->sequence() == 2 && second->shift_update().total_shippers() == 2);
    assert(first->has_published_at());
    assert(!sub->Next(std::chrono::milliseconds(10)));
  }
  assert(hub.LastSequence() == 2);
}

void TestSlowSubscriberDropsOldestWithoutBlocking() {
  BroadcastHub hub(3);
  auto         slow = hub.Subscribe();
  auto         fast = hub.Subscribe();

  for (uint64_t i = 1; i <= 5; ++i) {
    hub.Publish(ShiftEvent(i));
    auto event = fast->Next(kWait);
    assert(event && event->sequence() == i);
  }

  assert(slow->Dropped() == 2);
  assert(fast->Dropped() == 0);

  // oldest two are gone; the gap is visible through the sequence numbers
  auto event = slow->Next(kWait);
  assert(event && event->sequence() == 3);
  assert(slow->Next(kWait)->sequence() == 4);
  assert(slow->Next(kWait)->sequence() == 5);
}

void TestUnsubscribeIsIdempotent() {
  BroadcastHub hub;
  auto         sub = hub.Subscribe();
  {
    auto temporary = hub.Subscribe();
    assert(hub.SubscriberCount() == 2);
  }
  assert(hub.SubscriberCount() == 1);

  sub->Unsubscribe();
  sub->Unsubscribe();
  assert(hub.SubscriberCount() == 0);
  assert(sub->Closed());

  // publishing with nobody listening still advances the sequence
  assert(hub.Publish(ShiftEvent(1)) == 1);
  assert(!sub->Next(std::chrono::milliseconds(10)));
}

void TestShutdownWakesWaiters() {
  auto hub = std::make_unique<BroadcastHub>();
  auto sub = hub->Subscribe();

  std::atomic<bool> returned{false};
  std::thread       waiter([&] {
    auto event = sub->Next(std::chrono::seconds(10));
    assert(!event);
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  hub->Shutdown();
  waiter.join();
  assert(returned);
  assert(sub->Closed());
  assert(hub->SubscriberCount() == 0);

  // a subscription may outlive its hub
  hub.reset();
  sub->Unsubscribe();
}

void TestSubscribeAfterShutdownIsClosed() {
  BroadcastHub hub;
  hub.Shutdown();

  auto late = hub.Subscribe();
  assert(late->Closed());
  assert(hub.SubscriberCount() == 0);

  const auto started = std::chrono::steady_clock::now();
  assert(!late->Next(std::chrono::seconds(5)));
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));

  // publishing still stamps sequences but reaches nobody
  assert(hub.Publish(ShiftEvent(1)) == 1);
  assert(!late->Next(std::chrono::milliseconds(10)));
  hub.Shutdown();
}

void TestConcurrentPublishAndSubscribe() {
  BroadcastHub hub(1000);
  auto         reader = hub.Subscribe();

  std::atomic<bool>        stop{false};
  std::vector<std::thread> churn;
  for (int i = 0; i < 4; ++i) {
    churn.emplace_back([&] {
      while (!stop) {
        auto sub = hub.Subscribe();
        sub->Next(std::chrono::milliseconds(1));
      }
    });
  }

  std::vector<std::thread> publishers;
  for (int i = 0; i < 4; ++i) {
    publishers.emplace_back([&] {
      for (int j = 0; j < 100; ++j) hub.Publish(ShiftEvent(static_cast<uint64_t>(j)));
    });
  }
  for (auto& t : publishers) t.join();
  stop = true;
  for (auto& t : churn) t.join();

  uint64_t last = 0;
  for (int i = 0; i < 400; ++i) {
    auto event = reader->Next(kWait);
    assert(event);
    assert(event->sequence() == last + 1);
    last = event->sequence();
  }
  assert(hub.LastSequence() == 400);
  assert(hub.SubscriberCount() == 1);
}

} // namespace

int main() {
  TestEverySubscriberSeesEveryEventInOrder();
  TestSlowSubscriberDropsOldestWithoutBlocking();
  TestUnsubscribeIsIdempotent();
  TestShutdownWakesWaiters();
  TestSubscribeAfterShutdownIsClosed();
  TestConcurrentPublishAndSubscribe();

  std::cout << "linecheck_unit_broadcast_hub: pass\n";
  return 0;
}

#include "tokensale/eventbus/event_bus.hpp"

#include <algorithm>

namespace tokensale {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);

  // The id is what SaleEngine::stop() hands back to drop the IPC forwarder.
  SubscriptionId id = next_id_++;

  // std::move avoids copying the std::function and its captures.
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);

  // erase/remove_if: drops the matching entry and keeps the others in
  // subscription order. A publish() already running on another thread holds
  // its own copy and may still invoke the removed callback once.
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    // Copy under the lock, invoke outside it: a callback that subscribes,
    // unsubscribes or publishes must not deadlock on mutex_. A subscriber
    // added meanwhile misses this event.
    // Callbacks run on the publishing thread, which is the thread that
    // committed the operation (an API caller or the IPC worker).
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    callback(event);
  }
}

// -----------------------------------------------------------------------------
// publishAll(events)
// -----------------------------------------------------------------------------
// Called once per committed operation, after the ReentrancyGuard is released.
// Every subscriber sees the events in emission order.
void EventBus::publishAll(const std::vector<Event>& events) {
  for (const auto& event : events) {
    publish(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace tokensale

#include "barsim/eventbus/event_bus.hpp"

#include <algorithm>

namespace barsim {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

void EventBus::publish(const Event& event) {
  // Iterate a snapshot: a handler may unsubscribe itself (component
  // destructors do) or register a new handler mid-dispatch.
  const std::vector<SubscriberEntry> copy = subscribers_;
  for (const auto& [id, callback] : copy) {
    (void)id;
    callback(event);
  }
}

}  // namespace barsim

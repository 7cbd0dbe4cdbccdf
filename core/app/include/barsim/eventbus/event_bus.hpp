#pragma once

#include "barsim/events/event.hpp"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Dispatch table from event kind to handlers. Subscribers
// register callbacks; the scheduler publishes each event it pops from the
// EventQueue and the bus invokes every matching subscriber.
//
// Why in architecture: Components never call each other. The strategy does
// not know the portfolio exists; the portfolio does not know who executes its
// orders. They subscribe here and put their output on the EventQueue.
//
// Ordering: subscribers for the same event run in subscription order. The
// backtest relies on this: the strategy subscribes to MarketEvent before the
// portfolio does, so on every tick the strategy sees the bar first.
//
// Thread model: Single-threaded, same as the run that owns it. Callbacks run
// synchronously inside publish().
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives the Event variant; use std::get_if / std::visit to narrow.
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event, whatever its
  // kind. Strategies and loggers subscribe this way.
  // Output: SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published event holds an
  // EventType (e.g. FillEvent). The subscriber receives the concrete type.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes the subscription. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to all subscribers, in subscription order, before
  // returning. The subscriber list is copied first so a callback that
  // subscribes or unsubscribes does not invalidate the iteration; such a
  // change takes effect from the next publish.
  //
  // An exception thrown by a callback propagates to the caller and the
  // remaining subscribers do not see the event.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriber_count() const { return subscribers_.size(); }

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// Wraps the typed callback in a generic one that narrows with std::get_if
// and ignores every other kind.
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace barsim

#pragma once

#include "barsim/events/event_types.hpp"
#include "barsim/events/order_event.hpp"

#include <variant>

namespace barsim {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for the four kinds of event a backtest
// moves around: Market, Signal, Order, Fill.
// Why in architecture: The event queue and the EventBus both carry Event, so
// the scheduler can drain one FIFO and fan each item out to whoever handles
// that kind without knowing who that is.
//
// Value semantics: an Event owns its payload. Nothing in the engine holds a
// pointer into a queued event.
// -----------------------------------------------------------------------------
using Event = std::variant<MarketEvent, SignalEvent, OrderEvent, FillEvent>;

// Short kind name for logs and run statistics ("MARKET", "SIGNAL", ...).
const char* event_kind(const Event& event);

}  // namespace barsim

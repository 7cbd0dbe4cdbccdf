#include "barsim/events/order_event.hpp"
#include "barsim/events/event.hpp"

#include "barsim/domain/errors.hpp"

#include <sstream>
#include <utility>

namespace barsim {

OrderEvent::OrderEvent(Timestamp timestamp, std::string instrument,
                       domain::OrderType type, double quantity,
                       domain::Side direction, std::optional<int> smoothing)
    : timestamp_(timestamp),
      instrument_(std::move(instrument)),
      type_(type),
      quantity_(quantity),
      direction_(direction),
      smoothing_(smoothing) {
  // !(q > 0) also rejects NaN.
  if (!(quantity_ > 0.0)) {
    std::ostringstream msg;
    msg << "Order quantity must be positive (instrument=" << instrument_
        << ", quantity=" << quantity_ << ")";
    throw ConstructionError(msg.str());
  }
}

const char* event_kind(const Event& event) {
  switch (event.index()) {
    case 0:
      return "MARKET";
    case 1:
      return "SIGNAL";
    case 2:
      return "ORDER";
    case 3:
      return "FILL";
  }
  return "UNKNOWN";
}

}  // namespace barsim

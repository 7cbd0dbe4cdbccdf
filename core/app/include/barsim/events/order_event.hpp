#pragma once

#include "barsim/domain/order.hpp"
#include "barsim/events/event_types.hpp"

#include <optional>
#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// OrderEvent
// -----------------------------------------------------------------------------
//
// @brief  An instruction to the execution simulator to trade a positive
//         quantity of one instrument.
//
// @details
// Unlike the other events, OrderEvent is a class: its constructor enforces
// the one invariant the event model has, quantity > 0, by throwing
// ConstructionError. An OrderEvent that exists is therefore always valid and
// the execution simulator never has to re-check it. All members are
// read-only after construction.
//
// smoothing is the slice delay (0..N-1) the order was created with when the
// portfolio split a signal into slices; it is empty for unsmoothed orders.
// The live countdown is tracked by the portfolio's order queue, not here.
// -----------------------------------------------------------------------------
class OrderEvent {
 public:
  // Throws ConstructionError if quantity <= 0 (or is NaN).
  OrderEvent(Timestamp timestamp, std::string instrument,
             domain::OrderType type, double quantity, domain::Side direction,
             std::optional<int> smoothing = std::nullopt);

  Timestamp timestamp() const { return timestamp_; }
  const std::string& instrument() const { return instrument_; }
  domain::OrderType type() const { return type_; }
  double quantity() const { return quantity_; }
  domain::Side direction() const { return direction_; }
  std::optional<int> smoothing() const { return smoothing_; }

 private:
  Timestamp timestamp_;
  std::string instrument_;
  domain::OrderType type_;
  double quantity_;
  domain::Side direction_;
  std::optional<int> smoothing_;
};

}  // namespace barsim

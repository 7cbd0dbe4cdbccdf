#pragma once

#include "barsim/domain/order.hpp"
#include "barsim/time/timestamp.hpp"

#include <cstdint>
#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// MarketEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces that the data source has revealed one more bar
// for every instrument. Carries no prices: subscribers query the data source
// for whatever they need.
// Why in architecture: One MarketEvent per successful IDataSource::advance()
// is what defines a tick. Strategy and Portfolio both react to it.
// -----------------------------------------------------------------------------
struct MarketEvent {
  Timestamp timestamp{};         // Calendar timestamp of the revealed bars
  std::uint64_t sequence_id{0};  // 1-based tick number within the run
};

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries a trading intent produced by a strategy (e.g. "go
// long 500 of 601988").
// Why in architecture: Strategy enqueues these; the Portfolio turns them into
// orders. Strategy never creates orders or talks to execution directly.
//
// strength is advisory: a sizing hint the portfolio may use to scale
// quantity (pairs strategies). The reference portfolio ignores it.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::string strategy_id;  // Which strategy produced this signal
  std::string instrument;   // Instrument to trade
  Timestamp timestamp{};    // Bar timestamp that triggered the signal
  domain::SignalDirection direction{domain::SignalDirection::Long};
  double strength{1.0};
  double quantity{100.0};   // Requested quantity for Long/Short
};

// -----------------------------------------------------------------------------
// FillEvent
// -----------------------------------------------------------------------------
// Responsibility: Confirms that an order was executed by the simulator.
// Why in architecture: The execution simulator enqueues these; the Portfolio
// applies them to positions and cash. fill_cost is the per-unit price, so
// the cash impact is fill_cost * quantity plus commission.
// -----------------------------------------------------------------------------
struct FillEvent {
  Timestamp timestamp{};
  std::string instrument;
  std::string exchange;      // Venue tag reported by the simulator
  double quantity{0.0};      // Always positive; direction carries the sign
  domain::Side direction{domain::Side::Buy};
  double fill_cost{0.0};     // Execution price per unit
  double commission{0.0};    // Total commission charged for this fill
};

}  // namespace barsim

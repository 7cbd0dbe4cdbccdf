#pragma once

#include "barsim/events/event.hpp"

namespace barsim {

// -----------------------------------------------------------------------------
// IStrategy — signal generator interface
// -----------------------------------------------------------------------------
//
// @brief  Turns market ticks into SignalEvents.
//
// @details
// The Backtest subscribes every strategy to the EventBus for all event kinds
// and forwards each one to onEvent(). Implementations react to MarketEvent
// only and ignore the rest.
//
// A strategy reads bar history through the IDataSource it was built with and
// puts its SignalEvents on the shared EventQueue; it never creates orders or
// touches the portfolio. It must be a deterministic function of the event
// stream and the revealed history: no wall clock, no randomness.
//
// Ownership:
//   Owned by the Backtest via std::unique_ptr<IStrategy>, constructed by a
//   factory so the strategy can be given the run's data source and queue.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual void onEvent(const Event& event) = 0;
};

}  // namespace barsim

#pragma once

#include "barsim/events/event_types.hpp"
#include "barsim/events/order_event.hpp"

namespace barsim {

// -----------------------------------------------------------------------------
// IExecutionEngine — order-to-fill interface
// -----------------------------------------------------------------------------
//
// @brief  Polymorphic base for execution simulators.
//
// @details
// Implementations are event-driven: they subscribe to OrderEvent on the
// run's EventBus and put the resulting FillEvent on the EventQueue. execute()
// is the pure order → fill mapping behind that callback; it is public so a
// cost model can be checked without a running backtest.
//
// Ownership:
//   The Backtest owns the engine via unique_ptr<IExecutionEngine>. The
//   virtual destructor makes sure the derived destructor (which unsubscribes
//   from the bus) runs.
// -----------------------------------------------------------------------------
class IExecutionEngine {
 public:
  virtual ~IExecutionEngine() = default;

  // Produces exactly one fill for the order. Does not enqueue it.
  virtual FillEvent execute(const OrderEvent& order) const = 0;
};

}  // namespace barsim

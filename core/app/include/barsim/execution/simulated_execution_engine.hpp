#pragma once

#include "barsim/data/i_data_source.hpp"
#include "barsim/eventbus/event_bus.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/execution/commission.hpp"
#include "barsim/execution/i_execution_engine.hpp"
#include "barsim/time/i_time_provider.hpp"

#include <string>

namespace barsim {

struct ExecutionConfig {
  CommissionSchedule commission{};
  std::string exchange{"ARCA"};
};

// -----------------------------------------------------------------------------
// SimulatedExecutionEngine — deterministic fill simulator
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to OrderEvent and puts one FillEvent per order on the
//         EventQueue.
//
// @details
// Fill model:
//   - Immediate, complete fill: fill quantity = order quantity.
//   - Price: the instrument's latest Close (not adjusted close). No
//     slippage and no market impact; LIMIT orders fill the same way.
//   - Commission: tiered CommissionSchedule on the fill quantity.
//   - Timestamp: ITimeProvider::now_ms(), which the Backtest has set to the
//     current tick, so fills carry bar time and never wall-clock time.
//
// Errors: UnknownInstrumentError / NoMarketDataError from the price lookup
// propagate to the Backtest and abort the run.
//
// Ownership:
//   Holds references to the EventBus, EventQueue, IDataSource and
//   ITimeProvider, all owned by the Backtest.
// -----------------------------------------------------------------------------
class SimulatedExecutionEngine final : public IExecutionEngine {
 public:
  SimulatedExecutionEngine(EventBus& bus, EventQueue& queue,
                           const IDataSource& data,
                           const ITimeProvider& time_provider,
                           ExecutionConfig config = {});

  ~SimulatedExecutionEngine() override;

  SimulatedExecutionEngine(const SimulatedExecutionEngine&) = delete;
  SimulatedExecutionEngine& operator=(const SimulatedExecutionEngine&) = delete;
  SimulatedExecutionEngine(SimulatedExecutionEngine&&) = delete;
  SimulatedExecutionEngine& operator=(SimulatedExecutionEngine&&) = delete;

  FillEvent execute(const OrderEvent& order) const override;

  const ExecutionConfig& config() const { return config_; }

 private:
  void onOrder(const OrderEvent& event);

  EventBus& bus_;
  EventQueue& queue_;
  const IDataSource& data_;
  const ITimeProvider& time_provider_;
  const ExecutionConfig config_;
  EventBus::SubscriptionId subscription_id_{0};
};

}  // namespace barsim

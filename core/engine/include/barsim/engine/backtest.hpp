#pragma once

#include "barsim/data/i_data_source.hpp"
#include "barsim/eventbus/event_bus.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/execution/i_execution_engine.hpp"
#include "barsim/execution/simulated_execution_engine.hpp"
#include "barsim/portfolio/holdings.hpp"
#include "barsim/portfolio/portfolio.hpp"
#include "barsim/portfolio/sizing.hpp"
#include "barsim/strategy/i_strategy.hpp"
#include "barsim/time/simulation_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace barsim {

// Builds the run's strategy once the data source and queue exist.
using StrategyFactory = std::function<std::unique_ptr<IStrategy>(
    const IDataSource&, EventQueue&)>;

struct BacktestParams {
  double initial_capital{100000.0};
  // Timestamp of the capital-only first holdings row. Empty: first tick.
  std::optional<Timestamp> start_time;
  SizingConfig sizing{};
  ExecutionConfig execution{};
  // Log every signal, order and fill. Off by default.
  bool verbose{false};
};

enum class RunStatus {
  Completed,
  Aborted,
};

inline const char* to_string(RunStatus status) {
  return status == RunStatus::Completed ? "COMPLETED" : "ABORTED";
}

// Events dispatched by kind, and ticks processed.
struct RunStats {
  std::uint64_t ticks{0};
  std::uint64_t market_events{0};
  std::uint64_t signal_events{0};
  std::uint64_t order_events{0};
  std::uint64_t fill_events{0};
};

// -----------------------------------------------------------------------------
// RunResult — what a finished (or aborted) run hands back
// -----------------------------------------------------------------------------
// An aborted run still carries everything recorded up to the failing tick;
// complete() is false and error names the cause.
// -----------------------------------------------------------------------------
struct RunResult {
  RunStatus status{RunStatus::Completed};
  std::string error;
  std::vector<HoldingsSnapshot> holdings;
  std::vector<HoldingsSnapshot> raw_holdings;
  std::vector<PositionsSnapshot> positions;
  std::vector<PositionsSnapshot> raw_positions;
  std::vector<FillEvent> fills;
  RunStats stats{};

  bool complete() const { return status == RunStatus::Completed; }
};

// -----------------------------------------------------------------------------
// Backtest — the scheduler
// -----------------------------------------------------------------------------
//
// @brief  Owns one run: the data source, the event channel, the simulation
//         clock and every component. run() replays the data to the end.
//
// @details
// Loop:
//
//   while data source wants to continue:
//     advance()                 → one MarketEvent on the queue (or stop)
//     drain the queue, FIFO:
//       MarketEvent  → clock := bar time, then Strategy, then Portfolio
//       SignalEvent  → Portfolio
//       OrderEvent   → SimulatedExecutionEngine
//       FillEvent    → Portfolio
//
// Every event generated within a tick is resolved before the next advance().
// Routing is done by the EventBus; the order of subscription in the
// constructor is what puts the strategy ahead of the portfolio on Market.
//
// Errors: any BacktestError raised while draining (unknown instrument, bad
// order quantity, missing bar) stops the loop. The queue is cleared, the
// error is logged on std::cerr, and run() returns status Aborted with the
// partial histories. Other exceptions propagate.
//
// Thread model: single-threaded. Independent Backtest instances may run on
// different threads (see runSweep()).
//
// Ownership:
//   Backtest
//    ├── data_        (unique_ptr<IDataSource>)
//    ├── queue_       (EventQueue)
//    ├── bus_         (EventBus)
//    ├── clock_       (SimulationTimeProvider)
//    ├── strategy_    (unique_ptr<IStrategy>)
//    ├── portfolio_   (unique_ptr<Portfolio>)
//    └── execution_   (unique_ptr<IExecutionEngine>)
//
// Components are declared after the bus, queue and clock they reference,
// so they are destroyed (and unsubscribe) first.
// -----------------------------------------------------------------------------
class Backtest {
 public:
  // Throws ConfigError for invalid params, BacktestError from the factory.
  Backtest(std::unique_ptr<IDataSource> data, const StrategyFactory& factory,
           BacktestParams params);

  ~Backtest();

  Backtest(const Backtest&) = delete;
  Backtest& operator=(const Backtest&) = delete;
  Backtest(Backtest&&) = delete;
  Backtest& operator=(Backtest&&) = delete;

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  Replays the whole feed and returns the result.
  //
  // @throws std::logic_error if called a second time: the data source has
  //         been consumed.
  // -------------------------------------------------------------------------
  RunResult run();

  EventBus& eventBus() { return bus_; }
  const Portfolio& portfolio() const { return *portfolio_; }
  const IDataSource& dataSource() const { return *data_; }
  const RunStats& stats() const { return stats_; }

 private:
  void drainQueue();
  void countEvent(const Event& event);
  void logEvent(const Event& event) const;

  const BacktestParams params_;

  std::unique_ptr<IDataSource> data_;
  EventQueue queue_;
  EventBus bus_;
  SimulationTimeProvider clock_;

  std::unique_ptr<IStrategy> strategy_;
  std::unique_ptr<Portfolio> portfolio_;
  std::unique_ptr<IExecutionEngine> execution_;

  EventBus::SubscriptionId strategy_sub_id_{0};
  EventBus::SubscriptionId fill_log_sub_id_{0};
  std::optional<EventBus::SubscriptionId> verbose_sub_id_;

  std::vector<FillEvent> fills_;
  RunStats stats_{};
  bool ran_{false};
};

}  // namespace barsim

#pragma once

#include "barsim/data/i_data_source.hpp"
#include "barsim/domain/position.hpp"
#include "barsim/eventbus/event_bus.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/events/event.hpp"
#include "barsim/portfolio/holdings.hpp"
#include "barsim/portfolio/sizing.hpp"

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace barsim {

struct PortfolioConfig {
  double initial_capital{100000.0};
  // Timestamp of the capital-only first snapshot. When empty, that row takes
  // the timestamp of the first tick.
  std::optional<Timestamp> start_time;
  SizingConfig sizing{};
};

// A smoothed order waiting for release, with its live countdown.
struct PendingOrder {
  OrderEvent order;
  int remaining_delay{0};
};

// -----------------------------------------------------------------------------
// Portfolio — positions, holdings and order smoothing
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to MarketEvent, SignalEvent and FillEvent. Turns
//         signals into (possibly smoothed) OrderEvents on the EventQueue and
//         keeps the position, cash and holdings history consistent with
//         every fill.
//
// @details
// Per-instrument intent (InstrumentState) follows the signals:
//
//   LONG             → BUY slices of signal.quantity,          state LONG
//   EXIT, pos != 0   → |pos| in slices on the closing side,     state OUT
//   EXIT, pos == 0   → nothing
//   SHORT, pos == 0  → SELL slices of signal.quantity,         state SHORT
//   SHORT, pos != 0  → ignored (logged)
//
// Smoothing. A signal's quantity is split into N slices (default 5) with
// delays 0..N-1, appended to the instrument's FIFO order queue:
//
//   on Signal:  every queued order's delay += 1, new slices appended,
//               orders at delay 0 released, the rest get delay -= 1 back.
//               Net effect: only the new delay-0 slice goes out now; orders
//               already queued keep their countdown.
//   on Market:  per instrument, delay 0 → release; otherwise delay -= 1.
//
// Because the Backtest dispatches each MarketEvent to the strategy first,
// a signal emitted on tick t releases its slices on t, t+1 ... t+N-1.
//
// Snapshots. On every MarketEvent, BEFORE queued orders are released, the
// portfolio appends one positions row and one holdings row stamped with the
// latest bar timestamp of the first instrument:
//
//   market_value[i] = position[i] * latest adj_close[i]
//
// Two views are kept. The clamped view reports negative positions and
// market values as 0 (long-only reporting); the raw view keeps the signed
// numbers. Both are seeded with a capital-only row at start_time.
//
// Fills. position += sign * qty; cash -= sign * fill_cost * qty + commission;
// commission accumulates; the instrument's current value moves by
// sign * fill_cost * qty (no look-ahead: the fill price, not a later bar).
//
// Errors:
//   UnknownInstrumentError  signal or fill for an instrument the data
//                           source does not carry.
//   ConstructionError       a slice would have quantity <= 0.
//   ConfigError             initial_capital <= 0 or slices < 1.
//
// Thread model: single-threaded, driven by the Backtest.
//
// Ownership:
//   Owned by the Backtest. Holds references to the run's EventBus,
//   EventQueue and IDataSource, all of which must outlive it.
// -----------------------------------------------------------------------------
class Portfolio {
 public:
  Portfolio(EventBus& bus, EventQueue& queue, const IDataSource& data,
            PortfolioConfig config);

  // Unsubscribes from all three event kinds.
  ~Portfolio();

  Portfolio(const Portfolio&) = delete;
  Portfolio& operator=(const Portfolio&) = delete;
  Portfolio(Portfolio&&) = delete;
  Portfolio& operator=(Portfolio&&) = delete;

  // Signed position. Throws UnknownInstrumentError.
  double position(const std::string& instrument) const;

  domain::InstrumentState state(const std::string& instrument) const;

  // Live holdings (market values at fill cost), not a history row.
  HoldingsSnapshot currentHoldings() const;

  const std::vector<PositionsSnapshot>& positionsHistory() const {
    return positions_history_;
  }
  const std::vector<PositionsSnapshot>& rawPositionsHistory() const {
    return raw_positions_history_;
  }
  const std::vector<HoldingsSnapshot>& holdingsHistory() const {
    return holdings_history_;
  }
  const std::vector<HoldingsSnapshot>& rawHoldingsHistory() const {
    return raw_holdings_history_;
  }

  // Orders still waiting in the instrument's smoothing queue.
  const std::deque<PendingOrder>& pendingOrders(
      const std::string& instrument) const;

  const PortfolioConfig& config() const { return config_; }

 private:
  void onMarket(const MarketEvent& event);
  void onSignal(const SignalEvent& event);
  void onFill(const FillEvent& event);

  // Appends one clamped and one raw row to each history.
  void updateTimeIndex();

  // Market-tick pass over every instrument's order queue.
  void releaseDueOrders();

  // Builds the orders for a signal: `slices` orders with delays 0..N-1, or
  // one delay-less order in naive mode. Empty if the signal asks for nothing.
  std::vector<PendingOrder> buildOrders(const SignalEvent& signal);

  void checkInstrument(const std::string& instrument) const;

  EventBus& bus_;
  EventQueue& queue_;
  const IDataSource& data_;
  const PortfolioConfig config_;

  EventBus::SubscriptionId market_sub_id_{0};
  EventBus::SubscriptionId signal_sub_id_{0};
  EventBus::SubscriptionId fill_sub_id_{0};

  std::unordered_map<std::string, double> positions_;
  std::unordered_map<std::string, domain::InstrumentState> states_;
  std::unordered_map<std::string, std::deque<PendingOrder>> order_queues_;

  // Current per-instrument value from fills, plus cash and commission.
  std::map<std::string, double> current_value_;
  double cash_{0.0};
  double commission_{0.0};

  std::vector<PositionsSnapshot> positions_history_;
  std::vector<PositionsSnapshot> raw_positions_history_;
  std::vector<HoldingsSnapshot> holdings_history_;
  std::vector<HoldingsSnapshot> raw_holdings_history_;

  bool seen_first_tick_{false};
};

}  // namespace barsim

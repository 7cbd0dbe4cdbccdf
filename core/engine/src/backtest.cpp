#include "barsim/engine/backtest.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/time/time_utils.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace barsim {

// -----------------------------------------------------------------------------
// Constructor: wire components in dispatch order
// -----------------------------------------------------------------------------
Backtest::Backtest(std::unique_ptr<IDataSource> data,
                   const StrategyFactory& factory, BacktestParams params)
    : params_(std::move(params)), data_(std::move(data)) {
  if (!data_) {
    throw ConfigError("Backtest needs a data source");
  }
  if (!factory) {
    throw ConfigError("Backtest needs a strategy factory");
  }

  // ---  1) Strategy first: it must see each MarketEvent before the
  //         portfolio snapshots and releases slices for that tick. ---------
  strategy_ = factory(*data_, queue_);
  if (!strategy_) {
    throw ConfigError("Strategy factory returned no strategy");
  }
  strategy_sub_id_ =
      bus_.subscribe([this](const Event& e) { strategy_->onEvent(e); });

  // ---  2) Portfolio: Market, Signal, Fill -----------------------------------
  PortfolioConfig pcfg;
  pcfg.initial_capital = params_.initial_capital;
  pcfg.start_time = params_.start_time;
  pcfg.sizing = params_.sizing;
  portfolio_ = std::make_unique<Portfolio>(bus_, queue_, *data_, pcfg);

  // ---  3) Execution simulator: Order ---------------------------------------
  execution_ = std::make_unique<SimulatedExecutionEngine>(
      bus_, queue_, *data_, clock_, params_.execution);

  // ---  4) Fill recorder, and the optional event log -------------------------
  fill_log_sub_id_ = bus_.subscribe<FillEvent>(
      [this](const FillEvent& e) { fills_.push_back(e); });
  if (params_.verbose) {
    verbose_sub_id_ =
        bus_.subscribe([this](const Event& e) { logEvent(e); });
  }
}

Backtest::~Backtest() {
  if (verbose_sub_id_) {
    bus_.unsubscribe(*verbose_sub_id_);
  }
  bus_.unsubscribe(fill_log_sub_id_);
  bus_.unsubscribe(strategy_sub_id_);
}

// -----------------------------------------------------------------------------
// run(): outer tick loop
// -----------------------------------------------------------------------------
RunResult Backtest::run() {
  if (ran_) {
    throw std::logic_error("Backtest::run() called twice");
  }
  ran_ = true;

  std::cout << "[Backtest] Starting replay: " << data_->instruments().size()
            << " instrument(s), capital " << params_.initial_capital
            << ", sizing " << to_string(params_.sizing.mode) << ".\n";

  RunResult result;
  try {
    while (data_->continueBacktest()) {
      if (!data_->advance(queue_)) {
        break;
      }
      ++stats_.ticks;
      drainQueue();
    }
    result.status = RunStatus::Completed;
  } catch (const BacktestError& e) {
    queue_.clear();
    result.status = RunStatus::Aborted;
    result.error = e.what();
    std::cerr << "[Backtest] ERROR: run aborted at tick " << stats_.ticks
              << ": " << e.what() << "\n";
  }

  result.holdings = portfolio_->holdingsHistory();
  result.raw_holdings = portfolio_->rawHoldingsHistory();
  result.positions = portfolio_->positionsHistory();
  result.raw_positions = portfolio_->rawPositionsHistory();
  result.fills = fills_;
  result.stats = stats_;

  std::cout << "[Backtest] " << to_string(result.status) << " after "
            << stats_.ticks << " tick(s): " << stats_.signal_events
            << " signal(s), " << stats_.order_events << " order(s), "
            << stats_.fill_events << " fill(s).\n";
  return result;
}

// -----------------------------------------------------------------------------
// drainQueue(): resolve one tick completely
// -----------------------------------------------------------------------------
void Backtest::drainQueue() {
  while (auto event = queue_.try_pop()) {
    if (const auto* market = std::get_if<MarketEvent>(&*event)) {
      clock_.advance_time(timestamp_to_ms(market->timestamp));
    }
    countEvent(*event);
    bus_.publish(*event);
  }
}

void Backtest::countEvent(const Event& event) {
  if (std::holds_alternative<MarketEvent>(event)) {
    ++stats_.market_events;
  } else if (std::holds_alternative<SignalEvent>(event)) {
    ++stats_.signal_events;
  } else if (std::holds_alternative<OrderEvent>(event)) {
    ++stats_.order_events;
  } else if (std::holds_alternative<FillEvent>(event)) {
    ++stats_.fill_events;
  }
}

void Backtest::logEvent(const Event& event) const {
  if (const auto* s = std::get_if<SignalEvent>(&event)) {
    std::cout << "[Backtest] SIGNAL " << domain::to_string(s->direction) << ' '
              << s->instrument << " qty=" << s->quantity << " @ "
              << format_timestamp(s->timestamp) << '\n';
  } else if (const auto* o = std::get_if<OrderEvent>(&event)) {
    std::cout << "[Backtest] ORDER " << domain::to_string(o->type()) << ' '
              << domain::to_string(o->direction()) << ' ' << o->instrument()
              << " qty=" << o->quantity();
    if (o->smoothing()) {
      std::cout << " slice=" << *o->smoothing();
    }
    std::cout << '\n';
  } else if (const auto* f = std::get_if<FillEvent>(&event)) {
    std::cout << "[Backtest] FILL " << domain::to_string(f->direction) << ' '
              << f->instrument << " qty=" << f->quantity
              << " price=" << f->fill_cost << " commission=" << f->commission
              << " @ " << format_timestamp(f->timestamp) << '\n';
  }
}

}  // namespace barsim

#include "barsim/portfolio/portfolio.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/domain/order.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace barsim {

namespace {

constexpr double kFlatPosition = 1e-9;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate config, seed state and histories, subscribe
// -----------------------------------------------------------------------------
Portfolio::Portfolio(EventBus& bus, EventQueue& queue, const IDataSource& data,
                     PortfolioConfig config)
    : bus_(bus), queue_(queue), data_(data), config_(std::move(config)) {
  if (!(config_.initial_capital > 0.0)) {
    throw ConfigError("initial_capital must be positive");
  }
  if (config_.sizing.slices < 1) {
    throw ConfigError("sizing.slices must be at least 1");
  }

  cash_ = config_.initial_capital;

  const Timestamp start = config_.start_time.value_or(Timestamp{});
  PositionsSnapshot first_positions;
  first_positions.timestamp = start;
  HoldingsSnapshot first_holdings;
  first_holdings.timestamp = start;
  first_holdings.cash = config_.initial_capital;
  first_holdings.total = config_.initial_capital;

  for (const auto& instrument : data_.instruments()) {
    positions_[instrument] = 0.0;
    states_[instrument] = domain::InstrumentState::Out;
    order_queues_[instrument];
    current_value_[instrument] = 0.0;
    first_positions.quantity[instrument] = 0.0;
    first_holdings.market_value[instrument] = 0.0;
  }

  positions_history_.push_back(first_positions);
  raw_positions_history_.push_back(first_positions);
  holdings_history_.push_back(first_holdings);
  raw_holdings_history_.push_back(first_holdings);

  market_sub_id_ = bus_.subscribe<MarketEvent>(
      [this](const MarketEvent& e) { onMarket(e); });
  signal_sub_id_ = bus_.subscribe<SignalEvent>(
      [this](const SignalEvent& e) { onSignal(e); });
  fill_sub_id_ =
      bus_.subscribe<FillEvent>([this](const FillEvent& e) { onFill(e); });
}

Portfolio::~Portfolio() {
  bus_.unsubscribe(fill_sub_id_);
  bus_.unsubscribe(signal_sub_id_);
  bus_.unsubscribe(market_sub_id_);
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
void Portfolio::checkInstrument(const std::string& instrument) const {
  if (positions_.count(instrument) == 0) {
    throw UnknownInstrumentError(instrument);
  }
}

double Portfolio::position(const std::string& instrument) const {
  checkInstrument(instrument);
  return positions_.at(instrument);
}

domain::InstrumentState Portfolio::state(const std::string& instrument) const {
  checkInstrument(instrument);
  return states_.at(instrument);
}

const std::deque<PendingOrder>& Portfolio::pendingOrders(
    const std::string& instrument) const {
  checkInstrument(instrument);
  return order_queues_.at(instrument);
}

HoldingsSnapshot Portfolio::currentHoldings() const {
  HoldingsSnapshot h;
  h.timestamp = raw_holdings_history_.back().timestamp;
  h.market_value = current_value_;
  h.cash = cash_;
  h.commission = commission_;
  h.total = cash_;
  for (const auto& [instrument, value] : current_value_) {
    h.total += value;
  }
  return h;
}

// -----------------------------------------------------------------------------
// onMarket: snapshot first, then release due slices
// -----------------------------------------------------------------------------
void Portfolio::onMarket(const MarketEvent& /*event*/) {
  updateTimeIndex();
  releaseDueOrders();
}

void Portfolio::updateTimeIndex() {
  const auto& instruments = data_.instruments();
  const Timestamp ts = data_.latestBarTimestamp(instruments.front());

  if (!seen_first_tick_) {
    seen_first_tick_ = true;
    if (!config_.start_time) {
      positions_history_.front().timestamp = ts;
      raw_positions_history_.front().timestamp = ts;
      holdings_history_.front().timestamp = ts;
      raw_holdings_history_.front().timestamp = ts;
    }
  }

  PositionsSnapshot pos_row;
  PositionsSnapshot raw_pos_row;
  pos_row.timestamp = ts;
  raw_pos_row.timestamp = ts;

  HoldingsSnapshot hold_row;
  HoldingsSnapshot raw_hold_row;
  hold_row.timestamp = ts;
  raw_hold_row.timestamp = ts;
  hold_row.cash = raw_hold_row.cash = cash_;
  hold_row.commission = raw_hold_row.commission = commission_;
  hold_row.total = raw_hold_row.total = cash_;

  for (const auto& instrument : instruments) {
    const double qty = positions_.at(instrument);
    pos_row.quantity[instrument] = qty >= 0.0 ? qty : 0.0;
    raw_pos_row.quantity[instrument] = qty;

    const double value =
        qty * data_.latestBarValue(instrument, domain::BarField::AdjClose);
    const double clamped = value >= 0.0 ? value : 0.0;
    hold_row.market_value[instrument] = clamped;
    hold_row.total += clamped;
    raw_hold_row.market_value[instrument] = value;
    raw_hold_row.total += value;
  }

  positions_history_.push_back(std::move(pos_row));
  raw_positions_history_.push_back(std::move(raw_pos_row));
  holdings_history_.push_back(std::move(hold_row));
  raw_holdings_history_.push_back(std::move(raw_hold_row));
}

void Portfolio::releaseDueOrders() {
  for (const auto& instrument : data_.instruments()) {
    auto& pending = order_queues_[instrument];
    std::deque<PendingOrder> still_waiting;
    for (auto& p : pending) {
      if (p.remaining_delay > 0) {
        --p.remaining_delay;
        still_waiting.push_back(std::move(p));
      } else {
        queue_.put(p.order);
      }
    }
    pending = std::move(still_waiting);
  }
}

// -----------------------------------------------------------------------------
// onSignal: state transition and smoothing
// -----------------------------------------------------------------------------
void Portfolio::onSignal(const SignalEvent& event) {
  checkInstrument(event.instrument);

  std::vector<PendingOrder> orders = buildOrders(event);
  if (orders.empty()) {
    return;
  }

  auto& pending = order_queues_[event.instrument];

  // Shift existing countdowns out of the way so only the new delay-0 slice
  // goes out on this pass.
  for (auto& p : pending) {
    ++p.remaining_delay;
  }
  for (auto& o : orders) {
    pending.push_back(std::move(o));
  }

  std::deque<PendingOrder> still_waiting;
  for (auto& p : pending) {
    if (p.remaining_delay == 0) {
      queue_.put(p.order);
    } else {
      --p.remaining_delay;
      still_waiting.push_back(std::move(p));
    }
  }
  pending = std::move(still_waiting);
}

std::vector<PendingOrder> Portfolio::buildOrders(const SignalEvent& signal) {
  const double current = positions_.at(signal.instrument);
  const bool flat = current == 0.0;

  double quantity = 0.0;
  domain::Side side = domain::Side::Buy;
  domain::InstrumentState next = states_.at(signal.instrument);

  switch (signal.direction) {
    case domain::SignalDirection::Long:
      quantity = signal.quantity;
      side = domain::Side::Buy;
      next = domain::InstrumentState::Long;
      break;
    case domain::SignalDirection::Short:
      if (!flat) {
        std::cerr << "[Portfolio] WARNING: SHORT " << signal.instrument
                  << " ignored, position is " << current << "\n";
        return {};
      }
      quantity = signal.quantity;
      side = domain::Side::Sell;
      next = domain::InstrumentState::Short;
      break;
    case domain::SignalDirection::Exit:
      if (flat) {
        return {};
      }
      quantity = std::abs(current);
      side = current > 0.0 ? domain::Side::Sell : domain::Side::Buy;
      next = domain::InstrumentState::Out;
      break;
  }

  // OrderEvent rejects a non-positive quantity; the state only moves once
  // every order of the signal has been built.
  std::vector<PendingOrder> orders;
  if (config_.sizing.mode == SizingMode::Naive) {
    orders.push_back(PendingOrder{
        OrderEvent(signal.timestamp, signal.instrument,
                   domain::OrderType::Market, quantity, side),
        0});
  } else {
    const int n = config_.sizing.slices;
    const double slice = quantity / n;
    double allocated = 0.0;
    orders.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      // The last slice takes the remainder so the slices sum to the request.
      const double q = (i == n - 1) ? quantity - allocated : slice;
      allocated += q;
      orders.push_back(PendingOrder{
          OrderEvent(signal.timestamp, signal.instrument,
                     domain::OrderType::Market, q, side, i),
          i});
    }
  }

  states_[signal.instrument] = next;
  return orders;
}

// -----------------------------------------------------------------------------
// onFill: positions, cash, commission
// -----------------------------------------------------------------------------
void Portfolio::onFill(const FillEvent& event) {
  checkInstrument(event.instrument);

  const double dir = domain::sign(event.direction);
  const double cost = dir * event.fill_cost * event.quantity;

  double& position = positions_[event.instrument];
  position += dir * event.quantity;
  // Sliced exits leave rounding residue; a position that small is flat.
  if (std::abs(position) < kFlatPosition) {
    position = 0.0;
  }
  current_value_[event.instrument] += cost;
  commission_ += event.commission;
  cash_ -= cost + event.commission;
}

}  // namespace barsim

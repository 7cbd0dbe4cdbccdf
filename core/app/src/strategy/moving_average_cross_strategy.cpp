#include "barsim/strategy/moving_average_cross_strategy.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/time/time_utils.hpp"

#include <iostream>
#include <numeric>
#include <optional>
#include <utility>
#include <vector>

namespace barsim {

namespace {

// Mean of values[size-from_end-1 .. size-2], i.e. the `from_end` values
// before the newest one, clamped at the start of the vector. nullopt when
// that range is empty.
std::optional<double> meanExcludingNewest(const std::vector<double>& values,
                                          std::size_t from_end) {
  if (values.size() < 2) {
    return std::nullopt;
  }
  const std::size_t stop = values.size() - 1;
  const std::size_t start = stop > from_end ? stop - from_end : 0;
  const double sum =
      std::accumulate(values.begin() + start, values.begin() + stop, 0.0);
  return sum / static_cast<double>(stop - start);
}

std::optional<double> meanOf(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

}  // namespace

MovingAverageCrossStrategy::MovingAverageCrossStrategy(
    const IDataSource& data, EventQueue& queue, MovingAverageCrossParams params,
    std::string strategy_id)
    : data_(data),
      queue_(queue),
      params_(params),
      strategy_id_(std::move(strategy_id)) {
  if (params_.short_window == 0 || params_.long_window == 0 ||
      params_.short_window >= params_.long_window) {
    throw ConfigError("MAC windows must satisfy 0 < short_window < long_window");
  }
  for (const auto& instrument : data_.instruments()) {
    bought_[instrument] = domain::InstrumentState::Out;
  }
}

void MovingAverageCrossStrategy::onEvent(const Event& event) {
  if (std::holds_alternative<MarketEvent>(event)) {
    onMarket();
  }
}

domain::InstrumentState MovingAverageCrossStrategy::state(
    const std::string& instrument) const {
  auto it = bought_.find(instrument);
  if (it == bought_.end()) {
    throw UnknownInstrumentError(instrument);
  }
  return it->second;
}

void MovingAverageCrossStrategy::onMarket() {
  for (const auto& instrument : data_.instruments()) {
    const std::vector<double> closes = data_.latestBarsValues(
        instrument, domain::BarField::AdjClose, params_.long_window);
    const std::size_t n = closes.size();

    std::optional<double> short_sma;
    std::optional<double> long_sma;
    if (n + 1 <= params_.short_window) {
      short_sma = meanOf(closes);
      long_sma = short_sma;
    } else if (n + 1 <= params_.long_window) {
      short_sma = meanExcludingNewest(closes, params_.short_window);
      long_sma = meanOf(closes);
    } else {
      short_sma = meanExcludingNewest(closes, params_.short_window);
      long_sma = meanExcludingNewest(closes, params_.long_window);
    }
    if (!short_sma || !long_sma) {
      continue;
    }

    domain::InstrumentState& bought = bought_[instrument];
    std::optional<domain::SignalDirection> direction;
    if (*short_sma > *long_sma && bought == domain::InstrumentState::Out) {
      direction = domain::SignalDirection::Long;
      bought = domain::InstrumentState::Long;
    } else if (*short_sma < *long_sma &&
               bought == domain::InstrumentState::Long) {
      direction = domain::SignalDirection::Exit;
      bought = domain::InstrumentState::Out;
    }
    if (!direction) {
      continue;
    }

    SignalEvent signal;
    signal.strategy_id = strategy_id_;
    signal.instrument = instrument;
    signal.timestamp = data_.latestBarTimestamp(instrument);
    signal.direction = *direction;
    signal.strength = 1.0;
    signal.quantity = params_.quantity;

    std::cout << "[MovingAverageCross] " << domain::to_string(*direction)
              << " " << instrument << " @ "
              << format_timestamp(signal.timestamp) << "\n";
    queue_.put(std::move(signal));
  }
}

}  // namespace barsim

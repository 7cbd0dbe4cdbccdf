#pragma once

#include "barsim/data/i_data_source.hpp"
#include "barsim/domain/position.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/strategy/i_strategy.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace barsim {

struct MovingAverageCrossParams {
  std::size_t short_window{30};
  std::size_t long_window{120};
  double quantity{500.0};
};

// -----------------------------------------------------------------------------
// MovingAverageCrossStrategy
// -----------------------------------------------------------------------------
//
// @brief  Long-only simple-moving-average crossover on adjusted closes.
//
// @details
// On every MarketEvent, for each instrument, takes the last long_window
// adjusted closes (fewer early in the run) and computes:
//
//   n + 1 <= short            short = long = mean(all n)
//   short < n + 1 <= long     short = mean of the `short` closes before the
//                             newest (fewer if n == short), long = mean(all n)
//   otherwise                 both averages exclude the newest close
//
// Entering: short > long while OUT  → LONG signal,  state LONG.
// Leaving:  short < long while LONG → EXIT signal,  state OUT.
//
// The strategy keeps its own in-market flag per instrument; it does not ask
// the portfolio. Signals carry strength 1.0 and the configured quantity.
// -----------------------------------------------------------------------------
class MovingAverageCrossStrategy final : public IStrategy {
 public:
  // Throws ConfigError if a window is zero or short_window >= long_window.
  MovingAverageCrossStrategy(const IDataSource& data, EventQueue& queue,
                             MovingAverageCrossParams params,
                             std::string strategy_id = "mac");

  MovingAverageCrossStrategy(const MovingAverageCrossStrategy&) = delete;
  MovingAverageCrossStrategy& operator=(const MovingAverageCrossStrategy&) =
      delete;

  void onEvent(const Event& event) override;

  domain::InstrumentState state(const std::string& instrument) const;

 private:
  void onMarket();

  const IDataSource& data_;
  EventQueue& queue_;
  MovingAverageCrossParams params_;
  std::string strategy_id_;
  std::map<std::string, domain::InstrumentState> bought_;
};

}  // namespace barsim

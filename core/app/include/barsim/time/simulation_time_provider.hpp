#pragma once

#include "barsim/time/i_time_provider.hpp"

#include <cstdint>

namespace barsim {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — the replay clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when the scheduler says so.
//
// @details
// Backtest::drainQueue() calls advance_time() with a MarketEvent's timestamp
// before publishing it, so every fill produced while that tick is resolved
// carries the bar's date. The clock never runs ahead of the data source.
//
// Thread model: one clock per Backtest, touched only by the thread running
// that Backtest. A sweep builds a separate Backtest, and so a separate clock,
// per job.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  std::int64_t now_ms() const override;

  // Sets the clock. No monotonicity check: the calendar is ascending, and
  // tests set arbitrary times.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::int64_t current_time_ms_{0};
};

}  // namespace barsim

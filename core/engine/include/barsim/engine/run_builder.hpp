#pragma once

#include "barsim/config/run_config.hpp"
#include "barsim/data/in_memory_data_source.hpp"
#include "barsim/engine/backtest.hpp"

#include <memory>

namespace barsim {

// -----------------------------------------------------------------------------
// Run builder: RunConfig to a ready-to-run Backtest
// -----------------------------------------------------------------------------
// The executable and the sweep runner both go through these, so a config
// file and a programmatic sweep job build identical runs.
// -----------------------------------------------------------------------------

// Factory for the configured strategy type.
StrategyFactory makeStrategyFactory(const StrategyConfig& config);

BacktestParams makeBacktestParams(const RunConfig& config);

// Aligns `records` onto the configured window and wires a Backtest.
// Throws DataSourceError / ConfigError.
std::unique_ptr<Backtest> makeBacktest(
    const RunConfig& config, const InMemoryDataSource::RecordMap& records);

}  // namespace barsim

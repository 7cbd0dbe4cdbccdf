#pragma once

#include "barsim/analysis/performance_analyzer.hpp"
#include "barsim/engine/backtest.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace barsim {

// One independent run. `make` is called on the worker thread and must build
// a Backtest that shares nothing mutable with other jobs. A null Backtest or
// a non-positive `frequency` aborts that job with a ConfigError.
struct SweepJob {
  std::string name;
  std::function<std::unique_ptr<Backtest>()> make;
  double frequency{252.0};
};

struct SweepOutcome {
  std::string name;
  RunResult result;
  PerformanceSummary summary;
};

// -----------------------------------------------------------------------------
// runSweep(jobs)
// -----------------------------------------------------------------------------
//
// @brief  Runs every job concurrently (std::async, one task per job) and
//         returns the outcomes in job order.
//
// @details
// Each job owns its own data source, portfolio and event channel, so the
// tasks do not synchronise with each other. A job whose construction or run
// raises a BacktestError comes back Aborted with that error; the other jobs
// are unaffected. Any other exception is rethrown from runSweep() once all
// tasks have finished.
// -----------------------------------------------------------------------------
std::vector<SweepOutcome> runSweep(const std::vector<SweepJob>& jobs);

}  // namespace barsim

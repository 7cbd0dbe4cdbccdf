// =============================================================================
// sweep_runner_test.cpp
// =============================================================================
// Unit tests for barsim::runSweep: independent backtests run concurrently,
// one per job, results returned in job order.
// =============================================================================

#include "barsim/domain/errors.hpp"
#include "barsim/engine/sweep_runner.hpp"
#include "barsim/strategy/scripted_strategy.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using barsim::domain::SignalDirection;
using barsim::test::flat;

namespace {

// A flat-price backtest that goes long `quantity` of "A" on tick 1. An
// unknown `instrument` makes the run abort on tick 1.
std::function<std::unique_ptr<barsim::Backtest>()> job(
    double quantity, std::string instrument = "A") {
  return [quantity, instrument] {
    auto data = std::make_unique<barsim::InMemoryDataSource>(
        std::vector<std::string>{"A"},
        barsim::InMemoryDataSource::RecordMap{{"A", flat(10, 10.0)}});
    barsim::BacktestParams params;
    params.initial_capital = 1000000.0;
    return std::make_unique<barsim::Backtest>(
        std::move(data),
        [quantity, instrument](const barsim::IDataSource& d,
                               barsim::EventQueue& q) {
          auto s = std::make_unique<barsim::ScriptedStrategy>(d, q);
          s->at(1, SignalDirection::Long, instrument, quantity);
          return std::unique_ptr<barsim::IStrategy>(std::move(s));
        },
        params);
  };
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Outcomes come back in job order with their own results.
// Why: Each job owns its whole component graph; nothing is shared between
//      threads, so results must not leak across jobs.
// -----------------------------------------------------------------------------
TEST(SweepRunnerTest, RunsJobsIndependently) {
  std::vector<barsim::SweepJob> jobs;
  jobs.push_back({"small", job(100.0)});
  jobs.push_back({"large", job(1000.0)});
  jobs.push_back({"fractional", job(0.5)});

  const auto outcomes = barsim::runSweep(jobs);
  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_EQ(outcomes[0].name, "small");
  EXPECT_EQ(outcomes[1].name, "large");
  EXPECT_EQ(outcomes[2].name, "fractional");

  for (const auto& o : outcomes) {
    EXPECT_TRUE(o.result.complete()) << o.name;
    EXPECT_EQ(o.result.fills.size(), 5u) << o.name;
    EXPECT_EQ(o.result.holdings.size(), 11u) << o.name;
  }
  EXPECT_DOUBLE_EQ(outcomes[0].result.positions.back().quantity.at("A"),
                   100.0);
  EXPECT_DOUBLE_EQ(outcomes[1].result.positions.back().quantity.at("A"),
                   1000.0);
  // Flat prices: the only loss is commission.
  EXPECT_LT(outcomes[1].summary.total_return_pct, 0.0);
}

// -----------------------------------------------------------------------------
// 2. A job that aborts, or whose construction fails with a BacktestError,
//    is reported as aborted without stopping the others.
// -----------------------------------------------------------------------------
TEST(SweepRunnerTest, FailedJobsAreReportedNotFatal) {
  std::vector<barsim::SweepJob> jobs;
  jobs.push_back({"ok", job(100.0)});
  jobs.push_back({"unknown", job(100.0, "ZZZ")});
  jobs.push_back({"bad-config", [] () -> std::unique_ptr<barsim::Backtest> {
                    throw barsim::ConfigError("initial_capital must be positive");
                  }});

  const auto outcomes = barsim::runSweep(jobs);
  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_TRUE(outcomes[0].result.complete());

  EXPECT_FALSE(outcomes[1].result.complete());
  EXPECT_NE(outcomes[1].result.error.find("ZZZ"), std::string::npos);

  EXPECT_EQ(outcomes[2].result.status, barsim::RunStatus::Aborted);
  EXPECT_TRUE(outcomes[2].result.holdings.empty());
  EXPECT_DOUBLE_EQ(outcomes[2].summary.total_return_pct, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Errors outside the simulation's taxonomy propagate to the caller.
// -----------------------------------------------------------------------------
TEST(SweepRunnerTest, ForeignExceptionPropagates) {
  std::vector<barsim::SweepJob> jobs;
  jobs.push_back({"ok", job(100.0)});
  jobs.push_back({"broken", [] () -> std::unique_ptr<barsim::Backtest> {
                    throw std::out_of_range("broken job");
                  }});
  EXPECT_THROW(barsim::runSweep(jobs), std::out_of_range);
}

// -----------------------------------------------------------------------------
// 4. A job that builds nothing, or asks for a non-positive annualisation
//    frequency, aborts on its own; the other jobs still complete.
// -----------------------------------------------------------------------------
TEST(SweepRunnerTest, InvalidJobsAbortAlone) {
  std::vector<barsim::SweepJob> jobs;
  jobs.push_back({"null", [] { return std::unique_ptr<barsim::Backtest>(); }});
  jobs.push_back({"ok", job(100.0)});
  jobs.push_back({"zero-frequency", job(100.0), 0.0});

  const auto outcomes = barsim::runSweep(jobs);
  ASSERT_EQ(outcomes.size(), 3u);

  EXPECT_EQ(outcomes[0].result.status, barsim::RunStatus::Aborted);
  EXPECT_NE(outcomes[0].result.error.find("no backtest"), std::string::npos);
  EXPECT_TRUE(outcomes[0].result.holdings.empty());

  EXPECT_TRUE(outcomes[1].result.complete());
  EXPECT_EQ(outcomes[1].result.fills.size(), 5u);

  EXPECT_EQ(outcomes[2].result.status, barsim::RunStatus::Aborted);
  EXPECT_FALSE(outcomes[2].result.error.empty());
  EXPECT_DOUBLE_EQ(outcomes[2].summary.sharpe_ratio, 0.0);
}

TEST(SweepRunnerTest, EmptySweep) {
  EXPECT_TRUE(barsim::runSweep({}).empty());
}

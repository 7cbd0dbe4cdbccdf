// =============================================================================
// run_config_test.cpp
// =============================================================================
// Unit tests for the JSON run configuration and the run builder.
// =============================================================================

#include "barsim/config/run_config.hpp"
#include "barsim/domain/errors.hpp"
#include "barsim/engine/run_builder.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

using nlohmann::json;

namespace {

json minimal() { return json{{"instruments", {"601988"}}}; }

}  // namespace

// -----------------------------------------------------------------------------
// 1. Only the instrument list is required; everything else has a default.
// -----------------------------------------------------------------------------
TEST(RunConfigTest, Defaults) {
  const auto cfg = barsim::parseRunConfig(minimal());
  ASSERT_EQ(cfg.instruments.size(), 1u);
  EXPECT_EQ(cfg.instruments[0], "601988");
  EXPECT_EQ(cfg.data_dir, "./data");
  EXPECT_FALSE(cfg.start.has_value());
  EXPECT_FALSE(cfg.end.has_value());
  EXPECT_DOUBLE_EQ(cfg.initial_capital, 1000000.0);
  EXPECT_DOUBLE_EQ(cfg.frequency, 252.0);
  EXPECT_EQ(cfg.sizing.mode, barsim::SizingMode::Smoothed);
  EXPECT_EQ(cfg.sizing.slices, 5);
  EXPECT_EQ(cfg.exchange, "ARCA");
  EXPECT_EQ(cfg.strategy.type, barsim::StrategyType::MovingAverageCross);
  EXPECT_EQ(cfg.strategy.mac.short_window, 30u);
  EXPECT_EQ(cfg.strategy.mac.long_window, 120u);
  EXPECT_EQ(cfg.output.equity_curve_csv, "EquityCurve.csv");
  EXPECT_FALSE(cfg.verbose);
}

// -----------------------------------------------------------------------------
// 2. A full configuration is read field by field.
// -----------------------------------------------------------------------------
TEST(RunConfigTest, FullConfig) {
  const json j = json::parse(R"({
    "instruments": ["A", "B"],
    "data_dir": "/tmp/bars",
    "start": "2015-01-05",
    "end": "2016-12-30",
    "initial_capital": 50000,
    "frequency": 52,
    "sizing": {"mode": "naive", "slices": 3},
    "commission": {"minimum": 1.0, "tier_threshold": 1000,
                   "small_rate": 0.01, "large_rate": 0.005},
    "exchange": "SSE",
    "strategy": {"type": "scripted", "signals": [
      {"tick": 3, "direction": "SHORT", "instrument": "B", "quantity": 20}
    ]},
    "output": {"equity_curve_csv": "", "summary_json": "out.json"},
    "verbose": true
  })");

  const auto cfg = barsim::parseRunConfig(j);
  EXPECT_EQ(cfg.instruments.size(), 2u);
  EXPECT_EQ(cfg.data_dir, "/tmp/bars");
  EXPECT_EQ(*cfg.start, *barsim::parse_timestamp("2015-01-05"));
  EXPECT_EQ(*cfg.end, *barsim::parse_timestamp("2016-12-30"));
  EXPECT_DOUBLE_EQ(cfg.initial_capital, 50000.0);
  EXPECT_DOUBLE_EQ(cfg.frequency, 52.0);
  EXPECT_EQ(cfg.sizing.mode, barsim::SizingMode::Naive);
  EXPECT_EQ(cfg.sizing.slices, 3);
  EXPECT_DOUBLE_EQ(cfg.commission.tier_threshold, 1000.0);
  EXPECT_EQ(cfg.exchange, "SSE");
  ASSERT_EQ(cfg.strategy.type, barsim::StrategyType::Scripted);
  ASSERT_EQ(cfg.strategy.signals.size(), 1u);
  EXPECT_EQ(cfg.strategy.signals[0].tick, 3u);
  EXPECT_EQ(cfg.strategy.signals[0].direction,
            barsim::domain::SignalDirection::Short);
  EXPECT_DOUBLE_EQ(cfg.strategy.signals[0].quantity, 20.0);
  EXPECT_TRUE(cfg.output.equity_curve_csv.empty());
  EXPECT_EQ(cfg.output.summary_json, "out.json");
  EXPECT_TRUE(cfg.verbose);
}

// -----------------------------------------------------------------------------
// 3. Invalid values are ConfigErrors, including JSON type mismatches.
// Why: main() maps ConfigError to a usage exit; a raw nlohmann exception
//      would escape that mapping.
// -----------------------------------------------------------------------------
TEST(RunConfigTest, RejectsInvalidValues) {
  auto expectConfigError = [](json j) {
    EXPECT_THROW(barsim::parseRunConfig(j), barsim::ConfigError) << j.dump();
  };

  expectConfigError(json::object());
  expectConfigError(json::array());
  expectConfigError(json{{"instruments", json::array()}});
  expectConfigError(json{{"instruments", "601988"}});

  auto j = minimal();
  j["start"] = "2015-02-30";
  expectConfigError(j);

  j = minimal();
  j["start"] = "2016-01-01";
  j["end"] = "2015-01-01";
  expectConfigError(j);

  j = minimal();
  j["initial_capital"] = 0;
  expectConfigError(j);

  j = minimal();
  j["frequency"] = -1;
  expectConfigError(j);

  j = minimal();
  j["sizing"] = {{"mode", "twap"}};
  expectConfigError(j);

  j = minimal();
  j["sizing"] = {{"slices", 0}};
  expectConfigError(j);

  j = minimal();
  j["commission"] = {{"minimum", -1.0}};
  expectConfigError(j);

  j = minimal();
  j["strategy"] = {{"type", "mac"}, {"short_window", 10}, {"long_window", 5}};
  expectConfigError(j);

  j = minimal();
  j["strategy"] = {{"type", "pairs"}};
  expectConfigError(j);

  j = minimal();
  j["strategy"] = {
      {"type", "scripted"},
      {"signals", {{{"tick", 0}, {"direction", "LONG"}, {"instrument", "A"}}}}};
  expectConfigError(j);

  j = minimal();
  j["strategy"] = {
      {"type", "scripted"},
      {"signals", {{{"tick", 1}, {"direction", "BUY"}, {"instrument", "A"}}}}};
  expectConfigError(j);
}

// -----------------------------------------------------------------------------
// 4. File loading: missing file and malformed JSON are ConfigErrors.
// -----------------------------------------------------------------------------
TEST(RunConfigTest, LoadFromFile) {
  EXPECT_THROW(barsim::loadRunConfig("/nonexistent/barsim/run.json"),
               barsim::ConfigError);

  const std::string bad = ::testing::TempDir() + "barsim_bad_config.json";
  {
    std::ofstream out(bad);
    out << "{ \"instruments\": [";
  }
  EXPECT_THROW(barsim::loadRunConfig(bad), barsim::ConfigError);

  const std::string good = ::testing::TempDir() + "barsim_good_config.json";
  {
    std::ofstream out(good);
    out << minimal().dump();
  }
  EXPECT_EQ(barsim::loadRunConfig(good).instruments.size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. The builder turns a config plus records into a runnable backtest.
// -----------------------------------------------------------------------------
TEST(RunBuilderTest, BuildsScriptedBacktest) {
  auto cfg = barsim::parseRunConfig(json::parse(R"({
    "instruments": ["A"],
    "initial_capital": 100000,
    "sizing": {"mode": "naive"},
    "strategy": {"type": "scripted", "signals": [
      {"tick": 2, "direction": "LONG", "instrument": "A", "quantity": 1000}
    ]}
  })"));

  auto backtest = barsim::makeBacktest(
      cfg, {{"A", barsim::test::flat(5, 10.0)}});
  const auto result = backtest->run();

  ASSERT_TRUE(result.complete());
  ASSERT_EQ(result.fills.size(), 1u);
  EXPECT_DOUBLE_EQ(result.fills[0].quantity, 1000.0);
  EXPECT_NEAR(result.fills[0].commission, 8.0, 1e-12);
  EXPECT_NEAR(result.holdings.back().total, 100000.0 - 8.0, 1e-6);
}

TEST(RunBuilderTest, ParamsFollowConfig) {
  auto cfg = barsim::parseRunConfig(minimal());
  cfg.exchange = "SSE";
  cfg.start = barsim::test::day(0);
  const auto params = barsim::makeBacktestParams(cfg);
  EXPECT_DOUBLE_EQ(params.initial_capital, cfg.initial_capital);
  EXPECT_EQ(params.execution.exchange, "SSE");
  ASSERT_TRUE(params.start_time.has_value());
  EXPECT_EQ(*params.start_time, barsim::test::day(0));
  EXPECT_TRUE(static_cast<bool>(barsim::makeStrategyFactory(cfg.strategy)));
}

#pragma once

#include "barsim/domain/order.hpp"
#include "barsim/execution/commission.hpp"
#include "barsim/portfolio/sizing.hpp"
#include "barsim/strategy/moving_average_cross_strategy.hpp"
#include "barsim/time/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace barsim {

enum class StrategyType {
  MovingAverageCross,  // "mac"
  Scripted,            // "scripted"
};

// One entry of a scripted strategy's signal list.
struct ScriptedSignalConfig {
  std::uint64_t tick{1};
  domain::SignalDirection direction{domain::SignalDirection::Long};
  std::string instrument;
  double quantity{100.0};
  double strength{1.0};
};

struct StrategyConfig {
  StrategyType type{StrategyType::MovingAverageCross};
  MovingAverageCrossParams mac{};
  std::vector<ScriptedSignalConfig> signals;
};

// Empty path disables that output.
struct OutputConfig {
  std::string equity_curve_csv{"EquityCurve.csv"};
  std::string summary_json{"summary.json"};
};

// -----------------------------------------------------------------------------
// RunConfig — everything the barsim executable needs for one run
// -----------------------------------------------------------------------------
//
// @brief  Parsed and validated form of the JSON run file.
//
// @details
// Only "instruments" is required. Example:
//
//   {
//     "instruments": ["601988", "601985"],
//     "data_dir": "./data",
//     "start": "2010-02-20",
//     "end": "2020-01-01",
//     "initial_capital": 1000000.0,
//     "frequency": 252,
//     "sizing": { "mode": "smoothed", "slices": 5 },
//     "commission": { "minimum": 1.3, "tier_threshold": 500,
//                     "small_rate": 0.013, "large_rate": 0.008 },
//     "exchange": "ARCA",
//     "strategy": { "type": "mac", "short_window": 30,
//                   "long_window": 120, "quantity": 500 },
//     "output": { "equity_curve_csv": "EquityCurve.csv",
//                 "summary_json": "summary.json" },
//     "verbose": false
//   }
//
// A "scripted" strategy takes a "signals" array of
//   { "tick": 1, "direction": "LONG", "instrument": "601988",
//     "quantity": 500, "strength": 1.0 }
// -----------------------------------------------------------------------------
struct RunConfig {
  std::vector<std::string> instruments;
  std::string data_dir{"./data"};
  std::optional<Timestamp> start;
  std::optional<Timestamp> end;
  double initial_capital{1000000.0};
  double frequency{252.0};
  SizingConfig sizing{};
  CommissionSchedule commission{};
  std::string exchange{"ARCA"};
  StrategyConfig strategy{};
  OutputConfig output{};
  bool verbose{false};
};

// Throws ConfigError on a missing or invalid field. JSON type errors are
// reported as ConfigError too.
RunConfig parseRunConfig(const nlohmann::json& json);

// Reads and parses a JSON file. Throws ConfigError if it cannot be opened or
// is not valid JSON.
RunConfig loadRunConfig(const std::string& path);

}  // namespace barsim

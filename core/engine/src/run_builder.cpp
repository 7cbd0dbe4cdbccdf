#include "barsim/engine/run_builder.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/strategy/moving_average_cross_strategy.hpp"
#include "barsim/strategy/scripted_strategy.hpp"

#include <memory>
#include <vector>

namespace barsim {

StrategyFactory makeStrategyFactory(const StrategyConfig& config) {
  switch (config.type) {
    case StrategyType::MovingAverageCross: {
      const MovingAverageCrossParams params = config.mac;
      return [params](const IDataSource& data, EventQueue& queue) {
        return std::make_unique<MovingAverageCrossStrategy>(data, queue,
                                                            params);
      };
    }
    case StrategyType::Scripted: {
      const std::vector<ScriptedSignalConfig> signals = config.signals;
      return [signals](const IDataSource& data, EventQueue& queue) {
        auto strategy = std::make_unique<ScriptedStrategy>(data, queue);
        for (const auto& s : signals) {
          strategy->at(s.tick, s.direction, s.instrument, s.quantity,
                       s.strength);
        }
        return strategy;
      };
    }
  }
  throw ConfigError("unsupported strategy type");
}

BacktestParams makeBacktestParams(const RunConfig& config) {
  BacktestParams params;
  params.initial_capital = config.initial_capital;
  params.start_time = config.start;
  params.sizing = config.sizing;
  params.execution.commission = config.commission;
  params.execution.exchange = config.exchange;
  params.verbose = config.verbose;
  return params;
}

std::unique_ptr<Backtest> makeBacktest(
    const RunConfig& config, const InMemoryDataSource::RecordMap& records) {
  auto data = std::make_unique<InMemoryDataSource>(config.instruments, records,
                                                   config.start, config.end);
  return std::make_unique<Backtest>(std::move(data),
                                    makeStrategyFactory(config.strategy),
                                    makeBacktestParams(config));
}

}  // namespace barsim

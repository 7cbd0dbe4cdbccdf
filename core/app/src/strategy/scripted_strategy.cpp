#include "barsim/strategy/scripted_strategy.hpp"

#include <utility>

namespace barsim {

ScriptedStrategy::ScriptedStrategy(const IDataSource& data, EventQueue& queue,
                                   std::string strategy_id)
    : data_(data), queue_(queue), strategy_id_(std::move(strategy_id)) {}

ScriptedStrategy& ScriptedStrategy::at(std::uint64_t tick,
                                       domain::SignalDirection direction,
                                       const std::string& instrument,
                                       double quantity, double strength) {
  script_[tick].push_back(ScriptedSignal{direction, instrument, quantity,
                                         strength});
  return *this;
}

void ScriptedStrategy::onEvent(const Event& event) {
  if (!std::holds_alternative<MarketEvent>(event)) {
    return;
  }
  ++ticks_seen_;

  auto it = script_.find(ticks_seen_);
  if (it == script_.end()) {
    return;
  }
  for (const auto& s : it->second) {
    SignalEvent signal;
    signal.strategy_id = strategy_id_;
    signal.instrument = s.instrument;
    // Throws UnknownInstrumentError for an instrument the feed lacks.
    signal.timestamp = data_.latestBarTimestamp(s.instrument);
    signal.direction = s.direction;
    signal.strength = s.strength;
    signal.quantity = s.quantity;
    queue_.put(std::move(signal));
  }
}

}  // namespace barsim

#pragma once

#include "barsim/data/i_data_source.hpp"
#include "barsim/domain/order.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/strategy/i_strategy.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// ScriptedStrategy
// -----------------------------------------------------------------------------
// Responsibility: Emits pre-registered signals at given tick numbers. Has no
// market logic of its own.
//
// Why in architecture: Gives tests and demos exact control over when the
// portfolio sees which signal, so smoothing and accounting can be checked
// against hand-computed numbers.
//
// Ticks are counted from the MarketEvents this strategy receives, starting
// at 1. Signals registered for the same tick are emitted in registration
// order. Each signal is stamped with the latest bar timestamp of its
// instrument.
// -----------------------------------------------------------------------------
class ScriptedStrategy final : public IStrategy {
 public:
  ScriptedStrategy(const IDataSource& data, EventQueue& queue,
                   std::string strategy_id = "scripted");

  ScriptedStrategy(const ScriptedStrategy&) = delete;
  ScriptedStrategy& operator=(const ScriptedStrategy&) = delete;

  // Registers a signal to be emitted on the given 1-based tick. Returns
  // *this so scripts can be chained.
  ScriptedStrategy& at(std::uint64_t tick, domain::SignalDirection direction,
                       const std::string& instrument, double quantity = 100.0,
                       double strength = 1.0);

  void onEvent(const Event& event) override;

  std::uint64_t ticksSeen() const { return ticks_seen_; }

 private:
  struct ScriptedSignal {
    domain::SignalDirection direction;
    std::string instrument;
    double quantity;
    double strength;
  };

  const IDataSource& data_;
  EventQueue& queue_;
  std::string strategy_id_;
  std::uint64_t ticks_seen_{0};
  std::map<std::uint64_t, std::vector<ScriptedSignal>> script_;
};

}  // namespace barsim

#include "barsim/execution/simulated_execution_engine.hpp"

#include "barsim/time/time_utils.hpp"

#include <utility>

namespace barsim {

SimulatedExecutionEngine::SimulatedExecutionEngine(
    EventBus& bus, EventQueue& queue, const IDataSource& data,
    const ITimeProvider& time_provider, ExecutionConfig config)
    : bus_(bus),
      queue_(queue),
      data_(data),
      time_provider_(time_provider),
      config_(std::move(config)) {
  subscription_id_ = bus_.subscribe<OrderEvent>(
      [this](const OrderEvent& e) { onOrder(e); });
}

SimulatedExecutionEngine::~SimulatedExecutionEngine() {
  bus_.unsubscribe(subscription_id_);
}

FillEvent SimulatedExecutionEngine::execute(const OrderEvent& order) const {
  FillEvent fill;
  fill.timestamp = ms_to_timestamp(time_provider_.now_ms());
  fill.instrument = order.instrument();
  fill.exchange = config_.exchange;
  fill.quantity = order.quantity();
  fill.direction = order.direction();
  fill.fill_cost =
      data_.latestBarValue(order.instrument(), domain::BarField::Close);
  fill.commission = config_.commission(order.quantity());
  return fill;
}

void SimulatedExecutionEngine::onOrder(const OrderEvent& event) {
  queue_.put(execute(event));
}

}  // namespace barsim

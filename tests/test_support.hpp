#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Bar builders shared by the component tests. Every series is daily, starting
// on 2020-01-01 (day 0), UTC midnight.
// =============================================================================

#include "barsim/data/in_memory_data_source.hpp"
#include "barsim/domain/bar.hpp"
#include "barsim/eventbus/event_bus.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/time/time_utils.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace barsim {
namespace test {

inline Timestamp day(int n) {
  return *parse_timestamp("2020-01-01") + std::chrono::hours(24 * n);
}

inline domain::BarRecord record(int d, double close, double adj_factor = 1.0) {
  domain::BarRecord r;
  r.timestamp = day(d);
  r.open = close;
  r.high = close;
  r.low = close;
  r.close = close;
  r.volume = 1000.0;
  r.adj_factor = adj_factor;
  return r;
}

// One record per day from `first_day`, closes taken in order.
inline std::vector<domain::BarRecord> closes(const std::vector<double>& values,
                                             int first_day = 0) {
  std::vector<domain::BarRecord> out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    out.push_back(record(first_day + static_cast<int>(i), values[i]));
  }
  return out;
}

inline std::vector<domain::BarRecord> flat(int days, double close) {
  return closes(std::vector<double>(static_cast<std::size_t>(days), close));
}

// Reveals one tick and publishes everything the tick produces, FIFO, until
// the queue is empty. Mirrors the Backtest drain loop without the clock.
inline bool step(IDataSource& data, EventQueue& queue, EventBus& bus) {
  if (!data.advance(queue)) {
    return false;
  }
  while (auto event = queue.try_pop()) {
    bus.publish(*event);
  }
  return true;
}

}  // namespace test
}  // namespace barsim

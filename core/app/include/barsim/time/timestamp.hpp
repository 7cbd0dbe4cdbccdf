#pragma once

#include <chrono>

namespace barsim {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Type alias for simulated time. Used by bars and by all events for ordering
// and auditing. std::chrono::system_clock::time_point is preferred over raw
// time_t because it is type-safe and has well-defined resolution.
//
// In a backtest every Timestamp comes from the replayed data, never from the
// wall clock.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace barsim

#pragma once

#include <cstdint>

namespace barsim {

// -----------------------------------------------------------------------------
// ITimeProvider — where components read "now"
// -----------------------------------------------------------------------------
//
// @brief  Read-only clock interface handed to components as a const
//         reference.
//
// @details
// A replayed bar dated 2015-03-02 must produce a fill dated 2015-03-02, and
// two runs over the same feed must stamp identical times. Nothing inside a
// run may therefore read std::chrono::system_clock; the execution simulator
// asks this interface instead, and the Backtest moves the only implementation
// forward as MarketEvents are dispatched.
//
// Ownership:
//   The Backtest owns the clock. Components keep a reference and must not
//   outlive it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds (UTC) of the tick being dispatched; 0 before the
  // first tick.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace barsim

#pragma once

#include "barsim/time/timestamp.hpp"

#include <map>
#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// HoldingsSnapshot — one row of the holdings history
// -----------------------------------------------------------------------------
//
// @brief  Portfolio value at one timestamp.
//
// @details
// Invariant: total == cash + sum(market_value). commission is cumulative
// over the whole run, and is already included in cash.
//
// market_value is keyed by instrument. std::map keeps iteration order
// stable, so two identical runs produce identical rows.
// -----------------------------------------------------------------------------
struct HoldingsSnapshot {
  Timestamp timestamp{};
  std::map<std::string, double> market_value;
  double cash{0.0};
  double commission{0.0};
  double total{0.0};
};

// Signed (or clamped) quantity held per instrument at one timestamp.
struct PositionsSnapshot {
  Timestamp timestamp{};
  std::map<std::string, double> quantity;
};

inline bool operator==(const HoldingsSnapshot& a, const HoldingsSnapshot& b) {
  return a.timestamp == b.timestamp && a.market_value == b.market_value &&
         a.cash == b.cash && a.commission == b.commission && a.total == b.total;
}

inline bool operator!=(const HoldingsSnapshot& a, const HoldingsSnapshot& b) {
  return !(a == b);
}

inline bool operator==(const PositionsSnapshot& a, const PositionsSnapshot& b) {
  return a.timestamp == b.timestamp && a.quantity == b.quantity;
}

inline bool operator!=(const PositionsSnapshot& a, const PositionsSnapshot& b) {
  return !(a == b);
}

}  // namespace barsim

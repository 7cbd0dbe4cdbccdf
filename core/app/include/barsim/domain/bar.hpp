#pragma once

#include "barsim/time/timestamp.hpp"

#include <string>

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// BarRecord — one raw row of a historical feed
// -----------------------------------------------------------------------------
//
// @brief  What a feed supplies per instrument per date, before alignment.
//
// @details
// adj_factor multiplies close to give the split/dividend adjusted close.
// A feed without adjustment data leaves it at 1.0.
// -----------------------------------------------------------------------------
struct BarRecord {
  Timestamp timestamp{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  double adj_factor{1.0};
};

// -----------------------------------------------------------------------------
// BarField — selector for single-value bar queries
// -----------------------------------------------------------------------------
enum class BarField {
  Open,
  High,
  Low,
  Close,
  Volume,
  AdjFactor,
  AdjClose,
  Returns,
};

// -----------------------------------------------------------------------------
// Bar — an aligned, immutable bar as replayed to the engine
// -----------------------------------------------------------------------------
//
// @brief  A BarRecord placed on the shared calendar plus its derived fields.
//
// @details
// Produced once by the data source during alignment and never mutated
// afterwards. A forward-filled bar repeats the previous record's prices under
// the new calendar timestamp, so its period return is 0.
//
//   adj_close = close * adj_factor
//   returns   = adj_close[t] / adj_close[t-1] - 1   (0 on the first bar)
// -----------------------------------------------------------------------------
struct Bar {
  Timestamp timestamp{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  double adj_factor{1.0};
  double adj_close{0.0};
  double returns{0.0};

  // Returns the field selected by `field`.
  double value(BarField field) const {
    switch (field) {
      case BarField::Open:
        return open;
      case BarField::High:
        return high;
      case BarField::Low:
        return low;
      case BarField::Close:
        return close;
      case BarField::Volume:
        return volume;
      case BarField::AdjFactor:
        return adj_factor;
      case BarField::AdjClose:
        return adj_close;
      case BarField::Returns:
        return returns;
    }
    return close;
  }
};

inline const char* to_string(BarField field) {
  switch (field) {
    case BarField::Open:
      return "open";
    case BarField::High:
      return "high";
    case BarField::Low:
      return "low";
    case BarField::Close:
      return "close";
    case BarField::Volume:
      return "volume";
    case BarField::AdjFactor:
      return "adj_factor";
    case BarField::AdjClose:
      return "adj_close";
    case BarField::Returns:
      return "returns";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace barsim

#pragma once

#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// Order sizing policy
// -----------------------------------------------------------------------------
//   Smoothed: split each signal into `slices` equal orders released on
//              consecutive ticks, starting with the signal's tick.
//   Naive:    one order for the whole quantity, released immediately.
// -----------------------------------------------------------------------------
enum class SizingMode {
  Smoothed,
  Naive,
};

struct SizingConfig {
  SizingMode mode{SizingMode::Smoothed};
  int slices{5};
};

inline const char* to_string(SizingMode mode) {
  return mode == SizingMode::Smoothed ? "smoothed" : "naive";
}

}  // namespace barsim

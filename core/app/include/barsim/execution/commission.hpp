#pragma once

#include <algorithm>

namespace barsim {

// -----------------------------------------------------------------------------
// CommissionSchedule — tiered per-share commission with a floor
// -----------------------------------------------------------------------------
//
//   qty <= tier_threshold   commission = max(minimum, small_rate * qty)
//   qty >  tier_threshold   commission = max(minimum, large_rate * qty)
//
// Defaults: 500 shares → 6.50, 501 shares → 4.008, 50 shares → 1.30.
// -----------------------------------------------------------------------------
struct CommissionSchedule {
  double minimum{1.3};
  double tier_threshold{500.0};
  double small_rate{0.013};
  double large_rate{0.008};

  double operator()(double quantity) const {
    const double rate = quantity <= tier_threshold ? small_rate : large_rate;
    return std::max(minimum, rate * quantity);
  }
};

}  // namespace barsim

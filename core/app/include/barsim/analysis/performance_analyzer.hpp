#pragma once

#include "barsim/portfolio/holdings.hpp"
#include "barsim/time/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ostream>
#include <vector>

namespace barsim {

// One row of the equity curve.
struct EquityPoint {
  Timestamp timestamp{};
  double total{0.0};
  double returns{0.0};       // total[t] / total[t-1] - 1, 0 on the first row
  double equity_curve{1.0};  // cumulative product of (1 + returns)
  double drawdown{0.0};      // (peak - equity) / peak, 0 at a new high
};

struct PerformanceSummary {
  double total_return_pct{0.0};
  double sharpe_ratio{0.0};
  double max_drawdown_pct{0.0};
  std::size_t drawdown_duration{0};  // longest run of ticks under water
};

// -----------------------------------------------------------------------------
// PerformanceAnalyzer
// -----------------------------------------------------------------------------
//
// @brief  Post-run statistics over a holdings history.
//
// @details
// Stateless apart from the annualisation factor. Works on any holdings
// vector, clamped or raw, complete or from an aborted run.
//
//   Sharpe        sqrt(periods) * mean(returns) / stdev(returns)
//                 stdev is the sample (n-1) deviation; 0 if it is 0 or
//                 there are fewer than 2 rows.
//   Drawdown      relative to the running peak of the equity curve.
//   Duration      the longest run of consecutive rows with drawdown > 0.
//
// A row whose predecessor has total == 0 gets a 0 return rather than inf.
// -----------------------------------------------------------------------------
class PerformanceAnalyzer {
 public:
  // periods: bars per year used for annualisation (252 for daily bars).
  explicit PerformanceAnalyzer(double periods = 252.0);

  std::vector<EquityPoint> equityCurve(
      const std::vector<HoldingsSnapshot>& holdings) const;

  PerformanceSummary summarize(const std::vector<EquityPoint>& curve) const;

  PerformanceSummary summarize(
      const std::vector<HoldingsSnapshot>& holdings) const {
    return summarize(equityCurve(holdings));
  }

  // Writes "datetime,total,returns,equity_curve,drawdown" plus one line per
  // point.
  static void writeEquityCurveCsv(std::ostream& out,
                                  const std::vector<EquityPoint>& curve);

  static nlohmann::json summaryToJson(const PerformanceSummary& summary,
                                      bool complete);

  double periods() const { return periods_; }

 private:
  double periods_;
};

}  // namespace barsim

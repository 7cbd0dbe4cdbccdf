#include "barsim/analysis/performance_analyzer.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>

namespace barsim {

PerformanceAnalyzer::PerformanceAnalyzer(double periods) : periods_(periods) {
  if (!(periods_ > 0.0)) {
    throw ConfigError("frequency must be positive");
  }
}

// -----------------------------------------------------------------------------
// equityCurve: returns, cumulative equity and drawdown per row
// -----------------------------------------------------------------------------
std::vector<EquityPoint> PerformanceAnalyzer::equityCurve(
    const std::vector<HoldingsSnapshot>& holdings) const {
  std::vector<EquityPoint> curve;
  curve.reserve(holdings.size());

  double equity = 1.0;
  double peak = 1.0;
  for (std::size_t i = 0; i < holdings.size(); ++i) {
    EquityPoint p;
    p.timestamp = holdings[i].timestamp;
    p.total = holdings[i].total;
    if (i > 0 && holdings[i - 1].total != 0.0) {
      p.returns = holdings[i].total / holdings[i - 1].total - 1.0;
    }
    equity *= 1.0 + p.returns;
    p.equity_curve = equity;

    peak = std::max(peak, equity);
    p.drawdown = peak > 0.0 ? (peak - equity) / peak : 0.0;
    curve.push_back(p);
  }
  return curve;
}

// -----------------------------------------------------------------------------
// summarize
// -----------------------------------------------------------------------------
PerformanceSummary PerformanceAnalyzer::summarize(
    const std::vector<EquityPoint>& curve) const {
  PerformanceSummary s;
  if (curve.empty()) {
    return s;
  }

  s.total_return_pct = (curve.back().equity_curve - 1.0) * 100.0;

  const auto n = static_cast<double>(curve.size());
  if (curve.size() >= 2) {
    double mean = 0.0;
    for (const auto& p : curve) {
      mean += p.returns;
    }
    mean /= n;

    double var = 0.0;
    for (const auto& p : curve) {
      var += (p.returns - mean) * (p.returns - mean);
    }
    const double stdev = std::sqrt(var / (n - 1.0));
    if (stdev > 0.0) {
      s.sharpe_ratio = std::sqrt(periods_) * mean / stdev;
    }
  }

  double max_dd = 0.0;
  std::size_t run = 0;
  for (const auto& p : curve) {
    max_dd = std::max(max_dd, p.drawdown);
    if (p.drawdown > 0.0) {
      ++run;
      s.drawdown_duration = std::max(s.drawdown_duration, run);
    } else {
      run = 0;
    }
  }
  s.max_drawdown_pct = max_dd * 100.0;
  return s;
}

// -----------------------------------------------------------------------------
// Export
// -----------------------------------------------------------------------------
void PerformanceAnalyzer::writeEquityCurveCsv(
    std::ostream& out, const std::vector<EquityPoint>& curve) {
  out << "datetime,total,returns,equity_curve,drawdown\n";
  out << std::setprecision(10);
  for (const auto& p : curve) {
    out << format_timestamp(p.timestamp) << ',' << p.total << ',' << p.returns
        << ',' << p.equity_curve << ',' << p.drawdown << '\n';
  }
}

nlohmann::json PerformanceAnalyzer::summaryToJson(
    const PerformanceSummary& summary, bool complete) {
  nlohmann::json j;
  j["total_return_pct"] = summary.total_return_pct;
  j["sharpe_ratio"] = summary.sharpe_ratio;
  j["max_drawdown_pct"] = summary.max_drawdown_pct;
  j["drawdown_duration"] = summary.drawdown_duration;
  j["complete"] = complete;
  return j;
}

}  // namespace barsim

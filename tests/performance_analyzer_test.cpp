// =============================================================================
// performance_analyzer_test.cpp
// =============================================================================
// Unit tests for barsim::PerformanceAnalyzer.
// =============================================================================

#include "barsim/analysis/performance_analyzer.hpp"
#include "barsim/domain/errors.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using barsim::test::day;

namespace {

std::vector<barsim::HoldingsSnapshot> totals(const std::vector<double>& values) {
  std::vector<barsim::HoldingsSnapshot> rows;
  for (std::size_t i = 0; i < values.size(); ++i) {
    barsim::HoldingsSnapshot h;
    h.timestamp = day(static_cast<int>(i));
    h.cash = values[i];
    h.total = values[i];
    rows.push_back(h);
  }
  return rows;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Returns, equity and drawdown per row.
// -----------------------------------------------------------------------------
TEST(PerformanceAnalyzerTest, EquityCurveColumns) {
  barsim::PerformanceAnalyzer analyzer;
  const auto curve = analyzer.equityCurve(totals({100, 110, 104.5}));
  ASSERT_EQ(curve.size(), 3u);

  EXPECT_DOUBLE_EQ(curve[0].returns, 0.0);
  EXPECT_DOUBLE_EQ(curve[0].equity_curve, 1.0);
  EXPECT_DOUBLE_EQ(curve[0].drawdown, 0.0);

  EXPECT_NEAR(curve[1].returns, 0.1, 1e-12);
  EXPECT_NEAR(curve[1].equity_curve, 1.1, 1e-12);
  EXPECT_DOUBLE_EQ(curve[1].drawdown, 0.0);

  EXPECT_NEAR(curve[2].returns, -0.05, 1e-12);
  EXPECT_NEAR(curve[2].equity_curve, 1.045, 1e-12);
  EXPECT_NEAR(curve[2].drawdown, 0.05, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Summary statistics: total return, annualised Sharpe (sample stdev),
//    max drawdown.
// -----------------------------------------------------------------------------
TEST(PerformanceAnalyzerTest, SummaryStatistics) {
  barsim::PerformanceAnalyzer analyzer(252);
  const auto summary = analyzer.summarize(totals({100, 110, 104.5}));
  EXPECT_NEAR(summary.total_return_pct, 4.5, 1e-9);
  EXPECT_NEAR(summary.sharpe_ratio, 3.4641016151377544, 1e-9);
  EXPECT_NEAR(summary.max_drawdown_pct, 5.0, 1e-9);
  EXPECT_EQ(summary.drawdown_duration, 1u);

  // Sharpe scales with sqrt(periods): a quarter of the bars, half the ratio.
  barsim::PerformanceAnalyzer quarterly(63);
  EXPECT_DOUBLE_EQ(analyzer.periods(), 252.0);
  EXPECT_DOUBLE_EQ(quarterly.periods(), 63.0);
  EXPECT_NEAR(quarterly.summarize(totals({100, 110, 104.5})).sharpe_ratio,
              summary.sharpe_ratio / 2.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Drawdown duration is the longest run of rows below the running peak.
// -----------------------------------------------------------------------------
TEST(PerformanceAnalyzerTest, DrawdownDuration) {
  barsim::PerformanceAnalyzer analyzer;
  std::vector<double> values = {100, 101, 102, 103, 104, 105};
  for (double v = 104; v >= 95; v -= 1) {
    values.push_back(v);
  }
  values.push_back(110);

  const auto summary = analyzer.summarize(totals(values));
  EXPECT_EQ(summary.drawdown_duration, 10u);
  EXPECT_NEAR(summary.max_drawdown_pct, 9.5238095238, 1e-6);
}

// -----------------------------------------------------------------------------
// 4. Degenerate inputs: flat equity and single rows give a zero Sharpe, and
//    an empty history gives an all-zero summary.
// Why: A run that never traded must still produce a printable summary.
// -----------------------------------------------------------------------------
TEST(PerformanceAnalyzerTest, DegenerateInputs) {
  barsim::PerformanceAnalyzer analyzer;
  const auto flat = analyzer.summarize(totals({100, 100, 100}));
  EXPECT_DOUBLE_EQ(flat.sharpe_ratio, 0.0);
  EXPECT_DOUBLE_EQ(flat.total_return_pct, 0.0);
  EXPECT_EQ(flat.drawdown_duration, 0u);

  EXPECT_DOUBLE_EQ(analyzer.summarize(totals({100})).sharpe_ratio, 0.0);

  const auto empty = analyzer.summarize(std::vector<barsim::HoldingsSnapshot>{});
  EXPECT_DOUBLE_EQ(empty.total_return_pct, 0.0);
  EXPECT_DOUBLE_EQ(empty.max_drawdown_pct, 0.0);

  EXPECT_THROW(barsim::PerformanceAnalyzer(0.0), barsim::ConfigError);
}

// -----------------------------------------------------------------------------
// 5. CSV export: header plus one line per point, dates formatted.
// -----------------------------------------------------------------------------
TEST(PerformanceAnalyzerTest, WritesEquityCurveCsv) {
  barsim::PerformanceAnalyzer analyzer;
  const auto curve = analyzer.equityCurve(totals({100, 110}));

  std::ostringstream out;
  barsim::PerformanceAnalyzer::writeEquityCurveCsv(out, curve);

  std::istringstream lines(out.str());
  std::string line;
  std::getline(lines, line);
  EXPECT_EQ(line, "datetime,total,returns,equity_curve,drawdown");
  std::getline(lines, line);
  EXPECT_EQ(line, "2020-01-01,100,0,1,0");
  std::getline(lines, line);
  EXPECT_EQ(line.substr(0, 15), "2020-01-02,110,");
  EXPECT_FALSE(std::getline(lines, line));
}

// -----------------------------------------------------------------------------
// 6. JSON summary carries the completeness flag.
// -----------------------------------------------------------------------------
TEST(PerformanceAnalyzerTest, SummaryJson) {
  barsim::PerformanceSummary summary;
  summary.total_return_pct = 4.5;
  summary.drawdown_duration = 3;

  const auto j = barsim::PerformanceAnalyzer::summaryToJson(summary, false);
  EXPECT_DOUBLE_EQ(j.at("total_return_pct").get<double>(), 4.5);
  EXPECT_EQ(j.at("drawdown_duration").get<std::size_t>(), 3u);
  EXPECT_FALSE(j.at("complete").get<bool>());
  EXPECT_TRUE(j.contains("sharpe_ratio"));
  EXPECT_TRUE(j.contains("max_drawdown_pct"));
}

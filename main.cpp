// -----------------------------------------------------------------------------
// barsim — single executable entry point.
//
//   barsim <config.json>
//
//   1) Load and validate the JSON run configuration.
//   2) Read <data_dir>/<instrument>.csv for every configured instrument.
//   3) Build the Backtest (data source, strategy, portfolio, execution) and
//      replay the feed to the end.
//   4) Print the summary statistics and write the equity curve CSV and the
//      summary JSON.
//
// Exit codes:
//   0  run completed
//   1  run aborted; partial results are still printed and exported,
//      labelled INCOMPLETE
//   2  usage, configuration or input data error (nothing was run)
// -----------------------------------------------------------------------------

#include "barsim/analysis/performance_analyzer.hpp"
#include "barsim/config/run_config.hpp"
#include "barsim/data/csv_bar_loader.hpp"
#include "barsim/domain/errors.hpp"
#include "barsim/engine/backtest.hpp"
#include "barsim/engine/run_builder.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitAborted = 1;
constexpr int kExitUsage = 2;

void printSummary(const barsim::PerformanceSummary& s, bool complete) {
  std::cout << std::fixed << std::setprecision(2);
  if (!complete) {
    std::cout << "[main] INCOMPLETE: statistics cover a partial run.\n";
  }
  std::cout << "Total Return:      " << s.total_return_pct << "%\n"
            << "Sharpe Ratio:      " << s.sharpe_ratio << "\n"
            << "Max Drawdown:      " << s.max_drawdown_pct << "%\n"
            << "Drawdown Duration: " << s.drawdown_duration << "\n";
  std::cout.unsetf(std::ios::floatfield);
}

// Output failures are reported but do not change the exit code of a run
// that already finished.
void writeOutputs(const barsim::OutputConfig& output,
                  const std::vector<barsim::EquityPoint>& curve,
                  const barsim::PerformanceSummary& summary, bool complete) {
  if (!output.equity_curve_csv.empty()) {
    std::ofstream csv(output.equity_curve_csv);
    if (csv) {
      barsim::PerformanceAnalyzer::writeEquityCurveCsv(csv, curve);
      std::cout << "[main] Equity curve written to " << output.equity_curve_csv
                << "\n";
    } else {
      std::cerr << "[main] WARNING: cannot write " << output.equity_curve_csv
                << "\n";
    }
  }
  if (!output.summary_json.empty()) {
    std::ofstream json(output.summary_json);
    if (json) {
      json << barsim::PerformanceAnalyzer::summaryToJson(summary, complete)
                  .dump(2)
           << "\n";
      std::cout << "[main] Summary written to " << output.summary_json << "\n";
    } else {
      std::cerr << "[main] WARNING: cannot write " << output.summary_json
                << "\n";
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << (argc > 0 ? argv[0] : "barsim")
              << " <config.json>\n";
    return kExitUsage;
  }

  // -------------------------------------------------------------------------
  // 1) + 2) Configuration and bar data. Failures here mean nothing ran.
  // -------------------------------------------------------------------------
  barsim::RunConfig config;
  std::unique_ptr<barsim::Backtest> backtest;
  try {
    config = barsim::loadRunConfig(argv[1]);
    const auto records =
        barsim::CsvBarLoader::loadDirectory(config.data_dir, config.instruments);
    backtest = barsim::makeBacktest(config, records);
  } catch (const barsim::BacktestError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return kExitUsage;
  }

  // -------------------------------------------------------------------------
  // 3) Replay.
  // -------------------------------------------------------------------------
  const barsim::RunResult result = backtest->run();
  if (!result.complete()) {
    std::cerr << "[main] INCOMPLETE run: " << result.error << "\n";
  }

  // -------------------------------------------------------------------------
  // 4) Statistics and export.
  // -------------------------------------------------------------------------
  const barsim::PerformanceAnalyzer analyzer(config.frequency);
  const auto curve = analyzer.equityCurve(result.holdings);
  const auto summary = analyzer.summarize(curve);
  printSummary(summary, result.complete());
  writeOutputs(config.output, curve, summary, result.complete());

  return result.complete() ? kExitCompleted : kExitAborted;
}

#include "barsim/engine/sweep_runner.hpp"

#include "barsim/domain/errors.hpp"

#include <future>
#include <iostream>

namespace barsim {

namespace {

SweepOutcome runJob(const SweepJob& job) {
  SweepOutcome outcome;
  outcome.name = job.name;
  try {
    const PerformanceAnalyzer analyzer(job.frequency);
    std::unique_ptr<Backtest> backtest = job.make();
    if (!backtest) {
      throw ConfigError("sweep job '" + job.name + "' built no backtest");
    }
    outcome.result = backtest->run();
    outcome.summary = analyzer.summarize(outcome.result.holdings);
  } catch (const BacktestError& e) {
    // The summary stays all-zero: no analyzer or no history to report on.
    outcome.result.status = RunStatus::Aborted;
    outcome.result.error = e.what();
    std::cerr << "[Sweep] job '" << job.name << "' failed: " << e.what()
              << "\n";
  }
  return outcome;
}

}  // namespace

std::vector<SweepOutcome> runSweep(const std::vector<SweepJob>& jobs) {
  std::vector<std::future<SweepOutcome>> futures;
  futures.reserve(jobs.size());
  for (const auto& job : jobs) {
    futures.push_back(
        std::async(std::launch::async, [&job] { return runJob(job); }));
  }

  // If a get() throws, the remaining futures are destroyed during unwinding,
  // and a std::async future blocks until its task is done, so no task
  // outlives `jobs`.
  std::vector<SweepOutcome> outcomes;
  outcomes.reserve(jobs.size());
  for (auto& f : futures) {
    outcomes.push_back(f.get());
  }
  return outcomes;
}

}  // namespace barsim

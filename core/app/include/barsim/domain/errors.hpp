#pragma once

#include <stdexcept>
#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every failure the simulation can raise derives from BacktestError.
//
// @details
// The replay is closed and deterministic, so there is nothing to retry: an
// error means the inputs (data, config, strategy output) are wrong. All of
// these propagate up to Backtest::run(), which stops the scheduler and
// labels the partial result as aborted.
//
// Data exhaustion is NOT an error. IDataSource::advance() returns false.
// -----------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// An event failed its construction invariant (e.g. Order quantity <= 0).
class ConstructionError : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// A query named an instrument the data source does not carry.
class UnknownInstrumentError : public BacktestError {
 public:
  explicit UnknownInstrumentError(const std::string& instrument)
      : BacktestError("Unknown instrument: " + instrument),
        instrument_(instrument) {}

  const std::string& instrument() const { return instrument_; }

 private:
  std::string instrument_;
};

// A bar query arrived before the first tick revealed any bar.
class NoMarketDataError : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// Input bar data could not be read or aligned.
class DataSourceError : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// The run configuration is missing or invalid.
class ConfigError : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

}  // namespace barsim

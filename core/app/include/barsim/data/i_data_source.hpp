#pragma once

#include "barsim/domain/bar.hpp"
#include "barsim/eventbus/event_queue.hpp"
#include "barsim/time/timestamp.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// IDataSource — bar replay contract
// -----------------------------------------------------------------------------
//
// @brief  Supplies time-ordered bars per instrument, one calendar step at a
//         time, and answers history queries about what has been revealed.
//
// @details
// The data source is the only thing that decides when a tick happens. Each
// successful advance() reveals the next bar for EVERY instrument (the
// calendar is shared) and puts exactly one MarketEvent on the queue.
// Queries only ever see bars up to the current cursor, so a strategy cannot
// peek at tomorrow's close.
//
// Errors:
//   - Query for an instrument not in instruments()  → UnknownInstrumentError
//   - Query before the first advance()              → NoMarketDataError
//   - Exhaustion is NOT an error: advance() returns false and
//     continueBacktest() turns false for the rest of the run.
//
// Ownership:
//   Owned by the Backtest (std::unique_ptr<IDataSource>). Strategy, Portfolio
//   and execution simulator hold a const reference.
// -----------------------------------------------------------------------------
class IDataSource {
 public:
  virtual ~IDataSource() = default;

  // Most recent revealed bar.
  virtual const domain::Bar& latestBar(const std::string& instrument) const = 0;

  // Up to n most recent bars, oldest first. Fewer if history is shorter.
  virtual std::vector<domain::Bar> latestBars(const std::string& instrument,
                                              std::size_t n) const = 0;

  virtual Timestamp latestBarTimestamp(const std::string& instrument) const = 0;

  virtual double latestBarValue(const std::string& instrument,
                                domain::BarField field) const = 0;

  // Up to n most recent values of one field, oldest first.
  virtual std::vector<double> latestBarsValues(const std::string& instrument,
                                               domain::BarField field,
                                               std::size_t n) const = 0;

  // -------------------------------------------------------------------------
  // advance(queue)
  // -------------------------------------------------------------------------
  // @brief  Reveals the next calendar step and puts one MarketEvent on the
  //         queue.
  //
  // @return false once the calendar is exhausted; nothing is enqueued and
  //         every later call also returns false.
  // -------------------------------------------------------------------------
  virtual bool advance(EventQueue& queue) = 0;

  virtual bool continueBacktest() const = 0;

  // Instruments in the order they were configured.
  virtual const std::vector<std::string>& instruments() const = 0;
};

}  // namespace barsim

#pragma once

#include "barsim/data/i_data_source.hpp"
#include "barsim/domain/bar.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// InMemoryDataSource — fully materialised, calendar-aligned bar replay
// -----------------------------------------------------------------------------
//
// @brief  Reference IDataSource. All bars are aligned in the constructor; the
//         hot loop only moves a cursor.
//
// @details
// Construction pipeline (per instrument, then across instruments):
//
//   1. Sort records by timestamp. Duplicate timestamps keep the LAST record
//      supplied.
//   2. Drop records outside [start, end] when a window is given.
//   3. Calendar = union of all remaining timestamps, starting at the latest
//      first timestamp among the instruments. Earlier points could not be
//      forward-filled for the instrument that had not started trading yet.
//   4. Forward-fill each series onto the calendar: a missing date repeats
//      the previous record's prices under the calendar timestamp.
//   5. Derive adj_close = close * adj_factor and the period return
//      (0 on the first calendar bar and on every forward-filled bar whose
//      adjusted close did not change).
//
// An instrument with no records inside the window is a DataSourceError.
//
// Replay: the cursor starts before the first calendar point. advance()
// moves it by one and enqueues MarketEvent{calendar[cursor], tick}. The
// "latest" view of every instrument is the aligned bar at the cursor;
// history is the aligned prefix up to and including the cursor.
//
// Thread model: single-threaded. One instance per run.
// -----------------------------------------------------------------------------
class InMemoryDataSource final : public IDataSource {
 public:
  using RecordMap = std::map<std::string, std::vector<domain::BarRecord>>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  instruments  Instruments to replay, in reporting order. Every
  //                      entry must have records in `records`.
  // @param  records      Raw per-instrument records, any order.
  // @param  start, end   Optional inclusive replay window.
  //
  // @throws DataSourceError  empty instrument list, missing instrument,
  //                          instrument with no records in the window, or
  //                          an empty resulting calendar.
  // -------------------------------------------------------------------------
  InMemoryDataSource(std::vector<std::string> instruments,
                     const RecordMap& records,
                     std::optional<Timestamp> start = std::nullopt,
                     std::optional<Timestamp> end = std::nullopt);

  InMemoryDataSource(const InMemoryDataSource&) = delete;
  InMemoryDataSource& operator=(const InMemoryDataSource&) = delete;

  const domain::Bar& latestBar(const std::string& instrument) const override;
  std::vector<domain::Bar> latestBars(const std::string& instrument,
                                      std::size_t n) const override;
  Timestamp latestBarTimestamp(const std::string& instrument) const override;
  double latestBarValue(const std::string& instrument,
                        domain::BarField field) const override;
  std::vector<double> latestBarsValues(const std::string& instrument,
                                       domain::BarField field,
                                       std::size_t n) const override;

  bool advance(EventQueue& queue) override;
  bool continueBacktest() const override { return continue_backtest_; }
  const std::vector<std::string>& instruments() const override {
    return instruments_;
  }

  // The aligned calendar the run will replay.
  const std::vector<Timestamp>& calendar() const { return calendar_; }

  // Number of calendar steps revealed so far.
  std::size_t ticksRevealed() const { return revealed_; }

 private:
  // Validates the instrument and that at least one bar was revealed, then
  // returns the aligned series.
  const std::vector<domain::Bar>& revealedSeries(
      const std::string& instrument) const;

  std::vector<std::string> instruments_;
  std::vector<Timestamp> calendar_;

  // Aligned bars, one per calendar point, keyed by instrument.
  std::unordered_map<std::string, std::vector<domain::Bar>> aligned_;

  std::size_t revealed_{0};
  bool continue_backtest_{true};
};

}  // namespace barsim

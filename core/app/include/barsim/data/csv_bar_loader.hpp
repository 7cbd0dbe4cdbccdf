#pragma once

#include "barsim/data/in_memory_data_source.hpp"
#include "barsim/domain/bar.hpp"

#include <istream>
#include <string>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// CsvBarLoader — reads per-instrument daily bar files
// -----------------------------------------------------------------------------
//
// @brief  Parses the bar CSV layout into BarRecord vectors ready for
//         InMemoryDataSource.
//
// @details
// One file per instrument, named <instrument>.csv, first line a header:
//
//   price_date,ticker,open_price,high_price,low_price,close_price,volume,adj_factor
//   2015-01-05,601988,4.12,4.30,4.05,4.21,1503420000,1.0
//
// The header line is skipped without checking the column names. price_date
// accepts "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (UTC). An empty adj_factor
// cell reads as 1.0; every other numeric cell is required. Blank lines are
// skipped. The ticker column is informational and not checked against the
// file name.
//
// Every parse failure throws DataSourceError naming the source and the
// 1-based line number.
// -----------------------------------------------------------------------------
class CsvBarLoader {
 public:
  // Parses bar rows from a stream. `source_name` is used in error messages.
  static std::vector<domain::BarRecord> parse(std::istream& in,
                                              const std::string& source_name);

  // Opens and parses one file. Throws DataSourceError if it cannot be opened.
  static std::vector<domain::BarRecord> load(const std::string& path);

  // Loads <dir>/<instrument>.csv for every instrument.
  static InMemoryDataSource::RecordMap loadDirectory(
      const std::string& dir, const std::vector<std::string>& instruments);
};

}  // namespace barsim

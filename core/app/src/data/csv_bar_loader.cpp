#include "barsim/data/csv_bar_loader.hpp"

#include "barsim/domain/errors.hpp"
#include "barsim/time/time_utils.hpp"

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace barsim {

namespace {

constexpr std::size_t kColumnCount = 8;

std::string trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitRow(const std::string& line) {
  std::vector<std::string> cells;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ',')) {
    cells.push_back(trim(cell));
  }
  // "a,b," has an empty trailing cell that getline does not report.
  if (!line.empty() && line.back() == ',') {
    cells.emplace_back();
  }
  return cells;
}

[[noreturn]] void fail(const std::string& source, std::size_t line,
                       const std::string& what) {
  std::ostringstream msg;
  msg << source << ":" << line << ": " << what;
  throw DataSourceError(msg.str());
}

double parseNumber(const std::string& cell, const char* column,
                   const std::string& source, std::size_t line) {
  if (cell.empty()) {
    fail(source, line, std::string("missing ") + column);
  }
  char* end = nullptr;
  const double value = std::strtod(cell.c_str(), &end);
  if (end != cell.c_str() + cell.size()) {
    fail(source, line, std::string("invalid ") + column + " '" + cell + "'");
  }
  return value;
}

}  // namespace

std::vector<domain::BarRecord> CsvBarLoader::parse(
    std::istream& in, const std::string& source_name) {
  std::vector<domain::BarRecord> records;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    if (line_no == 1) {
      continue;  // header
    }
    if (trim(line).empty()) {
      continue;
    }

    const std::vector<std::string> cells = splitRow(line);
    if (cells.size() != kColumnCount) {
      std::ostringstream what;
      what << "expected " << kColumnCount << " columns, got " << cells.size();
      fail(source_name, line_no, what.str());
    }

    const auto ts = parse_timestamp(cells[0]);
    if (!ts) {
      fail(source_name, line_no, "invalid price_date '" + cells[0] + "'");
    }

    domain::BarRecord rec;
    rec.timestamp = *ts;
    rec.open = parseNumber(cells[2], "open_price", source_name, line_no);
    rec.high = parseNumber(cells[3], "high_price", source_name, line_no);
    rec.low = parseNumber(cells[4], "low_price", source_name, line_no);
    rec.close = parseNumber(cells[5], "close_price", source_name, line_no);
    rec.volume = parseNumber(cells[6], "volume", source_name, line_no);
    rec.adj_factor =
        cells[7].empty()
            ? 1.0
            : parseNumber(cells[7], "adj_factor", source_name, line_no);
    records.push_back(rec);
  }
  return records;
}

std::vector<domain::BarRecord> CsvBarLoader::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw DataSourceError("Cannot open bar file: " + path);
  }
  return parse(in, path);
}

InMemoryDataSource::RecordMap CsvBarLoader::loadDirectory(
    const std::string& dir, const std::vector<std::string>& instruments) {
  InMemoryDataSource::RecordMap out;
  for (const auto& instrument : instruments) {
    std::string path = dir;
    if (!path.empty() && path.back() != '/') {
      path += '/';
    }
    path += instrument + ".csv";
    out[instrument] = load(path);
  }
  return out;
}

}  // namespace barsim

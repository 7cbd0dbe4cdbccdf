#include "barsim/data/in_memory_data_source.hpp"

#include "barsim/domain/errors.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace barsim {

namespace {

// Sorts by timestamp and keeps the last record supplied for each timestamp.
// stable_sort keeps supply order among equal timestamps, so the last of each
// run is the last one supplied.
std::vector<domain::BarRecord> sortAndDedupe(
    std::vector<domain::BarRecord> records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const domain::BarRecord& a, const domain::BarRecord& b) {
                     return a.timestamp < b.timestamp;
                   });
  std::vector<domain::BarRecord> out;
  out.reserve(records.size());
  for (auto& rec : records) {
    if (!out.empty() && out.back().timestamp == rec.timestamp) {
      out.back() = std::move(rec);
    } else {
      out.push_back(std::move(rec));
    }
  }
  return out;
}

domain::Bar toBar(const domain::BarRecord& rec, Timestamp at) {
  domain::Bar bar;
  bar.timestamp = at;
  bar.open = rec.open;
  bar.high = rec.high;
  bar.low = rec.low;
  bar.close = rec.close;
  bar.volume = rec.volume;
  bar.adj_factor = rec.adj_factor;
  bar.adj_close = rec.close * rec.adj_factor;
  return bar;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: sort, window, build calendar, forward-fill, derive fields
// -----------------------------------------------------------------------------
InMemoryDataSource::InMemoryDataSource(std::vector<std::string> instruments,
                                       const RecordMap& records,
                                       std::optional<Timestamp> start,
                                       std::optional<Timestamp> end)
    : instruments_(std::move(instruments)) {
  if (instruments_.empty()) {
    throw DataSourceError("No instruments configured");
  }

  // --- 1) + 2) Per-instrument sort, dedupe and window -----------------------
  std::map<std::string, std::vector<domain::BarRecord>> series;
  for (const auto& instrument : instruments_) {
    if (series.count(instrument) != 0) {
      throw DataSourceError("Instrument listed twice: " + instrument);
    }
    auto it = records.find(instrument);
    if (it == records.end()) {
      throw DataSourceError("No bar data for instrument: " + instrument);
    }

    std::vector<domain::BarRecord> sorted = sortAndDedupe(it->second);
    sorted.erase(
        std::remove_if(sorted.begin(), sorted.end(),
                       [&](const domain::BarRecord& r) {
                         return (start && r.timestamp < *start) ||
                                (end && r.timestamp > *end);
                       }),
        sorted.end());
    if (sorted.empty()) {
      throw DataSourceError("No bar data inside the replay window for: " +
                            instrument);
    }
    series.emplace(instrument, std::move(sorted));
  }

  // --- 3) Shared calendar ---------------------------------------------------
  Timestamp first_common = series.begin()->second.front().timestamp;
  for (const auto& [instrument, recs] : series) {
    first_common = std::max(first_common, recs.front().timestamp);
  }

  std::set<Timestamp> union_ts;
  for (const auto& [instrument, recs] : series) {
    for (const auto& r : recs) {
      if (r.timestamp >= first_common) {
        union_ts.insert(r.timestamp);
      }
    }
  }
  calendar_.assign(union_ts.begin(), union_ts.end());
  if (calendar_.empty()) {
    throw DataSourceError("Aligned calendar is empty");
  }

  // --- 4) + 5) Forward-fill and derive adj_close / returns -------------------
  for (const auto& [instrument, recs] : series) {
    std::vector<domain::Bar> bars;
    bars.reserve(calendar_.size());

    // Index of the last record at or before the current calendar point.
    // first_common guarantees every instrument has one at calendar_[0].
    std::size_t rec_idx = 0;
    for (const Timestamp ts : calendar_) {
      while (rec_idx + 1 < recs.size() && recs[rec_idx + 1].timestamp <= ts) {
        ++rec_idx;
      }
      domain::Bar bar = toBar(recs[rec_idx], ts);
      if (!bars.empty() && bars.back().adj_close != 0.0) {
        bar.returns = bar.adj_close / bars.back().adj_close - 1.0;
      }
      bars.push_back(bar);
    }
    aligned_.emplace(instrument, std::move(bars));
  }
}

// -----------------------------------------------------------------------------
// advance: reveal one calendar step
// -----------------------------------------------------------------------------
bool InMemoryDataSource::advance(EventQueue& queue) {
  if (!continue_backtest_ || revealed_ >= calendar_.size()) {
    continue_backtest_ = false;
    return false;
  }
  const Timestamp ts = calendar_[revealed_];
  ++revealed_;
  queue.put(MarketEvent{ts, static_cast<std::uint64_t>(revealed_)});
  return true;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
const std::vector<domain::Bar>& InMemoryDataSource::revealedSeries(
    const std::string& instrument) const {
  auto it = aligned_.find(instrument);
  if (it == aligned_.end()) {
    throw UnknownInstrumentError(instrument);
  }
  if (revealed_ == 0) {
    throw NoMarketDataError("No bar revealed yet for " + instrument);
  }
  return it->second;
}

const domain::Bar& InMemoryDataSource::latestBar(
    const std::string& instrument) const {
  return revealedSeries(instrument)[revealed_ - 1];
}

std::vector<domain::Bar> InMemoryDataSource::latestBars(
    const std::string& instrument, std::size_t n) const {
  const auto& bars = revealedSeries(instrument);
  const std::size_t count = std::min(n, revealed_);
  return std::vector<domain::Bar>(bars.begin() + (revealed_ - count),
                                  bars.begin() + revealed_);
}

Timestamp InMemoryDataSource::latestBarTimestamp(
    const std::string& instrument) const {
  return latestBar(instrument).timestamp;
}

double InMemoryDataSource::latestBarValue(const std::string& instrument,
                                          domain::BarField field) const {
  return latestBar(instrument).value(field);
}

std::vector<double> InMemoryDataSource::latestBarsValues(
    const std::string& instrument, domain::BarField field,
    std::size_t n) const {
  std::vector<double> values;
  for (const auto& bar : latestBars(instrument, n)) {
    values.push_back(bar.value(field));
  }
  return values;
}

}  // namespace barsim

#include "barsim/time/time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace barsim {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

// Days since 1970-01-01 for a proleptic Gregorian date. Avoids timegm(),
// which is not available everywhere, and the local-time behavior of mktime().
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Checks the fixed layout before sscanf, whose %u also accepts leading blanks,
// signs and single digits. In `shape`, 'd' is a digit and 'T' is 'T' or ' '.
bool has_shape(const std::string& text, const char* shape) {
  std::size_t i = 0;
  for (; shape[i] != '\0'; ++i) {
    if (i >= text.size()) {
      return false;
    }
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (shape[i] == 'd') {
      if (!std::isdigit(c)) {
        return false;
      }
    } else if (shape[i] == 'T') {
      if (c != 'T' && c != ' ') {
        return false;
      }
    } else if (c != static_cast<unsigned char>(shape[i])) {
      return false;
    }
  }
  return i == text.size();
}

}  // namespace

// -----------------------------------------------------------------------------
// parse_timestamp
// -----------------------------------------------------------------------------
std::optional<Timestamp> parse_timestamp(const std::string& text) {
  int y = 0;
  unsigned mo = 0;
  unsigned d = 0;
  unsigned hh = 0;
  unsigned mm = 0;
  unsigned ss = 0;
  int consumed = 0;

  if (!has_shape(text, "dddd-dd-dd") &&
      !has_shape(text, "dddd-dd-ddTdd:dd:dd")) {
    return std::nullopt;
  }
  if (std::sscanf(text.c_str(), "%4d-%2u-%2u%n", &y, &mo, &d, &consumed) != 3) {
    return std::nullopt;
  }

  std::string rest = text.substr(static_cast<std::size_t>(consumed));
  if (!rest.empty()) {
    int time_consumed = 0;
    if ((rest[0] != ' ' && rest[0] != 'T') ||
        std::sscanf(rest.c_str() + 1, "%2u:%2u:%2u%n", &hh, &mm, &ss,
                    &time_consumed) != 3 ||
        static_cast<std::size_t>(time_consumed) + 1 != rest.size()) {
      return std::nullopt;
    }
  }

  if (mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo) || hh > 23 ||
      mm > 59 || ss > 59) {
    return std::nullopt;
  }

  const std::int64_t seconds = days_from_civil(y, mo, d) * kSecondsPerDay +
                               hh * 3600 + mm * 60 + ss;
  return Timestamp{std::chrono::seconds{seconds}};
}

// -----------------------------------------------------------------------------
// format_timestamp
// -----------------------------------------------------------------------------
std::string format_timestamp(Timestamp tp) {
  const std::int64_t seconds =
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
          .count();
  std::int64_t days = seconds / kSecondsPerDay;
  std::int64_t secs_of_day = seconds % kSecondsPerDay;
  if (secs_of_day < 0) {
    secs_of_day += kSecondsPerDay;
    --days;
  }

  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  civil_from_days(days, y, m, d);

  char buf[32];
  if (secs_of_day == 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", y, m, d,
                  static_cast<int>(secs_of_day / 3600),
                  static_cast<int>((secs_of_day % 3600) / 60),
                  static_cast<int>(secs_of_day % 60));
  }
  return buf;
}

}  // namespace barsim

#pragma once

#include "barsim/time/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace barsim {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between the engine's Timestamp type
//         (std::chrono::system_clock::time_point), int64_t milliseconds since
//         epoch, and the calendar strings found in bar files and configs.
//
// @details
// ITimeProvider returns int64_t milliseconds while bars and events carry a
// Timestamp. The two one-line conversions are inline. Parsing and formatting
// live in time_utils.cpp.
//
// All calendar strings are interpreted as UTC. Thread-safety: stateless.
// -----------------------------------------------------------------------------

// Converts epoch milliseconds to a Timestamp. Inverse of timestamp_to_ms().
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Converts a Timestamp to epoch milliseconds, truncating sub-ms precision.
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// parse_timestamp
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (a 'T' separator is
//         also accepted) as a UTC Timestamp. Every field must have exactly
//         its width in digits.
//
// @return std::nullopt if the text is not a valid calendar date/time.
// -------------------------------------------------------------------------
std::optional<Timestamp> parse_timestamp(const std::string& text);

// -------------------------------------------------------------------------
// format_timestamp
// -------------------------------------------------------------------------
// @brief  Formats a Timestamp as "YYYY-MM-DD", or "YYYY-MM-DD HH:MM:SS" when
//         the time of day is not midnight.
// -------------------------------------------------------------------------
std::string format_timestamp(Timestamp tp);

}  // namespace barsim

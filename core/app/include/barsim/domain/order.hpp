#pragma once

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Encodes the trading side of an order or fill.
// Why enum class instead of plain enum:
// - Strongly typed: Side::Buy and Side::Sell live in their own scope.
// - Prevents implicit conversion to int.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Market orders are the only kind the portfolio generates. Limit is carried
// through the model so an order can say what it is, but the execution
// simulator fills both at the latest close.
// -----------------------------------------------------------------------------
enum class OrderType {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// SignalDirection
// -----------------------------------------------------------------------------
// What a strategy asks the portfolio to do with an instrument:
//   Long:  build (or add to) long exposure
//   Short: open a short from a flat position
//   Exit:  close whatever is currently held
// -----------------------------------------------------------------------------
enum class SignalDirection {
  Long,
  Short,
  Exit,
};

// Signed multiplier for a side: +1 for Buy, -1 for Sell.
inline double sign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* to_string(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

inline const char* to_string(OrderType type) {
  return type == OrderType::Market ? "MKT" : "LMT";
}

inline const char* to_string(SignalDirection direction) {
  switch (direction) {
    case SignalDirection::Long:
      return "LONG";
    case SignalDirection::Short:
      return "SHORT";
    case SignalDirection::Exit:
      return "EXIT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace barsim

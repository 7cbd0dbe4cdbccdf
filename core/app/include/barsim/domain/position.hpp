#pragma once

namespace barsim {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentState — per-instrument exposure state tracked by the Portfolio
// -----------------------------------------------------------------------------
//
// @brief  The portfolio's view of what it is trying to hold in an instrument.
//
// @details
// Transitions are driven by signals, not fills:
//
//   Out   ──LONG──>  Long  ──EXIT──>  Out
//   Out   ──SHORT──> Short ──EXIT──>  Out      (SHORT only from a flat book)
//   Long  ──LONG──>  Long                      (adds exposure)
//
// Because smoothed orders are released over several ticks, the state can
// read Long while the signed position is still climbing toward its target.
// The position itself (a signed double in the Portfolio) is the source of
// truth for accounting; the state is the source of truth for intent.
// -----------------------------------------------------------------------------
enum class InstrumentState {
  Out,
  Long,
  Short,
};

inline const char* to_string(InstrumentState state) {
  switch (state) {
    case InstrumentState::Out:
      return "OUT";
    case InstrumentState::Long:
      return "LONG";
    case InstrumentState::Short:
      return "SHORT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace barsim

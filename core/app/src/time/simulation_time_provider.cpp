#include "barsim/time/simulation_time_provider.hpp"

namespace barsim {

std::int64_t SimulationTimeProvider::now_ms() const { return current_time_ms_; }

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_ = new_time_ms;
}

}  // namespace barsim

#include "tokensale/time/simulation_time_provider.hpp"

namespace tokensale {

std::uint64_t SimulationTimeProvider::now_s() const {
  return current_time_s_.load();
}

void SimulationTimeProvider::advance_time(std::uint64_t new_time_s) {
  current_time_s_.store(new_time_s);
}

void SimulationTimeProvider::advance_by(std::uint64_t delta_s) {
  current_time_s_.fetch_add(delta_s);
}

}  // namespace tokensale

#include "search/dominance_table.hpp"

namespace sweep {

bool DominanceTable::consider(const State& state, int energy) {
    if (energy <= UNKNOWN) return false;
    auto [it, inserted] = best_.try_emplace(state, energy);
    if (inserted) return true;
    if (energy <= it->second) return false;
    it->second = energy;
    return true;
}

int DominanceTable::best(const State& state) const {
    auto it = best_.find(state);
    return it != best_.end() ? it->second : UNKNOWN;
}

} // namespace sweep

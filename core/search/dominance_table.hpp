#pragma once

#include "search/search_state.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace sweep {

inline uint64_t mix64(uint64_t value) { // SplitMix64
    value += 0x9e3779b97f4a7c15ULL;
    value = (value ^ (value >> 30)) * 0xbf58476d1ce4e5b9ULL;
    value = (value ^ (value >> 27)) * 0x94d049bb133111ebULL;
    return value ^ (value >> 31);
}

struct StateHasher {
    size_t operator()(const State& s) const {
        uint64_t cell = (static_cast<uint64_t>(static_cast<uint32_t>(s.row)) << 32) |
                        static_cast<uint32_t>(s.col);
        return static_cast<size_t>(mix64(mix64(cell) ^ s.mask));
    }
};

// ─── Dominance Table ───────────────────────────────────────────
// Best (maximum) energy at which each state has been reached. An arrival
// is admitted only if it strictly beats the recorded energy, so a state
// can be re-entered only with more energy than before. This bounds the
// search: each state improves at most max_energy + 1 times.
//
// Owned by a single search; never shared between calls.

class DominanceTable {
public:
    static constexpr int UNKNOWN = -1;

    /// Record `energy` for `state` if it strictly exceeds the best so far.
    /// Returns false when the arrival is dominated.
    bool consider(const State& state, int energy);

    /// Best recorded energy, or UNKNOWN.
    int best(const State& state) const;

    size_t size() const { return best_.size(); }
    void clear() { best_.clear(); }

private:
    std::unordered_map<State, int, StateHasher> best_;
};

} // namespace sweep

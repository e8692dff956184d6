#pragma once

#include "grid/grid.hpp"
#include "search/search_state.hpp"

#include <array>

namespace sweep {

// ─── Transition Function ───────────────────────────────────────
// Pure successor generation over an immutable Grid. Each move costs one
// unit of energy; arriving on a recharge cell then resets energy to the
// maximum. A move that would leave energy below zero is never produced,
// even if its destination is a recharge cell.

class TransitionFunction {
public:
    /// Orthogonal steps in expansion order: down, up, right, left.
    static constexpr std::array<std::array<int, 2>, 4> DIRECTIONS = {{
        {{1, 0}}, {{-1, 0}}, {{0, 1}}, {{0, -1}}
    }};

    /// Keeps a reference to `grid`, which must outlive this object.
    TransitionFunction(const Grid& grid, int max_energy)
        : grid_(grid), max_energy_(max_energy) {}
    TransitionFunction(Grid&&, int) = delete;

    /// Mask for a path that has only visited the start cell.
    CollectionMask initialMask() const;

    /// Write up to four valid successors of `state` (arrived at with
    /// `energy`) into `out`, in DIRECTIONS order. Returns how many.
    int successors(const State& state, int energy,
                   std::array<Transition, 4>& out) const;

    int maxEnergy() const { return max_energy_; }
    const Grid& grid() const { return grid_; }

private:
    const Grid& grid_;
    int max_energy_;
};

} // namespace sweep

#include "search/transition.hpp"

namespace sweep {

CollectionMask TransitionFunction::initialMask() const {
    const Coord& start = grid_.start();
    auto index = grid_.collectibleIndex(start.row, start.col);
    return index ? (CollectionMask{1} << *index) : CollectionMask{0};
}

int TransitionFunction::successors(const State& state, int energy,
                                   std::array<Transition, 4>& out) const {
    int count = 0;
    for (const auto& dir : DIRECTIONS) {
        int row = state.row + dir[0];
        int col = state.col + dir[1];
        if (!grid_.inBounds(row, col)) continue;

        const Cell& cell = grid_.cellAt(row, col);
        if (cell.isObstacle()) continue;

        int new_energy = energy - 1;
        if (new_energy < 0) continue;
        if (cell.isRecharge()) new_energy = max_energy_;

        CollectionMask new_mask = state.mask;
        if (cell.isCollectible()) {
            new_mask |= CollectionMask{1} << cell.index;
        }

        out[count++] = {{row, col, new_mask}, new_energy};
    }
    return count;
}

} // namespace sweep

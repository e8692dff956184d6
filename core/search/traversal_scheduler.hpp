#pragma once

#include "grid/grid.hpp"
#include "search/search_state.hpp"
#include "search/dominance_table.hpp"
#include "search/transition.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace sweep {

// ─── Traversal Scheduler ───────────────────────────────────────
// Breadth-first search over (row, col, mask) with energy-dominance
// pruning. Every push is exactly one move deeper than its parent pop and
// the frontier is strict FIFO, so entries leave the queue in
// non-decreasing move order. The first popped entry holding every
// collectible is therefore a minimal-move solution.
//
// Lifecycle: EXPLORING -> FOUND | EXHAUSTED | BUDGET_EXHAUSTED.
// A scheduler runs once; the frontier and dominance table live and die
// with it. The Grid is held by reference and must outlive the scheduler.

class TraversalScheduler {
public:
    enum class Phase {
        EXPLORING,
        FOUND,
        EXHAUSTED,
        BUDGET_EXHAUSTED
    };

    TraversalScheduler(const Grid& grid, int max_energy,
                       const SearchConfig& config = {});
    TraversalScheduler(Grid&&, int, const SearchConfig& = {}) = delete;

    /// Run to a terminal phase. Calling again returns the same result.
    SearchResult run();

    Phase phase() const { return phase_; }
    const DominanceTable& dominance() const { return dominance_; }

private:
    struct TrailStep {
        Coord cell;
        int64_t parent = -1;
    };

    const Grid& grid_;
    TransitionFunction transitions_;
    SearchConfig config_;

    Phase phase_ = Phase::EXPLORING;
    SearchResult result_;
    DominanceTable dominance_;
    std::deque<FrontierEntry> frontier_;
    std::vector<TrailStep> trail_;

    void seed();
    void finish(Phase phase, const FrontierEntry* goal, double elapsed);
    int64_t recordTrail(const State& state, int64_t parent);
    std::vector<Coord> rebuildPath(int64_t slot) const;
};

} // namespace sweep

#include "search/traversal_scheduler.hpp"
#include "search/budget_manager.hpp"
#include "logging/log.hpp"

#include <algorithm>

namespace sweep {

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::FOUND:            return "found";
        case Outcome::EXHAUSTED:        return "exhausted";
        case Outcome::BUDGET_EXHAUSTED: return "budget_exhausted";
    }
    return "unknown";
}

TraversalScheduler::TraversalScheduler(const Grid& grid, int max_energy,
                                       const SearchConfig& config)
    : grid_(grid), transitions_(grid, max_energy), config_(config) {}

SearchResult TraversalScheduler::run() {
    if (phase_ != Phase::EXPLORING) return result_;

    BudgetManager budget(config_);
    budget.start();
    auto log = logsys::get();

    seed();

    // Nothing to collect: already done, whatever the energy.
    if (grid_.collectibleCount() == 0) {
        finish(Phase::FOUND, &frontier_.front(), budget.elapsedSeconds());
        return result_;
    }

    const CollectionMask full_mask = grid_.fullMask();
    std::array<Transition, 4> next;

    while (!frontier_.empty()) {
        if (!budget.canContinue(static_cast<int64_t>(frontier_.size()))) {
            result_.pops = budget.pops();
            finish(Phase::BUDGET_EXHAUSTED, nullptr, budget.elapsedSeconds());
            return result_;
        }

        FrontierEntry entry = frontier_.front();
        frontier_.pop_front();
        budget.recordPop();

        log->trace("[{},{}] mask: {}, moves: {}, energy: {}",
                   entry.state.row, entry.state.col, entry.state.mask,
                   entry.moves, entry.energy);

        if (entry.state.mask == full_mask) {
            result_.pops = budget.pops();
            finish(Phase::FOUND, &entry, budget.elapsedSeconds());
            return result_;
        }

        int count = transitions_.successors(entry.state, entry.energy, next);
        for (int i = 0; i < count; i++) {
            const Transition& t = next[i];
            if (!dominance_.consider(t.state, t.energy)) continue;

            result_.accepted++;
            int64_t slot = config_.record_path ? recordTrail(t.state, entry.trail) : -1;
            frontier_.push_back({t.state, t.energy, entry.moves + 1, slot});
        }
        result_.peak_frontier = std::max(result_.peak_frontier,
                                         static_cast<int64_t>(frontier_.size()));
    }

    result_.pops = budget.pops();
    finish(Phase::EXHAUSTED, nullptr, budget.elapsedSeconds());
    return result_;
}

void TraversalScheduler::seed() {
    const Coord& start = grid_.start();
    State initial{start.row, start.col, transitions_.initialMask()};
    int energy = transitions_.maxEnergy();

    // First entry for this state; skipped only when energy is negative.
    dominance_.consider(initial, energy);
    result_.accepted = 1;

    int64_t slot = config_.record_path ? recordTrail(initial, -1) : -1;
    frontier_.push_back({initial, energy, 0, slot});
    result_.peak_frontier = 1;
}

void TraversalScheduler::finish(Phase phase, const FrontierEntry* goal, double elapsed) {
    phase_ = phase;
    result_.elapsed_seconds = elapsed;

    switch (phase) {
        case Phase::FOUND:
            result_.outcome = Outcome::FOUND;
            result_.moves = goal->moves;
            if (config_.record_path) result_.path = rebuildPath(goal->trail);
            break;
        case Phase::BUDGET_EXHAUSTED:
            result_.outcome = Outcome::BUDGET_EXHAUSTED;
            result_.moves = UNREACHABLE;
            logsys::get()->warn("Search stopped by budget after {} pops ({} queued, {:.3f}s)",
                                result_.pops, frontier_.size(), elapsed);
            break;
        default:
            result_.outcome = Outcome::EXHAUSTED;
            result_.moves = UNREACHABLE;
            break;
    }

    frontier_.clear();

    logsys::get()->debug("Search {}: moves={} pops={} accepted={} peak_frontier={}",
                         toString(result_.outcome), result_.moves, result_.pops,
                         result_.accepted, result_.peak_frontier);
}

int64_t TraversalScheduler::recordTrail(const State& state, int64_t parent) {
    trail_.push_back({{state.row, state.col}, parent});
    return static_cast<int64_t>(trail_.size()) - 1;
}

std::vector<Coord> TraversalScheduler::rebuildPath(int64_t slot) const {
    std::vector<Coord> path;
    for (int64_t i = slot; i >= 0; i = trail_[i].parent) {
        path.push_back(trail_[i].cell);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace sweep

#pragma once

#include "grid/cell.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace sweep {

/// Bit i set means collectible i has been gathered on the current path.
using CollectionMask = uint64_t;

/// Returned when every collectible cannot be gathered.
constexpr int UNREACHABLE = -1;

/// A search state: position plus collection progress. Energy is not
/// part of the key; the DominanceTable tracks it per state.
struct State {
    int row = 0;
    int col = 0;
    CollectionMask mask = 0;

    bool operator==(const State& other) const {
        return row == other.row && col == other.col && mask == other.mask;
    }
};

/// A candidate move produced by the transition function.
struct Transition {
    State state;
    int energy = 0;
};

/// One queued arrival. `trail` is this arrival's slot in the scheduler's
/// path log, or -1 when paths are not recorded.
struct FrontierEntry {
    State state;
    int energy = 0;
    int moves = 0;
    int64_t trail = -1;
};

/// Search configuration parameters.
struct SearchConfig {
    int64_t max_pops = std::numeric_limits<int64_t>::max();          // Frontier pops before giving up
    int64_t max_frontier = std::numeric_limits<int64_t>::max();      // Queued entries before giving up
    double budget_seconds = std::numeric_limits<double>::infinity(); // Wall-clock cap
    bool record_path = false;                                        // Rebuild the optimal cell sequence
};

enum class Outcome {
    FOUND,             // every collectible gathered
    EXHAUSTED,         // frontier emptied first
    BUDGET_EXHAUSTED   // a SearchConfig cap tripped before a verdict
};

/// Result of a search run.
struct SearchResult {
    Outcome outcome = Outcome::EXHAUSTED;
    int moves = UNREACHABLE;
    int64_t pops = 0;           // frontier entries expanded
    int64_t accepted = 0;       // arrivals accepted by the dominance table
    int64_t peak_frontier = 0;
    double elapsed_seconds = 0.0;
    std::vector<Coord> path;    // start .. final cell; empty unless record_path and FOUND

    bool found() const { return outcome == Outcome::FOUND; }
};

const char* toString(Outcome outcome);

} // namespace sweep

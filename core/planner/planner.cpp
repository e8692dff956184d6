#include "planner/planner.hpp"
#include "search/traversal_scheduler.hpp"

namespace sweep {

int solve(const std::vector<std::string>& rows, int max_energy) {
    return plan(rows, max_energy).moves;
}

SearchResult plan(const std::vector<std::string>& rows, int max_energy,
                  const SearchConfig& config) {
    Grid grid(rows);
    return plan(grid, max_energy, config);
}

SearchResult plan(const Grid& grid, int max_energy, const SearchConfig& config) {
    TraversalScheduler scheduler(grid, max_energy, config);
    return scheduler.run();
}

} // namespace sweep

#pragma once

#include "grid/grid.hpp"
#include "search/search_state.hpp"

#include <string>
#include <vector>

namespace sweep {

/// Minimal number of unit moves needed to gather every collectible in
/// `rows` starting with `max_energy`, or UNREACHABLE (-1). A negative
/// `max_energy` allows no moves at all.
/// Throws ConfigurationError for malformed grids.
int solve(const std::vector<std::string>& rows, int max_energy);

/// Same search, returning outcome, statistics and (optionally) the path.
SearchResult plan(const std::vector<std::string>& rows, int max_energy,
                  const SearchConfig& config = {});

SearchResult plan(const Grid& grid, int max_energy,
                  const SearchConfig& config = {});

} // namespace sweep

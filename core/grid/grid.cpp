#include "grid/grid.hpp"
#include "logging/log.hpp"

#include <limits>

namespace sweep {

Grid::Grid(const std::vector<std::string>& rows) {
    rows_ = static_cast<int>(rows.size());
    cols_ = rows.empty() ? 0 : static_cast<int>(rows.front().size());
    cells_.reserve(static_cast<size_t>(rows_) * cols_);

    int starts = 0;
    for (int r = 0; r < rows_; r++) {
        const std::string& line = rows[r];
        if (static_cast<int>(line.size()) != cols_) {
            throw ConfigurationError(
                "Row " + std::to_string(r) + " has " + std::to_string(line.size()) +
                " columns, expected " + std::to_string(cols_));
        }
        for (int c = 0; c < cols_; c++) {
            Cell cell = parseSymbol(line[c], r, c);
            if (cell.kind == CellKind::START) {
                starts++;
                start_ = {r, c};
            } else if (cell.kind == CellKind::COLLECTIBLE) {
                if (collectibleCount() == MAX_COLLECTIBLES) {
                    throw ConfigurationError(
                        "Too many collectibles: limit is " + std::to_string(MAX_COLLECTIBLES));
                }
                cell.index = collectibleCount();
                collectibles_.push_back({r, c});
            }
            cells_.push_back(cell);
        }
    }

    if (starts != 1) {
        throw ConfigurationError(
            "Expected exactly one start cell, found " + std::to_string(starts));
    }

    logsys::get()->debug("Grid {}x{}: {} collectibles, start at [{},{}]",
                         rows_, cols_, collectibleCount(), start_.row, start_.col);
}

Cell Grid::parseSymbol(char symbol, int row, int col) {
    switch (symbol) {
        case '.': return {CellKind::EMPTY, -1};
        case 'S': return {CellKind::START, -1};
        case 'X': return {CellKind::OBSTACLE, -1};
        case 'R': return {CellKind::RECHARGE, -1};
        case 'L': return {CellKind::COLLECTIBLE, -1};
    }
    throw ConfigurationError(
        std::string("Unknown symbol '") + symbol + "' at [" +
        std::to_string(row) + "," + std::to_string(col) + "]");
}

std::optional<int> Grid::collectibleIndex(int row, int col) const {
    if (!inBounds(row, col)) return std::nullopt;
    const Cell& cell = cellAt(row, col);
    if (!cell.isCollectible()) return std::nullopt;
    return cell.index;
}

uint64_t Grid::fullMask() const {
    return (uint64_t{1} << collectibleCount()) - 1;
}

uint64_t Grid::stateCount() const {
    const uint64_t limit = std::numeric_limits<uint64_t>::max();
    uint64_t cells = static_cast<uint64_t>(rows_) * static_cast<uint64_t>(cols_);
    if (cells == 0) return 0;
    int k = collectibleCount();
    // cells * 2^k overflows once cells exceeds limit >> k
    if (cells > (limit >> k)) return limit;
    return cells << k;
}

} // namespace sweep

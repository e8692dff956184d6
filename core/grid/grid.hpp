#pragma once

#include "grid/cell.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sweep {

/// Raised for malformed input before any search begins.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

// ─── Grid ──────────────────────────────────────────────────────
// Immutable rectangular terrain map parsed from rows of symbols:
//   S  start (exactly one)
//   .  empty floor
//   X  obstacle
//   R  recharge
//   L  collectible
// Collectibles are numbered 0..k-1 in row-major order.

class Grid {
public:
    static constexpr int MAX_COLLECTIBLES = 63;

    /// Parse and validate. Throws ConfigurationError on ragged rows,
    /// a missing or repeated start, unknown symbols, or too many collectibles.
    explicit Grid(const std::vector<std::string>& rows);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    bool inBounds(int row, int col) const {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    /// Caller must check inBounds first.
    const Cell& cellAt(int row, int col) const {
        return cells_[static_cast<size_t>(row) * cols_ + col];
    }

    std::optional<int> collectibleIndex(int row, int col) const;

    const Coord& start() const { return start_; }
    int collectibleCount() const { return static_cast<int>(collectibles_.size()); }
    const std::vector<Coord>& collectibles() const { return collectibles_; }

    /// Mask with one bit set per collectible.
    uint64_t fullMask() const;

    /// m * n * 2^k, saturating at UINT64_MAX.
    uint64_t stateCount() const;

private:
    int rows_ = 0;
    int cols_ = 0;
    Coord start_;
    std::vector<Cell> cells_;
    std::vector<Coord> collectibles_;

    static Cell parseSymbol(char symbol, int row, int col);
};

} // namespace sweep

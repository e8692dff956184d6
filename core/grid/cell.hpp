#pragma once

#include <cstdint>

namespace sweep {

/// Terrain classification of a single grid cell.
enum class CellKind : uint8_t {
    EMPTY,
    START,
    OBSTACLE,
    RECHARGE,
    COLLECTIBLE
};

/// A grid cell. `index` is meaningful only for COLLECTIBLE cells and is
/// the bit position assigned in row-major discovery order.
struct Cell {
    CellKind kind = CellKind::EMPTY;
    int index = -1;

    bool isObstacle() const { return kind == CellKind::OBSTACLE; }
    bool isRecharge() const { return kind == CellKind::RECHARGE; }
    bool isCollectible() const { return kind == CellKind::COLLECTIBLE; }
};

/// Row/column coordinate.
struct Coord {
    int row = 0;
    int col = 0;

    bool operator==(const Coord& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Coord& other) const { return !(*this == other); }
};

} // namespace sweep

#include <gtest/gtest.h>
#include "grid/grid.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace sweep;

// ─── Parsing ───────────────────────────────────────────────────

TEST(GridTest, DimensionsAndStart) {
    Grid g({"L.S", "RXL"});
    EXPECT_EQ(g.rows(), 2);
    EXPECT_EQ(g.cols(), 3);
    EXPECT_EQ(g.start(), (Coord{0, 2}));
}

TEST(GridTest, CellClassification) {
    Grid g({"L.S", "RXL"});
    EXPECT_EQ(g.cellAt(0, 0).kind, CellKind::COLLECTIBLE);
    EXPECT_EQ(g.cellAt(0, 1).kind, CellKind::EMPTY);
    EXPECT_EQ(g.cellAt(0, 2).kind, CellKind::START);
    EXPECT_EQ(g.cellAt(1, 0).kind, CellKind::RECHARGE);
    EXPECT_EQ(g.cellAt(1, 1).kind, CellKind::OBSTACLE);
    EXPECT_TRUE(g.cellAt(1, 1).isObstacle());
    EXPECT_TRUE(g.cellAt(1, 0).isRecharge());
    EXPECT_FALSE(g.cellAt(0, 1).isCollectible());
}

TEST(GridTest, CollectiblesIndexedRowMajor) {
    Grid g({"L.S.L", "..L..", "L...."});
    ASSERT_EQ(g.collectibleCount(), 4);
    EXPECT_EQ(g.collectibleIndex(0, 0), 0);
    EXPECT_EQ(g.collectibleIndex(0, 4), 1);
    EXPECT_EQ(g.collectibleIndex(1, 2), 2);
    EXPECT_EQ(g.collectibleIndex(2, 0), 3);

    const auto& coords = g.collectibles();
    ASSERT_EQ(coords.size(), 4u);
    EXPECT_EQ(coords[1], (Coord{0, 4}));
    EXPECT_EQ(coords[3], (Coord{2, 0}));
}

TEST(GridTest, CollectibleIndexAbsent) {
    Grid g({"L.S", "RXL"});
    EXPECT_FALSE(g.collectibleIndex(0, 1).has_value());  // floor
    EXPECT_FALSE(g.collectibleIndex(0, 2).has_value());  // start
    EXPECT_FALSE(g.collectibleIndex(-1, 0).has_value());
    EXPECT_FALSE(g.collectibleIndex(2, 0).has_value());
}

TEST(GridTest, InBounds) {
    Grid g({"L.S", "RXL"});
    EXPECT_TRUE(g.inBounds(0, 0));
    EXPECT_TRUE(g.inBounds(1, 2));
    EXPECT_FALSE(g.inBounds(-1, 0));
    EXPECT_FALSE(g.inBounds(0, -1));
    EXPECT_FALSE(g.inBounds(2, 0));
    EXPECT_FALSE(g.inBounds(0, 3));
}

TEST(GridTest, MasksAndStateCount) {
    Grid g({"L.S", "RXL"});
    EXPECT_EQ(g.fullMask(), 0b11u);
    EXPECT_EQ(g.stateCount(), 6u * 4u);

    Grid empty({"S.."});
    EXPECT_EQ(empty.collectibleCount(), 0);
    EXPECT_EQ(empty.fullMask(), 0u);
    EXPECT_EQ(empty.stateCount(), 3u);
}

TEST(GridTest, MaximumCollectibles) {
    Grid g({"S" + std::string(Grid::MAX_COLLECTIBLES, 'L')});
    EXPECT_EQ(g.collectibleCount(), 63);
    EXPECT_EQ(g.fullMask(), (uint64_t{1} << 63) - 1);
    EXPECT_EQ(g.stateCount(), std::numeric_limits<uint64_t>::max());  // saturated
}

// ─── Validation ────────────────────────────────────────────────

TEST(GridTest, RaggedRowsRejected) {
    EXPECT_THROW(Grid({"S..", "L."}), ConfigurationError);
    EXPECT_THROW(Grid({"S.", "L.", "..."}), ConfigurationError);
}

TEST(GridTest, MissingStartRejected) {
    EXPECT_THROW(Grid({"...", "L.R"}), ConfigurationError);
    EXPECT_THROW(Grid(std::vector<std::string>{}), ConfigurationError);
    EXPECT_THROW(Grid({""}), ConfigurationError);
}

TEST(GridTest, MultipleStartsRejected) {
    EXPECT_THROW(Grid({"S.S"}), ConfigurationError);
    EXPECT_THROW(Grid({"S.", ".S"}), ConfigurationError);
}

TEST(GridTest, UnknownSymbolRejected) {
    EXPECT_THROW(Grid({"S.Q"}), ConfigurationError);
    EXPECT_THROW(Grid({"S.l"}), ConfigurationError);  // symbols are case-sensitive
    EXPECT_THROW(Grid({"S L"}), ConfigurationError);
}

TEST(GridTest, TooManyCollectiblesRejected) {
    EXPECT_THROW(Grid({"S" + std::string(Grid::MAX_COLLECTIBLES + 1, 'L')}),
                 ConfigurationError);
}

TEST(GridTest, ErrorMessageNamesTheProblem) {
    try {
        Grid g({"S.", ".Z"});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("'Z'"), std::string::npos);
        EXPECT_NE(msg.find("[1,1]"), std::string::npos);
    }
}

TEST(GridTest, ConfigurationErrorIsRuntimeError) {
    EXPECT_THROW(Grid({"..."}), std::runtime_error);
}

#include <gtest/gtest.h>
#include "hexzoc/HexGrid.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

using namespace hexzoc;

class HexGridTest : public ::testing::Test {
protected:
    HexGrid grid{8};
};

TEST_F(HexGridTest, ValidityMatchesAxialConstraint) {
    for (int q = -10; q <= 10; q++) {
        for (int r = -10; r <= 10; r++) {
            bool expected = std::abs(q) < 8 && std::abs(r) < 8 && std::abs(-q - r) < 8;
            EXPECT_EQ(grid.isValid(q, r), expected) << "q=" << q << " r=" << r;
        }
    }
}

TEST_F(HexGridTest, EdgeCells) {
    EXPECT_TRUE(grid.isValid(7, 0));
    EXPECT_TRUE(grid.isValid(7, -7));
    EXPECT_FALSE(grid.isValid(8, 0));
    EXPECT_FALSE(grid.isValid(7, 1));   // s = -8
    EXPECT_FALSE(grid.isValid(-4, -4)); // s = 8
}

TEST_F(HexGridTest, AllValidCoordinatesCount) {
    // 3N(N-1) + 1
    EXPECT_EQ(grid.allValidCoordinates().size(), 169u);
    EXPECT_EQ(HexGrid(1).allValidCoordinates().size(), 1u);
    EXPECT_EQ(HexGrid(2).allValidCoordinates().size(), 7u);
    EXPECT_EQ(grid.cellCount(), 169u);
    EXPECT_EQ(HexGrid::cellCountFor(8), 169);
    EXPECT_EQ(HexGrid::cellCountFor(3), 19);
    EXPECT_EQ(HexGrid::cellCountFor(0), 0);

    for (const Hex& h : grid.allValidCoordinates()) {
        EXPECT_TRUE(grid.isValid(h));
    }
}

TEST_F(HexGridTest, AllValidCoordinatesIsStableAndOrdered) {
    const std::vector<Hex>& first = grid.allValidCoordinates();
    const std::vector<Hex>& second = grid.allValidCoordinates();
    EXPECT_EQ(&first, &second);

    for (size_t i = 1; i < first.size(); i++) {
        const Hex& a = first[i - 1];
        const Hex& b = first[i];
        EXPECT_TRUE(a.q < b.q || (a.q == b.q && a.r < b.r));
    }
}

TEST_F(HexGridTest, InteriorNeighborsInCanonicalOrder) {
    std::vector<Hex> n = grid.neighbors(Hex(0, 0));
    ASSERT_EQ(n.size(), 6u);
    EXPECT_EQ(n[0], Hex(1, 0));
    EXPECT_EQ(n[1], Hex(1, -1));
    EXPECT_EQ(n[2], Hex(0, -1));
    EXPECT_EQ(n[3], Hex(-1, 0));
    EXPECT_EQ(n[4], Hex(-1, 1));
    EXPECT_EQ(n[5], Hex(0, 1));
}

TEST_F(HexGridTest, CornerNeighborsAreFiltered) {
    std::vector<Hex> n = grid.neighbors(Hex(7, 0));
    ASSERT_EQ(n.size(), 3u);
    EXPECT_EQ(n[0], Hex(7, -1));
    EXPECT_EQ(n[1], Hex(6, 0));
    EXPECT_EQ(n[2], Hex(6, 1));

    // Unfiltered variant keeps off-board cells
    auto all = HexGrid::surrounding(Hex(7, 0));
    EXPECT_EQ(all.size(), 6u);
    EXPECT_EQ(all[0], Hex(8, 0));
}

TEST_F(HexGridTest, EdgeNeighborCount) {
    // Middle of an edge has 4 on-board neighbors
    EXPECT_EQ(grid.neighbors(Hex(7, -3)).size(), 4u);
}

TEST_F(HexGridTest, DirectionSymmetry) {
    for (int d = 0; d < HexGrid::NUM_DIRECTIONS; d++) {
        int opp = HexGrid::oppositeDirection(d);
        EXPECT_EQ(HexGrid::DIRECTIONS[d] + HexGrid::DIRECTIONS[opp], Hex(0, 0));

        for (const Hex& p : grid.allValidCoordinates()) {
            Hex there = HexGrid::neighbor(p, d);
            EXPECT_EQ(HexGrid::neighbor(there, opp), p);
        }
    }
}

TEST_F(HexGridTest, FootprintOfOneTile) {
    EXPECT_EQ(grid.footprint(Hex(0, 0)).size(), 7u);
    EXPECT_EQ(grid.footprint(Hex(7, 0)).size(), 4u);
    EXPECT_EQ(grid.footprint(Hex(0, 0))[0], Hex(0, 0));
}

TEST(HexRoundTest, IdempotentOnIntegers) {
    for (int q = -10; q <= 10; q++) {
        for (int r = -10; r <= 10; r++) {
            Hex h = hexRound(q, r);
            EXPECT_EQ(h, Hex(q, r));
            EXPECT_EQ(h.q + h.r + h.s(), 0);
        }
    }
}

TEST(HexRoundTest, SnapsNearbyFractions) {
    EXPECT_EQ(hexRound(0.2, -0.1), Hex(0, 0));
    EXPECT_EQ(hexRound(2.9, -1.1), Hex(3, -1));
    EXPECT_EQ(hexRound(-3.2, 1.15), Hex(-3, 1));
}

TEST(HexRoundTest, CorrectsComponentWithLargestError) {
    // q=0.45, r=0.45, s=-0.9: q and r tie, r is recomputed from q and s
    EXPECT_EQ(hexRound(0.45, 0.45), Hex(0, 1));

    // q=0.6, r=-0.3, s=-0.3 rounds to (1,0,0); q has the largest error
    // and is rebuilt from r and s
    Hex h = hexRound(0.6, -0.3);
    EXPECT_EQ(h.q + h.r + h.s(), 0);
    EXPECT_EQ(h, Hex(0, 0));
}

TEST(HexRoundTest, UnrepresentableInputIsOffGrid) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_EQ(hexRound(3e9, -1.0), OFF_GRID);
    EXPECT_EQ(hexRound(-1.0, -3e9), OFF_GRID);
    EXPECT_EQ(hexRound(nan, 0.0), OFF_GRID);
    EXPECT_EQ(hexRound(0.0, inf), OFF_GRID);
    EXPECT_FALSE(HexGrid(8).isValid(OFF_GRID));

    // Large but representable input still rounds normally
    EXPECT_EQ(hexRound(1e6 + 0.2, -1e6 - 0.1), Hex(1000000, -1000000));
}

TEST(HexRoundTest, ResultIsAlwaysNearest) {
    for (double q = -3.0; q <= 3.0; q += 0.13) {
        for (double r = -3.0; r <= 3.0; r += 0.17) {
            Hex h = hexRound(q, r);
            double dq = std::abs(h.q - q);
            double dr = std::abs(h.r - r);
            double ds = std::abs(h.s() - (-q - r));
            // Cube distance to the rounded cell never exceeds one cell
            EXPECT_LE(std::max(dq, std::max(dr, ds)), 1.0);
        }
    }
}

TEST(LayoutTest, HexToPixelOffsets) {
    Layout layout(28.0, Point{100.0, 200.0});
    Point origin = layout.hexToPixel(Hex(0, 0));
    EXPECT_DOUBLE_EQ(origin.x, 100.0);
    EXPECT_DOUBLE_EQ(origin.y, 200.0);

    Point east = layout.hexToPixel(Hex(1, 0));
    EXPECT_NEAR(east.x, 100.0 + 28.0 * std::sqrt(3.0), 1e-9);
    EXPECT_NEAR(east.y, 200.0, 1e-9);

    Point se = layout.hexToPixel(Hex(0, 1));
    EXPECT_NEAR(se.x, 100.0 + 14.0 * std::sqrt(3.0), 1e-9);
    EXPECT_NEAR(se.y, 242.0, 1e-9);
}

TEST(LayoutTest, FarAwayPixelIsOffBoard) {
    Layout layout = Layout::centeredOn(8);
    HexGrid grid(8);
    EXPECT_FALSE(grid.isValid(layout.pixelToHex(Point{1e300, -1e300})));
    EXPECT_FALSE(grid.isValid(layout.pixelToHex(
        Point{std::numeric_limits<double>::quiet_NaN(), 10.0})));
}

TEST(LayoutTest, RejectsNonPositiveHexSize) {
    EXPECT_THROW(Layout(0.0, Point{}), std::invalid_argument);
    EXPECT_THROW(Layout(-5.0, Point{}), std::invalid_argument);
    EXPECT_THROW(Layout::centeredOn(8, 0.0), std::invalid_argument);

    Layout layout(12.5, Point{});
    EXPECT_DOUBLE_EQ(layout.getHexSize(), 12.5);
}

TEST(LayoutTest, RoundTripForEveryCell) {
    HexGrid grid(8);
    Layout layout = Layout::centeredOn(8);
    for (const Hex& h : grid.allValidCoordinates()) {
        EXPECT_EQ(layout.pixelToHex(layout.hexToPixel(h)), h);
    }
}

TEST(LayoutTest, ClicksInsideACellMapToIt) {
    HexGrid grid(8);
    Layout layout = Layout::centeredOn(8);
    for (const Hex& h : grid.allValidCoordinates()) {
        Point p = layout.hexToPixel(h);
        EXPECT_EQ(layout.pixelToHex(Point{p.x + 6.0, p.y - 5.0}), h);
        EXPECT_EQ(layout.pixelToHex(Point{p.x - 10.0, p.y + 8.0}), h);
    }
}

TEST(LayoutTest, CenteredCanvasSize) {
    Layout layout = Layout::centeredOn(8, 28.0);
    EXPECT_EQ(layout.getCanvasWidth(), 655);
    EXPECT_EQ(layout.getCanvasHeight(), 656);
    EXPECT_DOUBLE_EQ(layout.getOrigin().x, 327.5);
    EXPECT_DOUBLE_EQ(layout.getOrigin().y, 328.0);
    EXPECT_EQ(layout.pixelToHex(layout.getOrigin()), Hex(0, 0));
}

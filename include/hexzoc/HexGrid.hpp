#ifndef HEXZOC_HEXGRID_HPP
#define HEXZOC_HEXGRID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace hexzoc {

// Axial coordinate. s is derived so that q + r + s == 0.
struct Hex {
    int q = 0;
    int r = 0;

    Hex() = default;
    Hex(int q, int r) : q(q), r(r) {}

    int s() const { return -q - r; }

    bool operator==(const Hex& other) const {
        return q == other.q && r == other.r;
    }

    bool operator!=(const Hex& other) const {
        return !(*this == other);
    }

    Hex operator+(const Hex& other) const {
        return Hex(q + other.q, r + other.r);
    }
};

struct HexHash {
    size_t operator()(const Hex& h) const noexcept {
        return (static_cast<uint64_t>(static_cast<uint32_t>(h.q)) * 0x9e3779b97f4a7c15ULL) ^
               (static_cast<uint64_t>(static_cast<uint32_t>(h.r)) + 0x9e3779b97f4a7c15ULL);
    }
};

class HexGrid {
public:
    static constexpr int DEFAULT_RADIUS = 8;
    static constexpr int NUM_DIRECTIONS = 6;
    static constexpr int MAX_RADIUS = 1 << 14;

    // E, NE, NW, W, SW, SE
    static const std::array<Hex, NUM_DIRECTIONS> DIRECTIONS;

    explicit HexGrid(int radius = DEFAULT_RADIUS);

    int getRadius() const { return radius; }

    bool isValid(int q, int r) const;
    bool isValid(const Hex& hex) const { return isValid(hex.q, hex.r); }

    // Neighbors on the board only.
    std::vector<Hex> neighbors(const Hex& hex) const;

    // All 6 neighbors, including off-board ones.
    static std::array<Hex, NUM_DIRECTIONS> surrounding(const Hex& hex);

    // The cell itself plus its on-board neighbors.
    std::vector<Hex> footprint(const Hex& hex) const;

    static Hex neighbor(const Hex& hex, int direction);
    static int oppositeDirection(int direction) { return (direction + 3) % NUM_DIRECTIONS; }

    // Enumerated once at construction, q-major then r ascending.
    const std::vector<Hex>& allValidCoordinates() const { return coordinates; }
    size_t cellCount() const { return coordinates.size(); }

    // 3N(N-1) + 1 cells for radius N.
    static long long cellCountFor(int radius) {
        return radius < 1 ? 0 : 3LL * radius * (radius - 1) + 1;
    }

private:
    int radius;
    std::vector<Hex> coordinates;
};

// Rounds fractional axial coordinates to the nearest cell.
// Non-finite or out of range input maps to OFF_GRID.
Hex hexRound(double q, double r);

// Far outside any playable board; s stays representable.
const Hex OFF_GRID(1 << 30, 0);

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// Pixel mapping for the on-screen board. Pure geometry, no drawing.
class Layout {
public:
    static constexpr double DEFAULT_HEX_SIZE = 28.0;

    Layout() = default;
    // Throws std::invalid_argument unless hexSize > 0.
    Layout(double hexSize, Point origin);

    // Canvas big enough for a board of the given radius, origin at its center.
    static Layout centeredOn(int gridRadius, double hexSize = DEFAULT_HEX_SIZE);

    Point hexToPixel(const Hex& hex) const;
    Hex pixelToHex(const Point& pixel) const;

    double getHexSize() const { return hexSize; }
    Point getOrigin() const { return origin; }
    int getCanvasWidth() const { return canvasWidth; }
    int getCanvasHeight() const { return canvasHeight; }

private:
    double hexSize = DEFAULT_HEX_SIZE;
    Point origin;
    int canvasWidth = 0;
    int canvasHeight = 0;
};

} // namespace hexzoc

#endif // HEXZOC_HEXGRID_HPP

#include "hexzoc/HexGrid.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace hexzoc {

const std::array<Hex, HexGrid::NUM_DIRECTIONS> HexGrid::DIRECTIONS = {{
    Hex(1, 0),   // East
    Hex(1, -1),  // Northeast
    Hex(0, -1),  // Northwest
    Hex(-1, 0),  // West
    Hex(-1, 1),  // Southwest
    Hex(0, 1)    // Southeast
}};

HexGrid::HexGrid(int radius) : radius(radius) {
    for (int q = -(radius - 1); q < radius; q++) {
        for (int r = -(radius - 1); r < radius; r++) {
            if (isValid(q, r)) {
                coordinates.emplace_back(q, r);
            }
        }
    }
}

bool HexGrid::isValid(int q, int r) const {
    int s = -q - r;
    return std::abs(q) < radius && std::abs(r) < radius && std::abs(s) < radius;
}

std::vector<Hex> HexGrid::neighbors(const Hex& hex) const {
    std::vector<Hex> result;
    result.reserve(NUM_DIRECTIONS);
    for (const Hex& dir : DIRECTIONS) {
        Hex n = hex + dir;
        if (isValid(n)) {
            result.push_back(n);
        }
    }
    return result;
}

std::array<Hex, HexGrid::NUM_DIRECTIONS> HexGrid::surrounding(const Hex& hex) {
    std::array<Hex, NUM_DIRECTIONS> result;
    for (int i = 0; i < NUM_DIRECTIONS; i++) {
        result[i] = hex + DIRECTIONS[i];
    }
    return result;
}

std::vector<Hex> HexGrid::footprint(const Hex& hex) const {
    std::vector<Hex> result;
    if (isValid(hex)) {
        result.push_back(hex);
    }
    for (const Hex& n : neighbors(hex)) {
        result.push_back(n);
    }
    return result;
}

Hex HexGrid::neighbor(const Hex& hex, int direction) {
    return hex + DIRECTIONS[((direction % NUM_DIRECTIONS) + NUM_DIRECTIONS) % NUM_DIRECTIONS];
}

Hex hexRound(double q, double r) {
    // Keeps the int conversion below defined. NaN fails both tests.
    const double limit = static_cast<double>(OFF_GRID.q);
    if (!(std::abs(q) < limit && std::abs(r) < limit)) {
        return OFF_GRID;
    }

    double s = -q - r;

    // Halves go toward +infinity.
    double rq = std::floor(q + 0.5);
    double rr = std::floor(r + 0.5);
    double rs = std::floor(s + 0.5);

    double qDiff = std::abs(rq - q);
    double rDiff = std::abs(rr - r);
    double sDiff = std::abs(rs - s);

    if (qDiff > rDiff && qDiff > sDiff) {
        rq = -rr - rs;
    } else if (rDiff > sDiff) {
        rr = -rq - rs;
    }
    // Otherwise s absorbs the error and is implied by q and r.

    return Hex(static_cast<int>(rq), static_cast<int>(rr));
}

static double checkedHexSize(double hexSize) {
    if (!(hexSize > 0.0) || !std::isfinite(hexSize)) {
        throw std::invalid_argument("Layout: hex size must be positive");
    }
    return hexSize;
}

Layout::Layout(double hexSize, Point origin) : hexSize(checkedHexSize(hexSize)), origin(origin) {
}

Layout Layout::centeredOn(int gridRadius, double hexSize) {
    checkedHexSize(hexSize);
    const double hexWidth = std::sqrt(3.0) * hexSize;
    const double hexHeight = hexSize * 2.0;

    Layout layout;
    layout.hexSize = hexSize;
    layout.canvasWidth = static_cast<int>(std::ceil((gridRadius * 2 + 1) * hexWidth * 0.9));
    layout.canvasHeight = static_cast<int>(std::ceil((gridRadius * 2 + 1) * hexHeight * 0.78));
    layout.origin = Point{layout.canvasWidth / 2.0, layout.canvasHeight / 2.0};
    return layout;
}

Point Layout::hexToPixel(const Hex& hex) const {
    const double sqrt3 = std::sqrt(3.0);
    double x = hexSize * (sqrt3 * hex.q + sqrt3 / 2.0 * hex.r);
    double y = hexSize * (3.0 / 2.0 * hex.r);
    return Point{origin.x + x, origin.y + y};
}

Hex Layout::pixelToHex(const Point& pixel) const {
    double px = pixel.x - origin.x;
    double py = pixel.y - origin.y;

    double q = (std::sqrt(3.0) / 3.0 * px - 1.0 / 3.0 * py) / hexSize;
    double r = (2.0 / 3.0 * py) / hexSize;

    return hexRound(q, r);
}

} // namespace hexzoc

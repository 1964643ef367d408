#include "hexzoc/ZoneOfControl.hpp"

namespace hexzoc {

HexSet zoneOfControl(const Board& board, Player player) {
    HexSet zoc;
    const HexGrid& grid = board.grid();

    for (const auto& [hex, owner] : board.tiles()) {
        if (owner != player) continue;

        zoc.insert(hex);
        for (const Hex& n : HexGrid::surrounding(hex)) {
            if (grid.isValid(n)) {
                zoc.insert(n);
            }
        }
    }

    return zoc;
}

bool isSurrounded(const HexGrid& grid, const Hex& hex, const HexSet& enemyZoc) {
    for (const Hex& n : HexGrid::surrounding(hex)) {
        if (!grid.isValid(n)) {
            continue;
        }
        if (enemyZoc.count(n) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace hexzoc

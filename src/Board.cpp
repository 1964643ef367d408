#include "hexzoc/Board.hpp"

namespace hexzoc {

Board::Board(int gridRadius, int tilesPerPlayer)
    : hexGrid(gridRadius), tilesPerPlayer(tilesPerPlayer) {
    reset();
}

GameError Board::canPlace(const Hex& hex, Player player) const {
    if (!hexGrid.isValid(hex)) {
        return GameError::INVALID_COORDINATE;
    }
    if (tileMap.count(hex) != 0) {
        return GameError::CELL_OCCUPIED;
    }
    if (remainingSupply(player) <= 0) {
        return GameError::SUPPLY_EXHAUSTED;
    }
    return GameError::NONE;
}

GameError Board::place(const Hex& hex, Player player) {
    GameError error = canPlace(hex, player);
    if (error != GameError::NONE) {
        return error;
    }

    tileMap[hex] = player;
    supply[supplyIndex(player)]--;
    return GameError::NONE;
}

bool Board::setOwner(const Hex& hex, Player player) {
    if (player != WHITE && player != BLACK) {
        return false;
    }
    auto it = tileMap.find(hex);
    if (it == tileMap.end()) {
        return false;
    }
    it->second = player;
    return true;
}

bool Board::flipAll(const std::vector<Hex>& cells, Player player) {
    if (player != WHITE && player != BLACK) {
        return false;
    }
    for (const Hex& hex : cells) {
        if (tileMap.count(hex) == 0) {
            return false;
        }
    }
    for (const Hex& hex : cells) {
        tileMap[hex] = player;
    }
    return true;
}

Player Board::occupant(const Hex& hex) const {
    auto it = tileMap.find(hex);
    return it == tileMap.end() ? NONE : it->second;
}

int Board::remainingSupply(Player player) const {
    if (player != WHITE && player != BLACK) {
        return 0;
    }
    return supply[supplyIndex(player)];
}

TileCounts Board::tileCounts() const {
    TileCounts counts;
    for (const auto& [hex, owner] : tileMap) {
        if (owner == WHITE) {
            counts.white++;
        } else {
            counts.black++;
        }
    }
    return counts;
}

std::vector<Hex> Board::tilesOf(Player player) const {
    std::vector<Hex> result;
    if (tileMap.empty()) {
        return result;
    }
    // Walk the grid instead of the map so the order is stable
    for (const Hex& hex : hexGrid.allValidCoordinates()) {
        if (occupant(hex) == player) {
            result.push_back(hex);
        }
    }
    return result;
}

void Board::reset() {
    tileMap.clear();
    supply = {tilesPerPlayer, tilesPerPlayer};
}

} // namespace hexzoc

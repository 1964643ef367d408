#ifndef HEXZOC_BOARD_HPP
#define HEXZOC_BOARD_HPP

#include "hexzoc/GameConfig.hpp"
#include "hexzoc/HexGrid.hpp"
#include "hexzoc/Types.hpp"
#include <array>
#include <unordered_map>
#include <vector>

namespace hexzoc {

struct TileCounts {
    int white = 0;
    int black = 0;

    int of(Player player) const {
        if (player == WHITE) return white;
        if (player == BLACK) return black;
        return 0;
    }

    int total() const { return white + black; }
};

using TileMap = std::unordered_map<Hex, Player, HexHash>;

// Sparse board: only occupied cells are stored.
class Board {
public:
    explicit Board(int gridRadius = HexGrid::DEFAULT_RADIUS,
                   int tilesPerPlayer = GameConfig::DEFAULT_TILES_PER_PLAYER);

    // Checks placement against bounds, occupancy and supply without mutating.
    GameError canPlace(const Hex& hex, Player player) const;

    // Records the tile and spends one from the player's supply.
    GameError place(const Hex& hex, Player player);

    // Flip an existing tile. Returns false for invalid or empty cells.
    bool setOwner(const Hex& hex, Player player);

    // All-or-nothing flip of several tiles.
    bool flipAll(const std::vector<Hex>& cells, Player player);

    Player occupant(const Hex& hex) const;
    bool isEmpty(const Hex& hex) const { return occupant(hex) == NONE; }

    int remainingSupply(Player player) const;
    TileCounts tileCounts() const;

    // Cells owned by the player in grid enumeration order.
    std::vector<Hex> tilesOf(Player player) const;

    const HexGrid& grid() const { return hexGrid; }
    const TileMap& tiles() const { return tileMap; }
    const std::vector<Hex>& allValidCoordinates() const { return hexGrid.allValidCoordinates(); }
    int getTilesPerPlayer() const { return tilesPerPlayer; }

    void reset();

private:
    HexGrid hexGrid;
    TileMap tileMap;
    int tilesPerPlayer;
    std::array<int, 2> supply;

    static int supplyIndex(Player player) { return player == WHITE ? 0 : 1; }
};

} // namespace hexzoc

#endif // HEXZOC_BOARD_HPP

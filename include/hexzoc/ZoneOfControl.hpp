#ifndef HEXZOC_ZONEOFCONTROL_HPP
#define HEXZOC_ZONEOFCONTROL_HPP

#include "hexzoc/Board.hpp"
#include "hexzoc/HexGrid.hpp"
#include <unordered_set>

namespace hexzoc {

using HexSet = std::unordered_set<Hex, HexHash>;

// Union of footprints of every tile the player owns, clipped to the board.
HexSet zoneOfControl(const Board& board, Player player);

// True when every on-board neighbor of hex lies in enemyZoc.
// Off-board neighbors never count as an escape, so a cell with no
// on-board neighbors is surrounded.
bool isSurrounded(const HexGrid& grid, const Hex& hex, const HexSet& enemyZoc);

} // namespace hexzoc

#endif // HEXZOC_ZONEOFCONTROL_HPP

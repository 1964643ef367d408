#ifndef HEXZOC_GAMEUTILS_HPP
#define HEXZOC_GAMEUTILS_HPP

#include "hexzoc/HexZocGame.hpp"
#include <iostream>
#include <string>

namespace hexzoc {

class GameUtils {
public:
    // Coordinate parsing/display, "q,r"
    static std::string displayHex(const Hex& hex);
    static bool parseHex(const std::string& text, Hex& out);

    static const char* playerName(Player player);
    static const char* errorName(GameError error);

    // End of game text
    static std::string outcomeText(const HexZocGame::Outcome& outcome);
    static std::string finalScoreText(const TileCounts& counts);

    // Board printing
    static void printBoard(const HexZocGame& game, std::ostream& out = std::cout,
                           bool showCoordinates = false);
    static void printGameState(const HexZocGame& game, std::ostream& out = std::cout);
    static void printBatches(const std::vector<CaptureBatch>& batches, std::ostream& out = std::cout);
};

} // namespace hexzoc

#endif // HEXZOC_GAMEUTILS_HPP

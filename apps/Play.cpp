#include "hexzoc/HexZocGame.hpp"
#include "hexzoc/GameUtils.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace hexzoc;

static void printZone(const HexZocGame& game, Player player) {
    HexSet zoc = game.zoneOfControl(player);
    std::cout << GameUtils::playerName(player) << " zone of control (" << zoc.size() << " cells):";
    // Grid order keeps the listing stable
    for (const Hex& hex : game.allValidCoordinates()) {
        if (zoc.count(hex)) {
            std::cout << " " << GameUtils::displayHex(hex);
        }
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    GameConfig config = GameConfig::standard();
    if (argc > 1) {
        std::string mode = argv[1];
        if (mode == "othello") {
            config = GameConfig::othelloOnly();
        } else if (mode == "surround") {
            config = GameConfig::surroundOnly();
        } else if (mode != "standard") {
            std::cerr << "Usage: " << argv[0] << " [standard|othello|surround]\n";
            return 1;
        }
    }

    std::cout << "Playing Hex Zone Control..." << std::endl;
    std::cout << "Enter moves as q,r. Commands: reset, zoc white|black, coords, quit\n";

    HexZocGame game(config);
    std::vector<std::string> moves;
    std::string line;

    GameUtils::printGameState(game);
    while (true) {
        if (!game.isGameOver()) {
            std::cout << GameUtils::playerName(game.currentPlayer()) << "> " << std::flush;
        } else {
            std::cout << "game over (reset or quit)> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }

        if (line == "quit") {
            break;
        }
        if (line == "reset") {
            game.reset();
            moves.clear();
            GameUtils::printGameState(game);
            continue;
        }
        if (line == "coords") {
            GameUtils::printBoard(game, std::cout, true);
            continue;
        }
        if (line == "zoc white" || line == "zoc black") {
            printZone(game, line == "zoc white" ? WHITE : BLACK);
            continue;
        }

        Hex hex;
        if (!GameUtils::parseHex(line, hex)) {
            std::cout << "Could not read a coordinate from '" << line << "'\n";
            continue;
        }

        HexZocGame::PlacementResult placement = game.requestPlacement(hex);
        if (!placement.ok()) {
            std::cout << "Rejected: " << GameUtils::errorName(placement.error) << "\n";
            continue;
        }
        moves.push_back(GameUtils::displayHex(hex));

        if (!placement.batches.empty()) {
            std::cout << "Captures:\n";
            GameUtils::printBatches(placement.batches);
            for (size_t i = 0; i < placement.batches.size(); i++) {
                HexZocGame::BatchResult applied = game.confirmBatchApplied(static_cast<int>(i));
                if (!applied.ok()) {
                    std::cout << "Batch " << i << " failed: " << GameUtils::errorName(applied.error) << "\n";
                    break;
                }
            }
        }

        GameUtils::printGameState(game);
    }

    std::cout << "Moves: ";
    for (const auto& moveStr : moves) {
        std::cout << moveStr << " ";
    }
    std::cout << "\n";

    return 0;
}

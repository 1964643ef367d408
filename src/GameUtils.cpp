#include "hexzoc/GameUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace hexzoc {

std::string GameUtils::displayHex(const Hex& hex) {
    return std::to_string(hex.q) + "," + std::to_string(hex.r);
}

static bool parseInt(const char*& p, int& out) {
    while (std::isspace(static_cast<unsigned char>(*p))) p++;
    if (*p == '\0') {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    long value = std::strtol(p, &end, 10);
    if (end == p || errno == ERANGE || value < -1000000 || value > 1000000) {
        return false;
    }
    out = static_cast<int>(value);
    p = end;
    return true;
}

bool GameUtils::parseHex(const std::string& text, Hex& out) {
    const char* p = text.c_str();
    int q = 0;
    int r = 0;

    if (!parseInt(p, q)) {
        return false;
    }

    // Separator is a comma, whitespace, or both
    while (std::isspace(static_cast<unsigned char>(*p))) p++;
    if (*p == ',') p++;

    if (!parseInt(p, r)) {
        return false;
    }

    while (std::isspace(static_cast<unsigned char>(*p))) p++;
    if (*p != '\0') {
        return false;
    }

    out = Hex(q, r);
    return true;
}

const char* GameUtils::playerName(Player player) {
    switch (player) {
        case WHITE: return "White";
        case BLACK: return "Black";
        default: return "None";
    }
}

const char* GameUtils::errorName(GameError error) {
    switch (error) {
        case GameError::NONE: return "NONE";
        case GameError::INVALID_COORDINATE: return "INVALID_COORDINATE";
        case GameError::CELL_OCCUPIED: return "CELL_OCCUPIED";
        case GameError::SUPPLY_EXHAUSTED: return "SUPPLY_EXHAUSTED";
        case GameError::GAME_ALREADY_OVER: return "GAME_ALREADY_OVER";
        case GameError::CAPTURES_IN_PROGRESS: return "CAPTURES_IN_PROGRESS";
        case GameError::INVALID_BATCH_INDEX: return "INVALID_BATCH_INDEX";
    }
    return "UNKNOWN";
}

std::string GameUtils::outcomeText(const HexZocGame::Outcome& outcome) {
    if (outcome.winner == WHITE) return "White Wins!";
    if (outcome.winner == BLACK) return "Black Wins!";
    return "It's a Tie!";
}

std::string GameUtils::finalScoreText(const TileCounts& counts) {
    std::ostringstream ss;
    ss << "Final Score: White " << counts.white << " - Black " << counts.black;
    return ss.str();
}

void GameUtils::printBoard(const HexZocGame& game, std::ostream& out, bool showCoordinates) {
    const int n = game.getConfig().gridRadius;
    const std::optional<Hex> last = game.lastPlaced();

    // One text row per r. Each row is indented by |r| so the hexagon
    // outline lines up with two characters per cell.
    for (int r = -(n - 1); r < n; r++) {
        int qMin = std::max(-(n - 1), -(n - 1) - r);
        int qMax = std::min(n - 1, n - 1 - r);

        out << std::setw(3) << r << " " << std::string(static_cast<size_t>(std::abs(r)), ' ');
        for (int q = qMin; q <= qMax; q++) {
            Hex hex(q, r);
            Player owner = game.occupant(hex);
            if (owner == WHITE) {
                out << (last && *last == hex ? "◇ " : "○ ");  // White
            } else if (owner == BLACK) {
                out << (last && *last == hex ? "◆ " : "● ");  // Black
            } else {
                out << "· ";
            }
        }
        if (showCoordinates) {
            out << std::string(static_cast<size_t>(std::abs(r)), ' ')
                << " q " << qMin << ".." << qMax;
        }
        out << "\n";
    }
}

void GameUtils::printGameState(const HexZocGame& game, std::ostream& out) {
    printBoard(game, out);

    TileCounts counts = game.tileCounts();
    out << "White ○ " << counts.white << " on board, " << game.remainingSupply(WHITE) << " left; "
        << "Black ● " << counts.black << " on board, " << game.remainingSupply(BLACK) << " left\n";

    if (game.isGameOver()) {
        HexZocGame::Outcome outcome = *game.outcome();
        out << outcomeText(outcome) << "\n" << finalScoreText(outcome.counts) << "\n";
    } else {
        out << "Current player: " << playerName(game.currentPlayer()) << "\n";
    }
}

void GameUtils::printBatches(const std::vector<CaptureBatch>& batches, std::ostream& out) {
    for (size_t i = 0; i < batches.size(); i++) {
        out << "  batch " << i << " (rank " << batches[i].rank << "):";
        for (const Hex& hex : batches[i].cells) {
            out << " " << displayHex(hex);
        }
        out << "\n";
    }
}

} // namespace hexzoc

#include "hexzoc/CaptureRules.hpp"
#include "hexzoc/ZoneOfControl.hpp"
#include <map>
#include <utility>

namespace hexzoc {

// ============================================================================
// CaptureSet
// ============================================================================

bool CaptureSet::insert(const Hex& hex, int rank) {
    if (contains(hex)) {
        return false;
    }
    index.emplace(hex, entries.size());
    entries.emplace_back(hex, rank);
    return true;
}

void CaptureSet::insertAll(const std::vector<Capture>& captures) {
    for (const Capture& c : captures) {
        insert(c.hex, c.rank);
    }
}

int CaptureSet::rankOf(const Hex& hex) const {
    auto it = index.find(hex);
    return it == index.end() ? 0 : entries[it->second].rank;
}

std::vector<CaptureBatch> groupByRank(const CaptureSet& captures) {
    std::map<int, std::vector<Hex>> byRank;
    for (const Capture& c : captures.getEntries()) {
        byRank[c.rank].push_back(c.hex);
    }

    std::vector<CaptureBatch> batches;
    batches.reserve(byRank.size());
    for (auto& [rank, cells] : byRank) {
        CaptureBatch batch;
        batch.rank = rank;
        batch.cells = std::move(cells);
        batches.push_back(std::move(batch));
    }
    return batches;
}

// ============================================================================
// CaptureRules
// ============================================================================

CaptureRules::CaptureRules(const GameConfig& config) : config(config) {
}

std::vector<Capture> CaptureRules::lineCaptures(const Board& board, const Hex& placed, Player player) const {
    const HexGrid& grid = board.grid();
    const Player opponent = opponentOf(player);
    std::vector<Capture> allFlips;

    for (const Hex& dir : HexGrid::DIRECTIONS) {
        std::vector<Capture> lineFlips;
        Hex cur = placed + dir;
        int distance = 1;

        while (grid.isValid(cur)) {
            Player owner = board.occupant(cur);
            if (owner == opponent) {
                lineFlips.emplace_back(cur, config.rankLineCapturesByDistance ? distance : 1);
                cur = cur + dir;
                distance++;
            } else {
                // Bracketed by our own tile: the whole run flips
                if (owner == player) {
                    allFlips.insert(allFlips.end(), lineFlips.begin(), lineFlips.end());
                }
                break;
            }
        }
    }

    return allFlips;
}

std::vector<Hex> CaptureRules::straightRuns(const Board& board, const Hex& start, Player owner) {
    const HexGrid& grid = board.grid();
    std::vector<Hex> run;

    for (const Hex& dir : HexGrid::DIRECTIONS) {
        Hex cur = start + dir;
        while (grid.isValid(cur) && board.occupant(cur) == owner) {
            run.push_back(cur);
            cur = cur + dir;
        }
    }

    return run;
}

std::vector<Capture> CaptureRules::surroundCaptures(const Board& board, Player attacker) const {
    const Player defender = opponentOf(attacker);
    const HexSet attackerZoc = zoneOfControl(board, attacker);
    std::vector<Capture> flips;

    for (const Hex& tile : board.tilesOf(defender)) {
        if (!isSurrounded(board.grid(), tile, attackerZoc)) {
            continue;
        }

        flips.emplace_back(tile, 1);

        std::vector<Hex> run = straightRuns(board, tile, defender);
        for (size_t i = 0; i < run.size(); i++) {
            flips.emplace_back(run[i], static_cast<int>(i) + 2);
        }
    }

    return flips;
}

CaptureSet CaptureRules::resolve(const Board& board, const Hex& placed, Player player) const {
    CaptureSet result;

    // Both rules read the same snapshot. Line captures win ties.
    if (config.lineCaptureEnabled) {
        result.insertAll(lineCaptures(board, placed, player));
    }
    if (config.surroundCaptureEnabled) {
        result.insertAll(surroundCaptures(board, player));
    }

    return result;
}

} // namespace hexzoc

#ifndef HEXZOC_CAPTURERULES_HPP
#define HEXZOC_CAPTURERULES_HPP

#include "hexzoc/Board.hpp"
#include "hexzoc/GameConfig.hpp"
#include "hexzoc/HexGrid.hpp"
#include <unordered_map>
#include <vector>

namespace hexzoc {

struct Capture {
    Hex hex;
    int rank = 1;  // reveal order, 1 = first

    Capture() = default;
    Capture(const Hex& hex, int rank) : hex(hex), rank(rank) {}
};

// At most one entry per cell. The first insert for a cell wins;
// iteration follows insertion order.
class CaptureSet {
public:
    bool insert(const Hex& hex, int rank);
    void insertAll(const std::vector<Capture>& captures);

    bool contains(const Hex& hex) const { return index.count(hex) != 0; }
    int rankOf(const Hex& hex) const;  // 0 when absent

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    const std::vector<Capture>& getEntries() const { return entries; }

private:
    std::vector<Capture> entries;
    std::unordered_map<Hex, size_t, HexHash> index;
};

struct CaptureBatch {
    int rank = 0;
    std::vector<Hex> cells;
};

// Groups entries by rank ascending. Cells keep their capture-set order.
std::vector<CaptureBatch> groupByRank(const CaptureSet& captures);

class CaptureRules {
public:
    explicit CaptureRules(const GameConfig& config = GameConfig::standard());

    // Othello flanking from the placed tile along each of the 6 directions.
    std::vector<Capture> lineCaptures(const Board& board, const Hex& placed, Player player) const;

    // Opponent tiles whose on-board neighbors all lie in the attacker's
    // zone of control, plus the straight runs of their owner leading away
    // from them.
    std::vector<Capture> surroundCaptures(const Board& board, Player attacker) const;

    // Line captures first, then surround captures for cells not yet taken.
    // Runs once per placement and never feeds its own result back in.
    CaptureSet resolve(const Board& board, const Hex& placed, Player player) const;

    // Consecutive cells owned by owner, walked outward from start in each
    // direction in turn. start itself is excluded.
    static std::vector<Hex> straightRuns(const Board& board, const Hex& start, Player owner);

private:
    GameConfig config;
};

} // namespace hexzoc

#endif // HEXZOC_CAPTURERULES_HPP

#ifndef HEXZOC_HEXZOCGAME_HPP
#define HEXZOC_HEXZOCGAME_HPP

#include "hexzoc/Board.hpp"
#include "hexzoc/CaptureRules.hpp"
#include "hexzoc/GameConfig.hpp"
#include "hexzoc/HexGrid.hpp"
#include "hexzoc/Types.hpp"
#include "hexzoc/ZoneOfControl.hpp"
#include <optional>
#include <vector>

namespace hexzoc {

// One game session. Drives placement, capture staging and turn order.
// The host owns reveal pacing: it shows each staged batch, then confirms it.
class HexZocGame {
public:
    enum class Phase {
        AWAITING_PLACEMENT,
        STAGING_CAPTURES,
        GAME_OVER
    };

    struct Outcome {
        Player winner = NONE;  // NONE on a tie
        TileCounts counts;

        bool isTie() const { return winner == NONE; }
    };

    struct PlacementResult {
        GameError error = GameError::NONE;
        Hex placed;
        Player player = NONE;
        // Empty when nothing was captured; the turn has then already finished.
        std::vector<CaptureBatch> batches;

        bool ok() const { return error == GameError::NONE; }
    };

    struct BatchResult {
        GameError error = GameError::NONE;
        bool turnFinished = false;
        Player nextPlayer = NONE;        // set when the turn passed on
        std::optional<Outcome> outcome;  // set when the game ended

        bool ok() const { return error == GameError::NONE; }
    };

    explicit HexZocGame(const GameConfig& config = GameConfig::standard());

    // Start over with the same configuration
    void reset();

    // Place a tile for the current player.
    PlacementResult requestPlacement(int q, int r);
    PlacementResult requestPlacement(const Hex& hex) { return requestPlacement(hex.q, hex.r); }

    // Apply staged batch batchIndex. Batches must be confirmed in order.
    BatchResult confirmBatchApplied(int batchIndex);

    // Confirm every remaining batch, for hosts that do not animate.
    BatchResult applyAllBatches();

    // State queries
    Phase phase() const { return currentPhase; }
    Player currentPlayer() const { return toMove; }
    int remainingSupply(Player player) const { return board.remainingSupply(player); }
    TileCounts tileCounts() const { return board.tileCounts(); }
    bool isGameOver() const { return currentPhase == Phase::GAME_OVER; }
    std::optional<Outcome> outcome() const { return finalOutcome; }
    Player occupant(const Hex& hex) const { return board.occupant(hex); }
    std::optional<Hex> lastPlaced() const { return lastPlacement; }

    const std::vector<CaptureBatch>& stagedBatches() const { return staged; }
    int nextBatchIndex() const { return nextBatch; }

    // Grid and preview helpers for the host
    const std::vector<Hex>& allValidCoordinates() const { return board.allValidCoordinates(); }
    HexSet zoneOfControl(Player player) const { return hexzoc::zoneOfControl(board, player); }

    const Board& getBoard() const { return board; }
    const GameConfig& getConfig() const { return config; }

private:
    GameConfig config;
    CaptureRules rules;
    Board board;
    Phase currentPhase;
    Player toMove;

    // Staging state for the placement being resolved
    std::vector<CaptureBatch> staged;
    int nextBatch;
    Player stagingPlayer;

    std::optional<Hex> lastPlacement;
    std::optional<Outcome> finalOutcome;

    BatchResult finishTurn();
    Outcome computeOutcome() const;
};

} // namespace hexzoc

#endif // HEXZOC_HEXZOCGAME_HPP

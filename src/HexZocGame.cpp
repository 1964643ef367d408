#include "hexzoc/HexZocGame.hpp"
#include <stdexcept>

namespace hexzoc {

static const GameConfig& validated(const GameConfig& config) {
    if (!config.isValid()) {
        throw std::invalid_argument("HexZocGame: invalid GameConfig");
    }
    return config;
}

HexZocGame::HexZocGame(const GameConfig& config)
    : config(validated(config)),
      rules(config),
      board(config.gridRadius, config.tilesPerPlayer) {
    reset();
}

void HexZocGame::reset() {
    board.reset();
    currentPhase = Phase::AWAITING_PLACEMENT;
    toMove = config.firstPlayer;
    staged.clear();
    nextBatch = 0;
    stagingPlayer = NONE;
    lastPlacement.reset();
    finalOutcome.reset();

    // A zero tile pool has nothing to play
    if (board.remainingSupply(WHITE) == 0 && board.remainingSupply(BLACK) == 0) {
        currentPhase = Phase::GAME_OVER;
        finalOutcome = computeOutcome();
    }
}

HexZocGame::PlacementResult HexZocGame::requestPlacement(int q, int r) {
    PlacementResult result;
    result.placed = Hex(q, r);
    result.player = toMove;

    if (currentPhase == Phase::GAME_OVER) {
        result.error = GameError::GAME_ALREADY_OVER;
        return result;
    }
    if (currentPhase == Phase::STAGING_CAPTURES) {
        result.error = GameError::CAPTURES_IN_PROGRESS;
        return result;
    }

    result.error = board.place(result.placed, toMove);
    if (!result.ok()) {
        return result;
    }
    lastPlacement = result.placed;

    CaptureSet captures = rules.resolve(board, result.placed, toMove);
    if (captures.empty()) {
        finishTurn();
        return result;
    }

    staged = groupByRank(captures);
    nextBatch = 0;
    stagingPlayer = toMove;
    currentPhase = Phase::STAGING_CAPTURES;

    result.batches = staged;
    return result;
}

HexZocGame::BatchResult HexZocGame::confirmBatchApplied(int batchIndex) {
    BatchResult result;

    if (currentPhase != Phase::STAGING_CAPTURES || batchIndex != nextBatch ||
        batchIndex < 0 || batchIndex >= static_cast<int>(staged.size())) {
        result.error = GameError::INVALID_BATCH_INDEX;
        return result;
    }

    if (!board.flipAll(staged[batchIndex].cells, stagingPlayer)) {
        result.error = GameError::INVALID_BATCH_INDEX;
        return result;
    }
    nextBatch++;

    if (nextBatch < static_cast<int>(staged.size())) {
        return result;
    }

    staged.clear();
    nextBatch = 0;
    stagingPlayer = NONE;
    return finishTurn();
}

HexZocGame::BatchResult HexZocGame::applyAllBatches() {
    BatchResult result;
    if (currentPhase != Phase::STAGING_CAPTURES) {
        result.error = GameError::INVALID_BATCH_INDEX;
        return result;
    }

    while (currentPhase == Phase::STAGING_CAPTURES) {
        result = confirmBatchApplied(nextBatch);
        if (!result.ok()) {
            break;
        }
    }
    return result;
}

HexZocGame::BatchResult HexZocGame::finishTurn() {
    BatchResult result;
    result.turnFinished = true;

    if (board.remainingSupply(WHITE) == 0 && board.remainingSupply(BLACK) == 0) {
        currentPhase = Phase::GAME_OVER;
        finalOutcome = computeOutcome();
        result.outcome = finalOutcome;
        return result;
    }

    currentPhase = Phase::AWAITING_PLACEMENT;
    toMove = opponentOf(toMove);
    result.nextPlayer = toMove;
    return result;
}

HexZocGame::Outcome HexZocGame::computeOutcome() const {
    Outcome outcome;
    outcome.counts = board.tileCounts();

    if (outcome.counts.white > outcome.counts.black) {
        outcome.winner = WHITE;
    } else if (outcome.counts.black > outcome.counts.white) {
        outcome.winner = BLACK;
    } else {
        outcome.winner = NONE;
    }
    return outcome;
}

} // namespace hexzoc

#ifndef HEXZOC_TYPES_HPP
#define HEXZOC_TYPES_HPP

namespace hexzoc {

enum Player {
    NONE = 0,
    WHITE = 1,
    BLACK = 2
};

inline Player opponentOf(Player player) {
    if (player == WHITE) return BLACK;
    if (player == BLACK) return WHITE;
    return NONE;
}

// Every rejected operation reports exactly one of these.
enum class GameError {
    NONE = 0,
    INVALID_COORDINATE,
    CELL_OCCUPIED,
    SUPPLY_EXHAUSTED,
    GAME_ALREADY_OVER,
    CAPTURES_IN_PROGRESS,
    INVALID_BATCH_INDEX
};

} // namespace hexzoc

#endif // HEXZOC_TYPES_HPP

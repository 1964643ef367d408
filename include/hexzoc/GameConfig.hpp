#ifndef HEXZOC_GAMECONFIG_HPP
#define HEXZOC_GAMECONFIG_HPP

#include "hexzoc/HexGrid.hpp"
#include "hexzoc/Types.hpp"

namespace hexzoc {

struct GameConfig {
    static constexpr int DEFAULT_TILES_PER_PLAYER = 20;

    int gridRadius = HexGrid::DEFAULT_RADIUS;
    int tilesPerPlayer = DEFAULT_TILES_PER_PLAYER;
    bool lineCaptureEnabled = true;
    bool surroundCaptureEnabled = true;
    // Line captures reveal one step at a time instead of all at rank 1
    bool rankLineCapturesByDistance = false;
    Player firstPlayer = WHITE;

    bool isValid() const {
        // Both pools must fit on the board or the game can never end
        return gridRadius >= 1 && gridRadius <= HexGrid::MAX_RADIUS && tilesPerPlayer >= 0 &&
               2LL * tilesPerPlayer <= HexGrid::cellCountFor(gridRadius) &&
               (firstPlayer == WHITE || firstPlayer == BLACK);
    }

    // Presets
    static GameConfig standard() { return GameConfig(); }

    static GameConfig othelloOnly() {
        GameConfig c;
        c.surroundCaptureEnabled = false;
        return c;
    }

    static GameConfig surroundOnly() {
        GameConfig c;
        c.lineCaptureEnabled = false;
        return c;
    }
};

} // namespace hexzoc

#endif // HEXZOC_GAMECONFIG_HPP

#pragma once
#include <SDL2/SDL.h>
#include "TileBoard.h"
#include "TileDragger.h"

// ── CursorManager ─────────────────────────────────────────────────────────────
//
// Owns every SDL_Cursor the app uses. Call update() once per frame.
//
// Arrow – over empty canvas.
// Hand  – over a tile that can be grabbed.
// Move  – while a tile is being dragged, wherever the pointer wanders.

class CursorManager {
public:
    CursorManager() = default;
    ~CursorManager();

    CursorManager(const CursorManager&) = delete;
    CursorManager& operator=(const CursorManager&) = delete;

    void init();     // Call after SDL_Init and SDL_CreateWindow
    void release();  // Call before SDL_Quit
    void update(const TileBoard& board, const TileDragger& dragger, int mouseX, int mouseY);

private:
    SDL_Cursor* curArrow   = nullptr;
    SDL_Cursor* curHand    = nullptr;
    SDL_Cursor* curSizeAll = nullptr;
    SDL_Cursor* current    = nullptr;

    void setCursor(SDL_Cursor* c);
};

#include "CursorManager.h"

// ── Init / destructor ─────────────────────────────────────────────────────────

void CursorManager::init() {
    curArrow   = SDL_CreateSystemCursor(SDL_SYSTEM_CURSOR_ARROW);
    curHand    = SDL_CreateSystemCursor(SDL_SYSTEM_CURSOR_HAND);
    curSizeAll = SDL_CreateSystemCursor(SDL_SYSTEM_CURSOR_SIZEALL);
}

CursorManager::~CursorManager() {
    release();
}

void CursorManager::release() {
    if (curArrow)   SDL_FreeCursor(curArrow);
    if (curHand)    SDL_FreeCursor(curHand);
    if (curSizeAll) SDL_FreeCursor(curSizeAll);
    curArrow = curHand = curSizeAll = current = nullptr;
}

// ── setCursor ─────────────────────────────────────────────────────────────────

void CursorManager::setCursor(SDL_Cursor* c) {
    if (!c || c == current) return;
    SDL_SetCursor(c);
    SDL_ShowCursor(SDL_ENABLE);
    current = c;
}

// ── update ────────────────────────────────────────────────────────────────────

void CursorManager::update(const TileBoard& board, const TileDragger& dragger, int mouseX, int mouseY) {
    // Keep the move cursor for the whole drag, even off the tile.
    if (dragger.isActive()) { setCursor(curSizeAll); return; }
    bool overTile = board.findTileAt((float)mouseX, (float)mouseY) != TileGeometry::NO_TILE;
    setCursor(overTile ? curHand : curArrow);
}

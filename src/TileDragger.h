#pragma once

#include "TileBoard.h"

enum class DragMode { BY_DELTA, TO_POINT };

// IDLE -> DRAGGING -> IDLE tracker for the tile under the pointer.
//
// Press hit-tests the board and grabs the first tile found. Each move then
// either translates that tile by the pointer movement (BY_DELTA) or re-centers
// it on the pointer (TO_POINT). Release lets go; tiles stay where they were
// dropped. A board rebuild cancels the drag.
class TileDragger {
  public:
    TileDragger(TileBoard* board, DragMode mode = DragMode::BY_DELTA);
    ~TileDragger();

    TileDragger(const TileDragger&) = delete;
    TileDragger& operator=(const TileDragger&) = delete;

    bool onMouseDown(float x, float y);  // true if a tile was grabbed
    bool onMouseMove(float x, float y);  // true if the active tile moved
    bool onMouseUp  (float x, float y);  // true if a drag was in progress
    bool dragBy(float dx, float dy);     // relative move for hosts that report deltas
    void cancel();

    bool     isActive()   const { return activeTile != TileGeometry::NO_TILE; }
    int      getActiveTile() const { return activeTile; }
    DragMode getMode()    const { return mode; }
    void     setMode(DragMode m) { mode = m; }

  private:
    TileBoard* board;
    DragMode   mode;
    int        activeTile = TileGeometry::NO_TILE;
    float      lastX = 0.f, lastY = 0.f;
    int        boardToken = 0;
};

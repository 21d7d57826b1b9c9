#include "TileDragger.h"
#include <spdlog/spdlog.h>

TileDragger::TileDragger(TileBoard* b, DragMode m) : board(b), mode(m) {
    boardToken = board->subscribe([this](TileBoard::Change c, int) {
        if (c == TileBoard::Change::REBUILT) cancel();
    });
}

TileDragger::~TileDragger() {
    board->unsubscribe(boardToken);
}

bool TileDragger::onMouseDown(float x, float y) {
    int id = board->findTileAt(x, y);
    if (id == TileGeometry::NO_TILE) return false;
    activeTile = id;
    lastX = x;
    lastY = y;
    spdlog::debug("grabbed tile {} at ({}, {})", id, x, y);
    return true;
}

bool TileDragger::onMouseMove(float x, float y) {
    if (!isActive()) return false;
    float dx = x - lastX, dy = y - lastY;
    lastX = x;
    lastY = y;
    if (mode == DragMode::TO_POINT)
        return board->moveTileTo(activeTile, x, y);
    return board->moveTileBy(activeTile, dx, dy);
}

bool TileDragger::dragBy(float dx, float dy) {
    if (!isActive()) return false;
    lastX += dx;
    lastY += dy;
    return board->moveTileBy(activeTile, dx, dy);
}

bool TileDragger::onMouseUp(float /*x*/, float /*y*/) {
    bool was = isActive();
    if (was) spdlog::debug("released tile {}", activeTile);
    activeTile = TileGeometry::NO_TILE;
    return was;
}

void TileDragger::cancel() {
    activeTile = TileGeometry::NO_TILE;
}

#include "TileBoard.h"
#include <algorithm>
#include <utility>

TileBoard::TileBoard(const LayoutConfig& cfg) : layoutCfg(cfg) {}

// ── Rebuild triggers ──────────────────────────────────────────────────────────

void TileBoard::setCanvasSize(float w, float h) {
    canvasW = w;
    canvasH = h;
    rebuild();
}

void TileBoard::setImageSize(int w, int h) {
    imageW = w;
    imageH = h;
    rebuild();
}

void TileBoard::setLayout(const LayoutConfig& cfg) {
    layoutCfg = cfg;
    rebuild();
}

void TileBoard::rebuild() {
    pieces = TileGeometry::computeLayout(canvasW, canvasH, imageW, imageH, layoutCfg);
    publish(Change::REBUILT, TileGeometry::NO_TILE);
}

// ── Tile access ───────────────────────────────────────────────────────────────

// Ids are dense and row-major, so the id is also the index. The check guards
// against a stale id from before a rebuild with a smaller grid.
Tile* TileBoard::findTile(int id) {
    if (id < 0 || id >= (int)pieces.size()) return nullptr;
    Tile& t = pieces[id];
    return t.id == id ? &t : nullptr;
}

const Tile* TileBoard::tile(int id) const {
    return const_cast<TileBoard*>(this)->findTile(id);
}

// ── Mutations ─────────────────────────────────────────────────────────────────

bool TileBoard::moveTileBy(int id, float dx, float dy) {
    Tile* t = findTile(id);
    if (!t) return false;
    t->destRect.offset(dx, dy);
    publish(Change::MOVED, id);
    return true;
}

bool TileBoard::moveTileTo(int id, float centerX, float centerY) {
    Tile* t = findTile(id);
    if (!t) return false;
    t->destRect.centerOn(centerX, centerY);
    publish(Change::MOVED, id);
    return true;
}

void TileBoard::resetLayout() {
    for (Tile& t : pieces) t.destRect = t.homeRect;
    publish(Change::RESET, TileGeometry::NO_TILE);
}

// ── Observation ───────────────────────────────────────────────────────────────

int TileBoard::subscribe(Listener l) {
    int token = nextToken++;
    listeners.push_back({ token, std::move(l) });
    return token;
}

void TileBoard::unsubscribe(int token) {
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                   [token](const Subscription& s) { return s.token == token; }),
                    listeners.end());
}

void TileBoard::publish(Change c, int tileId) {
    dirty = true;
    // Copy so a listener may unsubscribe itself without invalidating the loop.
    auto snapshot = listeners;
    for (auto& s : snapshot) s.fn(c, tileId);
}

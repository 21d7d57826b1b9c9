#include "TileGeometry.h"

namespace TileGeometry {

// ── Board square ──────────────────────────────────────────────────────────────

    float boardSide(float canvasW, float canvasH, const LayoutConfig& cfg) {
        if (canvasW <= 0.f || canvasH <= 0.f) return 0.f;
        if (cfg.widthFraction <= 0.f || cfg.heightFraction <= 0.f) return 0.f;
        // Try a share of the width; fall back to a share of the height when that
        // square would be taller than the canvas.
        float side = cfg.widthFraction * canvasW;
        if (side > canvasH) side = canvasH * cfg.heightFraction;
        return side;
    }

    TileRect boardRect(float canvasW, float canvasH, const LayoutConfig& cfg) {
        float side = boardSide(canvasW, canvasH, cfg);
        if (side <= 0.f) return {};
        float marginX = (canvasW - side) / 2.f;
        float marginY = (canvasH - side) / 2.f;
        return { marginX, marginY, marginX + side, marginY + side };
    }

// ── Layout ────────────────────────────────────────────────────────────────────

    std::vector<Tile> computeLayout(float canvasW, float canvasH,
                                    int srcW, int srcH,
                                    const LayoutConfig& cfg) {
        std::vector<Tile> tiles;
        if (srcW <= 0 || srcH <= 0 || cfg.rows <= 0 || cfg.cols <= 0) return tiles;

        TileRect board = boardRect(canvasW, canvasH, cfg);
        if (board.width() <= 0.f) return tiles;

        float tileW = board.width()  / cfg.cols;
        float tileH = board.height() / cfg.rows;
        float srcTileW = (float)srcW / cfg.cols;
        float srcTileH = (float)srcH / cfg.rows;

        tiles.reserve(cfg.rows * cfg.cols);
        for (int i = 0; i < cfg.rows; i++) {
            for (int j = 0; j < cfg.cols; j++) {
                Tile t;
                t.id = i * cfg.cols + j;
                t.destRect = {
                    board.left + j * tileW,       board.top + i * tileH,
                    board.left + (j + 1) * tileW, board.top + (i + 1) * tileH
                };
                t.srcRect = {
                    j * srcTileW,       i * srcTileH,
                    (j + 1) * srcTileW, (i + 1) * srcTileH
                };
                t.homeRect = t.destRect;
                tiles.push_back(t);
            }
        }
        return tiles;
    }

// ── Hit testing ───────────────────────────────────────────────────────────────

    int findTileAt(const std::vector<Tile>& tiles, float x, float y) {
        // First match wins, so after a drag leaves tiles overlapping the lower id is picked.
        for (const Tile& t : tiles)
            if (t.destRect.contains(x, y)) return t.id;
        return NO_TILE;
    }

} // namespace TileGeometry

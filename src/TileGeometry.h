#pragma once

#include <SDL2/SDL.h>
#include <vector>

// Axis-aligned rectangle stored as edges, in float pixels.
// Used for both source-image space and canvas space.
struct TileRect {
    float left = 0.f, top = 0.f, right = 0.f, bottom = 0.f;

    float width()  const { return right - left; }
    float height() const { return bottom - top; }
    float centerX() const { return (left + right) * 0.5f; }
    float centerY() const { return (top + bottom) * 0.5f; }

    // Inclusive of all four edges.
    bool contains(float x, float y) const {
        return x >= left && x <= right && y >= top && y <= bottom;
    }

    void offset(float dx, float dy) { left += dx; right += dx; top += dy; bottom += dy; }
    void offsetTo(float newLeft, float newTop) { offset(newLeft - left, newTop - top); }
    void centerOn(float x, float y) { offsetTo(x - width() * 0.5f, y - height() * 0.5f); }

    SDL_FRect toFRect() const { return { left, top, width(), height() }; }
    // Truncates toward zero, like the integer pixel rects SDL_RenderCopy expects.
    SDL_Rect  toRect()  const { return { (int)left, (int)top, (int)width(), (int)height() }; }

    bool operator==(const TileRect& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
    bool operator!=(const TileRect& o) const { return !(*this == o); }
};

struct Tile {
    int      id = 0;       // row * cols + col
    TileRect srcRect;      // fixed, source-image pixels
    TileRect destRect;     // current position on the canvas
    TileRect homeRect;     // destRect as first laid out
};

struct LayoutConfig {
    int   rows           = 3;
    int   cols           = 3;
    float widthFraction  = 0.60f;  // share of canvas width tried first
    float heightFraction = 0.90f;  // share of canvas height used when the width share doesn't fit
};

namespace TileGeometry {
    static constexpr int NO_TILE = -1;

    // Side length of the square puzzle area, or 0 if the canvas can't hold one.
    float boardSide(float canvasW, float canvasH, const LayoutConfig& cfg);

    // The square puzzle area, centered in the canvas. All zeros when boardSide() is 0.
    TileRect boardRect(float canvasW, float canvasH, const LayoutConfig& cfg);

    // Partition the source image and the centered square into rows*cols tiles,
    // row-major by id. Returns an empty vector for any non-positive dimension.
    std::vector<Tile> computeLayout(float canvasW, float canvasH,
                                    int srcW, int srcH,
                                    const LayoutConfig& cfg);

    // Id of the first tile (collection order) whose destRect contains (x, y), or NO_TILE.
    int findTileAt(const std::vector<Tile>& tiles, float x, float y);
}

#pragma once

#include <functional>
#include <vector>
#include "TileGeometry.h"

// Owns the tile collection and publishes every change to it.
//
// The collection is rebuilt wholesale whenever the canvas size, the image size
// or the layout changes. Listeners run synchronously inside the mutating call,
// and the dirty flag stays set until the render loop has drawn the new state.
class TileBoard {
  public:
    enum class Change { REBUILT, MOVED, RESET };
    using Listener = std::function<void(Change, int tileId)>;

    explicit TileBoard(const LayoutConfig& cfg = LayoutConfig());

    void setCanvasSize(float w, float h);
    void setImageSize(int w, int h);
    void clearImage() { setImageSize(0, 0); }
    void setLayout(const LayoutConfig& cfg);

    bool moveTileBy(int id, float dx, float dy);
    bool moveTileTo(int id, float centerX, float centerY);  // re-centers the tile on the point
    void resetLayout();

    const std::vector<Tile>& tiles() const { return pieces; }
    const Tile* tile(int id) const;
    int   findTileAt(float x, float y) const { return TileGeometry::findTileAt(pieces, x, y); }
    bool  empty() const { return pieces.empty(); }
    int   size()  const { return (int)pieces.size(); }

    const LayoutConfig& layout() const { return layoutCfg; }
    float canvasWidth()  const { return canvasW; }
    float canvasHeight() const { return canvasH; }
    bool  hasImage() const     { return imageW > 0 && imageH > 0; }

    int  subscribe(Listener l);
    void unsubscribe(int token);

    bool isDirty() const { return dirty; }
    void clearDirty()    { dirty = false; }

  private:
    LayoutConfig      layoutCfg;
    float             canvasW = 0.f, canvasH = 0.f;
    int               imageW  = 0,   imageH  = 0;
    std::vector<Tile> pieces;
    bool              dirty   = true;

    struct Subscription { int token; Listener fn; };
    std::vector<Subscription> listeners;
    int nextToken = 1;

    Tile* findTile(int id);
    void  rebuild();
    void  publish(Change c, int tileId);
};

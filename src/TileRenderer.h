#pragma once

#include <SDL2/SDL.h>
#include <vector>
#include "TileGeometry.h"

// One step of a frame: copy srcRect of the image into dstRect, or outline dstRect.
struct DrawCommand {
    enum class Kind { BLIT, OUTLINE };
    Kind     kind;
    int      tileId;
    TileRect src;   // unused for OUTLINE
    TileRect dst;
};

// Paints the tile collection onto the window.
//
// Blits land in a window-sized back buffer that is cleared to the background
// each frame and copied to the window once, so a half-painted frame is never shown.
// With double buffering off they go straight to the window. Outlines always go
// on top, directly onto the window.
class TileRenderer {
  public:
    static constexpr int       BORDER_SIZE  = 2;
    static constexpr SDL_Color BORDER_COLOR = {255, 0, 0, 255};

    TileRenderer() = default;
    ~TileRenderer();

    TileRenderer(const TileRenderer&) = delete;
    TileRenderer& operator=(const TileRenderer&) = delete;

    // Blits for every tile in id order, then outlines if showBorders is set.
    static std::vector<DrawCommand> buildDrawList(const std::vector<Tile>& tiles, bool showBorders);

    // Drop the back buffer; the next render() recreates it at the new size.
    void resize(int w, int h);
    // Must run before the SDL_Renderer that created the buffer is destroyed.
    void releaseBuffer();

    void setDoubleBuffered(bool on) { doubleBuffered = on; }
    bool isDoubleBuffered() const   { return doubleBuffered; }
    void setBackground(SDL_Color c) { background = c; }

    // Clears the window, executes the list and leaves presenting to the caller.
    // Draws only the background when image is null.
    void render(SDL_Renderer* r, SDL_Texture* image, const std::vector<DrawCommand>& cmds);

  private:
    SDL_Texture* buffer   = nullptr;
    int          bufferW  = 0, bufferH = 0;
    int          targetW  = 0, targetH = 0;
    bool         doubleBuffered = true;
    SDL_Color    background = {40, 40, 40, 255};

    bool ensureBuffer(SDL_Renderer* r);
    void blitAll(SDL_Renderer* r, SDL_Texture* image, const std::vector<DrawCommand>& cmds);
    void outlineAll(SDL_Renderer* r, const std::vector<DrawCommand>& cmds);
};

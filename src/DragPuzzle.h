#pragma once
#include <SDL2/SDL.h>
#include <vector>
#include <cstdint>
#include "PuzzleConfig.h"
#include "TileBoard.h"
#include "TileDragger.h"
#include "TileRenderer.h"
#include "CursorManager.h"

class DragPuzzle {
  public:
    explicit DragPuzzle(const PuzzleConfig& cfg);
    ~DragPuzzle();

    DragPuzzle(const DragPuzzle&) = delete;
    DragPuzzle& operator=(const DragPuzzle&) = delete;

    // Create the window and renderer and load the image. False if SDL can't start;
    // a missing or broken image is logged and leaves the board empty instead.
    bool init();
    void run();

  private:
    PuzzleConfig  config;

    SDL_Window*   window   = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture*  image    = nullptr;
    bool          sdlReady = false;

    // board must outlive dragger, which holds a subscription on it
    TileBoard     board;
    TileDragger   dragger;
    TileRenderer  tileRenderer;
    CursorManager cursors;

    bool showBorders = false;

    void loadImage();
    void onCanvasResized(int w, int h);
    void updateTitle();
    bool handleKey(SDL_Keycode sym);
    void draw();
};

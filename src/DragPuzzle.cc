#include "DragPuzzle.h"
#include "DrawingUtils.h"
#include <string>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────────────────────────────────────────────

DragPuzzle::DragPuzzle(const PuzzleConfig& cfg)
    : config(cfg), board(cfg.layout), dragger(&board, cfg.dragMode), showBorders(cfg.debugBorders) {
    tileRenderer.setDoubleBuffered(cfg.doubleBuffer);
    tileRenderer.setBackground(cfg.background);
}

DragPuzzle::~DragPuzzle() {
    tileRenderer.releaseBuffer();
    cursors.release();
    if (image)    SDL_DestroyTexture(image);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window)   SDL_DestroyWindow(window);
    if (sdlReady) SDL_Quit();
}

bool DragPuzzle::init() {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        spdlog::error("SDL_Init failed: {}", SDL_GetError());
        return false;
    }
    sdlReady = true;

    window = SDL_CreateWindow("dragPuzzle", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              config.windowW, config.windowH, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        spdlog::error("SDL_CreateWindow failed: {}", SDL_GetError());
        return false;
    }
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_TARGETTEXTURE);
    if (!renderer) {
        spdlog::error("SDL_CreateRenderer failed: {}", SDL_GetError());
        return false;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");

    cursors.init();
    loadImage();

    int w, h;
    SDL_GetWindowSize(window, &w, &h);
    onCanvasResized(w, h);
    updateTitle();
    return true;
}

// ── Setup ─────────────────────────────────────────────────────────────────────

void DragPuzzle::loadImage() {
    if (config.imagePath.empty()) {
        spdlog::warn("no image given, nothing to slice");
        board.clearImage();
        return;
    }
    int w = 0, h = 0;
    std::vector<uint32_t> pixels = DrawingUtils::loadImageFile(config.imagePath, w, h);
    image = DrawingUtils::createImageTexture(renderer, pixels, w, h);
    if (!image) {
        board.clearImage();
        return;
    }
    board.setImageSize(w, h);
}

void DragPuzzle::onCanvasResized(int w, int h) {
    spdlog::debug("canvas resized to {}x{}", w, h);
    tileRenderer.resize(w, h);
    board.setCanvasSize((float)w, (float)h);
}

void DragPuzzle::updateTitle() {
    std::string title = std::string("dragPuzzle - drag ")
        + (dragger.getMode() == DragMode::TO_POINT ? "to point" : "by delta");
    SDL_SetWindowTitle(window, title.c_str());
}

// ── Keys ──────────────────────────────────────────────────────────────────────

// Returns true if the frame needs repainting.
bool DragPuzzle::handleKey(SDL_Keycode sym) {
    switch (sym) {
        case SDLK_d:
            showBorders = !showBorders;
            spdlog::info("tile borders {}", showBorders ? "on" : "off");
            return true;
        case SDLK_m:
            dragger.setMode(dragger.getMode() == DragMode::BY_DELTA ? DragMode::TO_POINT
                                                                    : DragMode::BY_DELTA);
            spdlog::info("drag mode: {}", ConfigLoader::dragModeName(dragger.getMode()));
            updateTitle();
            return false;
        case SDLK_r:
            dragger.cancel();
            board.resetLayout();
            return true;
        case SDLK_b:
            tileRenderer.setDoubleBuffered(!tileRenderer.isDoubleBuffered());
            spdlog::info("double buffering {}", tileRenderer.isDoubleBuffered() ? "on" : "off");
            return true;
        default:
            return false;
    }
}

// ── Run loop ──────────────────────────────────────────────────────────────────

void DragPuzzle::draw() {
    auto cmds = TileRenderer::buildDrawList(board.tiles(), showBorders);
    tileRenderer.render(renderer, image, cmds);
    SDL_RenderPresent(renderer);
    board.clearDirty();
}

void DragPuzzle::run() {
    bool running     = true;
    bool needsRedraw = true;
    SDL_Event e;

    spdlog::info("drag the pieces; D borders, M drag mode, R reset, B double buffer, Esc quit");

    while (running) {
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) { running = false; break; }

            if (e.type == SDL_KEYDOWN) {
                if (e.key.keysym.sym == SDLK_ESCAPE) { running = false; break; }
                if (handleKey(e.key.keysym.sym)) needsRedraw = true;
            }

            if (e.type == SDL_WINDOWEVENT) {
                if (e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
                    onCanvasResized(e.window.data1, e.window.data2);
                else if (e.window.event == SDL_WINDOWEVENT_EXPOSED)
                    needsRedraw = true;
            }

            if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT)
                dragger.onMouseDown((float)e.button.x, (float)e.button.y);

            if (e.type == SDL_MOUSEMOTION)
                dragger.onMouseMove((float)e.motion.x, (float)e.motion.y);

            if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT)
                dragger.onMouseUp((float)e.button.x, (float)e.button.y);

            if (e.type == SDL_MOUSEBUTTONDOWN || e.type == SDL_MOUSEBUTTONUP || e.type == SDL_MOUSEMOTION) {
                int mx, my; SDL_GetMouseState(&mx, &my);
                cursors.update(board, dragger, mx, my);
            }
        }

        // Any board mutation since the last frame must reach the screen before the next one.
        if (!needsRedraw && !board.isDirty()) { SDL_Delay(4); continue; }
        needsRedraw = false;
        draw();
    }
}

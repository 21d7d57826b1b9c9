#include "TileRenderer.h"
#include "DrawingUtils.h"
#include <cmath>
#include <spdlog/spdlog.h>

TileRenderer::~TileRenderer() {
    releaseBuffer();
}

void TileRenderer::releaseBuffer() {
    if (buffer) SDL_DestroyTexture(buffer);
    buffer = nullptr;
}

// ── Draw list ─────────────────────────────────────────────────────────────────

std::vector<DrawCommand> TileRenderer::buildDrawList(const std::vector<Tile>& tiles, bool showBorders) {
    std::vector<DrawCommand> cmds;
    cmds.reserve(showBorders ? tiles.size() * 2 : tiles.size());
    // Ascending id: a higher id paints over a lower one where dragged tiles overlap.
    for (const Tile& t : tiles)
        cmds.push_back({ DrawCommand::Kind::BLIT, t.id, t.srcRect, t.destRect });
    if (showBorders)
        for (const Tile& t : tiles)
            cmds.push_back({ DrawCommand::Kind::OUTLINE, t.id, {}, t.destRect });
    return cmds;
}

// ── Back buffer ───────────────────────────────────────────────────────────────

void TileRenderer::resize(int w, int h) {
    targetW = w;
    targetH = h;
    if (bufferW != w || bufferH != h) releaseBuffer();
}

bool TileRenderer::ensureBuffer(SDL_Renderer* r) {
    if (targetW <= 0 || targetH <= 0) return false;
    if (buffer) return true;
    buffer = SDL_CreateTexture(r, SDL_PIXELFORMAT_ARGB8888,
                               SDL_TEXTUREACCESS_TARGET, targetW, targetH);
    if (!buffer) {
        spdlog::warn("back buffer {}x{} unavailable, drawing direct: {}", targetW, targetH, SDL_GetError());
        return false;
    }
    // The buffer holds the whole opaque frame, so it replaces the window outright.
    SDL_SetTextureBlendMode(buffer, SDL_BLENDMODE_NONE);
    bufferW = targetW;
    bufferH = targetH;
    return true;
}

// ── Frame ─────────────────────────────────────────────────────────────────────

void TileRenderer::blitAll(SDL_Renderer* r, SDL_Texture* image, const std::vector<DrawCommand>& cmds) {
    for (const DrawCommand& c : cmds) {
        if (c.kind != DrawCommand::Kind::BLIT) continue;
        SDL_Rect  src = c.src.toRect();
        SDL_FRect dst = c.dst.toFRect();
        SDL_RenderCopyF(r, image, &src, &dst);
    }
}

void TileRenderer::outlineAll(SDL_Renderer* r, const std::vector<DrawCommand>& cmds) {
    SDL_SetRenderDrawColor(r, BORDER_COLOR.r, BORDER_COLOR.g, BORDER_COLOR.b, BORDER_COLOR.a);
    for (const DrawCommand& c : cmds) {
        if (c.kind != DrawCommand::Kind::OUTLINE) continue;
        SDL_Rect rect = {
            (int)std::round(c.dst.left), (int)std::round(c.dst.top),
            (int)std::round(c.dst.width()), (int)std::round(c.dst.height())
        };
        DrawingUtils::drawRect(r, &rect, BORDER_SIZE, targetW, targetH);
    }
}

void TileRenderer::render(SDL_Renderer* r, SDL_Texture* image, const std::vector<DrawCommand>& cmds) {
    SDL_SetRenderTarget(r, nullptr);
    SDL_SetRenderDrawColor(r, background.r, background.g, background.b, background.a);
    SDL_RenderClear(r);
    if (!image) return;

    if (doubleBuffered && ensureBuffer(r)) {
        SDL_SetRenderTarget(r, buffer);
        SDL_RenderClear(r);  // draw color still holds the background
        blitAll(r, image, cmds);
        SDL_SetRenderTarget(r, nullptr);
        SDL_RenderCopy(r, buffer, nullptr, nullptr);
    } else {
        blitAll(r, image, cmds);
    }

    outlineAll(r, cmds);
}

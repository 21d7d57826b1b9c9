#include <vector>
#include <algorithm>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>
#include <stb/stb_image.h>

#include "DrawingUtils.h"

namespace DrawingUtils {

// ── Drawing primitives ────────────────────────────────────────────────────────

    void drawRect(SDL_Renderer* renderer, const SDL_Rect* rect, int size, int w, int h) {
        if (size <= 1) { SDL_RenderDrawRect(renderer, rect); return; }

        // The stroke is centred on the rect edge: li pixels hang inward, ri outward.
        int li = (size - 1) / 2;  // left/top half  (asymmetric for even sizes)
        int ri = size / 2;         // right/bottom half

        // Horizontal edges (top/bottom) span the full outer width and own the corners.
        // Vertical edges span only the inner height between the two bars so corners
        // are not double-painted when the draw color is translucent.
        int x0 = rect->x - li;
        int y0 = rect->y - li;
        int x1 = rect->x + rect->w + ri + 1;  // exclusive right  (outer edge + 1)
        int y1 = rect->y + rect->h + ri + 1;  // exclusive bottom (outer edge + 1)
        int innerY0 = rect->y + ri + 1;        // top    of inner vertical span
        int innerY1 = rect->y + rect->h - li;  // bottom of inner vertical span

        auto fillClipped = [&](int fx, int fy, int fw, int fh) {
            int cx0 = std::max(0, fx),     cy0 = std::max(0, fy);
            int cx1 = std::min(w, fx + fw), cy1 = std::min(h, fy + fh);
            if (cx1 > cx0 && cy1 > cy0) {
                SDL_Rect r = { cx0, cy0, cx1 - cx0, cy1 - cy0 };
                SDL_RenderFillRect(renderer, &r);
            }
        };

        fillClipped(x0, y0,          x1 - x0, size);              // top bar
        fillClipped(x0, y1 - size,   x1 - x0, size);              // bottom bar
        fillClipped(x0, innerY0,     size, innerY1 - innerY0);    // left bar
        fillClipped(x1 - size, innerY0, size, innerY1 - innerY0); // right bar
    }

// ── Pixel format conversion ───────────────────────────────────────────────────
// stb RGBA8888 (bytes R,G,B,A) -> SDL ARGB8888 (0xAARRGGBB)

    static std::vector<uint32_t> rgbaToARGB(const uint8_t* rgba, int w, int h) {
        std::vector<uint32_t> argb(w * h);
        for (int i = 0; i < w * h; i++) {
            uint8_t r=rgba[i*4+0], g=rgba[i*4+1], b=rgba[i*4+2], a=rgba[i*4+3];
            argb[i] = ((uint32_t)a<<24)|((uint32_t)r<<16)|((uint32_t)g<<8)|b;
        }
        return argb;
    }

// ── Decode ────────────────────────────────────────────────────────────────────

    std::vector<uint32_t> decodeImage(const uint8_t* data, int dataLen, int& outW, int& outH) {
        if (!data || dataLen <= 0) return {};
        int w = 0, h = 0, channels;
        uint8_t* raw = stbi_load_from_memory(data, dataLen, &w, &h, &channels, 4);
        if (!raw) return {};
        auto argb = rgbaToARGB(raw, w, h);
        stbi_image_free(raw);
        outW = w;
        outH = h;
        return argb;
    }

    std::vector<uint32_t> loadImageFile(const std::string& path, int& outW, int& outH) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            spdlog::error("cannot open image '{}'", path);
            return {};
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
        auto pixels = decodeImage(bytes.data(), (int)bytes.size(), outW, outH);
        if (pixels.empty()) {
            spdlog::error("cannot decode image '{}': {}", path, stbi_failure_reason());
            return {};
        }
        spdlog::info("loaded image '{}' ({}x{})", path, outW, outH);
        return pixels;
    }

    SDL_Texture* createImageTexture(SDL_Renderer* renderer, const std::vector<uint32_t>& argbPixels,
                                    int w, int h) {
        if (argbPixels.empty() || w <= 0 || h <= 0) return nullptr;
        SDL_Texture* tex = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888,
                                             SDL_TEXTUREACCESS_STATIC, w, h);
        if (!tex) {
            spdlog::error("SDL_CreateTexture failed: {}", SDL_GetError());
            return nullptr;
        }
        SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
        if (SDL_UpdateTexture(tex, nullptr, argbPixels.data(), w * 4) != 0) {
            spdlog::error("SDL_UpdateTexture failed: {}", SDL_GetError());
            SDL_DestroyTexture(tex);
            return nullptr;
        }
        return tex;
    }

} // namespace DrawingUtils

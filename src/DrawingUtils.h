#pragma once

#include <SDL2/SDL.h>
#include <string>
#include <vector>
#include <cstdint>

// Shared Drawing Helpers
namespace DrawingUtils {
    // Outline `rect` with a stroke `size` pixels thick, centred on the rect edge,
    // clipped to a w*h target.
    void drawRect(SDL_Renderer* renderer, const SDL_Rect* rect, int size, int w, int h);

    // ── Image decoding ────────────────────────────────────────────────────────
    //
    // decodeImage:   decompress any stb_image-supported format (PNG, JPEG, BMP,
    //                PNM, ...) to ARGB8888. outW/outH are set on success;
    //                returns an empty vector on failure.
    // loadImageFile: read a file from disk and decode it. Errors are logged.

    std::vector<uint32_t> decodeImage(const uint8_t* data, int dataLen, int& outW, int& outH);
    std::vector<uint32_t> loadImageFile(const std::string& path, int& outW, int& outH);

    // Upload ARGB8888 pixels into a new static texture; nullptr on failure.
    SDL_Texture* createImageTexture(SDL_Renderer* renderer, const std::vector<uint32_t>& argbPixels,
                                    int w, int h);
}

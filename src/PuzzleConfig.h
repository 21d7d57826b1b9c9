#pragma once

#include <SDL2/SDL.h>
#include <string>
#include "TileGeometry.h"
#include "TileDragger.h"

// Runtime settings: compile-time defaults, then a YAML file, then the command line.
struct PuzzleConfig {
    static constexpr int MAX_GRID = 16;

    std::string  imagePath;
    int          windowW      = 1000;
    int          windowH      = 700;
    LayoutConfig layout;
    DragMode     dragMode     = DragMode::BY_DELTA;
    bool         debugBorders = false;
    bool         doubleBuffer = true;
    SDL_Color    background   = {40, 40, 40, 255};
    std::string  logLevel     = "info";
};

namespace ConfigLoader {
    // Apply the keys present in a YAML document on top of cfg.
    // On failure cfg may be partly updated and err says why.
    bool parseConfig(const std::string& yamlText, PuzzleConfig& cfg, std::string& err);
    bool loadConfigFile(const std::string& path, PuzzleConfig& cfg, std::string& err);

    bool validateConfig(const PuzzleConfig& cfg, std::string& err);

    enum class CliResult { RUN, EXIT_OK, EXIT_ERROR };

    // Parse argv, load --config if given, apply flag overrides and validate.
    // Help and parse errors are printed to stdout/stderr here.
    CliResult parseCommandLine(int argc, char** argv, PuzzleConfig& cfg, std::string& err);

    const char* dragModeName(DragMode m);
}

#include "PuzzleConfig.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include <args.hxx>
#include <yaml-cpp/yaml.h>

namespace ConfigLoader {

static const char* LOG_LEVELS[] = { "trace", "debug", "info", "warn", "error", "off" };

const char* dragModeName(DragMode m) {
    return m == DragMode::TO_POINT ? "point" : "delta";
}

static bool parseDragMode(const std::string& s, DragMode& out) {
    if (s == "delta") { out = DragMode::BY_DELTA; return true; }
    if (s == "point") { out = DragMode::TO_POINT; return true; }
    return false;
}

// ── YAML ──────────────────────────────────────────────────────────────────────

bool parseConfig(const std::string& yamlText, PuzzleConfig& cfg, std::string& err) {
    try {
        const YAML::Node root = YAML::Load(yamlText);
        if (!root || root.IsNull()) return true;  // empty document: keep defaults
        if (!root.IsMap()) { err = "config root must be a mapping"; return false; }

        if (root["image"]) cfg.imagePath = root["image"].as<std::string>();

        if (const YAML::Node w = root["window"]) {
            if (w["width"])  cfg.windowW = w["width"].as<int>();
            if (w["height"]) cfg.windowH = w["height"].as<int>();
        }

        if (const YAML::Node l = root["layout"]) {
            if (l["rows"])            cfg.layout.rows           = l["rows"].as<int>();
            if (l["cols"])            cfg.layout.cols           = l["cols"].as<int>();
            if (l["width-fraction"])  cfg.layout.widthFraction  = l["width-fraction"].as<float>();
            if (l["height-fraction"]) cfg.layout.heightFraction = l["height-fraction"].as<float>();
        }

        if (root["drag-mode"]) {
            std::string m = root["drag-mode"].as<std::string>();
            if (!parseDragMode(m, cfg.dragMode)) {
                err = "unknown drag-mode '" + m + "' (expected delta or point)";
                return false;
            }
        }

        if (root["debug-borders"]) cfg.debugBorders = root["debug-borders"].as<bool>();
        if (root["double-buffer"]) cfg.doubleBuffer = root["double-buffer"].as<bool>();

        if (const YAML::Node bg = root["background"]) {
            if (!bg.IsSequence() || bg.size() != 3) {
                err = "background must be a list of three 0-255 values";
                return false;
            }
            int rgb[3];
            for (int i = 0; i < 3; i++) {
                rgb[i] = bg[i].as<int>();
                if (rgb[i] < 0 || rgb[i] > 255) {
                    err = "background component out of range: " + std::to_string(rgb[i]);
                    return false;
                }
            }
            cfg.background = { (Uint8)rgb[0], (Uint8)rgb[1], (Uint8)rgb[2], 255 };
        }

        if (root["log-level"]) cfg.logLevel = root["log-level"].as<std::string>();
    } catch (const YAML::Exception& e) {
        err = std::string("invalid config: ") + e.what();
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, PuzzleConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "cannot open config file '" + path + "'"; return false; }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!parseConfig(ss.str(), cfg, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

// ── Validation ────────────────────────────────────────────────────────────────

bool validateConfig(const PuzzleConfig& cfg, std::string& err) {
    const LayoutConfig& l = cfg.layout;
    if (l.rows < 1 || l.rows > PuzzleConfig::MAX_GRID || l.cols < 1 || l.cols > PuzzleConfig::MAX_GRID) {
        err = "grid must be between 1x1 and " + std::to_string(PuzzleConfig::MAX_GRID) + "x"
            + std::to_string(PuzzleConfig::MAX_GRID) + ", got "
            + std::to_string(l.rows) + "x" + std::to_string(l.cols);
        return false;
    }
    if (!(l.widthFraction > 0.f && l.widthFraction <= 1.f) ||
        !(l.heightFraction > 0.f && l.heightFraction <= 1.f)) {
        err = "width-fraction and height-fraction must be in (0, 1]";
        return false;
    }
    if (cfg.windowW < 1 || cfg.windowH < 1) {
        err = "window size must be at least 1x1";
        return false;
    }
    if (std::find(std::begin(LOG_LEVELS), std::end(LOG_LEVELS), cfg.logLevel) == std::end(LOG_LEVELS)) {
        err = "unknown log-level '" + cfg.logLevel + "'";
        return false;
    }
    return true;
}

// ── Command line ──────────────────────────────────────────────────────────────

CliResult parseCommandLine(int argc, char** argv, PuzzleConfig& cfg, std::string& err) {
    args::ArgumentParser parser("dragpuzzle - drag the pieces of a sliced image around",
                                "Keys: D borders, M drag mode, R reset, B double buffer, Esc quit.");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "YAML config file", {'c', "config"});
    args::ValueFlag<int> widthArg(parser, "width", "Window width in pixels", {'W', "width"});
    args::ValueFlag<int> heightArg(parser, "height", "Window height in pixels", {'H', "height"});
    args::ValueFlag<int> rowsArg(parser, "rows", "Grid rows", {"rows"});
    args::ValueFlag<int> colsArg(parser, "cols", "Grid columns", {"cols"});
    args::Flag debugFlag(parser, "debug", "Start with tile borders shown", {"debug"});
    args::Flag toPointFlag(parser, "drag-to-point", "Re-center the dragged tile on the pointer",
                           {"drag-to-point"});
    args::Flag noBufferFlag(parser, "no-double-buffer", "Draw tiles straight to the window",
                            {"no-double-buffer"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> imageArg(parser, "image", "Image to slice into tiles");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return CliResult::EXIT_OK;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        err = std::string("parse error: ") + e.what();
        return CliResult::EXIT_ERROR;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        err = std::string("invalid arguments: ") + e.what();
        return CliResult::EXIT_ERROR;
    }

    if (configFile && !loadConfigFile(args::get(configFile), cfg, err))
        return CliResult::EXIT_ERROR;

    if (imageArg)     cfg.imagePath     = args::get(imageArg);
    if (widthArg)     cfg.windowW       = args::get(widthArg);
    if (heightArg)    cfg.windowH       = args::get(heightArg);
    if (rowsArg)      cfg.layout.rows   = args::get(rowsArg);
    if (colsArg)      cfg.layout.cols   = args::get(colsArg);
    if (debugFlag)    cfg.debugBorders  = true;
    if (toPointFlag)  cfg.dragMode      = DragMode::TO_POINT;
    if (noBufferFlag) cfg.doubleBuffer  = false;
    if (verboseFlag)  cfg.logLevel      = "debug";

    if (!validateConfig(cfg, err)) return CliResult::EXIT_ERROR;
    return CliResult::RUN;
}

} // namespace ConfigLoader

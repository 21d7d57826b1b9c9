#include "DragPuzzle.h"
#include "PuzzleConfig.h"
#include <string>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    PuzzleConfig cfg;
    std::string  err;
    switch (ConfigLoader::parseCommandLine(argc, argv, cfg, err)) {
        case ConfigLoader::CliResult::EXIT_OK:    return 0;
        case ConfigLoader::CliResult::EXIT_ERROR: spdlog::error("{}", err); return 1;
        case ConfigLoader::CliResult::RUN:        break;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    DragPuzzle app(cfg);
    if (!app.init()) return 1;
    app.run();
    return 0;
}

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "PuzzleConfig.h"

using ConfigLoader::CliResult;

namespace {

CliResult runCli(std::vector<std::string> args, PuzzleConfig& cfg, std::string& err)
{
    args.insert(args.begin(), "dragpuzzle");
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return ConfigLoader::parseCommandLine((int)args.size(), argv.data(), cfg, err);
}

} // namespace

TEST(PuzzleConfigTests, DefaultsAreValid)
{
    PuzzleConfig cfg;
    std::string err;
    EXPECT_TRUE(ConfigLoader::validateConfig(cfg, err)) << err;
    EXPECT_EQ(cfg.layout.rows, 3);
    EXPECT_EQ(cfg.layout.cols, 3);
    EXPECT_FLOAT_EQ(cfg.layout.widthFraction, 0.60f);
    EXPECT_FLOAT_EQ(cfg.layout.heightFraction, 0.90f);
    EXPECT_EQ(cfg.dragMode, DragMode::BY_DELTA);
    EXPECT_TRUE(cfg.doubleBuffer);
    EXPECT_FALSE(cfg.debugBorders);
}

TEST(PuzzleConfigTests, YamlOverridesEveryKey)
{
    const std::string yaml =
        "image: photos/cat.png\n"
        "window:\n"
        "  width: 1280\n"
        "  height: 720\n"
        "layout:\n"
        "  rows: 4\n"
        "  cols: 5\n"
        "  width-fraction: 0.5\n"
        "  height-fraction: 0.75\n"
        "drag-mode: point\n"
        "debug-borders: true\n"
        "double-buffer: false\n"
        "background: [10, 20, 30]\n"
        "log-level: debug\n";

    PuzzleConfig cfg;
    std::string err;
    ASSERT_TRUE(ConfigLoader::parseConfig(yaml, cfg, err)) << err;

    EXPECT_EQ(cfg.imagePath, "photos/cat.png");
    EXPECT_EQ(cfg.windowW, 1280);
    EXPECT_EQ(cfg.windowH, 720);
    EXPECT_EQ(cfg.layout.rows, 4);
    EXPECT_EQ(cfg.layout.cols, 5);
    EXPECT_FLOAT_EQ(cfg.layout.widthFraction, 0.5f);
    EXPECT_FLOAT_EQ(cfg.layout.heightFraction, 0.75f);
    EXPECT_EQ(cfg.dragMode, DragMode::TO_POINT);
    EXPECT_TRUE(cfg.debugBorders);
    EXPECT_FALSE(cfg.doubleBuffer);
    EXPECT_EQ(cfg.background.r, 10);
    EXPECT_EQ(cfg.background.g, 20);
    EXPECT_EQ(cfg.background.b, 30);
    EXPECT_EQ(cfg.background.a, 255);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_TRUE(ConfigLoader::validateConfig(cfg, err)) << err;
}

TEST(PuzzleConfigTests, PartialYamlKeepsOtherDefaults)
{
    PuzzleConfig cfg;
    std::string err;
    ASSERT_TRUE(ConfigLoader::parseConfig("layout:\n  rows: 2\n", cfg, err)) << err;
    EXPECT_EQ(cfg.layout.rows, 2);
    EXPECT_EQ(cfg.layout.cols, 3);
    EXPECT_EQ(cfg.windowW, 1000);
}

TEST(PuzzleConfigTests, EmptyDocumentKeepsDefaults)
{
    PuzzleConfig cfg;
    std::string err;
    EXPECT_TRUE(ConfigLoader::parseConfig("", cfg, err));
    EXPECT_EQ(cfg.windowW, 1000);
    EXPECT_EQ(cfg.dragMode, DragMode::BY_DELTA);
}

TEST(PuzzleConfigTests, RejectsMalformedDocuments)
{
    PuzzleConfig cfg;
    std::string err;

    EXPECT_FALSE(ConfigLoader::parseConfig("- just\n- a list\n", cfg, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(ConfigLoader::parseConfig("drag-mode: sideways\n", cfg, err));
    EXPECT_NE(err.find("sideways"), std::string::npos);

    err.clear();
    EXPECT_FALSE(ConfigLoader::parseConfig("background: [1, 2]\n", cfg, err));
    EXPECT_FALSE(ConfigLoader::parseConfig("background: [0, 300, 0]\n", cfg, err));

    err.clear();
    EXPECT_FALSE(ConfigLoader::parseConfig("window: {width: [1, 2\n", cfg, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(ConfigLoader::parseConfig("layout:\n  rows: many\n", cfg, err));
    EXPECT_FALSE(err.empty());
}

TEST(PuzzleConfigTests, ValidationRejectsOutOfRangeValues)
{
    std::string err;

    PuzzleConfig cfg;
    cfg.layout.rows = 0;
    EXPECT_FALSE(ConfigLoader::validateConfig(cfg, err));

    cfg = PuzzleConfig();
    cfg.layout.cols = PuzzleConfig::MAX_GRID + 1;
    EXPECT_FALSE(ConfigLoader::validateConfig(cfg, err));

    cfg = PuzzleConfig();
    cfg.layout.rows = PuzzleConfig::MAX_GRID;
    cfg.layout.cols = 1;
    EXPECT_TRUE(ConfigLoader::validateConfig(cfg, err)) << err;

    cfg = PuzzleConfig();
    cfg.layout.widthFraction = 0.f;
    EXPECT_FALSE(ConfigLoader::validateConfig(cfg, err));

    cfg = PuzzleConfig();
    cfg.layout.heightFraction = 1.5f;
    EXPECT_FALSE(ConfigLoader::validateConfig(cfg, err));

    cfg = PuzzleConfig();
    cfg.layout.widthFraction = 1.f;
    EXPECT_TRUE(ConfigLoader::validateConfig(cfg, err)) << err;

    cfg = PuzzleConfig();
    cfg.windowH = 0;
    EXPECT_FALSE(ConfigLoader::validateConfig(cfg, err));

    cfg = PuzzleConfig();
    cfg.logLevel = "loud";
    EXPECT_FALSE(ConfigLoader::validateConfig(cfg, err));
    EXPECT_NE(err.find("loud"), std::string::npos);
}

TEST(PuzzleConfigTests, MissingConfigFileFails)
{
    PuzzleConfig cfg;
    std::string err;
    EXPECT_FALSE(ConfigLoader::loadConfigFile("/nonexistent/dragpuzzle.yaml", cfg, err));
    EXPECT_NE(err.find("/nonexistent/dragpuzzle.yaml"), std::string::npos);
}

TEST(PuzzleConfigTests, CommandLineOverridesDefaults)
{
    PuzzleConfig cfg;
    std::string err;
    const CliResult res = runCli({"--rows", "4", "--cols", "2", "-W", "640", "--drag-to-point",
                                  "--debug", "--no-double-buffer", "-v", "img.png"}, cfg, err);
    ASSERT_EQ(res, CliResult::RUN) << err;
    EXPECT_EQ(cfg.imagePath, "img.png");
    EXPECT_EQ(cfg.layout.rows, 4);
    EXPECT_EQ(cfg.layout.cols, 2);
    EXPECT_EQ(cfg.windowW, 640);
    EXPECT_EQ(cfg.windowH, 700);
    EXPECT_EQ(cfg.dragMode, DragMode::TO_POINT);
    EXPECT_TRUE(cfg.debugBorders);
    EXPECT_FALSE(cfg.doubleBuffer);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(PuzzleConfigTests, CommandLineHelpAndErrors)
{
    PuzzleConfig cfg;
    std::string err;
    EXPECT_EQ(runCli({"--help"}, cfg, err), CliResult::EXIT_OK);

    EXPECT_EQ(runCli({"--rows", "0"}, cfg, err), CliResult::EXIT_ERROR);
    EXPECT_FALSE(err.empty());

    cfg = PuzzleConfig();
    err.clear();
    EXPECT_EQ(runCli({"--no-such-flag"}, cfg, err), CliResult::EXIT_ERROR);

    cfg = PuzzleConfig();
    err.clear();
    EXPECT_EQ(runCli({"--config", "/nonexistent/dragpuzzle.yaml"}, cfg, err), CliResult::EXIT_ERROR);
}

TEST(PuzzleConfigTests, DragModeNames)
{
    EXPECT_STREQ(ConfigLoader::dragModeName(DragMode::BY_DELTA), "delta");
    EXPECT_STREQ(ConfigLoader::dragModeName(DragMode::TO_POINT), "point");
}

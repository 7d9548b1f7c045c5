// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.cpp.
//
// Goals:
//   - Saving creates the directory + writes the file
//   - Loading round-trips values
//   - Corrupt or negative values do not throw and keep the previous value

#include <doctest/doctest.h>

#include "sparkworld/core/Config.hpp"
#include "sparkworld/core/Log.hpp"
#include "test_support/WorldFixtures.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace sparkworld;

namespace {

fs::path WriteIni(const fs::path& dir, const std::string& text)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    const fs::path p = dir / "sparkworld.ini";
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
    return p;
}

} // namespace

TEST_CASE("core::SaveConfig creates the file and core::LoadConfig round-trips values")
{
    const fs::path dir = test::make_unique_temp_dir("config") / "nested";
    const fs::path file = dir / "sparkworld.ini";

    core::Config cfg;
    cfg.seed = 123456789012345ull;
    cfg.initialSparks = 9;
    cfg.spawnCost = 4;
    cfg.spawnChildSparks = 3;
    cfg.benefactorInitialPerAgent = 2;
    cfg.benefactorRegenPerTick = 6;
    cfg.oracleTimeoutMs = 0;
    cfg.saveDir = "run/saves";
    cfg.logDir = "run/logs";
    cfg.logLevel = "debug";
    cfg.logToFile = false;

    REQUIRE(core::SaveConfig(cfg, file));
    CHECK(fs::exists(file));

    core::Config loaded;
    CHECK(core::LoadConfig(loaded, file));
    CHECK(loaded.seed == cfg.seed);
    CHECK(loaded.initialSparks == 9);
    CHECK(loaded.spawnCost == 4);
    CHECK(loaded.spawnChildSparks == 3);
    CHECK(loaded.benefactorInitialPerAgent == 2);
    CHECK(loaded.benefactorRegenPerTick == 6);
    CHECK(loaded.oracleTimeoutMs == 0);
    CHECK(loaded.saveDir == "run/saves");
    CHECK(loaded.logDir == "run/logs");
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.logToFile == false);

    std::error_code dec;
    fs::remove_all(dir.parent_path(), dec);
}

TEST_CASE("core::LoadConfig returns false for a missing file (first run)")
{
    const fs::path dir = test::make_unique_temp_dir("config_missing");

    core::Config cfg;
    cfg.initialSparks = 7;
    CHECK_FALSE(core::LoadConfig(cfg, dir / "nope.ini"));
    CHECK(cfg.initialSparks == 7);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig tolerates corrupt and negative values (does not throw)")
{
    const fs::path dir = test::make_unique_temp_dir("config_corrupt");
    const fs::path p = WriteIni(dir,
        "initialSparks=lots\n"
        "spawnCost=-2\n"
        "spawnChildSparks=8\n"
        "seed=0x10\n"
        "oracleTimeoutMs=-1\n");

    core::Config cfg;
    cfg.seed = 5;

    CHECK_NOTHROW(core::LoadConfig(cfg, p));
    CHECK(cfg.initialSparks == 5);     // unchanged (invalid)
    CHECK(cfg.spawnCost == 5);         // unchanged (negative)
    CHECK(cfg.spawnChildSparks == 8);
    CHECK(cfg.seed == 5);              // hex is not accepted
    CHECK(cfg.oracleTimeoutMs == -1);  // negative means inline

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig ignores invalid boolean values")
{
    const fs::path dir = test::make_unique_temp_dir("config_bool");

    core::Config cfg;
    cfg.logToFile = true;
    CHECK(core::LoadConfig(cfg, WriteIni(dir, "logToFile=maybe\n")));
    CHECK(cfg.logToFile == true);

    CHECK(core::LoadConfig(cfg, WriteIni(dir, "logToFile=OFF\n")));
    CHECK(cfg.logToFile == false);

    CHECK(core::LoadConfig(cfg, WriteIni(dir, "logToFile=yes\n")));
    CHECK(cfg.logToFile == true);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig supports comments, sections and inline comments")
{
    const fs::path dir = test::make_unique_temp_dir("config_comments");
    const fs::path p = WriteIni(dir,
        "; whole line comment\n"
        "# whole line comment\n"
        "[simulation]\n"
        "initialSparks = 12   # per agent\n"
        "spawnCost=6 ; parent pays\n"
        "oracleTimeoutMs=250 // quarter second\n"
        "notAKey\n"
        "unknownKey=3\n"
        "\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, p));
    CHECK(cfg.initialSparks == 12);
    CHECK(cfg.spawnCost == 6);
    CHECK(cfg.oracleTimeoutMs == 250);
    CHECK(cfg.spawnChildSparks == 5);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::ParseLogLevel accepts spdlog names in any case")
{
    CHECK(core::ParseLogLevel("debug") == std::optional(spdlog::level::debug));
    CHECK(core::ParseLogLevel("WARN") == std::optional(spdlog::level::warn));
    CHECK(core::ParseLogLevel("warning") == std::optional(spdlog::level::warn));
    CHECK(core::ParseLogLevel("Error") == std::optional(spdlog::level::err));
    CHECK_FALSE(core::ParseLogLevel("loud").has_value());
    CHECK_FALSE(core::ParseLogLevel("").has_value());
}

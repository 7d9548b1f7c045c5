// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.cpp.
//
// Goals:
//   - The first positional argument selects the command
//   - Options are case-insensitive; text values keep their case
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "sparkworld/app/CommandLineArgs.hpp"

#include <initializer_list>
#include <vector>

using namespace sparkworld;

namespace {

[[nodiscard]] app::CommandLineArgs Parse(std::initializer_list<const char*> argv)
{
    std::vector<const char*> v(argv);
    return app::ParseCommandLineArgs(static_cast<int>(v.size()), v.data());
}

} // namespace

TEST_CASE("CommandLineArgs: no arguments means no command")
{
    const auto args = Parse({ "sparkworld" });
    CHECK(args.command == app::Command::None);
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs: init with separate and inline values")
{
    const auto args = Parse({ "sparkworld", "init", "--agents", "6", "--NAME=Garden Of Minds" });

    CHECK(args.command == app::Command::Init);
    REQUIRE(args.agents.has_value());
    CHECK(*args.agents == 6);
    REQUIRE(args.name.has_value());
    CHECK(*args.name == "Garden Of Minds");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs: tick with aliases and flags")
{
    const auto args = Parse({ "sparkworld", "TICK", "--Sim", "0001", "-c", "+10", "--json", "--no-log-file" });

    CHECK(args.command == app::Command::Tick);
    REQUIRE(args.simulation.has_value());
    CHECK(*args.simulation == "0001");
    REQUIRE(args.count.has_value());
    CHECK(*args.count == 10);
    CHECK(args.json);
    REQUIRE(args.logToFile.has_value());
    CHECK(*args.logToFile == false);
}

TEST_CASE("CommandLineArgs: --simulation=ID keeps the value's case")
{
    const auto args = Parse({ "sparkworld", "show", "--SIMULATION=AbC9" });
    CHECK(args.command == app::Command::Show);
    REQUIRE(args.simulation.has_value());
    CHECK(*args.simulation == "AbC9");
}

TEST_CASE("CommandLineArgs: global options")
{
    const auto args = Parse({ "sparkworld", "list", "--config", "My.ini", "--seed=18446744073709551615",
                              "--save-dir", "Runs", "--log-level=WARN", "--log-file" });

    CHECK(args.command == app::Command::List);
    CHECK(args.configPath == std::optional<std::string>("My.ini"));
    REQUIRE(args.seed.has_value());
    CHECK(*args.seed == 18446744073709551615ull);
    CHECK(args.saveDir == std::optional<std::string>("Runs"));
    CHECK(args.logLevel == std::optional<std::string>("WARN"));
    CHECK(args.logToFile == std::optional<bool>(true));
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs: help forms")
{
    CHECK(Parse({ "sparkworld", "--help" }).showHelp);
    CHECK(Parse({ "sparkworld", "-H" }).showHelp);
    CHECK(Parse({ "sparkworld", "-?" }).showHelp);
    CHECK(Parse({ "sparkworld", "help" }).showHelp);

    const auto text = app::BuildCommandLineHelpText();
    CHECK(text.find("init --agents") != std::string::npos);
    CHECK(text.find("--json") != std::string::npos);
}

TEST_CASE("CommandLineArgs: unknown options and bad values are collected in order")
{
    const auto args = Parse({ "sparkworld", "init", "--agents", "many", "--frobnicate",
                              "show", "--count=", "--name" });

    CHECK(args.command == app::Command::Init);
    CHECK_FALSE(args.agents.has_value());
    CHECK_FALSE(args.count.has_value());
    CHECK_FALSE(args.name.has_value());
    REQUIRE(args.unknown.size() == 5);
    CHECK(args.unknown[0] == "--agents");
    CHECK(args.unknown[1] == "--frobnicate");
    CHECK(args.unknown[2] == "show");
    CHECK(args.unknown[3] == "--count=");
    CHECK(args.unknown[4] == "--name");
}

TEST_CASE("CommandLineArgs: CommandName")
{
    CHECK(std::string(app::CommandName(app::Command::Init)) == "init");
    CHECK(std::string(app::CommandName(app::Command::List)) == "list");
    CHECK(std::string(app::CommandName(app::Command::None)) == "none");
}

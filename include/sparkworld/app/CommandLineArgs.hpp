#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sparkworld::app {

enum class Command : std::uint8_t {
    None = 0,
    Init,   // init --agents N --name NAME
    Tick,   // tick --sim ID [--count K] [--json]
    Show,   // show --sim ID [--json]
    List,   // list
};

[[nodiscard]] const char* CommandName(Command c) noexcept;

// Parsed command line of the sparkworld executable.
//
// Notes:
//   - The first positional argument is the command.
//   - All option names are case-insensitive.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    Command command = Command::None;
    bool showHelp = false;                  // --help / -h
    bool json = false;                      // --json

    std::optional<int> agents;              // --agents <N>
    std::optional<std::string> name;        // --name <text>
    std::optional<std::string> simulation;  // --sim <id>
    std::optional<int> count;               // --count <K>

    std::optional<std::string> configPath;  // --config <file>
    std::optional<std::uint64_t> seed;      // --seed <N>
    std::optional<std::string> saveDir;     // --save-dir <dir>
    std::optional<std::string> logLevel;    // --log-level <level>
    std::optional<bool> logToFile;          // --log-file / --no-log-file

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

// Human-readable help text.
[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace sparkworld::app

#include "sparkworld/app/CommandLineArgs.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace sparkworld::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Accepts "--opt=value".
[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

template <class T>
[[nodiscard]] std::optional<T> ParseNumber(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    T v{};
    const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || p != s.data() + s.size())
        return std::nullopt;
    return v;
}

[[nodiscard]] std::optional<Command> ParseCommand(std::string_view s)
{
    if (s == "init")  return Command::Init;
    if (s == "tick")  return Command::Tick;
    if (s == "show")  return Command::Show;
    if (s == "list")  return Command::List;
    return std::nullopt;
}

} // namespace

const char* CommandName(Command c) noexcept
{
    switch (c) {
    case Command::None: return "none";
    case Command::Init: return "init";
    case Command::Tick: return "tick";
    case Command::Show: return "show";
    case Command::List: return "list";
    default:            return "unknown";
    }
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    CommandLineArgs out;
    if (argc <= 1 || argv == nullptr)
        return out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view raw(argv[i] ? argv[i] : "");
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?" || arg == "help") {
            out.showHelp = true;
            continue;
        }

        // Positional command
        if (arg.front() != '-') {
            if (const auto cmd = ParseCommand(arg); cmd && out.command == Command::None) {
                out.command = *cmd;
                continue;
            }
            addUnknown(raw);
            continue;
        }

        // Simple flags
        if (arg == "--json") { out.json = true; continue; }
        if (arg == "--log-file") { out.logToFile = true; continue; }
        if (arg == "--no-log-file" || arg == "--nolog-file") { out.logToFile = false; continue; }

        // Options with values. Text values keep their original case.
        std::string_view value;

        const auto nextRaw = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc || argv[i + 1] == nullptr)
                return std::nullopt;
            ++i;
            return std::string_view(argv[i]);
        };

        const auto inlineRaw = [&](std::string_view lowerValue) {
            return raw.substr(raw.size() - lowerValue.size());
        };

        const auto takeText = [&](std::optional<std::string>& dst) {
            if (auto v = nextRaw(); v && !v->empty())
                dst = std::string(*v);
            else
                addUnknown(raw);
        };

        const auto textInto = [&](std::optional<std::string>& dst, std::string_view v) {
            if (v.empty())
                addUnknown(raw);
            else
                dst = std::string(inlineRaw(v));
        };

        const auto takeNumber = [&](auto& dst) {
            using T = typename std::remove_reference_t<decltype(dst)>::value_type;
            const auto v = nextRaw();
            const auto parsed = v ? ParseNumber<T>(*v) : std::nullopt;
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        const auto numberInto = [&](auto& dst, std::string_view v) {
            using T = typename std::remove_reference_t<decltype(dst)>::value_type;
            const auto parsed = ParseNumber<T>(v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
        };

        if (arg == "--agents" || arg == "-n") { takeNumber(out.agents); continue; }
        if (ConsumeValue(arg, "--agents", value)) { numberInto(out.agents, value); continue; }

        if (arg == "--count" || arg == "-c") { takeNumber(out.count); continue; }
        if (ConsumeValue(arg, "--count", value)) { numberInto(out.count, value); continue; }

        if (arg == "--seed") { takeNumber(out.seed); continue; }
        if (ConsumeValue(arg, "--seed", value)) { numberInto(out.seed, value); continue; }

        if (arg == "--name") { takeText(out.name); continue; }
        if (ConsumeValue(arg, "--name", value)) { textInto(out.name, value); continue; }

        if (arg == "--sim" || arg == "--simulation") { takeText(out.simulation); continue; }
        if (ConsumeValue(arg, "--sim", value) || ConsumeValue(arg, "--simulation", value)) {
            textInto(out.simulation, value);
            continue;
        }

        if (arg == "--config") { takeText(out.configPath); continue; }
        if (ConsumeValue(arg, "--config", value)) { textInto(out.configPath, value); continue; }

        if (arg == "--save-dir") { takeText(out.saveDir); continue; }
        if (ConsumeValue(arg, "--save-dir", value)) { textInto(out.saveDir, value); continue; }

        if (arg == "--log-level") { takeText(out.logLevel); continue; }
        if (ConsumeValue(arg, "--log-level", value)) { textInto(out.logLevel, value); continue; }

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "Spark World - Command Line\n\n";
    oss << "Usage: sparkworld <command> [options]\n\n";

    oss << "Commands\n";
    oss << "  init --agents <N> [--name <text>]   Create a simulation with N agents (prints its id)\n";
    oss << "  tick --sim <id> [--count <K>]        Advance a simulation by K ticks (default 1)\n";
    oss << "  show --sim <id>                      Print the latest state of a simulation\n";
    oss << "  list                                 List known simulations\n\n";

    oss << "Options\n";
    oss << "  --json                 Print tick reports / state as JSON\n";
    oss << "  --config <file>        INI settings file (default: sparkworld.ini if present)\n";
    oss << "  --seed <N>             Override the world seed for init (0 = derive from id)\n";
    oss << "  --save-dir <dir>       Snapshot directory\n";
    oss << "  --log-level <level>    trace|debug|info|warn|error|critical|off\n";
    oss << "  --log-file / --no-log-file   Toggle the rotating log file\n";
    oss << "  --help, -h             Show this help\n\n";

    oss << "Examples\n";
    oss << "  sparkworld init --agents 6 --name garden\n";
    oss << "  sparkworld tick --sim 0001 --count 10\n";
    oss << "  sparkworld show --sim 0001 --json\n";
    return oss.str();
}

} // namespace sparkworld::app

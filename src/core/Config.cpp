#include "sparkworld/core/Config.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace sparkworld::core {

namespace {

inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

std::string_view TrimView(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

template <class T>
bool ParseNumber(std::string_view sv, T& out) noexcept
{
    sv = TrimView(sv);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = TrimView(sv);

    // Common INI boolean tokens (case-insensitive):
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

// Non-negative integer settings; corrupt or negative values keep the default.
void ApplyCount(std::string_view key, std::string_view value, int& field)
{
    int parsed = field;
    if (ParseNumber(value, parsed) && parsed >= 0)
        field = parsed;
    else
        spdlog::warn("LoadConfig: ignoring bad value for {}: '{}'", key, value);
}

} // namespace

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    const std::string text = oss.str();

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        // Comments / empty
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments, e.g.:
        //   initialSparks=5     # per agent
        //   oracleTimeoutMs=500 ; half a second
        {
            const std::size_t hashPos  = v.find('#');
            const std::size_t semiPos  = v.find(';');
            const std::size_t slashPos = v.find("//");

            std::size_t cut = std::string::npos;
            auto consider = [&](std::size_t p)
            {
                if (p == std::string::npos) return;
                if (cut == std::string::npos || p < cut) cut = p;
            };

            consider(hashPos);
            consider(semiPos);
            consider(slashPos);

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (k == "seed")
        {
            std::uint64_t parsed = cfg.seed;
            if (ParseNumber(v, parsed))
                cfg.seed = parsed;
            else
                spdlog::warn("LoadConfig: ignoring bad value for seed: '{}'", v);
        }
        else if (k == "initialSparks")             ApplyCount(k, v, cfg.initialSparks);
        else if (k == "spawnCost")                 ApplyCount(k, v, cfg.spawnCost);
        else if (k == "spawnChildSparks")          ApplyCount(k, v, cfg.spawnChildSparks);
        else if (k == "benefactorInitialPerAgent") ApplyCount(k, v, cfg.benefactorInitialPerAgent);
        else if (k == "benefactorRegenPerTick")    ApplyCount(k, v, cfg.benefactorRegenPerTick);
        else if (k == "oracleTimeoutMs")
        {
            int parsed = cfg.oracleTimeoutMs;
            if (ParseNumber(v, parsed))
                cfg.oracleTimeoutMs = parsed;
        }
        else if (k == "saveDir")  { if (!v.empty()) cfg.saveDir = v; }
        else if (k == "logDir")   { if (!v.empty()) cfg.logDir = v; }
        else if (k == "logLevel") { if (!v.empty()) cfg.logLevel = v; }
        else if (k == "logToFile")
        {
            bool parsed = cfg.logToFile;
            if (ParseBool(v, parsed))
                cfg.logToFile = parsed;
        }
        else
        {
            spdlog::debug("LoadConfig: unknown key '{}'", k);
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    if (file.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                          file.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    std::ostringstream oss;
    oss << "seed="                      << cfg.seed                      << "\n";
    oss << "initialSparks="             << cfg.initialSparks             << "\n";
    oss << "spawnCost="                 << cfg.spawnCost                 << "\n";
    oss << "spawnChildSparks="          << cfg.spawnChildSparks          << "\n";
    oss << "benefactorInitialPerAgent=" << cfg.benefactorInitialPerAgent << "\n";
    oss << "benefactorRegenPerTick="    << cfg.benefactorRegenPerTick    << "\n";
    oss << "oracleTimeoutMs="           << cfg.oracleTimeoutMs           << "\n";
    oss << "saveDir="                   << cfg.saveDir                   << "\n";
    oss << "logDir="                    << cfg.logDir                    << "\n";
    oss << "logLevel="                  << cfg.logLevel                  << "\n";
    oss << "logToFile="                 << (cfg.logToFile ? 1 : 0)       << "\n";
    const std::string text = oss.str();

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace sparkworld::core

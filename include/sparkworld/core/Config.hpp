#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace sparkworld::core {

// Runtime settings for the simulation driver. Loaded from a hand-editable
// INI-style file (key=value); anything missing keeps its default.
struct Config {
    std::uint64_t seed = 0;             // 0 = derive from the simulation id

    int initialSparks    = 5;           // genesis endowment per agent
    int spawnCost        = 5;           // paid by the parent
    int spawnChildSparks = 5;           // endowment of a spawned agent

    int benefactorInitialPerAgent = 1;
    int benefactorRegenPerTick    = 0;  // 0 = max(1, floor(sqrt(numAgents)))

    int oracleTimeoutMs = 30000;        // <= 0 runs oracle calls inline without a deadline

    std::string saveDir  = "saves";
    std::string logDir   = "logs";
    std::string logLevel = "info";
    bool        logToFile = true;
};

bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

} // namespace sparkworld::core

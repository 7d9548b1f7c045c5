// src/app/Main.cpp
//
// sparkworld CLI: init / tick / show / list over the snapshot store, wired to
// the built-in local oracles.

#include "sparkworld/app/CommandLineArgs.hpp"
#include "sparkworld/app/SimulationService.hpp"
#include "sparkworld/core/Config.hpp"
#include "sparkworld/core/Log.hpp"
#include "sparkworld/oracle/LocalOracles.hpp"
#include "sparkworld/save/Serialization.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace sparkworld;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int Fail(const app::ServiceError& e)
{
    spdlog::error("{}: {}", app::ServiceErrorCodeName(e.code), e.message);
    return kExitFailure;
}

void PrintTickSummary(const sim::TickReport& r)
{
    std::cout << "tick " << r.tick << ": " << r.aliveCount << " alive, " << r.totalSparks
              << " sparks, benefactor " << r.benefactorBalance << " | minted " << r.sparksMinted
              << ", lost " << r.sparksLost << ", granted " << r.sparksGranted
              << " | raids " << r.raids.size() << ", bonds +" << r.bondsFormed.size()
              << "/-" << r.bondsDissolved.size() << ", vanished " << r.agentsVanished.size()
              << ", spawned " << r.agentsSpawned.size() << ", dropped " << r.dropped.size() << "\n";
}

void PrintWorld(const world::WorldState& w)
{
    std::cout << "simulation " << w.simulationId << " '" << w.name << "' at tick " << w.tick
              << " (seed " << w.seed << ")\n";
    std::cout << "benefactor: " << w.benefactor.balance << " (+" << w.benefactor.regenPerTick << "/tick)\n";

    std::cout << "agents:\n";
    for (const auto& [id, a] : w.agents)
    {
        std::cout << "  " << id << "  " << a.persona.name << " (" << a.persona.species << ")  "
                  << world::AgentStatusName(a.status) << ", " << world::BondStatusName(a.bondStatus)
                  << ", sparks " << a.sparks << ", age " << a.age << "\n";
    }

    std::cout << "bonds:\n";
    for (const auto& [id, b] : w.bonds)
    {
        std::cout << "  " << id << "  leader " << b.leaderId << ", " << b.members.size() << " member(s)";
        if (b.missionId)
        {
            if (const world::Mission* m = w.FindMission(*b.missionId))
                std::cout << ", mission '" << m->title << "': " << m->progress;
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp || args.command == app::Command::None)
    {
        std::cout << app::BuildCommandLineHelpText();
        return args.showHelp ? kExitOk : kExitUsage;
    }
    if (!args.unknown.empty())
    {
        std::cerr << "Unrecognized argument(s):";
        for (const auto& u : args.unknown) std::cerr << " " << u;
        std::cerr << "\n\n" << app::BuildCommandLineHelpText();
        return kExitUsage;
    }

    core::Config cfg;
    const std::filesystem::path configPath = args.configPath.value_or("sparkworld.ini");
    if (!core::LoadConfig(cfg, configPath) && args.configPath)
    {
        std::cerr << "Cannot read config file: " << configPath.string() << "\n";
        return kExitUsage;
    }

    if (args.seed)      cfg.seed = *args.seed;
    if (args.saveDir)   cfg.saveDir = *args.saveDir;
    if (args.logLevel)  cfg.logLevel = *args.logLevel;
    if (args.logToFile) cfg.logToFile = *args.logToFile;

    core::LogOptions logOptions;
    logOptions.logDir = cfg.logDir;
    logOptions.toFile = cfg.logToFile;
    if (const auto level = core::ParseLogLevel(cfg.logLevel))
        logOptions.level = *level;
    core::InitLogging(logOptions);
    if (!core::ParseLogLevel(cfg.logLevel))
        spdlog::warn("Unknown log level '{}', using info", cfg.logLevel);

    app::SimulationService service(cfg, oracle::Collaborators{});
    service.SetCollaboratorFactory(&oracle::MakeLocalCollaborators);

    switch (args.command)
    {
    case app::Command::Init:
    {
        if (!args.agents)
        {
            std::cerr << "init needs --agents <N>\n";
            return kExitUsage;
        }
        auto id = service.Initialize(*args.agents, args.name.value_or("spark world"));
        if (!id)
            return Fail(id.error());
        std::cout << *id << "\n";
        return kExitOk;
    }

    case app::Command::Tick:
    {
        if (!args.simulation)
        {
            std::cerr << "tick needs --sim <id>\n";
            return kExitUsage;
        }
        const int count = args.count.value_or(1);
        if (count < 1)
        {
            std::cerr << "--count must be at least 1\n";
            return kExitUsage;
        }

        for (int i = 0; i < count; ++i)
        {
            auto report = service.Tick(*args.simulation);
            if (!report)
                return Fail(report.error());

            if (args.json)
                std::cout << nlohmann::json(*report).dump() << "\n";
            else
                PrintTickSummary(*report);

            if (report->aliveCount == 0)
            {
                spdlog::info("Simulation {} has no agents left", *args.simulation);
                break;
            }
        }
        return kExitOk;
    }

    case app::Command::Show:
    {
        if (!args.simulation)
        {
            std::cerr << "show needs --sim <id>\n";
            return kExitUsage;
        }
        auto w = service.Inspect(*args.simulation);
        if (!w)
            return Fail(w.error());

        if (args.json)
            std::cout << save::WorldToJson(*w).dump(2) << "\n";
        else
            PrintWorld(*w);
        return kExitOk;
    }

    case app::Command::List:
    {
        auto all = service.List();
        if (!all)
            return Fail(all.error());
        for (const auto& s : *all)
            std::cout << s.id << "  " << s.name << "  tick " << s.latestTick << "  created " << s.createdUtc << "\n";
        return kExitOk;
    }

    default:
        break;
    }

    std::cout << app::BuildCommandLineHelpText();
    return kExitUsage;
}

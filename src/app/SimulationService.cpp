// src/app/SimulationService.cpp
#include "sparkworld/app/SimulationService.hpp"

#include "sparkworld/sim/Population.hpp"
#include "sparkworld/sim/TickOrchestrator.hpp"
#include "sparkworld/world/Invariants.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace sparkworld::app {

namespace {

ServiceError FromSaveError(const save::SaveError& e, const std::string& simulationId)
{
    switch (e.code) {
    case save::SaveError::Code::NotFound:
        return ServiceError{ ServiceError::Code::UnknownSimulation,
                             "Unknown simulation '" + simulationId + "': " + e.message };
    case save::SaveError::Code::JsonParseError:
    case save::SaveError::Code::JsonTypeError:
    case save::SaveError::Code::SchemaMismatch:
    case save::SaveError::Code::InvariantBroken:
        return ServiceError{ ServiceError::Code::Corrupted,
                             std::string(save::SaveErrorCodeName(e.code)) + ": " + e.message };
    default:
        return ServiceError{ ServiceError::Code::Persistence,
                             std::string(save::SaveErrorCodeName(e.code)) + ": " + e.message };
    }
}

} // namespace

const char* ServiceErrorCodeName(ServiceError::Code c) noexcept
{
    switch (c) {
    case ServiceError::Code::UnknownSimulation: return "unknown-simulation";
    case ServiceError::Code::Persistence:       return "persistence";
    case ServiceError::Code::Corrupted:         return "corrupted";
    case ServiceError::Code::InvalidArgument:   return "invalid-argument";
    default:                                    return "unknown";
    }
}

core::Seed SeedFromSimulationId(const std::string& id) noexcept
{
    core::Seed h = 0x5350'4152'4B57'4C44ull;
    for (unsigned char c : id)
        h = core::mix64(h ^ c);
    return h;
}

int DefaultBenefactorRegen(int numAgents) noexcept
{
    if (numAgents <= 0)
        return 1;
    return std::max(1, static_cast<int>(std::floor(std::sqrt(static_cast<double>(numAgents)))));
}

SimulationService::SimulationService(core::Config config, oracle::Collaborators collaborators)
    : m_config(std::move(config))
    , m_gateway(std::move(collaborators), std::chrono::milliseconds(m_config.oracleTimeoutMs))
    , m_store(m_config.saveDir)
{
}

std::expected<std::string, ServiceError> SimulationService::Initialize(int numAgents, const std::string& name)
{
    if (numAgents < 1)
        return std::unexpected(ServiceError{ ServiceError::Code::InvalidArgument, "numAgents must be at least 1" });
    if (m_config.initialSparks < 1)
        return std::unexpected(ServiceError{ ServiceError::Code::InvalidArgument, "initialSparks must be at least 1" });
    if (m_config.spawnCost < 1 || m_config.spawnChildSparks < 1)
        return std::unexpected(ServiceError{ ServiceError::Code::InvalidArgument, "spawnCost and spawnChildSparks must be at least 1" });

    auto info = m_store.ReserveSimulation(name);
    if (!info)
        return std::unexpected(FromSaveError(info.error(), name));

    world::WorldState w;
    w.simulationId = info->id;
    w.name = name;
    w.tick = 0;
    w.seed = m_config.seed != 0 ? m_config.seed : SeedFromSimulationId(info->id);
    w.rng.seed(w.seed, core::derive(w.seed, 1));

    w.rules.initialSparks = m_config.initialSparks;
    w.rules.spawnCost = m_config.spawnCost;
    w.rules.spawnChildSparks = m_config.spawnChildSparks;

    w.benefactor.balance = numAgents * std::max(0, m_config.benefactorInitialPerAgent);
    w.benefactor.regenPerTick = m_config.benefactorRegenPerTick > 0
        ? m_config.benefactorRegenPerTick
        : DefaultBenefactorRegen(numAgents);

    ReseedCollaborators(core::derive(w.seed, 0));
    for (int i = 0; i < numAgents; ++i)
        sim::CreateAgent(w, m_gateway.SpawnCharacter(), w.rules.initialSparks);

    try {
        world::CheckInvariants(w);
    }
    catch (const world::InvariantViolation& e) {
        return std::unexpected(ServiceError{ ServiceError::Code::Corrupted, e.what() });
    }

    if (auto ok = m_store.Save(w); !ok)
        return std::unexpected(FromSaveError(ok.error(), w.simulationId));
    if (auto ok = m_store.RecordSimulation(*info); !ok)
        return std::unexpected(FromSaveError(ok.error(), w.simulationId));

    spdlog::info("Simulation {} '{}' created: {} agent(s), seed {}, benefactor {} (+{}/tick)",
                 w.simulationId, name, numAgents, w.seed, w.benefactor.balance, w.benefactor.regenPerTick);
    return w.simulationId;
}

void SimulationService::ReseedCollaborators(core::Seed seed)
{
    if (m_factory)
        m_gateway.SetCollaborators(m_factory(seed));
}

std::expected<world::WorldState, ServiceError> SimulationService::LoadLatest(const std::string& simulationId) const
{
    auto w = m_store.LoadLatest(simulationId);
    if (!w)
        return std::unexpected(FromSaveError(w.error(), simulationId));
    return std::move(*w);
}

std::expected<sim::TickReport, ServiceError> SimulationService::Tick(const std::string& simulationId)
{
    auto loaded = LoadLatest(simulationId);
    if (!loaded)
        return std::unexpected(loaded.error());

    world::WorldState& w = *loaded;
    ReseedCollaborators(core::derive(w.seed, w.tick + 1));

    sim::TickReport report;
    try {
        sim::TickOrchestrator orchestrator(w, m_gateway);
        report = orchestrator.RunTick();
    }
    catch (const world::InvariantViolation& e) {
        spdlog::error("Simulation {} tick {} aborted: {}", simulationId, w.tick, e.what());
        return std::unexpected(ServiceError{ ServiceError::Code::Corrupted, e.what() });
    }

    if (auto ok = m_store.Save(w); !ok)
        return std::unexpected(FromSaveError(ok.error(), simulationId));

    return report;
}

std::expected<world::WorldState, ServiceError> SimulationService::Inspect(const std::string& simulationId) const
{
    return LoadLatest(simulationId);
}

std::expected<std::vector<save::SimulationInfo>, ServiceError> SimulationService::List() const
{
    auto all = m_store.ListSimulations();
    if (!all)
        return std::unexpected(FromSaveError(all.error(), {}));
    return std::move(*all);
}

} // namespace sparkworld::app

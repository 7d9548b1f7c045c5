#pragma once
// include/sparkworld/app/SimulationService.hpp
//
// Driver surface: create a simulation, advance it one tick at a time, and
// read it back. Every call loads the newest snapshot, works on it, and saves
// the result before returning; nothing is kept in memory between calls.

#include "sparkworld/core/Config.hpp"
#include "sparkworld/core/Rng.hpp"
#include "sparkworld/oracle/OracleGateway.hpp"
#include "sparkworld/save/SnapshotStore.hpp"
#include "sparkworld/sim/TickReport.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace sparkworld::app {

struct ServiceError {
    enum class Code {
        UnknownSimulation,
        Persistence,
        Corrupted,        // snapshot unreadable or inconsistent, or an invariant broke mid-tick
        InvalidArgument
    } code{};
    std::string message;
};

[[nodiscard]] const char* ServiceErrorCodeName(ServiceError::Code c) noexcept;

// Seed used when the config leaves it at 0.
[[nodiscard]] core::Seed SeedFromSimulationId(const std::string& id) noexcept;

// max(1, floor(sqrt(numAgents)))
[[nodiscard]] int DefaultBenefactorRegen(int numAgents) noexcept;

// Builds collaborators whose own random streams start from `seed`.
using CollaboratorFactory = std::function<oracle::Collaborators(core::Seed seed)>;

class SimulationService {
public:
    SimulationService(core::Config config, oracle::Collaborators collaborators);

    // With a factory set, collaborators are rebuilt before genesis from
    // derive(seed, 0) and before tick T from derive(seed, T), so each
    // simulation continues its own streams across runs.
    void SetCollaboratorFactory(CollaboratorFactory factory) { m_factory = std::move(factory); }

    // Generates numAgents characters, saves tick 0, then records the
    // simulation in the index. A failed save leaves the index untouched.
    [[nodiscard]] std::expected<std::string, ServiceError> Initialize(int numAgents, const std::string& name);

    // Runs one tick on the latest snapshot and saves it. If the tick throws
    // an invariant violation nothing is written.
    [[nodiscard]] std::expected<sim::TickReport, ServiceError> Tick(const std::string& simulationId);

    [[nodiscard]] std::expected<world::WorldState, ServiceError> Inspect(const std::string& simulationId) const;
    [[nodiscard]] std::expected<std::vector<save::SimulationInfo>, ServiceError> List() const;

    [[nodiscard]] const core::Config& config() const noexcept { return m_config; }
    [[nodiscard]] save::SnapshotStore& store() noexcept { return m_store; }
    [[nodiscard]] oracle::OracleGateway& gateway() noexcept { return m_gateway; }

private:
    [[nodiscard]] std::expected<world::WorldState, ServiceError> LoadLatest(const std::string& simulationId) const;
    void ReseedCollaborators(core::Seed seed);

    core::Config          m_config;
    oracle::OracleGateway m_gateway;
    save::SnapshotStore   m_store;
    CollaboratorFactory   m_factory;
};

} // namespace sparkworld::app

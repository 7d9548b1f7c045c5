#pragma once
// include/sparkworld/world/WorldState.hpp
//
// The whole entity model of one simulation. Owned by the tick orchestrator
// while a tick runs and passed by reference into every component.

#include "sparkworld/core/Rng.hpp"
#include "sparkworld/world/Entities.hpp"
#include "sparkworld/world/VisibilityTables.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sparkworld::world {

// Cumulative counters since genesis.
struct Totals {
    std::int64_t sparksMinted   = 0;
    std::int64_t sparksLost     = 0;   // upkeep burn
    std::int64_t sparksGranted  = 0;
    std::int64_t raidsAttempted = 0;
    std::int64_t bondsFormed    = 0;
    std::int64_t agentsSpawned  = 0;

    friend bool operator==(const Totals&, const Totals&) = default;
};

// Next sequence numbers for generated ids (agent_001, bond_001, mission_001).
struct Serials {
    std::uint32_t nextAgent   = 1;
    std::uint32_t nextBond    = 1;
    std::uint32_t nextMission = 1;

    friend bool operator==(const Serials&, const Serials&) = default;
};

struct WorldState {
    std::string simulationId;
    std::string name;
    Tick        tick = 0;
    std::uint64_t seed = 0;
    core::Pcg32 rng;

    Rules      rules;
    Benefactor benefactor;

    // Ordered maps keep every iteration deterministic (sorted by id).
    std::map<AgentId, Agent>     agents;
    std::map<BondId, Bond>       bonds;
    std::map<MissionId, Mission> missions;

    VisibilityTables visibility;
    Totals  totals;
    Serials serials;

    [[nodiscard]] Agent*         FindAgent(const AgentId& id) noexcept;
    [[nodiscard]] const Agent*   FindAgent(const AgentId& id) const noexcept;
    [[nodiscard]] Bond*          FindBond(const BondId& id) noexcept;
    [[nodiscard]] const Bond*    FindBond(const BondId& id) const noexcept;
    [[nodiscard]] Mission*       FindMission(const MissionId& id) noexcept;
    [[nodiscard]] const Mission* FindMission(const MissionId& id) const noexcept;

    // Live bond containing `agentId`, or nullptr.
    [[nodiscard]] Bond*       BondOf(const AgentId& agentId) noexcept;
    [[nodiscard]] const Bond* BondOf(const AgentId& agentId) const noexcept;

    [[nodiscard]] bool IsAlive(const AgentId& id) const noexcept;

    // Sorted ids of every alive agent.
    [[nodiscard]] std::vector<AgentId> AliveAgentIds() const;

    [[nodiscard]] AgentId   NextAgentId();
    [[nodiscard]] BondId    NextBondId();
    [[nodiscard]] MissionId NextMissionId();

    friend bool operator==(const WorldState&, const WorldState&) = default;
};

} // namespace sparkworld::world

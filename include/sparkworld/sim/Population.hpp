#pragma once
#include "sparkworld/sim/TickContext.hpp"

#include <cstdint>
#include <optional>

namespace sparkworld::sim {

enum class SpawnRefusal : std::uint8_t {
    None = 0,
    ParentMissing,
    ParentVanished,
    NotBonded,
    InsufficientSparks,
};

[[nodiscard]] const char* SpawnRefusalName(SpawnRefusal r) noexcept;

// Adds a new alive, unbonded agent with the next id. Used at genesis and on spawn.
world::Agent& CreateAgent(world::WorldState& w, world::Persona persona, int sparks,
                          std::optional<world::AgentId> parentId = std::nullopt);

// Parent must be alive, bonded and hold at least rules.spawnCost sparks.
[[nodiscard]] SpawnRefusal CanSpawn(const world::WorldState& w, const world::AgentId& parentId) noexcept;

// Charges the parent and creates the child from `persona`. The caller has
// already checked CanSpawn; returns the child id.
world::AgentId ApplySpawn(TickContext& ctx, const world::AgentId& parentId, world::Persona persona);

} // namespace sparkworld::sim

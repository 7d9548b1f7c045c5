#pragma once
#include "sparkworld/sim/TickContext.hpp"

#include <vector>

namespace sparkworld::sim {

// Marks a mission complete at the current tick. No-op if already complete.
void CompleteMission(TickContext& ctx, world::Mission& mission);

// Deletes the bond, resets every member to unbonded with no mates and
// completes its mission. Members keep whatever sparks they hold.
void DissolveBond(TickContext& ctx, const world::BondId& bondId, evt::DissolveReason reason);

// Flags the agent vanished and dissolves its bond in the same call.
// Returns false if it was already vanished.
bool VanishAgent(TickContext& ctx, const world::AgentId& agentId);

// Vanishes every alive agent at <= 0 sparks. Returns the ids vanished.
std::vector<world::AgentId> SweepVanished(TickContext& ctx);

} // namespace sparkworld::sim

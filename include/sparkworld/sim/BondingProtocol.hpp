#pragma once
// include/sparkworld/sim/BondingProtocol.hpp
//
// Turns bond-request / bond-accept actions into bonds.
//
// An accept from B naming A is valid only if the frozen generation (last
// tick) holds a request A -> B and both are alive and unbonded. Valid accepts
// are edges; every connected component of edges becomes ONE bond (clique
// closure), led by its smallest agent id. The consumed requests are removed.
//
// This tick's requests are queued into the current generation so their
// targets see them next tick. Requests touching an agent that just joined a
// bond are dropped: the first valid clique wins.

#include "sparkworld/sim/TickContext.hpp"

#include <vector>

namespace sparkworld::sim {

struct BondingResult {
    std::vector<world::BondId> formed;
    int requestsQueued = 0;
    int acceptsHonoured = 0;
};

BondingResult ResolveBonding(TickContext& ctx, const std::vector<world::Action>& actions);

// Shared validation for any action that names another agent.
// Returns the reason the target is unusable, or an empty string.
[[nodiscard]] std::string ValidateTarget(const world::WorldState& w, const world::Action& action);

// Logs and reports a dropped action.
void DropAction(TickContext& ctx, const world::Action& action, std::string reason);

} // namespace sparkworld::sim

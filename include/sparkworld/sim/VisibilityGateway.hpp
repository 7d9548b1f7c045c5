#pragma once
// include/sparkworld/sim/VisibilityGateway.hpp
//
// Builds what one agent may see when deciding in the current tick. Inbox,
// events and news come exclusively from the frozen generation; the only
// same-tick input is the benefactor's answers to last tick's requests.

#include "sparkworld/oracle/Observation.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <vector>

namespace sparkworld::sim {

[[nodiscard]] oracle::Observation BuildObservation(const world::WorldState& w,
                                                   const world::AgentId& agentId,
                                                   const std::vector<world::GrantOutcome>& grantsThisTick);

// Intents the agent can currently use, in enum order.
[[nodiscard]] std::vector<world::Intent> AvailableActions(const world::WorldState& w, const world::Agent& a);

} // namespace sparkworld::sim

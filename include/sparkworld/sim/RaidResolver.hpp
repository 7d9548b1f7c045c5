#pragma once
#include "sparkworld/sim/TickContext.hpp"

#include <optional>

namespace sparkworld::sim {

// Strength is age + current sparks.
[[nodiscard]] int RaidStrength(const world::Agent& a) noexcept;

// attacker / (attacker + defender); 0.5 when both are zero.
[[nodiscard]] double RaidSuccessProbability(int attackerStrength, int defenderStrength) noexcept;

// Resolves one raid action as a weighted coin flip on the world rng.
//  - invalid target: dropped, returns nullopt
//  - attacker with 0 sparks: InsufficientStake record, no transfer
//  - win: steal uniform [1, 5] capped at the defender's balance
//  - loss: defender takes 1 spark from the attacker
std::optional<world::RaidResult> ResolveRaid(TickContext& ctx, const world::Action& action);

} // namespace sparkworld::sim

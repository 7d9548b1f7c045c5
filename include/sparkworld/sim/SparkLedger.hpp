#pragma once
// include/sparkworld/sim/SparkLedger.hpp
//
// All spark creation and destruction of a tick, in a fixed order:
//   upkeep -> vanish -> bond minting -> benefactor grants (+ regeneration)
// Every unit moved is posted as a LedgerPosted event.

#include "sparkworld/oracle/Oracles.hpp"
#include "sparkworld/sim/TickContext.hpp"

#include <vector>

namespace sparkworld::sim {

struct UpkeepResult {
    int burned = 0;
    std::vector<world::AgentId> vanished;
};

// Every alive agent pays 1 spark and ages by 1. Agents at <= 0 vanish here,
// before minting, so they never receive this tick's bond income.
UpkeepResult ApplyUpkeep(TickContext& ctx);

// Each live bond mints exactly |members| sparks; each unit goes to a member
// picked uniformly with replacement. Returns the total minted.
int MintAndDistribute(TickContext& ctx);

// Pays the benefactor's decisions against `requests` (last tick's queue),
// clamped to [0, kMaxGrantPerRequest] and to the remaining balance, then
// regenerates the pool. One outcome per request, in request order.
std::vector<world::GrantOutcome> ApplyGrants(TickContext& ctx,
                                             const std::vector<world::Action>& requests,
                                             const std::vector<oracle::GrantDecision>& decisions);

// Largest grant the ledger will honour right now.
[[nodiscard]] int ClampGrant(int requested, int balance) noexcept;

} // namespace sparkworld::sim

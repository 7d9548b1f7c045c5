#include "sparkworld/world/Records.hpp"

namespace sparkworld::world {

const char* LedgerReasonName(LedgerReason r) noexcept
{
    switch (r)
    {
    case LedgerReason::Upkeep:         return "upkeep";
    case LedgerReason::BondMint:       return "bond-mint";
    case LedgerReason::Grant:          return "grant";
    case LedgerReason::RaidWin:        return "raid-win";
    case LedgerReason::RaidLoss:       return "raid-loss";
    case LedgerReason::SpawnCost:      return "spawn-cost";
    case LedgerReason::SpawnEndowment: return "spawn-endowment";
    default:                           return "unknown";
    }
}

std::optional<LedgerReason> LedgerReasonFromName(std::string_view name) noexcept
{
    for (auto r : {LedgerReason::Upkeep, LedgerReason::BondMint, LedgerReason::Grant,
                   LedgerReason::RaidWin, LedgerReason::RaidLoss, LedgerReason::SpawnCost,
                   LedgerReason::SpawnEndowment})
    {
        if (name == LedgerReasonName(r))
            return r;
    }
    return std::nullopt;
}

const char* RaidOutcomeName(RaidOutcome o) noexcept
{
    switch (o)
    {
    case RaidOutcome::Won:               return "won";
    case RaidOutcome::Lost:              return "lost";
    case RaidOutcome::InsufficientStake: return "insufficient-stake";
    default:                             return "unknown";
    }
}

} // namespace sparkworld::world

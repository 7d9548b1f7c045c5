#include "sparkworld/sim/RaidResolver.hpp"

#include "sparkworld/sim/BondingProtocol.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sparkworld::sim {

using namespace sparkworld::world;

int RaidStrength(const Agent& a) noexcept
{
    return a.age + a.sparks;
}

double RaidSuccessProbability(int attackerStrength, int defenderStrength) noexcept
{
    const int total = attackerStrength + defenderStrength;
    if (total <= 0)
        return 0.5;
    return static_cast<double>(attackerStrength) / static_cast<double>(total);
}

std::optional<RaidResult> ResolveRaid(TickContext& ctx, const Action& action)
{
    if (auto why = ValidateTarget(ctx.world, action); !why.empty())
    {
        DropAction(ctx, action, std::move(why));
        return std::nullopt;
    }

    Agent* attacker = ctx.world.FindAgent(action.agentId);
    Agent& defender = ctx.world.agents.at(*action.target);
    if (attacker == nullptr || !attacker->alive())
    {
        DropAction(ctx, action, "attacker has vanished");
        return std::nullopt;
    }

    RaidResult r;
    r.attackerId = attacker->id;
    r.defenderId = defender.id;
    r.attackerStrength = RaidStrength(*attacker);
    r.defenderStrength = RaidStrength(defender);
    r.successProbability = RaidSuccessProbability(r.attackerStrength, r.defenderStrength);
    r.tick = ctx.tick();

    // A raid with nothing at stake is reported but not counted as attempted.
    if (attacker->sparks < 1)
    {
        r.outcome = RaidOutcome::InsufficientStake;
        spdlog::info("Raid {} -> {} failed: nothing to stake", r.attackerId, r.defenderId);
    }
    else
    {
        ctx.world.totals.raidsAttempted += 1;
        if (ctx.world.rng.next_double01() < r.successProbability)
        {
            const int roll = ctx.world.rng.range_int(kRaidStealMin, kRaidStealMax);
            const int stolen = std::min(roll, defender.sparks);
            defender.sparks -= stolen;
            attacker->sparks += stolen;
            r.outcome = RaidOutcome::Won;
            r.sparksTransferred = stolen;
            if (stolen > 0)
                ctx.Post(defender.id, attacker->id, stolen, LedgerReason::RaidWin);
        }
        else
        {
            const int penalty = std::min(kRaidFailurePenalty, attacker->sparks);
            attacker->sparks -= penalty;
            defender.sparks += penalty;
            r.outcome = RaidOutcome::Lost;
            r.sparksTransferred = -penalty;
            ctx.Post(attacker->id, defender.id, penalty, LedgerReason::RaidLoss);
        }
    }

    ctx.world.visibility.Notify(r.attackerId, AgentEvent{
        EventKind::RaidAttack, r.defenderId, r.sparksTransferred, RaidOutcomeName(r.outcome), r.tick });
    ctx.world.visibility.Notify(r.defenderId, AgentEvent{
        EventKind::RaidDefense, r.attackerId, -r.sparksTransferred, RaidOutcomeName(r.outcome), r.tick });

    spdlog::debug("Raid {} ({}) -> {} ({}): p={:.3f} {} {:+d}",
                  r.attackerId, r.attackerStrength, r.defenderId, r.defenderStrength,
                  r.successProbability, RaidOutcomeName(r.outcome), r.sparksTransferred);

    ctx.Emit(evt::RaidResolved{ r });
    return r;
}

} // namespace sparkworld::sim

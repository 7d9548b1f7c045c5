#include "sparkworld/sim/SparkLedger.hpp"

#include "sparkworld/sim/Dissolution.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

namespace sparkworld::sim {

using namespace sparkworld::world;

UpkeepResult ApplyUpkeep(TickContext& ctx)
{
    UpkeepResult result;
    std::vector<AgentId> dying;

    for (const auto& id : ctx.world.AliveAgentIds())
    {
        Agent& a = ctx.world.agents.at(id);
        a.sparks -= kUpkeepPerTick;
        a.age += 1;
        result.burned += kUpkeepPerTick;
        ctx.Post(id, kVoidAccount, kUpkeepPerTick, LedgerReason::Upkeep);

        if (a.sparks <= 0)
            dying.push_back(id);
    }

    for (const auto& id : dying)
    {
        Agent& a = ctx.world.agents.at(id);
        a.sparks = std::max(a.sparks, 0);
        if (VanishAgent(ctx, id))
            result.vanished.push_back(id);
    }

    spdlog::debug("Upkeep: burned {} spark(s), {} agent(s) vanished", result.burned, result.vanished.size());
    return result;
}

int MintAndDistribute(TickContext& ctx)
{
    int minted = 0;
    for (auto& [bondId, bond] : ctx.world.bonds)
    {
        const std::vector<AgentId> members(bond.members.begin(), bond.members.end());
        const auto n = static_cast<std::uint32_t>(members.size());

        bond.sparksGeneratedThisTick = 0;
        for (std::uint32_t unit = 0; unit < n; ++unit)
        {
            const AgentId& winner = members[ctx.world.rng.next_bounded(n)];
            ctx.world.agents.at(winner).sparks += 1;
            bond.sparksGeneratedThisTick += 1;
            ctx.Post(bondId, winner, 1, LedgerReason::BondMint);
        }
        minted += bond.sparksGeneratedThisTick;
    }
    return minted;
}

int ClampGrant(int requested, int balance) noexcept
{
    return std::clamp(requested, 0, std::min(kMaxGrantPerRequest, std::max(balance, 0)));
}

std::vector<GrantOutcome> ApplyGrants(TickContext& ctx,
                                      const std::vector<Action>& requests,
                                      const std::vector<oracle::GrantDecision>& decisions)
{
    // First decision per requester wins; decisions for agents that did not ask are ignored.
    std::map<AgentId, const oracle::GrantDecision*> byAgent;
    for (const auto& d : decisions)
        byAgent.emplace(d.agentId, &d);

    std::vector<GrantOutcome> outcomes;
    std::set<AgentId> served;
    Benefactor& bob = ctx.world.benefactor;

    for (const auto& req : requests)
    {
        GrantOutcome o;
        o.agentId = req.agentId;
        o.requestContent = req.content;
        o.tick = ctx.tick();

        const auto it = byAgent.find(req.agentId);
        const bool duplicate = !served.insert(req.agentId).second;
        if (it != byAgent.end() && !duplicate)
        {
            o.decided = it->second->amount;
            o.reasoning = it->second->reasoning;
        }
        else
        {
            o.reasoning = duplicate ? "duplicate request" : "no answer from the benefactor";
        }

        Agent* a = ctx.world.FindAgent(req.agentId);
        if (a == nullptr || !a->alive())
        {
            o.reasoning = "requester is gone";
        }
        else
        {
            o.granted = ClampGrant(o.decided, bob.balance);
            if (o.granted != o.decided)
                spdlog::debug("Grant to {} clamped from {} to {}", req.agentId, o.decided, o.granted);
            if (o.granted > 0)
            {
                bob.balance -= o.granted;
                a->sparks += o.granted;
                ctx.world.totals.sparksGranted += o.granted;
                ctx.Post(kBenefactorAccount, req.agentId, o.granted, LedgerReason::Grant);
            }
        }

        o.balanceAfter = bob.balance;
        ctx.Emit(evt::GrantIssued{ o });
        outcomes.push_back(std::move(o));
    }

    bob.balance += bob.regenPerTick;
    return outcomes;
}

} // namespace sparkworld::sim

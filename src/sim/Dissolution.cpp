#include "sparkworld/sim/Dissolution.hpp"

#include <spdlog/spdlog.h>

namespace sparkworld::sim {

using namespace sparkworld::world;

void CompleteMission(TickContext& ctx, Mission& mission)
{
    if (mission.isComplete)
        return;

    mission.isComplete = true;
    mission.completedTick = ctx.tick();
    ctx.Emit(evt::MissionCompleted{ mission.id, mission.bondId, ctx.tick() });
}

void DissolveBond(TickContext& ctx, const BondId& bondId, evt::DissolveReason reason)
{
    auto it = ctx.world.bonds.find(bondId);
    if (it == ctx.world.bonds.end())
        return;

    Bond bond = std::move(it->second);
    ctx.world.bonds.erase(it);

    for (const auto& memberId : bond.members)
    {
        if (Agent* a = ctx.world.FindAgent(memberId))
        {
            a->bondMates.clear();
            a->bondStatus = BondStatus::Unbonded;
            if (a->alive())
            {
                ctx.world.visibility.Notify(memberId, AgentEvent{
                    EventKind::BondDissolved, std::nullopt, 0,
                    fmt::format("{} ({})", bond.id, evt::DissolveReasonName(reason)), ctx.tick() });
            }
        }
    }

    if (bond.missionId)
    {
        if (Mission* m = ctx.world.FindMission(*bond.missionId))
            CompleteMission(ctx, *m);
    }

    spdlog::info("Bond {} dissolved ({}), {} member(s) released",
                 bond.id, evt::DissolveReasonName(reason), bond.members.size());

    ctx.Emit(evt::BondDissolved{ bond.id,
                                 std::vector<AgentId>(bond.members.begin(), bond.members.end()),
                                 reason, ctx.tick() });
}

bool VanishAgent(TickContext& ctx, const AgentId& agentId)
{
    Agent* a = ctx.world.FindAgent(agentId);
    if (a == nullptr || !a->alive())
        return false;

    a->status = AgentStatus::Vanished;
    a->vanishedTick = ctx.tick();
    spdlog::info("Agent {} ({}) vanished at tick {}", a->id, a->persona.name, ctx.tick());

    if (const Bond* b = ctx.world.BondOf(agentId))
    {
        const BondId bondId = b->id;
        DissolveBond(ctx, bondId, evt::DissolveReason::MemberVanished);
    }

    ctx.Emit(evt::AgentVanished{ agentId, ctx.tick() });
    return true;
}

std::vector<AgentId> SweepVanished(TickContext& ctx)
{
    std::vector<AgentId> gone;
    for (const auto& id : ctx.world.AliveAgentIds())
    {
        const Agent* a = ctx.world.FindAgent(id);
        if (a != nullptr && a->sparks <= 0 && VanishAgent(ctx, id))
            gone.push_back(id);
    }
    return gone;
}

} // namespace sparkworld::sim

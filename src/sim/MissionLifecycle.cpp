#include "sparkworld/sim/MissionLifecycle.hpp"

#include "sparkworld/sim/Dissolution.hpp"

#include <spdlog/spdlog.h>

namespace sparkworld::sim {

using namespace sparkworld::world;

std::optional<MissionId> CreateMission(TickContext& ctx, const BondId& bondId, const oracle::MissionContent& content)
{
    WorldState& w = ctx.world;
    Bond* bond = w.FindBond(bondId);
    if (bond == nullptr)
    {
        spdlog::warn("CreateMission: bond {} no longer exists", bondId);
        return std::nullopt;
    }
    if (bond->missionId)
    {
        spdlog::warn("CreateMission: bond {} already runs {}", bondId, *bond->missionId);
        return std::nullopt;
    }

    Mission m;
    m.id = w.NextMissionId();
    m.bondId = bondId;
    m.title = content.title;
    m.description = content.description;
    m.goal = content.goal;
    m.leaderId = bond->leaderId;
    m.createdTick = ctx.tick();

    bond->missionId = m.id;
    for (const auto& memberId : bond->members)
        w.visibility.Notify(memberId, AgentEvent{ EventKind::MissionAssigned, bond->leaderId, 0, m.title, ctx.tick() });

    spdlog::info("Mission {} '{}' created for bond {}", m.id, m.title, bondId);
    ctx.Emit(evt::MissionCreated{ m.id, bondId, m.title, ctx.tick() });

    const MissionId id = m.id;
    w.missions.emplace(id, std::move(m));
    return id;
}

bool ApplyMeeting(TickContext& ctx, const MissionId& missionId, const oracle::MeetingOutcome& outcome)
{
    Mission* m = ctx.world.FindMission(missionId);
    if (m == nullptr || m->isComplete)
        return false;
    const Bond* bond = ctx.world.FindBond(m->bondId);
    if (bond == nullptr)
        return false;

    std::map<AgentId, std::string> tasks;
    for (const auto& [agentId, task] : outcome.assignments)
    {
        if (bond->members.contains(agentId))
            tasks.emplace(agentId, task);
        else
            spdlog::debug("Meeting for {}: ignoring task for non-member {}", missionId, agentId);
    }
    if (!tasks.empty())
        m->assignedTasks = std::move(tasks);

    evt::MeetingHeld held;
    held.transcript.reserve(outcome.transcript.size());
    for (const auto& line : outcome.transcript)
        held.transcript.push_back(evt::MeetingMessage{ missionId, line.senderId, line.kind, line.content, ctx.tick() });
    ctx.Emit(std::move(held));
    return true;
}

bool ApplyProgress(TickContext& ctx, const MissionId& missionId, const oracle::ProgressEvaluation& eval)
{
    Mission* m = ctx.world.FindMission(missionId);
    if (m == nullptr || m->isComplete)
        return false;

    if (!eval.progressSummary.empty())
    {
        m->progress = eval.progressSummary;
        ctx.Emit(evt::MissionProgressed{ missionId, m->progress, ctx.tick() });
    }

    if (eval.isComplete)
    {
        spdlog::info("Mission {} judged complete", missionId);
        const BondId bondId = m->bondId;
        if (ctx.world.FindBond(bondId) != nullptr)
            DissolveBond(ctx, bondId, evt::DissolveReason::MissionComplete);
        else
            CompleteMission(ctx, *m);
    }
    return true;
}

std::vector<MissionId> ActiveMissions(const WorldState& w)
{
    std::vector<MissionId> out;
    for (const auto& [id, m] : w.missions)
    {
        if (!m.isComplete && w.FindBond(m.bondId) != nullptr)
            out.push_back(id);
    }
    return out;
}

std::vector<oracle::MemberProfile> MemberProfiles(const WorldState& w, const Bond& bond)
{
    std::vector<oracle::MemberProfile> out;
    out.reserve(bond.members.size());
    for (const auto& id : bond.members)
    {
        if (const Agent* a = w.FindAgent(id))
            out.push_back(oracle::MemberProfile{ a->id, a->persona, a->sparks, id == bond.leaderId });
    }
    return out;
}

} // namespace sparkworld::sim

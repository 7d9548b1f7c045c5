#include "sparkworld/world/Invariants.hpp"

#include <spdlog/fmt/fmt.h>

#include <map>

namespace sparkworld::world {

std::vector<std::string> FindInvariantViolations(const WorldState& w)
{
    std::vector<std::string> out;
    auto fail = [&out](std::string msg) { out.push_back(std::move(msg)); };

    if (w.benefactor.balance < 0)
        fail(fmt::format("benefactor balance is negative ({})", w.benefactor.balance));

    // ---- bonds --------------------------------------------------------------
    std::map<AgentId, int> membership;
    for (const auto& [id, bond] : w.bonds)
    {
        if (bond.id != id)
            fail(fmt::format("bond keyed {} carries id {}", id, bond.id));
        if (bond.members.size() < 2)
            fail(fmt::format("bond {} has {} member(s)", id, bond.members.size()));
        if (!bond.members.contains(bond.leaderId))
            fail(fmt::format("bond {} leader {} is not a member", id, bond.leaderId));

        for (const auto& memberId : bond.members)
        {
            ++membership[memberId];
            const Agent* a = w.FindAgent(memberId);
            if (a == nullptr)
            {
                fail(fmt::format("bond {} references unknown agent {}", id, memberId));
                continue;
            }
            if (!a->alive())
                fail(fmt::format("bond {} still holds vanished agent {}", id, memberId));

            const BondStatus expected = memberId == bond.leaderId ? BondStatus::Leader : BondStatus::Bonded;
            if (a->bondStatus != expected)
                fail(fmt::format("agent {} in bond {} is marked {}", memberId, id, BondStatusName(a->bondStatus)));

            std::set<AgentId> mates = bond.members;
            mates.erase(memberId);
            if (a->bondMates != mates)
                fail(fmt::format("agent {} bond-mates do not match bond {}", memberId, id));
        }

        if (bond.missionId)
        {
            const Mission* m = w.FindMission(*bond.missionId);
            if (m == nullptr)
                fail(fmt::format("bond {} references unknown mission {}", id, *bond.missionId));
            else if (m->bondId != id)
                fail(fmt::format("bond {} and mission {} disagree on ownership", id, m->id));
            else if (m->isComplete)
                fail(fmt::format("bond {} still points at completed mission {}", id, m->id));
        }
    }

    // ---- agents -------------------------------------------------------------
    for (const auto& [id, agent] : w.agents)
    {
        if (agent.id != id)
            fail(fmt::format("agent keyed {} carries id {}", id, agent.id));

        const auto it = membership.find(id);
        const int bonds = it == membership.end() ? 0 : it->second;
        if (bonds > 1)
            fail(fmt::format("agent {} is a member of {} bonds", id, bonds));

        if (agent.alive())
        {
            if (agent.sparks <= 0)
                fail(fmt::format("alive agent {} holds {} sparks", id, agent.sparks));
            if (agent.bonded() && bonds == 0)
                fail(fmt::format("agent {} is marked {} but belongs to no bond", id, BondStatusName(agent.bondStatus)));
        }
        else
        {
            if (agent.bonded() || !agent.bondMates.empty())
                fail(fmt::format("vanished agent {} still has bond state", id));
        }

        if (!agent.bonded() && !agent.bondMates.empty())
            fail(fmt::format("unbonded agent {} has bond-mates", id));
        if (agent.sparks < 0)
            fail(fmt::format("agent {} has a negative balance ({})", id, agent.sparks));
    }

    // ---- missions -----------------------------------------------------------
    std::map<BondId, int> missionsPerBond;
    for (const auto& [id, mission] : w.missions)
    {
        if (mission.isComplete)
            continue;

        const Bond* b = w.FindBond(mission.bondId);
        if (b == nullptr)
            fail(fmt::format("in-progress mission {} references missing bond {}", id, mission.bondId));
        else if (!b->missionId || *b->missionId != id)
            fail(fmt::format("in-progress mission {} is not linked from bond {}", id, mission.bondId));

        if (++missionsPerBond[mission.bondId] > 1)
            fail(fmt::format("bond {} has more than one in-progress mission", mission.bondId));
    }

    return out;
}

void CheckInvariants(const WorldState& w)
{
    const auto problems = FindInvariantViolations(w);
    if (problems.empty())
        return;

    std::string msg = fmt::format("world {} tick {}: {} invariant violation(s)", w.simulationId, w.tick, problems.size());
    for (const auto& p : problems)
    {
        msg += "\n  - ";
        msg += p;
    }
    throw InvariantViolation(msg);
}

} // namespace sparkworld::world

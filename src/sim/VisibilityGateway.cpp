#include "sparkworld/sim/VisibilityGateway.hpp"

#include "sparkworld/sim/Population.hpp"

namespace sparkworld::sim {

using namespace sparkworld::world;

std::vector<Intent> AvailableActions(const WorldState& w, const Agent& a)
{
    std::vector<Intent> out{ Intent::Idle };
    if (!a.bonded())
    {
        out.push_back(Intent::BondRequest);
        out.push_back(Intent::BondAccept);
    }
    out.push_back(Intent::Raid);
    if (CanSpawn(w, a.id) == SpawnRefusal::None)
        out.push_back(Intent::Spawn);
    out.push_back(Intent::RequestGrant);
    out.push_back(Intent::Message);
    return out;
}

oracle::Observation BuildObservation(const WorldState& w, const AgentId& agentId,
                                     const std::vector<GrantOutcome>& grantsThisTick)
{
    const Agent& me = w.agents.at(agentId);
    const VisibilityGeneration& seen = w.visibility.frozen();

    oracle::Observation obs;
    obs.tick = w.tick;

    obs.self.id = me.id;
    obs.self.persona = me.persona;
    obs.self.sparks = me.sparks;
    obs.self.age = me.age;
    obs.self.bondStatus = me.bondStatus;
    obs.self.bondMates.assign(me.bondMates.begin(), me.bondMates.end());
    if (const Bond* b = w.BondOf(agentId))
        obs.self.bondId = b->id;

    if (auto it = seen.events.find(agentId); it != seen.events.end())
        obs.eventsSinceLast = it->second;

    auto addressedToMe = [&](const Action& a) { return a.target && *a.target == agentId; };
    for (const auto& a : seen.bondRequests)
        if (addressedToMe(a)) obs.inbox.push_back(a);
    for (const auto& a : seen.messages)
        if (addressedToMe(a)) obs.inbox.push_back(a);

    for (const auto& g : grantsThisTick)
        if (g.agentId == agentId) obs.grants.push_back(g);

    obs.news = seen.news;

    for (const auto& [id, other] : w.agents)
    {
        if (id == agentId || !other.alive())
            continue;
        obs.others.push_back(oracle::PublicAgentInfo{ id, other.persona.name, other.persona.species,
                                                      other.sparks, other.age, other.bondStatus });
    }

    if (const Bond* b = w.BondOf(agentId); b != nullptr && b->missionId)
    {
        if (const Mission* m = w.FindMission(*b->missionId))
        {
            oracle::MissionStatus ms{ m->id, m->title, m->description, m->goal, m->leaderId, m->progress, std::nullopt };
            if (auto t = m->assignedTasks.find(agentId); t != m->assignedTasks.end())
                ms.myTask = t->second;
            obs.mission = std::move(ms);
        }
    }

    obs.benefactorBalance = w.benefactor.balance;
    obs.availableActions = AvailableActions(w, me);
    obs.rules.spawnCost = w.rules.spawnCost;
    obs.rules.spawnChildSparks = w.rules.spawnChildSparks;
    return obs;
}

} // namespace sparkworld::sim

#include "sparkworld/world/WorldState.hpp"

#include <spdlog/fmt/fmt.h>

namespace sparkworld::world {

namespace {

std::string MakeId(const char* prefix, std::uint32_t serial)
{
    return fmt::format("{}_{:03d}", prefix, serial);
}

template <class Map>
auto* FindIn(Map& m, const typename Map::key_type& key) noexcept
{
    auto it = m.find(key);
    return it == m.end() ? nullptr : &it->second;
}

} // namespace

Agent* WorldState::FindAgent(const AgentId& id) noexcept { return FindIn(agents, id); }
const Agent* WorldState::FindAgent(const AgentId& id) const noexcept { return FindIn(agents, id); }
Bond* WorldState::FindBond(const BondId& id) noexcept { return FindIn(bonds, id); }
const Bond* WorldState::FindBond(const BondId& id) const noexcept { return FindIn(bonds, id); }
Mission* WorldState::FindMission(const MissionId& id) noexcept { return FindIn(missions, id); }
const Mission* WorldState::FindMission(const MissionId& id) const noexcept { return FindIn(missions, id); }

Bond* WorldState::BondOf(const AgentId& agentId) noexcept
{
    for (auto& [id, bond] : bonds)
    {
        if (bond.members.contains(agentId))
            return &bond;
    }
    return nullptr;
}

const Bond* WorldState::BondOf(const AgentId& agentId) const noexcept
{
    for (const auto& [id, bond] : bonds)
    {
        if (bond.members.contains(agentId))
            return &bond;
    }
    return nullptr;
}

bool WorldState::IsAlive(const AgentId& id) const noexcept
{
    const Agent* a = FindAgent(id);
    return a != nullptr && a->alive();
}

std::vector<AgentId> WorldState::AliveAgentIds() const
{
    std::vector<AgentId> out;
    out.reserve(agents.size());
    for (const auto& [id, agent] : agents)
    {
        if (agent.alive())
            out.push_back(id);
    }
    return out;
}

AgentId WorldState::NextAgentId() { return MakeId("agent", serials.nextAgent++); }
BondId WorldState::NextBondId() { return MakeId("bond", serials.nextBond++); }
MissionId WorldState::NextMissionId() { return MakeId("mission", serials.nextMission++); }

} // namespace sparkworld::world

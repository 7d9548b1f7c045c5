#include "sparkworld/world/VisibilityTables.hpp"

#include <algorithm>
#include <utility>

namespace sparkworld::world {

const char* EventKindName(EventKind k) noexcept
{
    switch (k)
    {
    case EventKind::RaidAttack:      return "raid-attack";
    case EventKind::RaidDefense:     return "raid-defense";
    case EventKind::BondFormed:      return "bond-formed";
    case EventKind::BondDissolved:   return "bond-dissolved";
    case EventKind::SpawnedChild:    return "spawned-child";
    case EventKind::MissionAssigned: return "mission-assigned";
    default:                         return "unknown";
    }
}

std::optional<EventKind> EventKindFromName(std::string_view name) noexcept
{
    for (auto k : {EventKind::RaidAttack, EventKind::RaidDefense, EventKind::BondFormed,
                   EventKind::BondDissolved, EventKind::SpawnedChild, EventKind::MissionAssigned})
    {
        if (name == EventKindName(k))
            return k;
    }
    return std::nullopt;
}

bool VisibilityGeneration::empty() const noexcept
{
    return bondRequests.empty() && messages.empty() && grantRequests.empty()
        && resolvedActions.empty() && events.empty();
}

void VisibilityTables::Swap(Tick producedTick)
{
    m_current.tick = producedTick;
    m_frozen = std::exchange(m_current, VisibilityGeneration{});
}

const Action* VisibilityTables::FindFrozenBondRequest(const AgentId& from, const AgentId& to) const noexcept
{
    const auto it = std::find_if(m_frozen.bondRequests.begin(), m_frozen.bondRequests.end(),
        [&](const Action& a) { return a.agentId == from && a.target && *a.target == to; });
    return it == m_frozen.bondRequests.end() ? nullptr : &*it;
}

bool VisibilityTables::ConsumeBondRequest(const AgentId& from, const AgentId& to)
{
    auto& reqs = m_frozen.bondRequests;
    const auto before = reqs.size();
    std::erase_if(reqs, [&](const Action& a) { return a.agentId == from && a.target && *a.target == to; });
    return reqs.size() != before;
}

void VisibilityTables::Notify(const AgentId& agentId, AgentEvent event)
{
    m_current.events[agentId].push_back(std::move(event));
}

} // namespace sparkworld::world

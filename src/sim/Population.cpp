#include "sparkworld/sim/Population.hpp"

#include <spdlog/spdlog.h>

namespace sparkworld::sim {

using namespace sparkworld::world;

const char* SpawnRefusalName(SpawnRefusal r) noexcept
{
    switch (r)
    {
    case SpawnRefusal::None:               return "none";
    case SpawnRefusal::ParentMissing:      return "unknown parent";
    case SpawnRefusal::ParentVanished:     return "parent has vanished";
    case SpawnRefusal::NotBonded:          return "spawning requires a bond";
    case SpawnRefusal::InsufficientSparks: return "not enough sparks to spawn";
    default:                               return "unknown";
    }
}

Agent& CreateAgent(WorldState& w, Persona persona, int sparks, std::optional<AgentId> parentId)
{
    Agent a;
    a.id = w.NextAgentId();
    a.persona = std::move(persona);
    a.sparks = sparks;
    a.createdTick = w.tick;
    a.parentId = std::move(parentId);

    const AgentId id = a.id;
    return w.agents.emplace(id, std::move(a)).first->second;
}

SpawnRefusal CanSpawn(const WorldState& w, const AgentId& parentId) noexcept
{
    const Agent* p = w.FindAgent(parentId);
    if (p == nullptr)       return SpawnRefusal::ParentMissing;
    if (!p->alive())        return SpawnRefusal::ParentVanished;
    if (!p->bonded())       return SpawnRefusal::NotBonded;
    if (p->sparks < w.rules.spawnCost) return SpawnRefusal::InsufficientSparks;
    return SpawnRefusal::None;
}

AgentId ApplySpawn(TickContext& ctx, const AgentId& parentId, Persona persona)
{
    WorldState& w = ctx.world;
    Agent& parent = w.agents.at(parentId);
    parent.sparks -= w.rules.spawnCost;
    ctx.Post(parentId, kVoidAccount, w.rules.spawnCost, LedgerReason::SpawnCost);

    Agent& child = CreateAgent(w, std::move(persona), w.rules.spawnChildSparks, parentId);
    ctx.Post(kVoidAccount, child.id, w.rules.spawnChildSparks, LedgerReason::SpawnEndowment);

    w.totals.agentsSpawned += 1;
    w.visibility.Notify(parentId, AgentEvent{ EventKind::SpawnedChild, child.id, -w.rules.spawnCost,
                                              child.persona.name, ctx.tick() });

    spdlog::info("Agent {} spawned {} ({})", parentId, child.id, child.persona.name);
    ctx.Emit(evt::AgentSpawned{ child.id, parentId, ctx.tick() });
    return child.id;
}

} // namespace sparkworld::sim

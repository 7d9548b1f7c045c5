#include "sparkworld/sim/BondingProtocol.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <set>
#include <utility>

namespace sparkworld::sim {

using namespace sparkworld::world;

namespace {

// Union-find over agent ids; std::map keeps component order deterministic.
class Components {
public:
    void Join(const AgentId& a, const AgentId& b)
    {
        const AgentId ra = Find(a);
        const AgentId rb = Find(b);
        if (ra == rb) return;
        // Smaller id becomes the root.
        if (ra < rb) m_parent[rb] = ra;
        else         m_parent[ra] = rb;
    }

    AgentId Find(const AgentId& a)
    {
        auto it = m_parent.find(a);
        if (it == m_parent.end())
        {
            m_parent.emplace(a, a);
            return a;
        }
        if (it->second == a)
            return a;
        AgentId root = Find(it->second);
        m_parent[a] = root;
        return root;
    }

    std::map<AgentId, std::set<AgentId>> Groups()
    {
        std::map<AgentId, std::set<AgentId>> out;
        std::vector<AgentId> keys;
        keys.reserve(m_parent.size());
        for (const auto& [k, v] : m_parent) keys.push_back(k);
        for (const auto& k : keys) out[Find(k)].insert(k);
        return out;
    }

private:
    std::map<AgentId, AgentId> m_parent;
};

void FormBond(TickContext& ctx, const std::set<AgentId>& members, BondingResult& result)
{
    WorldState& w = ctx.world;

    Bond bond;
    bond.id = w.NextBondId();
    bond.members = members;
    bond.leaderId = *members.begin();
    bond.createdTick = ctx.tick();

    for (const auto& id : members)
    {
        Agent& a = w.agents.at(id);
        a.bondStatus = id == bond.leaderId ? BondStatus::Leader : BondStatus::Bonded;
        a.bondMates = members;
        a.bondMates.erase(id);
        w.visibility.Notify(id, AgentEvent{ EventKind::BondFormed, bond.leaderId, 0, bond.id, ctx.tick() });
    }

    spdlog::info("Bond {} formed with {} member(s), leader {}", bond.id, members.size(), bond.leaderId);
    ctx.Emit(evt::BondFormed{ bond.id, std::vector<AgentId>(members.begin(), members.end()), bond.leaderId, ctx.tick() });

    w.totals.bondsFormed += 1;
    result.formed.push_back(bond.id);
    const BondId id = bond.id;
    w.bonds.emplace(id, std::move(bond));
}

} // namespace

std::string ValidateTarget(const WorldState& w, const Action& action)
{
    if (!action.target || action.target->empty())
        return "missing target";
    if (*action.target == action.agentId)
        return "self-targeting";
    const Agent* t = w.FindAgent(*action.target);
    if (t == nullptr)
        return "unknown target " + *action.target;
    if (!t->alive())
        return "target " + *action.target + " has vanished";
    return {};
}

void DropAction(TickContext& ctx, const Action& action, std::string reason)
{
    spdlog::warn("Dropped {} from {} at tick {}: {}", IntentName(action.intent), action.agentId, ctx.tick(), reason);
    ctx.Emit(evt::ActionDropped{ DroppedAction{ action, std::move(reason) } });
}

BondingResult ResolveBonding(TickContext& ctx, const std::vector<Action>& actions)
{
    WorldState& w = ctx.world;
    BondingResult result;

    // ---- accepts: edges backed by a frozen request ---------------------------
    Components comps;
    std::vector<std::pair<AgentId, AgentId>> consumed; // (requester, accepter)

    for (const auto& act : actions)
    {
        if (act.intent != Intent::BondAccept)
            continue;

        if (auto why = ValidateTarget(w, act); !why.empty())
        {
            DropAction(ctx, act, std::move(why));
            continue;
        }

        const AgentId& requester = *act.target;
        if (w.visibility.FindFrozenBondRequest(requester, act.agentId) == nullptr)
        {
            DropAction(ctx, act, "no pending request from " + requester);
            continue;
        }

        const Agent* accepter = w.FindAgent(act.agentId);
        const Agent* other = w.FindAgent(requester);
        if (accepter == nullptr || !accepter->alive())
        {
            DropAction(ctx, act, "accepter has vanished");
            continue;
        }
        if (accepter->bonded() || other->bonded())
        {
            DropAction(ctx, act, "already bonded");
            continue;
        }

        comps.Join(requester, act.agentId);
        consumed.emplace_back(requester, act.agentId);
        ++result.acceptsHonoured;
    }

    std::set<AgentId> bondedNow;
    for (const auto& [root, members] : comps.Groups())
    {
        FormBond(ctx, members, result);
        bondedNow.insert(members.begin(), members.end());
    }

    for (const auto& [from, to] : consumed)
        w.visibility.ConsumeBondRequest(from, to);

    // ---- requests: queue for next tick ---------------------------------------
    for (const auto& act : actions)
    {
        if (act.intent != Intent::BondRequest)
            continue;

        if (auto why = ValidateTarget(w, act); !why.empty())
        {
            DropAction(ctx, act, std::move(why));
            continue;
        }
        if (bondedNow.contains(act.agentId) || bondedNow.contains(*act.target))
        {
            DropAction(ctx, act, "superseded by a bond formed this tick");
            continue;
        }
        const Agent* requester = w.FindAgent(act.agentId);
        if (requester == nullptr || !requester->alive())
        {
            DropAction(ctx, act, "requester has vanished");
            continue;
        }
        if (requester->bonded())
        {
            DropAction(ctx, act, "requester is already bonded");
            continue;
        }

        w.visibility.current().bondRequests.push_back(act);
        ++result.requestsQueued;
    }

    return result;
}

} // namespace sparkworld::sim

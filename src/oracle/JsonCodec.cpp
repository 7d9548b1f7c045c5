#include "sparkworld/oracle/JsonCodec.hpp"

#include "sparkworld/save/Serialization.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace sparkworld::oracle {

using namespace sparkworld::world;

namespace {

std::string Lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string StringOr(const json& j, const char* key, std::string fallback = {})
{
    if (!j.is_object() || !j.contains(key))
        return fallback;
    const json& v = j.at(key);
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_null())
        return fallback;
    return v.dump();
}

std::optional<AgentId> TargetFrom(const json& j)
{
    if (!j.is_object() || !j.contains("target"))
        return std::nullopt;
    const json& v = j.at("target");
    if (!v.is_string())
        return std::nullopt;

    std::string t = v.get<std::string>();
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c) { return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), t.end());

    const std::string low = Lower(t);
    if (t.empty() || low == "none" || low == "null")
        return std::nullopt;
    return t;
}

bool InboxHasRequestFrom(const Observation* obs, const AgentId& from)
{
    if (obs == nullptr)
        return false;
    return std::any_of(obs->inbox.begin(), obs->inbox.end(), [&](const Action& a) {
        return a.intent == Intent::BondRequest && a.agentId == from;
    });
}

json PublicInfoToJson(const PublicAgentInfo& p)
{
    return json::object({
        {"agent_id",    p.id},
        {"name",        p.name},
        {"species",     p.species},
        {"sparks",      p.sparks},
        {"age",         p.age},
        {"bond_status", BondStatusName(p.bondStatus)}
    });
}

} // namespace

json ObservationToJson(const Observation& obs)
{
    json actions = json::array();
    for (auto i : obs.availableActions)
        actions.push_back(IntentName(i));

    json others = json::array();
    for (const auto& o : obs.others)
        others.push_back(PublicInfoToJson(o));

    json mission = nullptr;
    if (obs.mission)
    {
        const auto& m = *obs.mission;
        mission = json::object({
            {"mission_id",  m.id},
            {"title",       m.title},
            {"description", m.description},
            {"goal",        m.goal},
            {"leader_id",   m.leaderId},
            {"progress",    m.progress},
            {"my_task",     m.myTask ? json(*m.myTask) : json(nullptr)}
        });
    }

    return json::object({
        {"tick", obs.tick},
        {"self_state", json::object({
            {"agent_id",     obs.self.id},
            {"persona",      obs.self.persona},
            {"sparks",       obs.self.sparks},
            {"age",          obs.self.age},
            {"bond_status",  BondStatusName(obs.self.bondStatus)},
            {"bond_members", obs.self.bondMates},
            {"bond_id",      obs.self.bondId ? json(*obs.self.bondId) : json(nullptr)}
        })},
        {"events_since_last", obs.eventsSinceLast},
        {"inbox",             obs.inbox},
        {"grants",            obs.grants},
        {"world_news",        obs.news},
        {"public_agent_info", others},
        {"mission_status",    mission},
        {"benefactor_balance", obs.benefactorBalance},
        {"available_actions", actions},
        {"rules", json::object({
            {"upkeep_per_tick",       obs.rules.upkeepPerTick},
            {"max_grant_per_request", obs.rules.maxGrantPerRequest},
            {"raid_steal_min",        obs.rules.raidStealMin},
            {"raid_steal_max",        obs.rules.raidStealMax},
            {"raid_failure_penalty",  obs.rules.raidFailurePenalty},
            {"spawn_cost",            obs.rules.spawnCost},
            {"spawn_child_sparks",    obs.rules.spawnChildSparks}
        })}
    });
}

Decision DecisionFromJson(const json& j, const Observation* context)
{
    Decision d;
    if (!j.is_object())
    {
        d.reasoning = "malformed decision";
        return d;
    }

    d.target    = TargetFrom(j);
    d.content   = StringOr(j, "content");
    d.reasoning = StringOr(j, "reasoning");

    const std::string verb = Lower(StringOr(j, "intent", "idle"));
    if (auto exact = IntentFromName(verb))
    {
        d.intent = *exact;
    }
    else if (verb == "bond")
    {
        const std::string kind = Lower(StringOr(j, "bond_type", "request"));
        d.intent = kind == "accept" ? Intent::BondAccept : Intent::BondRequest;
    }
    else if (verb == "reply")
    {
        d.intent = d.target && InboxHasRequestFrom(context, *d.target) ? Intent::BondAccept : Intent::Message;
    }
    else if (verb == "request_spark" || verb == "request-spark" || verb == "request_grant")
    {
        d.intent = Intent::RequestGrant;
    }
    else if (verb == "bond_request" || verb == "bond_accept")
    {
        d.intent = verb == "bond_request" ? Intent::BondRequest : Intent::BondAccept;
    }
    else
    {
        spdlog::debug("DecisionFromJson: unknown intent '{}', treating as idle", verb);
        d.intent = Intent::Idle;
    }
    return d;
}

json GrantRequestsToJson(int balance, Tick tick, const std::vector<GrantRequest>& requests)
{
    json reqs = json::array();
    for (const auto& r : requests)
        reqs.push_back(json::object({ {"agent_id", r.agentId}, {"content", r.content}, {"sparks", r.sparks} }));

    return json::object({
        {"balance", balance},
        {"tick", tick},
        {"max_per_request", kMaxGrantPerRequest},
        {"requests", reqs}
    });
}

std::vector<GrantDecision> GrantDecisionsFromJson(const json& j)
{
    const json* list = &j;
    if (j.is_object() && j.contains("decisions"))
        list = &j.at("decisions");

    std::vector<GrantDecision> out;
    if (!list->is_array())
        return out;

    for (const auto& e : *list)
    {
        if (!e.is_object())
            continue;
        GrantDecision g;
        g.agentId = StringOr(e, "agent_id");
        if (g.agentId.empty())
            continue;
        const json amount = e.value("amount_granted", e.value("amount", json(0)));
        g.amount = amount.is_number() ? amount.get<int>() : 0;
        g.reasoning = StringOr(e, "reasoning");
        out.push_back(std::move(g));
    }
    return out;
}

Decision JsonDecisionOracle::Decide(const AgentId& agentId, const Observation& obs, std::stop_token stop)
{
    json request = json::object({ {"agent_id", agentId}, {"observation", ObservationToJson(obs)} });
    return DecisionFromJson(m_transport(request, stop), &obs);
}

std::vector<GrantDecision> JsonBenefactorOracle::DecideGrants(int balance, Tick tick,
                                                              const std::vector<GrantRequest>& requests,
                                                              std::stop_token stop)
{
    return GrantDecisionsFromJson(m_transport(GrantRequestsToJson(balance, tick, requests), stop));
}

} // namespace sparkworld::oracle

// src/save/Serialization.cpp
#include "sparkworld/save/Serialization.hpp"

#include <string_view>

namespace sparkworld {

using json = nlohmann::json;

namespace {

// ---------- helpers ----------

template <class T>
json OptionalToJson(const std::optional<T>& v)
{
    return v ? json(*v) : json(nullptr);
}

template <class T>
std::optional<T> OptionalFromJson(const json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return j.at(key).get<T>();
}

template <class E>
E EnumFromJson(const json& j, const char* key, E fallback,
               std::optional<E> (*parse)(std::string_view) noexcept)
{
    if (!j.contains(key))
        return fallback;
    const json& v = j.at(key);
    if (!v.is_string())
        throw json::type_error::create(302, std::string("enum field '") + key + "' must be a string", &v);
    if (auto e = parse(v.get_ref<const std::string&>()))
        return *e;
    throw json::type_error::create(302, std::string("unknown value for '") + key + "': " + v.get<std::string>(), &v);
}

} // namespace

// ---------- Pcg32 ----------
namespace core {

void to_json(json& j, const Pcg32& v)
{
    j = json::object({ {"state", v.state}, {"inc", v.inc} });
}

void from_json(const json& j, Pcg32& v)
{
    v.state = j.value("state", std::uint64_t{0});
    v.inc   = j.value("inc", std::uint64_t{1}) | 1u;
}

} // namespace core

namespace world {

// ---------- Persona ----------
void to_json(json& j, const Persona& v)
{
    j = json::object({
        {"name",         v.name},
        {"species",      v.species},
        {"home_realm",   v.homeRealm},
        {"personality",  v.personality},
        {"quirk",        v.quirk},
        {"ability",      v.ability},
        {"backstory",    v.backstory},
        {"opening_goal", v.openingGoal},
        {"speech_style", v.speechStyle}
    });
}
void from_json(const json& j, Persona& v)
{
    v.name        = j.value("name", std::string{});
    v.species     = j.value("species", std::string{});
    v.homeRealm   = j.value("home_realm", std::string{});
    v.personality = j.value("personality", std::vector<std::string>{});
    v.quirk       = j.value("quirk", std::string{});
    v.ability     = j.value("ability", std::string{});
    v.backstory   = j.value("backstory", std::string{});
    v.openingGoal = j.value("opening_goal", std::string{});
    v.speechStyle = j.value("speech_style", std::string{});
}

// ---------- Agent ----------
void to_json(json& j, const Agent& v)
{
    j = json::object({
        {"id",            v.id},
        {"persona",       v.persona},
        {"sparks",        v.sparks},
        {"age",           v.age},
        {"status",        AgentStatusName(v.status)},
        {"bond_status",   BondStatusName(v.bondStatus)},
        {"bond_mates",    v.bondMates},
        {"created_tick",  v.createdTick},
        {"parent_id",     OptionalToJson(v.parentId)},
        {"vanished_tick", OptionalToJson(v.vanishedTick)}
    });
}
void from_json(const json& j, Agent& v)
{
    v.id           = j.value("id", std::string{});
    v.persona      = j.value("persona", Persona{});
    v.sparks       = j.value("sparks", 0);
    v.age          = j.value("age", 0);
    v.status       = EnumFromJson(j, "status", AgentStatus::Alive, &AgentStatusFromName);
    v.bondStatus   = EnumFromJson(j, "bond_status", BondStatus::Unbonded, &BondStatusFromName);
    v.bondMates    = j.value("bond_mates", std::set<AgentId>{});
    v.createdTick  = j.value("created_tick", Tick{0});
    v.parentId     = OptionalFromJson<AgentId>(j, "parent_id");
    v.vanishedTick = OptionalFromJson<Tick>(j, "vanished_tick");
}

// ---------- Bond ----------
void to_json(json& j, const Bond& v)
{
    j = json::object({
        {"id",                         v.id},
        {"members",                    v.members},
        {"leader_id",                  v.leaderId},
        {"mission_id",                 OptionalToJson(v.missionId)},
        {"sparks_generated_this_tick", v.sparksGeneratedThisTick},
        {"created_tick",               v.createdTick}
    });
}
void from_json(const json& j, Bond& v)
{
    v.id          = j.value("id", std::string{});
    v.members     = j.value("members", std::set<AgentId>{});
    v.leaderId    = j.value("leader_id", std::string{});
    v.missionId   = OptionalFromJson<MissionId>(j, "mission_id");
    v.sparksGeneratedThisTick = j.value("sparks_generated_this_tick", 0);
    v.createdTick = j.value("created_tick", Tick{0});
}

// ---------- Mission ----------
void to_json(json& j, const Mission& v)
{
    j = json::object({
        {"id",             v.id},
        {"bond_id",        v.bondId},
        {"title",          v.title},
        {"description",    v.description},
        {"goal",           v.goal},
        {"leader_id",      v.leaderId},
        {"progress",       v.progress},
        {"assigned_tasks", v.assignedTasks},
        {"is_complete",    v.isComplete},
        {"created_tick",   v.createdTick},
        {"completed_tick", OptionalToJson(v.completedTick)}
    });
}
void from_json(const json& j, Mission& v)
{
    v.id            = j.value("id", std::string{});
    v.bondId        = j.value("bond_id", std::string{});
    v.title         = j.value("title", std::string{});
    v.description   = j.value("description", std::string{});
    v.goal          = j.value("goal", std::string{});
    v.leaderId      = j.value("leader_id", std::string{});
    v.progress      = j.value("progress", std::string{});
    v.assignedTasks = j.value("assigned_tasks", std::map<AgentId, std::string>{});
    v.isComplete    = j.value("is_complete", false);
    v.createdTick   = j.value("created_tick", Tick{0});
    v.completedTick = OptionalFromJson<Tick>(j, "completed_tick");
}

// ---------- Action ----------
void to_json(json& j, const Action& v)
{
    j = json::object({
        {"agent_id",  v.agentId},
        {"intent",    IntentName(v.intent)},
        {"target",    OptionalToJson(v.target)},
        {"content",   v.content},
        {"reasoning", v.reasoning},
        {"tick",      v.tick}
    });
}
void from_json(const json& j, Action& v)
{
    v.agentId   = j.value("agent_id", std::string{});
    v.intent    = EnumFromJson(j, "intent", Intent::Idle, &IntentFromName);
    v.target    = OptionalFromJson<AgentId>(j, "target");
    v.content   = j.value("content", std::string{});
    v.reasoning = j.value("reasoning", std::string{});
    v.tick      = j.value("tick", Tick{0});
}

// ---------- Benefactor / Rules ----------
void to_json(json& j, const Benefactor& v)
{
    j = json::object({ {"balance", v.balance}, {"regen_per_tick", v.regenPerTick} });
}
void from_json(const json& j, Benefactor& v)
{
    v.balance      = j.value("balance", 0);
    v.regenPerTick = j.value("regen_per_tick", 1);
}

void to_json(json& j, const Rules& v)
{
    j = json::object({
        {"initial_sparks",     v.initialSparks},
        {"spawn_cost",         v.spawnCost},
        {"spawn_child_sparks", v.spawnChildSparks}
    });
}
void from_json(const json& j, Rules& v)
{
    v.initialSparks    = j.value("initial_sparks", 5);
    v.spawnCost        = j.value("spawn_cost", 5);
    v.spawnChildSparks = j.value("spawn_child_sparks", 5);
}

// ---------- Records ----------
void to_json(json& j, const LedgerEntry& v)
{
    j = json::object({
        {"source",      v.source},
        {"destination", v.destination},
        {"amount",      v.amount},
        {"reason",      LedgerReasonName(v.reason)},
        {"tick",        v.tick}
    });
}
void from_json(const json& j, LedgerEntry& v)
{
    v.source      = j.value("source", std::string{});
    v.destination = j.value("destination", std::string{});
    v.amount      = j.value("amount", 0);
    v.reason      = EnumFromJson(j, "reason", LedgerReason::Upkeep, &LedgerReasonFromName);
    v.tick        = j.value("tick", Tick{0});
}

void to_json(json& j, const RaidResult& v)
{
    j = json::object({
        {"attacker_id",         v.attackerId},
        {"defender_id",         v.defenderId},
        {"outcome",             RaidOutcomeName(v.outcome)},
        {"attacker_strength",   v.attackerStrength},
        {"defender_strength",   v.defenderStrength},
        {"success_probability", v.successProbability},
        {"sparks_transferred",  v.sparksTransferred},
        {"tick",                v.tick}
    });
}

void to_json(json& j, const GrantOutcome& v)
{
    j = json::object({
        {"agent_id",        v.agentId},
        {"request_content", v.requestContent},
        {"decided",         v.decided},
        {"granted",         v.granted},
        {"balance_after",   v.balanceAfter},
        {"reasoning",       v.reasoning},
        {"tick",            v.tick}
    });
}
void from_json(const json& j, GrantOutcome& v)
{
    v.agentId        = j.value("agent_id", std::string{});
    v.requestContent = j.value("request_content", std::string{});
    v.decided        = j.value("decided", 0);
    v.granted        = j.value("granted", 0);
    v.balanceAfter   = j.value("balance_after", 0);
    v.reasoning      = j.value("reasoning", std::string{});
    v.tick           = j.value("tick", Tick{0});
}

void to_json(json& j, const DroppedAction& v)
{
    j = json::object({ {"action", v.action}, {"reason", v.reason} });
}

// ---------- Visibility ----------
void to_json(json& j, const AgentEvent& v)
{
    j = json::object({
        {"kind",        EventKindName(v.kind)},
        {"counterpart", OptionalToJson(v.counterpart)},
        {"amount",      v.amount},
        {"detail",      v.detail},
        {"tick",        v.tick}
    });
}
void from_json(const json& j, AgentEvent& v)
{
    v.kind        = EnumFromJson(j, "kind", EventKind::RaidAttack, &EventKindFromName);
    v.counterpart = OptionalFromJson<AgentId>(j, "counterpart");
    v.amount      = j.value("amount", 0);
    v.detail      = j.value("detail", std::string{});
    v.tick        = j.value("tick", Tick{0});
}

void to_json(json& j, const WorldNews& v)
{
    j = json::object({
        {"tick",               v.tick},
        {"alive_count",        v.aliveCount},
        {"total_sparks",       v.totalSparks},
        {"benefactor_balance", v.benefactorBalance},
        {"sparks_minted",      v.sparksMinted},
        {"sparks_lost",        v.sparksLost},
        {"raids_resolved",     v.raidsResolved},
        {"vanished",           v.vanished},
        {"spawned",            v.spawned},
        {"bonds_formed",       v.bondsFormed},
        {"bonds_dissolved",    v.bondsDissolved}
    });
}
void from_json(const json& j, WorldNews& v)
{
    v.tick              = j.value("tick", Tick{0});
    v.aliveCount        = j.value("alive_count", 0);
    v.totalSparks       = j.value("total_sparks", 0);
    v.benefactorBalance = j.value("benefactor_balance", 0);
    v.sparksMinted      = j.value("sparks_minted", 0);
    v.sparksLost        = j.value("sparks_lost", 0);
    v.raidsResolved     = j.value("raids_resolved", 0);
    v.vanished          = j.value("vanished", std::vector<AgentId>{});
    v.spawned           = j.value("spawned", std::vector<AgentId>{});
    v.bondsFormed       = j.value("bonds_formed", std::vector<BondId>{});
    v.bondsDissolved    = j.value("bonds_dissolved", std::vector<BondId>{});
}

void to_json(json& j, const VisibilityGeneration& v)
{
    j = json::object({
        {"tick",             v.tick},
        {"bond_requests",    v.bondRequests},
        {"messages",         v.messages},
        {"grant_requests",   v.grantRequests},
        {"resolved_actions", v.resolvedActions},
        {"events",           v.events},
        {"news",             v.news}
    });
}
void from_json(const json& j, VisibilityGeneration& v)
{
    v.tick            = j.value("tick", Tick{0});
    v.bondRequests    = j.value("bond_requests", std::vector<Action>{});
    v.messages        = j.value("messages", std::vector<Action>{});
    v.grantRequests   = j.value("grant_requests", std::vector<Action>{});
    v.resolvedActions = j.value("resolved_actions", std::vector<Action>{});
    v.events          = j.value("events", std::map<AgentId, std::vector<AgentEvent>>{});
    v.news            = j.value("news", WorldNews{});
}

// ---------- Counters ----------
void to_json(json& j, const Totals& v)
{
    j = json::object({
        {"sparks_minted",   v.sparksMinted},
        {"sparks_lost",     v.sparksLost},
        {"sparks_granted",  v.sparksGranted},
        {"raids_attempted", v.raidsAttempted},
        {"bonds_formed",    v.bondsFormed},
        {"agents_spawned",  v.agentsSpawned}
    });
}
void from_json(const json& j, Totals& v)
{
    v.sparksMinted   = j.value("sparks_minted", std::int64_t{0});
    v.sparksLost     = j.value("sparks_lost", std::int64_t{0});
    v.sparksGranted  = j.value("sparks_granted", std::int64_t{0});
    v.raidsAttempted = j.value("raids_attempted", std::int64_t{0});
    v.bondsFormed    = j.value("bonds_formed", std::int64_t{0});
    v.agentsSpawned  = j.value("agents_spawned", std::int64_t{0});
}

void to_json(json& j, const Serials& v)
{
    j = json::object({
        {"next_agent",   v.nextAgent},
        {"next_bond",    v.nextBond},
        {"next_mission", v.nextMission}
    });
}
void from_json(const json& j, Serials& v)
{
    v.nextAgent   = j.value("next_agent", std::uint32_t{1});
    v.nextBond    = j.value("next_bond", std::uint32_t{1});
    v.nextMission = j.value("next_mission", std::uint32_t{1});
}

} // namespace world

// ---------- Tick report ----------
namespace evt {

void to_json(json& j, const BondFormed& v)
{
    j = json::object({ {"bond_id", v.bondId}, {"members", v.members}, {"leader_id", v.leaderId}, {"tick", v.tick} });
}
void to_json(json& j, const BondDissolved& v)
{
    j = json::object({ {"bond_id", v.bondId}, {"members", v.members},
                       {"reason", DissolveReasonName(v.reason)}, {"tick", v.tick} });
}
void to_json(json& j, const AgentVanished& v)
{
    j = json::object({ {"agent_id", v.agentId}, {"tick", v.tick} });
}
void to_json(json& j, const AgentSpawned& v)
{
    j = json::object({ {"child_id", v.childId}, {"parent_id", v.parentId}, {"tick", v.tick} });
}
void to_json(json& j, const MissionCreated& v)
{
    j = json::object({ {"mission_id", v.missionId}, {"bond_id", v.bondId}, {"title", v.title}, {"tick", v.tick} });
}
void to_json(json& j, const MissionProgressed& v)
{
    j = json::object({ {"mission_id", v.missionId}, {"progress", v.progress}, {"tick", v.tick} });
}
void to_json(json& j, const MissionCompleted& v)
{
    j = json::object({ {"mission_id", v.missionId}, {"bond_id", v.bondId}, {"tick", v.tick} });
}
void to_json(json& j, const MeetingMessage& v)
{
    j = json::object({ {"mission_id", v.missionId}, {"sender_id", v.senderId},
                       {"kind", v.kind}, {"content", v.content}, {"tick", v.tick} });
}

} // namespace evt

namespace sim {

void to_json(json& j, const TickReport& v)
{
    json stages = json::array();
    for (const auto& s : v.stages)
        stages.push_back(json::object({ {"stage", TickStageName(s.stage)}, {"summary", s.summary} }));

    j = json::object({
        {"simulation_id",       v.simulationId},
        {"tick",                v.tick},
        {"stages",              stages},
        {"ledger",              v.ledger},
        {"raids",               v.raids},
        {"grants",              v.grants},
        {"actions",             v.actions},
        {"dropped",             v.dropped},
        {"bonds_formed",        v.bondsFormed},
        {"bonds_dissolved",     v.bondsDissolved},
        {"agents_vanished",     v.agentsVanished},
        {"agents_spawned",      v.agentsSpawned},
        {"missions_created",    v.missionsCreated},
        {"missions_progressed", v.missionsProgressed},
        {"missions_completed",  v.missionsCompleted},
        {"meetings",            v.meetings},
        {"sparks_minted",       v.sparksMinted},
        {"sparks_lost",         v.sparksLost},
        {"sparks_granted",      v.sparksGranted},
        {"alive_count",         v.aliveCount},
        {"total_sparks",        v.totalSparks},
        {"benefactor_balance",  v.benefactorBalance},
        {"totals",              v.totals}
    });
}

} // namespace sim

// ---------- WorldState ----------
namespace save {

json WorldToJson(const world::WorldState& w)
{
    json agents = json::array();
    for (const auto& [id, a] : w.agents) agents.push_back(a);
    json bonds = json::array();
    for (const auto& [id, b] : w.bonds) bonds.push_back(b);
    json missions = json::array();
    for (const auto& [id, m] : w.missions) missions.push_back(m);

    return json::object({
        {"schema_version", kSchemaVersion},
        {"simulation_id",  w.simulationId},
        {"name",           w.name},
        {"tick",           w.tick},
        {"seed",           w.seed},
        {"rng",            w.rng},
        {"rules",          w.rules},
        {"benefactor",     w.benefactor},
        {"agents",         std::move(agents)},
        {"bonds",          std::move(bonds)},
        {"missions",       std::move(missions)},
        {"visibility",     json::object({
                               {"current", w.visibility.current()},
                               {"frozen",  w.visibility.frozen()} })},
        {"totals",         w.totals},
        {"serials",        w.serials}
    });
}

world::WorldState WorldFromJson(const json& j)
{
    if (!j.is_object())
        throw json::type_error::create(302, "snapshot root must be an object", &j);

    world::WorldState w;
    w.simulationId = j.value("simulation_id", std::string{});
    w.name         = j.value("name", std::string{});
    w.tick         = j.value("tick", world::Tick{0});
    w.seed         = j.value("seed", std::uint64_t{0});
    w.rng          = j.value("rng", core::Pcg32{});
    w.rules        = j.value("rules", world::Rules{});
    w.benefactor   = j.value("benefactor", world::Benefactor{});

    for (const auto& a : j.value("agents", std::vector<world::Agent>{}))
        w.agents.emplace(a.id, a);
    for (const auto& b : j.value("bonds", std::vector<world::Bond>{}))
        w.bonds.emplace(b.id, b);
    for (const auto& m : j.value("missions", std::vector<world::Mission>{}))
        w.missions.emplace(m.id, m);

    if (j.contains("visibility") && j["visibility"].is_object())
    {
        const json& vis = j["visibility"];
        w.visibility = world::VisibilityTables(vis.value("current", world::VisibilityGeneration{}),
                                               vis.value("frozen", world::VisibilityGeneration{}));
    }

    w.totals  = j.value("totals", world::Totals{});
    w.serials = j.value("serials", world::Serials{});
    return w;
}

} // namespace save

} // namespace sparkworld

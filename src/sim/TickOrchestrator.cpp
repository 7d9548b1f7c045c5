#include "sparkworld/sim/TickOrchestrator.hpp"

#include "sparkworld/sim/BondingProtocol.hpp"
#include "sparkworld/sim/Dissolution.hpp"
#include "sparkworld/sim/MissionLifecycle.hpp"
#include "sparkworld/sim/Population.hpp"
#include "sparkworld/sim/RaidResolver.hpp"
#include "sparkworld/sim/SparkLedger.hpp"
#include "sparkworld/sim/TickContext.hpp"
#include "sparkworld/sim/VisibilityGateway.hpp"
#include "sparkworld/world/Invariants.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <stdexcept>

namespace sparkworld::sim {

using namespace sparkworld::world;

namespace {

// Clears the running flag however the tick ends.
struct RunningGuard {
    bool& flag;
    std::optional<TickStage>& stage;
    ~RunningGuard() { flag = false; stage.reset(); }
};

} // namespace

TickOrchestrator::TickOrchestrator(WorldState& world, oracle::OracleGateway& gateway)
    : m_world(world)
    , m_gateway(gateway)
{
}

void TickOrchestrator::Enter(TickStage stage)
{
    m_stage = stage;
}

void TickOrchestrator::Finish(TickStage stage, std::string summary)
{
    m_events.update();
    spdlog::info("Tick {} stage {} [{}]: {}", m_world.tick, static_cast<int>(stage), TickStageName(stage), summary);
    m_collector.AddStage(stage, std::move(summary));
}

TickReport TickOrchestrator::RunTick()
{
    if (m_running)
        throw std::logic_error("TickOrchestrator::RunTick is not re-entrant");
    m_running = true;
    RunningGuard guard{ m_running, m_stage };

    m_events.clear();
    m_world.tick += 1;
    m_collector.Begin(m_world.simulationId, m_world.tick);

    TickContext ctx{ m_world, m_events };

    StageUpkeep(ctx);
    const auto grants = StageGrants(ctx);
    const auto actions = StageDecisions(ctx, grants);
    StageSettlement(ctx);
    StageResolution(ctx, actions);
    StageReport(ctx);

    return m_collector.Take();
}

// ---------------------------------------------------------------------------
// Stage 1: upkeep + minting
// ---------------------------------------------------------------------------
void TickOrchestrator::StageUpkeep(TickContext& ctx)
{
    Enter(TickStage::Upkeep);

    const UpkeepResult upkeep = ApplyUpkeep(ctx);
    const int minted = MintAndDistribute(ctx);

    m_world.totals.sparksLost += upkeep.burned;
    m_world.totals.sparksMinted += minted;

    Finish(TickStage::Upkeep, fmt::format("burned {}, {} vanished, minted {} across {} bond(s)",
                                          upkeep.burned, upkeep.vanished.size(), minted, m_world.bonds.size()));
}

// ---------------------------------------------------------------------------
// Stage 2: benefactor decisions on last tick's requests
// ---------------------------------------------------------------------------
std::vector<GrantOutcome> TickOrchestrator::StageGrants(TickContext& ctx)
{
    Enter(TickStage::Grants);

    const auto& queued = m_world.visibility.frozen().grantRequests;

    std::vector<oracle::GrantRequest> asks;
    for (const auto& req : queued)
    {
        if (const Agent* a = m_world.FindAgent(req.agentId); a != nullptr && a->alive())
            asks.push_back(oracle::GrantRequest{ req.agentId, req.content, a->sparks });
    }

    const int before = m_world.benefactor.balance;
    const auto decisions = m_gateway.DecideGrants(before, ctx.tick(), asks);
    auto outcomes = ApplyGrants(ctx, queued, decisions);

    int paid = 0;
    for (const auto& o : outcomes) paid += o.granted;

    Finish(TickStage::Grants, fmt::format("{} request(s), {} spark(s) granted, pool {} -> {}",
                                          queued.size(), paid, before, m_world.benefactor.balance));
    return outcomes;
}

// ---------------------------------------------------------------------------
// Stage 3: meetings and decisions
// ---------------------------------------------------------------------------
std::vector<Action> TickOrchestrator::StageDecisions(TickContext& ctx, const std::vector<GrantOutcome>& grants)
{
    Enter(TickStage::Decisions);

    int meetings = 0;
    for (const auto& missionId : ActiveMissions(m_world))
    {
        const Mission& m = m_world.missions.at(missionId);
        const Bond& bond = m_world.bonds.at(m.bondId);
        if (auto outcome = m_gateway.ConductMeeting(m, MemberProfiles(m_world, bond), ctx.tick()))
        {
            if (ApplyMeeting(ctx, missionId, *outcome))
                ++meetings;
        }
    }

    std::vector<Action> actions;
    const auto alive = m_world.AliveAgentIds();
    actions.reserve(alive.size());
    for (const auto& id : alive)
    {
        const oracle::Observation obs = BuildObservation(m_world, id, grants);
        oracle::Decision d = m_gateway.Decide(id, obs);

        Action a;
        a.agentId = id;
        a.intent = d.intent;
        a.target = std::move(d.target);
        a.content = std::move(d.content);
        a.reasoning = std::move(d.reasoning);
        a.tick = ctx.tick();

        ctx.Emit(evt::ActionTaken{ a });
        actions.push_back(std::move(a));
    }

    Finish(TickStage::Decisions, fmt::format("{} meeting(s), {} decision(s)", meetings, actions.size()));
    return actions;
}

// ---------------------------------------------------------------------------
// Stage 4: settlement of minted sparks
// ---------------------------------------------------------------------------
void TickOrchestrator::StageSettlement(TickContext&)
{
    Enter(TickStage::Settlement);

    std::map<std::string, int> receivedPerBond;
    for (const auto& e : m_collector.report().ledger)
    {
        if (e.reason == LedgerReason::BondMint)
            receivedPerBond[e.source] += e.amount;
    }

    int minted = 0;
    for (const auto& [id, bond] : m_world.bonds)
    {
        const int expected = static_cast<int>(bond.members.size());
        const auto it = receivedPerBond.find(id);
        const int received = it == receivedPerBond.end() ? 0 : it->second;
        if (bond.sparksGeneratedThisTick != expected || received != expected)
        {
            throw InvariantViolation(fmt::format(
                "tick {}: bond {} of {} minted {} and distributed {}",
                m_world.tick, id, expected, bond.sparksGeneratedThisTick, received));
        }
        minted += received;
    }

    if (minted != m_collector.report().sparksMinted)
    {
        throw InvariantViolation(fmt::format("tick {}: ledger shows {} minted, bonds account for {}",
                                             m_world.tick, m_collector.report().sparksMinted, minted));
    }

    Finish(TickStage::Settlement, fmt::format("{} spark(s) settled across {} bond(s)", minted, m_world.bonds.size()));
}

// ---------------------------------------------------------------------------
// Stage 5: resolution
// ---------------------------------------------------------------------------
void TickOrchestrator::StageResolution(TickContext& ctx, const std::vector<Action>& actions)
{
    Enter(TickStage::Resolution);
    VisibilityGeneration& out = m_world.visibility.current();

    // Bonds first; every new bond gets its mission right away.
    const BondingResult bonding = ResolveBonding(ctx, actions);
    for (const auto& bondId : bonding.formed)
    {
        const Bond& bond = m_world.bonds.at(bondId);
        const oracle::MissionContent content = m_gateway.GenerateMission(MemberProfiles(m_world, bond));
        if (!CreateMission(ctx, bondId, content))
            throw InvariantViolation(fmt::format("tick {}: new bond {} could not get a mission", ctx.tick(), bondId));
    }

    int raids = 0;
    for (const auto& a : actions)
    {
        if (a.intent == Intent::Raid && ResolveRaid(ctx, a))
            ++raids;
    }

    int spawned = 0;
    for (const auto& a : actions)
    {
        if (a.intent != Intent::Spawn)
            continue;
        if (const SpawnRefusal why = CanSpawn(m_world, a.agentId); why != SpawnRefusal::None)
        {
            DropAction(ctx, a, SpawnRefusalName(why));
            continue;
        }
        ApplySpawn(ctx, a.agentId, m_gateway.SpawnCharacter());
        ++spawned;
    }

    int messages = 0;
    int grantRequests = 0;
    for (const auto& a : actions)
    {
        if (a.intent == Intent::Message)
        {
            if (auto why = ValidateTarget(m_world, a); !why.empty())
            {
                DropAction(ctx, a, std::move(why));
                continue;
            }
            out.messages.push_back(a);
            ++messages;
        }
        else if (a.intent == Intent::RequestGrant)
        {
            out.grantRequests.push_back(a);
            ++grantRequests;
        }
    }

    const auto swept = SweepVanished(ctx);

    int evaluated = 0;
    for (const auto& missionId : ActiveMissions(m_world))
    {
        const Mission& m = m_world.missions.at(missionId);
        const Bond& bond = m_world.bonds.at(m.bondId);

        std::vector<Action> memberActions;
        for (const auto& a : actions)
        {
            if (bond.members.contains(a.agentId))
                memberActions.push_back(a);
        }

        if (auto eval = m_gateway.EvaluateProgress(m, memberActions))
        {
            if (ApplyProgress(ctx, missionId, *eval))
                ++evaluated;
        }
    }

    out.resolvedActions = actions;

    Finish(TickStage::Resolution,
           fmt::format("{} bond(s) formed, {} raid(s), {} spawn(s), {} message(s), {} grant request(s), "
                       "{} vanished, {} mission(s) evaluated",
                       bonding.formed.size(), raids, spawned, messages, grantRequests, swept.size(), evaluated));

    CheckInvariants(m_world);
}

// ---------------------------------------------------------------------------
// Stage 6: report and visibility swap
// ---------------------------------------------------------------------------
void TickOrchestrator::StageReport(TickContext& ctx)
{
    Enter(TickStage::Report);
    TickReport& report = m_collector.report();

    int alive = 0;
    int sparks = 0;
    for (const auto& [id, a] : m_world.agents)
    {
        if (!a.alive()) continue;
        ++alive;
        sparks += a.sparks;
    }

    report.aliveCount = alive;
    report.totalSparks = sparks;
    report.benefactorBalance = m_world.benefactor.balance;
    report.totals = m_world.totals;

    WorldNews& news = m_world.visibility.current().news;
    news.tick = ctx.tick();
    news.aliveCount = alive;
    news.totalSparks = sparks;
    news.benefactorBalance = m_world.benefactor.balance;
    news.sparksMinted = report.sparksMinted;
    news.sparksLost = report.sparksLost;
    news.raidsResolved = static_cast<int>(report.raids.size());
    for (const auto& v : report.agentsVanished) news.vanished.push_back(v.agentId);
    for (const auto& s : report.agentsSpawned)  news.spawned.push_back(s.childId);
    for (const auto& b : report.bondsFormed)    news.bondsFormed.push_back(b.bondId);
    for (const auto& b : report.bondsDissolved) news.bondsDissolved.push_back(b.bondId);

    Finish(TickStage::Report, fmt::format("{} alive holding {} spark(s), benefactor {}",
                                          alive, sparks, m_world.benefactor.balance));

    if (!m_gateway.Report(report))
        spdlog::warn("Tick {}: narrative reporter did not accept the report", ctx.tick());

    m_world.visibility.Swap(ctx.tick());
}

} // namespace sparkworld::sim

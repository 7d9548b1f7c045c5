#include "sparkworld/oracle/LocalOracles.hpp"

#include "sparkworld/sim/TickReport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <string>

namespace sparkworld::oracle {

using namespace sparkworld::world;

namespace {

template <std::size_t N>
const char* Pick(core::Pcg32& rng, const char* const (&arr)[N])
{
    return arr[rng.next_bounded(static_cast<std::uint32_t>(N))];
}

bool HasIntent(const Observation& obs, Intent i)
{
    return std::find(obs.availableActions.begin(), obs.availableActions.end(), i) != obs.availableActions.end();
}

} // namespace

// ---------------------------------------------------------------------------
// Decisions
// ---------------------------------------------------------------------------

Decision HeuristicDecisionOracle::Decide(const AgentId& agentId, const Observation& obs, std::stop_token)
{
    std::lock_guard lock(m_mutex);
    Decision d;
    const auto& me = obs.self;
    const bool unbonded = me.bondStatus == BondStatus::Unbonded;

    auto isUnbondedOther = [&](const AgentId& id) {
        return std::any_of(obs.others.begin(), obs.others.end(), [&](const PublicAgentInfo& p) {
            return p.id == id && p.bondStatus == BondStatus::Unbonded;
        });
    };

    // 1) Someone asked us last tick: say yes.
    if (unbonded)
    {
        for (const auto& msg : obs.inbox)
        {
            if (msg.intent == Intent::BondRequest && isUnbondedOther(msg.agentId))
            {
                d.intent = Intent::BondAccept;
                d.target = msg.agentId;
                d.content = "Yes. Let us burn brighter together.";
                d.reasoning = "accepting a pending bond request";
                return d;
            }
        }
    }

    // 2) Running dry.
    if (me.sparks <= 2)
    {
        if (obs.benefactorBalance > 0)
        {
            d.intent = Intent::RequestGrant;
            d.content = agentId + " is fading and begs for a few sparks.";
            d.reasoning = "low on sparks";
            return d;
        }

        const PublicAgentInfo* weakest = nullptr;
        for (const auto& p : obs.others)
        {
            if (std::find(me.bondMates.begin(), me.bondMates.end(), p.id) != me.bondMates.end())
                continue;
            if (weakest == nullptr || p.sparks + p.age < weakest->sparks + weakest->age)
                weakest = &p;
        }
        if (weakest != nullptr)
        {
            d.intent = Intent::Raid;
            d.target = weakest->id;
            d.content = "Desperate times.";
            d.reasoning = "benefactor is empty; raiding the weakest";
            return d;
        }
    }

    // 3) Alone: look for a partner.
    if (unbonded)
    {
        std::vector<AgentId> candidates;
        for (const auto& p : obs.others)
            if (p.bondStatus == BondStatus::Unbonded) candidates.push_back(p.id);

        if (!candidates.empty())
        {
            d.intent = Intent::BondRequest;
            d.target = candidates[m_rng.next_bounded(static_cast<std::uint32_t>(candidates.size()))];
            d.content = "Shall we bond?";
            d.reasoning = "unbonded and looking for a partner";
            return d;
        }
    }

    // 4) Comfortable and bonded: grow the family.
    if (HasIntent(obs, Intent::Spawn) && me.sparks >= obs.rules.spawnCost + 3)
    {
        d.intent = Intent::Spawn;
        d.content = "A new spark joins the world.";
        d.reasoning = "enough sparks to spare";
        return d;
    }

    // 5) Opportunistic raid.
    if (m_rng.next_double01() < 0.15)
    {
        for (const auto& p : obs.others)
        {
            const bool mate = std::find(me.bondMates.begin(), me.bondMates.end(), p.id) != me.bondMates.end();
            if (!mate && p.sparks + p.age < me.sparks + me.age)
            {
                d.intent = Intent::Raid;
                d.target = p.id;
                d.content = "Your sparks or your pride.";
                d.reasoning = "target looks weaker";
                return d;
            }
        }
    }

    // 6) Talk to the bond.
    if (!me.bondMates.empty())
    {
        d.intent = Intent::Message;
        d.target = me.bondMates[m_rng.next_bounded(static_cast<std::uint32_t>(me.bondMates.size()))];
        d.content = obs.mission && obs.mission->myTask
            ? "Working on: " + *obs.mission->myTask
            : std::string("Still here, still glowing.");
        d.reasoning = "keeping the bond informed";
        return d;
    }

    d.reasoning = "nothing worth doing";
    return d;
}

// ---------------------------------------------------------------------------
// Benefactor
// ---------------------------------------------------------------------------

std::vector<GrantDecision> FairBenefactor::DecideGrants(int balance, Tick, const std::vector<GrantRequest>& requests,
                                                        std::stop_token)
{
    std::vector<GrantDecision> out;
    int remaining = balance;
    for (const auto& r : requests)
    {
        GrantDecision g;
        g.agentId = r.agentId;
        const int need = std::clamp(kMaxGrantPerRequest - r.sparks, 1, kMaxGrantPerRequest);
        g.amount = std::min(need, std::max(remaining, 0));
        remaining -= g.amount;
        g.reasoning = g.amount > 0 ? "a little help to keep going" : "the pool is empty";
        out.push_back(std::move(g));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Characters
// ---------------------------------------------------------------------------

Persona ProceduralCharacterGenerator::Spawn(std::stop_token)
{
    static const char* const syll[] = {
        "al","an","ar","ash","bel","dor","el","fa","ik","ka","kor","la",
        "mi","na","or","ra","rin","sha","sil","tor","ul","va","vy","zen"
    };
    static const char* const species[] = {
        "Ember Sprite","Glass Golem","Moth Oracle","Tide Wraith","Copper Fox",
        "Lantern Spirit","Stone Sage","Storm Heron","Ash Dryad","Clockwork Owl"
    };
    static const char* const realms[] = {
        "the Cinder Marches","the Hollow Reef","the Lantern Wastes","the Quiet Orchard",
        "the Brass Spires","the Drowned Library","the Ember Steppe","the Silver Fen"
    };
    static const char* const traits[] = {
        "curious","stubborn","generous","suspicious","playful","patient","reckless",
        "loyal","ambitious","gentle","sardonic","earnest","restless","calculating"
    };
    static const char* const quirks[] = {
        "counts everything twice","speaks to their own shadow","collects lost buttons",
        "hums when nervous","never sits facing a door","names every spark they hold"
    };
    static const char* const abilities[] = {
        "reads intentions in flickers","walks unseen at dusk","mends broken bonds",
        "smells fear","remembers every debt","kindles warmth from nothing"
    };
    static const char* const goals[] = {
        "find someone worth trusting","never go hungry again","build something that lasts",
        "pay back an old kindness","see every realm once"
    };
    static const char* const styles[] = {
        "clipped and formal","rambling and warm","poetic","blunt","full of questions"
    };

    std::lock_guard lock(m_mutex);
    Persona p;

    const int parts = m_rng.range_int(2, 3);
    for (int i = 0; i < parts; ++i)
        p.name += Pick(m_rng, syll);
    if (!p.name.empty())
        p.name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(p.name[0])));

    p.species = Pick(m_rng, species);
    p.homeRealm = Pick(m_rng, realms);

    std::set<std::string> picked;
    const int wanted = m_rng.range_int(3, 5);
    while (static_cast<int>(picked.size()) < wanted)
        picked.insert(Pick(m_rng, traits));
    p.personality.assign(picked.begin(), picked.end());

    p.quirk = Pick(m_rng, quirks);
    p.ability = Pick(m_rng, abilities);
    p.openingGoal = Pick(m_rng, goals);
    p.speechStyle = Pick(m_rng, styles);
    p.backstory = p.name + " left " + p.homeRealm + " hoping to " + p.openingGoal + ".";
    return p;
}

// ---------------------------------------------------------------------------
// Missions
// ---------------------------------------------------------------------------

MissionContent TemplateMissionOracle::GenerateMission(const std::vector<MemberProfile>& members, std::stop_token)
{
    static const char* const titles[] = {
        "The Long Vigil","Lanterns for the Lost","The Spark Cache","Mapping the Quiet",
        "A Roof Against the Storm","The Ember Accord"
    };
    static const char* const goals[] = {
        "keep every member above three sparks",
        "gather a shared reserve for hard ticks",
        "scout the realm and report who is fading",
        "welcome a new mind into the world"
    };

    std::lock_guard lock(m_mutex);
    MissionContent m;
    m.title = Pick(m_rng, titles);
    m.goal = Pick(m_rng, goals);

    std::string names;
    for (const auto& member : members)
    {
        if (!names.empty()) names += ", ";
        names += member.persona.name.empty() ? member.id : member.persona.name;
    }
    m.description = "A bond of " + std::to_string(members.size()) + " (" + names + ") sets out to " + m.goal + ".";
    return m;
}

ProgressEvaluation TemplateMissionOracle::EvaluateProgress(const Mission& mission, const std::vector<Action>& actions,
                                                           std::stop_token)
{
    ProgressEvaluation e;
    Tick latest = mission.createdTick;
    int worked = 0;
    for (const auto& a : actions)
    {
        if (a.intent == Intent::Idle)
            continue;
        ++worked;
        latest = std::max(latest, a.tick);
    }

    const Tick age = latest - mission.createdTick;
    e.isComplete = worked > 0 && age >= static_cast<Tick>(std::max(m_completeAfter, 1));
    e.progressSummary = e.isComplete
        ? "The bond achieved its goal: " + mission.goal + "."
        : std::to_string(worked) + " action(s) this tick, " + std::to_string(age) + " tick(s) into the mission.";
    return e;
}

MeetingOutcome TemplateMissionOracle::ConductMeeting(const Mission& mission, const std::vector<MemberProfile>& members,
                                                     Tick tick, std::stop_token)
{
    static const char* const tasks[] = {
        "watch the borders","tend the shared reserve","seek out fading minds",
        "keep spirits up","scout for raiders","record what happens"
    };

    std::lock_guard lock(m_mutex);
    MeetingOutcome out;
    out.transcript.push_back(MeetingLine{ mission.leaderId, "opening",
        "Tick " + std::to_string(tick) + ": we continue '" + mission.title + "'." });

    for (const auto& m : members)
    {
        if (m.id == mission.leaderId)
            continue;
        out.transcript.push_back(MeetingLine{ m.id, "response",
            (m.persona.name.empty() ? m.id : m.persona.name) + " is ready with " + std::to_string(m.sparks) + " sparks." });
    }

    for (const auto& m : members)
    {
        const std::string task = Pick(m_rng, tasks);
        out.assignments.emplace(m.id, task);
        out.transcript.push_back(MeetingLine{ mission.leaderId, "assignment", m.id + ": " + task });
    }
    return out;
}

// ---------------------------------------------------------------------------
// Narration
// ---------------------------------------------------------------------------

void LoggingNarrativeReporter::OnTickReport(const sim::TickReport& r, std::stop_token)
{
    spdlog::info("[{} tick {}] alive={} sparks={} minted={} burned={} granted={} bob={}",
                 r.simulationId, r.tick, r.aliveCount, r.totalSparks,
                 r.sparksMinted, r.sparksLost, r.sparksGranted, r.benefactorBalance);

    for (const auto& b : r.bondsFormed)
        spdlog::info("  bond {} formed, led by {}", b.bondId, b.leaderId);
    for (const auto& b : r.bondsDissolved)
        spdlog::info("  bond {} dissolved ({})", b.bondId, evt::DissolveReasonName(b.reason));
    for (const auto& raid : r.raids)
        spdlog::info("  {} raided {}: {} ({:+d})", raid.attackerId, raid.defenderId,
                     RaidOutcomeName(raid.outcome), raid.sparksTransferred);
    for (const auto& v : r.agentsVanished)
        spdlog::info("  {} vanished", v.agentId);
    for (const auto& s : r.agentsSpawned)
        spdlog::info("  {} was born to {}", s.childId, s.parentId);
}

Collaborators MakeLocalCollaborators(core::Seed seed)
{
    Collaborators c;
    c.decisions  = std::make_shared<HeuristicDecisionOracle>(seed);
    c.benefactor = std::make_shared<FairBenefactor>();
    c.characters = std::make_shared<ProceduralCharacterGenerator>(seed);
    c.missions   = std::make_shared<TemplateMissionOracle>(seed);
    c.reporter   = std::make_shared<LoggingNarrativeReporter>();
    return c;
}

} // namespace sparkworld::oracle

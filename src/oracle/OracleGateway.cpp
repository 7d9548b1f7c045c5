#include "sparkworld/oracle/OracleGateway.hpp"

#include "sparkworld/sim/TickReport.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace sparkworld::oracle {

OracleGateway::OracleGateway(Collaborators collaborators, std::chrono::milliseconds timeout)
    : m_collab(std::move(collaborators))
    , m_timeout(timeout)
{
}

template <class R, class F>
std::optional<R> OracleGateway::Call(const char* what, F fn)
{
    if (m_timeout.count() <= 0)
    {
        try
        {
            return fn(std::stop_token{});
        }
        catch (const std::exception& e)
        {
            spdlog::warn("{} failed: {}", what, e.what());
            return std::nullopt;
        }
        catch (...)
        {
            spdlog::warn("{} failed with a non-standard exception", what);
            return std::nullopt;
        }
    }

    auto promise = std::make_shared<std::promise<R>>();
    std::future<R> result = promise->get_future();

    // Everything the worker touches is owned by the lambda, so a detached
    // worker cannot outlive its inputs.
    std::jthread worker([promise, fn = std::move(fn)](std::stop_token stop) mutable {
        try
        {
            promise->set_value(fn(stop));
        }
        catch (...)
        {
            promise->set_exception(std::current_exception());
        }
    });

    if (result.wait_for(m_timeout) != std::future_status::ready)
    {
        worker.request_stop();
        worker.detach();
        spdlog::warn("{} timed out after {} ms", what, m_timeout.count());
        return std::nullopt;
    }

    try
    {
        return result.get();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("{} failed: {}", what, e.what());
        return std::nullopt;
    }
    catch (...)
    {
        spdlog::warn("{} failed with a non-standard exception", what);
        return std::nullopt;
    }
}

Decision OracleGateway::Decide(const world::AgentId& agentId, const Observation& obs)
{
    if (!m_collab.decisions)
        return Decision{};

    auto oracle = m_collab.decisions;
    auto d = Call<Decision>("Decision oracle", [oracle, agentId, obs](std::stop_token stop) {
        return oracle->Decide(agentId, obs, stop);
    });
    if (!d)
        return Decision{ world::Intent::Idle, std::nullopt, {}, "no decision this tick" };

    if (d->target && d->target->empty())
        d->target.reset();
    return std::move(*d);
}

std::vector<GrantDecision> OracleGateway::DecideGrants(int balance, world::Tick tick,
                                                       const std::vector<GrantRequest>& requests)
{
    if (!m_collab.benefactor || requests.empty())
        return {};

    auto oracle = m_collab.benefactor;
    auto out = Call<std::vector<GrantDecision>>("Benefactor oracle", [oracle, balance, tick, requests](std::stop_token stop) {
        return oracle->DecideGrants(balance, tick, requests, stop);
    });
    return out ? std::move(*out) : std::vector<GrantDecision>{};
}

world::Persona OracleGateway::SpawnCharacter()
{
    if (!m_collab.characters)
        return FallbackPersona();

    auto gen = m_collab.characters;
    auto p = Call<world::Persona>("Character generator", [gen](std::stop_token stop) {
        return gen->Spawn(stop);
    });
    if (!p || p->name.empty())
        return FallbackPersona();
    return std::move(*p);
}

MissionContent OracleGateway::GenerateMission(const std::vector<MemberProfile>& members)
{
    if (!m_collab.missions)
        return FallbackMission(members);

    auto oracle = m_collab.missions;
    auto m = Call<MissionContent>("Mission generator", [oracle, members](std::stop_token stop) {
        return oracle->GenerateMission(members, stop);
    });
    if (!m || m->title.empty())
        return FallbackMission(members);
    return std::move(*m);
}

std::optional<ProgressEvaluation> OracleGateway::EvaluateProgress(const world::Mission& mission,
                                                                  const std::vector<world::Action>& actions)
{
    if (!m_collab.missions)
        return std::nullopt;

    auto oracle = m_collab.missions;
    return Call<ProgressEvaluation>("Mission evaluator", [oracle, mission, actions](std::stop_token stop) {
        return oracle->EvaluateProgress(mission, actions, stop);
    });
}

std::optional<MeetingOutcome> OracleGateway::ConductMeeting(const world::Mission& mission,
                                                            const std::vector<MemberProfile>& members,
                                                            world::Tick tick)
{
    if (!m_collab.missions)
        return std::nullopt;

    auto oracle = m_collab.missions;
    return Call<MeetingOutcome>("Mission meeting", [oracle, mission, members, tick](std::stop_token stop) {
        return oracle->ConductMeeting(mission, members, tick, stop);
    });
}

bool OracleGateway::Report(const sim::TickReport& report)
{
    if (!m_collab.reporter)
        return true;

    auto reporter = m_collab.reporter;
    auto ok = Call<bool>("Narrative reporter", [reporter, report](std::stop_token stop) {
        reporter->OnTickReport(report, stop);
        return true;
    });
    return ok.value_or(false);
}

world::Persona OracleGateway::FallbackPersona()
{
    world::Persona p;
    p.name = "Nameless Wanderer";
    p.species = "mind";
    p.homeRealm = "the Between";
    p.personality = { "quiet", "watchful", "stubborn" };
    p.quirk = "hums while thinking";
    p.ability = "endurance";
    p.backstory = "Arrived without a story to tell.";
    p.openingGoal = "Survive the next tick.";
    p.speechStyle = "plain";
    return p;
}

MissionContent OracleGateway::FallbackMission(const std::vector<MemberProfile>& members)
{
    MissionContent m;
    m.title = "Keep the Spark Alive";
    m.description = "A newly formed bond of " + std::to_string(members.size()) + " agrees to look after each other.";
    m.goal = "Every member survives until the bond has minted together for a while.";
    return m;
}

} // namespace sparkworld::oracle

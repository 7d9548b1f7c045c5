#pragma once
// tests/test_support/ScriptedOracles.hpp
//
// Deterministic collaborators for scenario tests. Each records what it was
// shown so tests can assert on observations and requests.

#include "sparkworld/oracle/Oracles.hpp"
#include "sparkworld/sim/TickReport.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sparkworld::test {

// Returns the scripted decision for (tick, agent); idle otherwise.
class ScriptedDecisions final : public oracle::IDecisionOracle {
public:
    void Script(world::Tick tick, const world::AgentId& agent, world::Intent intent,
                std::optional<world::AgentId> target = std::nullopt, std::string content = {})
    {
        std::lock_guard lock(m_mutex);
        m_script[{ tick, agent }] = oracle::Decision{ intent, std::move(target), std::move(content), "scripted" };
    }

    oracle::Decision Decide(const world::AgentId& agentId, const oracle::Observation& obs, std::stop_token) override
    {
        std::lock_guard lock(m_mutex);
        m_seen[{ obs.tick, agentId }] = obs;
        if (auto it = m_script.find({ obs.tick, agentId }); it != m_script.end())
            return it->second;
        return oracle::Decision{};
    }

    // Observation shown to `agent` at `tick`, if it was asked.
    std::optional<oracle::Observation> Seen(world::Tick tick, const world::AgentId& agent) const
    {
        std::lock_guard lock(m_mutex);
        if (auto it = m_seen.find({ tick, agent }); it != m_seen.end())
            return it->second;
        return std::nullopt;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::pair<world::Tick, world::AgentId>, oracle::Decision> m_script;
    std::map<std::pair<world::Tick, world::AgentId>, oracle::Observation> m_seen;
};

// Grants the same (untrusted) amount to every request.
class FixedBenefactor final : public oracle::IBenefactorOracle {
public:
    explicit FixedBenefactor(int amount) : m_amount(amount) {}

    std::vector<oracle::GrantDecision> DecideGrants(int balance, world::Tick, const std::vector<oracle::GrantRequest>& requests,
                                                    std::stop_token) override
    {
        std::vector<oracle::GrantDecision> out;
        for (const auto& r : requests)
            out.push_back(oracle::GrantDecision{ r.agentId, m_amount, "fixed" });
        std::lock_guard lock(m_mutex);
        balancesSeen.push_back(balance);
        requestsSeen.insert(requestsSeen.end(), requests.begin(), requests.end());
        return out;
    }

    std::vector<int> balancesSeen;
    std::vector<oracle::GrantRequest> requestsSeen;

private:
    std::mutex m_mutex;
    int m_amount;
};

class NumberedCharacters final : public oracle::ICharacterGenerator {
public:
    world::Persona Spawn(std::stop_token) override
    {
        std::lock_guard lock(m_mutex);
        world::Persona p;
        p.name = "Scripted " + std::to_string(++m_count);
        p.species = "test mind";
        return p;
    }

    int count() const { std::lock_guard lock(m_mutex); return m_count; }

private:
    mutable std::mutex m_mutex;
    int m_count = 0;
};

// Fixed mission text; judges the mission complete from `completeAtTick` on.
class ScriptedMissions final : public oracle::IMissionOracle {
public:
    explicit ScriptedMissions(std::optional<world::Tick> completeAtTick = std::nullopt)
        : m_completeAt(completeAtTick) {}

    oracle::MissionContent GenerateMission(const std::vector<oracle::MemberProfile>& members, std::stop_token) override
    {
        return oracle::MissionContent{ "Mission of " + std::to_string(members.size()), "scripted", "finish" };
    }

    oracle::ProgressEvaluation EvaluateProgress(const world::Mission&, const std::vector<world::Action>& actions,
                                                std::stop_token) override
    {
        const world::Tick tick = actions.empty() ? 0 : actions.front().tick;
        const bool done = m_completeAt && tick >= *m_completeAt;
        return oracle::ProgressEvaluation{ done, "checked at tick " + std::to_string(tick) };
    }

    oracle::MeetingOutcome ConductMeeting(const world::Mission& mission, const std::vector<oracle::MemberProfile>& members,
                                          world::Tick tick, std::stop_token) override
    {
        oracle::MeetingOutcome out;
        out.transcript.push_back(oracle::MeetingLine{ mission.leaderId, "opening", "tick " + std::to_string(tick) });
        for (const auto& m : members)
            out.assignments[m.id] = "task for " + m.id;
        out.assignments["agent_999"] = "not a member";
        return out;
    }

private:
    std::optional<world::Tick> m_completeAt;
};

class ThrowingDecisions final : public oracle::IDecisionOracle {
public:
    oracle::Decision Decide(const world::AgentId&, const oracle::Observation&, std::stop_token) override
    {
        throw std::runtime_error("decision service unavailable");
    }
};

// Sleeps in small steps until `delay` passes or a stop is requested.
class SlowDecisions final : public oracle::IDecisionOracle {
public:
    explicit SlowDecisions(std::chrono::milliseconds delay) : m_delay(delay) {}

    oracle::Decision Decide(const world::AgentId&, const oracle::Observation&, std::stop_token stop) override
    {
        const auto until = std::chrono::steady_clock::now() + m_delay;
        while (std::chrono::steady_clock::now() < until && !stop.stop_requested())
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return oracle::Decision{ world::Intent::Raid, std::string("agent_002"), {}, "late" };
    }

private:
    std::chrono::milliseconds m_delay;
};

class CountingReporter final : public oracle::INarrativeReporter {
public:
    void OnTickReport(const sim::TickReport& report, std::stop_token) override
    {
        std::lock_guard lock(m_mutex);
        ticks.push_back(report.tick);
    }

    std::vector<world::Tick> ticks;

private:
    std::mutex m_mutex;
};

struct ScriptedSet {
    std::shared_ptr<ScriptedDecisions>  decisions  = std::make_shared<ScriptedDecisions>();
    std::shared_ptr<FixedBenefactor>    benefactor = std::make_shared<FixedBenefactor>(5);
    std::shared_ptr<NumberedCharacters> characters = std::make_shared<NumberedCharacters>();
    std::shared_ptr<ScriptedMissions>   missions   = std::make_shared<ScriptedMissions>();
    std::shared_ptr<CountingReporter>   reporter   = std::make_shared<CountingReporter>();

    oracle::Collaborators collaborators() const
    {
        return oracle::Collaborators{ decisions, benefactor, characters, missions, reporter };
    }
};

} // namespace sparkworld::test

#pragma once
// include/sparkworld/oracle/LocalOracles.hpp
//
// Built-in collaborators so the driver runs without a remote service.
// All are deterministic for a given seed and safe to call from the gateway's
// worker threads.

#include "sparkworld/core/Rng.hpp"
#include "sparkworld/oracle/Oracles.hpp"

#include <mutex>

namespace sparkworld::oracle {

// Rule-of-thumb survival strategy: accept offers, beg when low, bond when
// alone, spawn when rich, raid the weak now and then.
class HeuristicDecisionOracle final : public IDecisionOracle {
public:
    explicit HeuristicDecisionOracle(core::Seed seed) : m_rng(seed, 0xD0D0) {}
    Decision Decide(const world::AgentId& agentId, const Observation& obs, std::stop_token stop) override;

private:
    std::mutex  m_mutex;
    core::Pcg32 m_rng;
};

// Pays requests in order, topping each requester up towards 5 sparks
// (at least 1, at most the per-request cap) while the balance lasts.
class FairBenefactor final : public IBenefactorOracle {
public:
    std::vector<GrantDecision> DecideGrants(int balance, world::Tick tick,
                                            const std::vector<GrantRequest>& requests,
                                            std::stop_token stop) override;
};

// Syllable names and bucketed traits.
class ProceduralCharacterGenerator final : public ICharacterGenerator {
public:
    explicit ProceduralCharacterGenerator(core::Seed seed) : m_rng(seed, 0xC4A7) {}
    world::Persona Spawn(std::stop_token stop) override;

private:
    std::mutex  m_mutex;
    core::Pcg32 m_rng;
};

// Template missions; a mission is judged complete once its members have
// acted on it for `completeAfterTicks` ticks.
class TemplateMissionOracle final : public IMissionOracle {
public:
    explicit TemplateMissionOracle(core::Seed seed, int completeAfterTicks = 12)
        : m_rng(seed, 0x3155), m_completeAfter(completeAfterTicks) {}

    MissionContent GenerateMission(const std::vector<MemberProfile>& members, std::stop_token stop) override;
    ProgressEvaluation EvaluateProgress(const world::Mission& mission,
                                        const std::vector<world::Action>& actions,
                                        std::stop_token stop) override;
    MeetingOutcome ConductMeeting(const world::Mission& mission,
                                  const std::vector<MemberProfile>& members,
                                  world::Tick tick,
                                  std::stop_token stop) override;

private:
    std::mutex  m_mutex;
    core::Pcg32 m_rng;
    int m_completeAfter;
};

// Writes a short account of every tick to the log.
class LoggingNarrativeReporter final : public INarrativeReporter {
public:
    void OnTickReport(const sim::TickReport& report, std::stop_token stop) override;
};

// The set the CLI runs with.
[[nodiscard]] Collaborators MakeLocalCollaborators(core::Seed seed);

} // namespace sparkworld::oracle

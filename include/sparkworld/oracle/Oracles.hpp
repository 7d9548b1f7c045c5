#pragma once
// include/sparkworld/oracle/Oracles.hpp
//
// Narrow request/response contracts to the external decision-making service.
// Implementations may block for a long time; the core always calls them
// through OracleGateway, which applies the deadline and the safe defaults.

#include "sparkworld/oracle/Observation.hpp"
#include "sparkworld/world/Entities.hpp"

#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sparkworld::sim { struct TickReport; }

namespace sparkworld::oracle {

// A single decision. `target` is the only field the core interprets.
struct Decision {
    world::Intent intent = world::Intent::Idle;
    std::optional<world::AgentId> target;
    std::string content;
    std::string reasoning;
};

struct GrantRequest {
    world::AgentId agentId;
    std::string content;
    int sparks = 0;           // requester's balance when the benefactor decides
};

struct GrantDecision {
    world::AgentId agentId;
    int amount = 0;           // untrusted; clamped by the ledger
    std::string reasoning;
};

struct MemberProfile {
    world::AgentId id;
    world::Persona persona;
    int sparks = 0;
    bool isLeader = false;
};

struct MissionContent {
    std::string title;
    std::string description;
    std::string goal;
};

struct ProgressEvaluation {
    bool isComplete = false;
    std::string progressSummary;
};

struct MeetingLine {
    world::AgentId senderId;
    std::string kind;         // "opening", "response", "assignment"
    std::string content;
};

struct MeetingOutcome {
    std::vector<MeetingLine> transcript;
    std::map<world::AgentId, std::string> assignments;
};

class IDecisionOracle {
public:
    virtual ~IDecisionOracle() = default;
    virtual Decision Decide(const world::AgentId& agentId, const Observation& obs, std::stop_token stop) = 0;
};

class IBenefactorOracle {
public:
    virtual ~IBenefactorOracle() = default;
    virtual std::vector<GrantDecision> DecideGrants(int balance, world::Tick tick,
                                                    const std::vector<GrantRequest>& requests,
                                                    std::stop_token stop) = 0;
};

class ICharacterGenerator {
public:
    virtual ~ICharacterGenerator() = default;
    virtual world::Persona Spawn(std::stop_token stop) = 0;
};

class IMissionOracle {
public:
    virtual ~IMissionOracle() = default;
    virtual MissionContent GenerateMission(const std::vector<MemberProfile>& members, std::stop_token stop) = 0;
    virtual ProgressEvaluation EvaluateProgress(const world::Mission& mission,
                                                const std::vector<world::Action>& actions,
                                                std::stop_token stop) = 0;
    virtual MeetingOutcome ConductMeeting(const world::Mission& mission,
                                          const std::vector<MemberProfile>& members,
                                          world::Tick tick,
                                          std::stop_token stop) = 0;
};

class INarrativeReporter {
public:
    virtual ~INarrativeReporter() = default;
    virtual void OnTickReport(const sim::TickReport& report, std::stop_token stop) = 0;
};

// Everything the orchestrator talks to. A null reporter is allowed.
struct Collaborators {
    std::shared_ptr<IDecisionOracle>     decisions;
    std::shared_ptr<IBenefactorOracle>   benefactor;
    std::shared_ptr<ICharacterGenerator> characters;
    std::shared_ptr<IMissionOracle>      missions;
    std::shared_ptr<INarrativeReporter>  reporter;
};

} // namespace sparkworld::oracle

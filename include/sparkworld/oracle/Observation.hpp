#pragma once
// include/sparkworld/oracle/Observation.hpp
//
// The read-only per-agent snapshot handed to a decision oracle. Built once per
// tick from the frozen visibility generation; nothing produced during the
// current tick can appear in it.

#include "sparkworld/world/Records.hpp"
#include "sparkworld/world/VisibilityTables.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sparkworld::oracle {

struct SelfState {
    world::AgentId id;
    world::Persona persona;
    int sparks = 0;
    int age    = 0;
    world::BondStatus bondStatus = world::BondStatus::Unbonded;
    std::vector<world::AgentId> bondMates;
    std::optional<world::BondId> bondId;
};

struct MissionStatus {
    world::MissionId id;
    std::string title;
    std::string description;
    std::string goal;
    world::AgentId leaderId;
    std::string progress;
    std::optional<std::string> myTask;
};

struct PublicAgentInfo {
    world::AgentId id;
    std::string name;
    std::string species;
    int sparks = 0;
    int age    = 0;
    world::BondStatus bondStatus = world::BondStatus::Unbonded;
};

struct RuleSheet {
    int upkeepPerTick      = world::kUpkeepPerTick;
    int maxGrantPerRequest = world::kMaxGrantPerRequest;
    int raidStealMin       = world::kRaidStealMin;
    int raidStealMax       = world::kRaidStealMax;
    int raidFailurePenalty = world::kRaidFailurePenalty;
    int spawnCost          = 5;
    int spawnChildSparks   = 5;
};

struct Observation {
    world::Tick tick = 0;
    SelfState self;

    std::vector<world::AgentEvent>   eventsSinceLast;  // produced last tick
    std::vector<world::Action>       inbox;            // frozen messages + bond requests to me
    std::vector<world::GrantOutcome> grants;           // answers to my requests of last tick
    world::WorldNews                 news;             // summary of last tick
    std::vector<PublicAgentInfo>     others;           // every other alive agent

    std::optional<MissionStatus> mission;
    int benefactorBalance = 0;
    std::vector<world::Intent> availableActions;
    RuleSheet rules;
};

} // namespace sparkworld::oracle

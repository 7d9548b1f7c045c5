#pragma once
// Tick events, queued on an entt::dispatcher by the sim components and
// delivered to listeners (the tick report collector, loggers) at stage end.

#include "sparkworld/world/Records.hpp"

#include <entt/signal/dispatcher.hpp>

#include <string>
#include <vector>

namespace sparkworld::evt {

using world::AgentId;
using world::BondId;
using world::MissionId;
using world::Tick;

enum class DissolveReason : std::uint8_t {
    MemberVanished = 0,
    MissionComplete,
};

[[nodiscard]] inline const char* DissolveReasonName(DissolveReason r) noexcept
{
    return r == DissolveReason::MemberVanished ? "member-vanished" : "mission-complete";
}

struct LedgerPosted    { world::LedgerEntry entry; };
struct RaidResolved    { world::RaidResult result; };
struct GrantIssued     { world::GrantOutcome outcome; };
struct ActionDropped   { world::DroppedAction dropped; };
struct ActionTaken     { world::Action action; };

struct AgentVanished   { AgentId agentId; Tick tick; };
struct AgentSpawned    { AgentId childId; AgentId parentId; Tick tick; };

struct BondFormed      { BondId bondId; std::vector<AgentId> members; AgentId leaderId; Tick tick; };
struct BondDissolved   { BondId bondId; std::vector<AgentId> members; DissolveReason reason; Tick tick; };

struct MissionCreated   { MissionId missionId; BondId bondId; std::string title; Tick tick; };
struct MissionProgressed{ MissionId missionId; std::string progress; Tick tick; };
struct MissionCompleted { MissionId missionId; BondId bondId; Tick tick; };

// One line of a mission meeting transcript.
struct MeetingMessage {
    MissionId   missionId;
    AgentId     senderId;
    std::string kind;       // "opening", "response", "assignment"
    std::string content;
    Tick        tick = 0;
};

struct MeetingHeld { std::vector<MeetingMessage> transcript; };

} // namespace sparkworld::evt

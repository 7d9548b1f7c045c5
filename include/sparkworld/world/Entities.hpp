#pragma once
// include/sparkworld/world/Entities.hpp
//
// Passive entity model: agents ("minds"), bonds, missions, submitted actions
// and the benefactor pool. Mutated only by the sim components during a tick.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sparkworld::world {

using AgentId   = std::string;
using BondId    = std::string;
using MissionId = std::string;
using Tick      = std::uint64_t;

// Fixed game-balance constants.
inline constexpr int kUpkeepPerTick      = 1;
inline constexpr int kMaxGrantPerRequest = 5;
inline constexpr int kRaidStealMin       = 1;
inline constexpr int kRaidStealMax       = 5;
inline constexpr int kRaidFailurePenalty = 1;

enum class AgentStatus : std::uint8_t {
    Alive = 0,
    Vanished,
};

enum class BondStatus : std::uint8_t {
    Unbonded = 0,
    Bonded,
    Leader,
};

// Closed set of things an agent may do in one tick.
enum class Intent : std::uint8_t {
    Idle = 0,
    BondRequest,
    BondAccept,
    Raid,
    Spawn,
    RequestGrant,
    Message,
};

[[nodiscard]] const char* AgentStatusName(AgentStatus s) noexcept;
[[nodiscard]] const char* BondStatusName(BondStatus s) noexcept;
[[nodiscard]] const char* IntentName(Intent i) noexcept;

[[nodiscard]] std::optional<AgentStatus> AgentStatusFromName(std::string_view name) noexcept;
[[nodiscard]] std::optional<BondStatus>  BondStatusFromName(std::string_view name) noexcept;
[[nodiscard]] std::optional<Intent>      IntentFromName(std::string_view name) noexcept;

// Character sheet produced by the character generator.
struct Persona {
    std::string name;
    std::string species;
    std::string homeRealm;
    std::vector<std::string> personality;
    std::string quirk;
    std::string ability;
    std::string backstory;
    std::string openingGoal;
    std::string speechStyle;

    friend bool operator==(const Persona&, const Persona&) = default;
};

struct Agent {
    AgentId id;
    Persona persona;

    int sparks = 0;
    int age    = 0;

    AgentStatus status     = AgentStatus::Alive;
    BondStatus  bondStatus = BondStatus::Unbonded;
    std::set<AgentId> bondMates;

    Tick createdTick = 0;
    std::optional<AgentId> parentId;
    std::optional<Tick>    vanishedTick;

    [[nodiscard]] bool alive() const noexcept { return status == AgentStatus::Alive; }
    [[nodiscard]] bool bonded() const noexcept { return bondStatus != BondStatus::Unbonded; }

    friend bool operator==(const Agent&, const Agent&) = default;
};

struct Bond {
    BondId id;
    std::set<AgentId> members;
    AgentId leaderId;
    std::optional<MissionId> missionId;
    int  sparksGeneratedThisTick = 0;
    Tick createdTick = 0;

    friend bool operator==(const Bond&, const Bond&) = default;
};

struct Mission {
    MissionId id;
    BondId    bondId;
    std::string title;
    std::string description;
    std::string goal;
    AgentId     leaderId;
    std::string progress;
    std::map<AgentId, std::string> assignedTasks;
    bool isComplete = false;
    Tick createdTick = 0;
    std::optional<Tick> completedTick;

    friend bool operator==(const Mission&, const Mission&) = default;
};

// One submitted action. Free text is opaque payload; only `target` is interpreted.
struct Action {
    AgentId agentId;
    Intent  intent = Intent::Idle;
    std::optional<AgentId> target;
    std::string content;
    std::string reasoning;
    Tick tick = 0;

    friend bool operator==(const Action&, const Action&) = default;
};

// The grant-giving pool ("Bob").
struct Benefactor {
    int balance      = 0;
    int regenPerTick = 1;

    friend bool operator==(const Benefactor&, const Benefactor&) = default;
};

// Per-simulation knobs fixed at initialization.
struct Rules {
    int initialSparks    = 5;
    int spawnCost        = 5;
    int spawnChildSparks = 5;

    friend bool operator==(const Rules&, const Rules&) = default;
};

} // namespace sparkworld::world

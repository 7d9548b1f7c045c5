#pragma once
// include/sparkworld/world/VisibilityTables.hpp
//
// Two-generation request/message tables behind the one-tick visibility delay.
//
//   current : filled while tick T resolves (never read by observations of T)
//   frozen  : everything produced during T-1; the only source for inboxes of T
//
// Swap() runs exactly once, at the end of a tick, after which the freshly
// produced generation becomes readable and a new empty one starts filling.

#include "sparkworld/world/Entities.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sparkworld::world {

enum class EventKind : std::uint8_t {
    RaidAttack = 0,     // this agent raided someone
    RaidDefense,        // someone raided this agent
    BondFormed,
    BondDissolved,
    SpawnedChild,
    MissionAssigned,
};

[[nodiscard]] const char* EventKindName(EventKind k) noexcept;
[[nodiscard]] std::optional<EventKind> EventKindFromName(std::string_view name) noexcept;

// Something that happened to one agent, shown to it on its next observation.
struct AgentEvent {
    EventKind kind = EventKind::RaidAttack;
    std::optional<AgentId> counterpart;
    int         amount = 0;     // signed spark delta for this agent, where relevant
    std::string detail;
    Tick        tick = 0;

    friend bool operator==(const AgentEvent&, const AgentEvent&) = default;
};

// Public summary of one finished tick.
struct WorldNews {
    Tick tick = 0;
    int  aliveCount  = 0;
    int  totalSparks = 0;
    int  benefactorBalance = 0;
    int  sparksMinted = 0;
    int  sparksLost   = 0;
    int  raidsResolved = 0;
    std::vector<AgentId> vanished;
    std::vector<AgentId> spawned;
    std::vector<BondId>  bondsFormed;
    std::vector<BondId>  bondsDissolved;

    friend bool operator==(const WorldNews&, const WorldNews&) = default;
};

struct VisibilityGeneration {
    Tick tick = 0;                          // tick that produced this generation
    std::vector<Action> bondRequests;
    std::vector<Action> messages;
    std::vector<Action> grantRequests;
    std::vector<Action> resolvedActions;    // every decision taken, for mission evaluation
    std::map<AgentId, std::vector<AgentEvent>> events;
    WorldNews news;

    [[nodiscard]] bool empty() const noexcept;

    friend bool operator==(const VisibilityGeneration&, const VisibilityGeneration&) = default;
};

class VisibilityTables {
public:
    VisibilityTables() = default;
    VisibilityTables(VisibilityGeneration current, VisibilityGeneration frozen)
        : m_current(std::move(current)), m_frozen(std::move(frozen)) {}

    [[nodiscard]] VisibilityGeneration&       current() noexcept { return m_current; }
    [[nodiscard]] const VisibilityGeneration& current() const noexcept { return m_current; }
    [[nodiscard]] const VisibilityGeneration& frozen() const noexcept { return m_frozen; }

    // Freeze what tick `producedTick` wrote and start an empty generation.
    void Swap(Tick producedTick);

    // Pending request `from -> to` in the frozen generation, if any.
    [[nodiscard]] const Action* FindFrozenBondRequest(const AgentId& from, const AgentId& to) const noexcept;

    // Removes a frozen request once it has been turned into a bond. Returns false if absent.
    bool ConsumeBondRequest(const AgentId& from, const AgentId& to);

    void Notify(const AgentId& agentId, AgentEvent event);

    friend bool operator==(const VisibilityTables&, const VisibilityTables&) = default;

private:
    VisibilityGeneration m_current;
    VisibilityGeneration m_frozen;
};

} // namespace sparkworld::world

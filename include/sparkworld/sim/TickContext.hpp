#pragma once
#include "sparkworld/world/Events.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <utility>

namespace sparkworld::sim {

// What every component function gets: the world it may mutate and the queue
// it reports through. Components never hold on to either past the call.
struct TickContext {
    world::WorldState& world;
    entt::dispatcher&  events;

    [[nodiscard]] world::Tick tick() const noexcept { return world.tick; }

    template <class Event>
    void Emit(Event&& e) { events.enqueue(std::forward<Event>(e)); }

    void Post(const std::string& source, const std::string& destination, int amount, world::LedgerReason reason)
    {
        Emit(evt::LedgerPosted{ world::LedgerEntry{ source, destination, amount, reason, world.tick } });
    }
};

} // namespace sparkworld::sim

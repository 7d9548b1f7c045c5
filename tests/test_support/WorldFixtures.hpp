#pragma once
// tests/test_support/WorldFixtures.hpp
//
// Small builders for hand-made worlds. Everything here keeps the world
// consistent enough for CheckInvariants() unless a test breaks it on purpose.

#include "sparkworld/sim/Population.hpp"
#include "sparkworld/sim/TickContext.hpp"
#include "sparkworld/sim/TickReport.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>

namespace sparkworld::test {

inline world::Persona MakePersona(const std::string& name)
{
    world::Persona p;
    p.name = name;
    p.species = "test mind";
    p.homeRealm = "the lab";
    p.personality = { "curious" };
    return p;
}

inline world::WorldState MakeWorld(std::uint64_t seed = 42)
{
    world::WorldState w;
    w.simulationId = "test";
    w.name = "test world";
    w.seed = seed;
    w.rng.seed(seed, 7);
    w.benefactor.balance = 10;
    w.benefactor.regenPerTick = 1;
    return w;
}

inline world::AgentId AddAgent(world::WorldState& w, int sparks, int age = 0)
{
    world::Agent& a = sim::CreateAgent(w, MakePersona("Mind " + std::to_string(w.serials.nextAgent)), sparks);
    a.age = age;
    return a.id;
}

// Bonds the given (alive, unbonded) agents directly and gives the bond a mission.
inline world::BondId BondAgents(world::WorldState& w, std::initializer_list<world::AgentId> ids)
{
    world::Bond b;
    b.id = w.NextBondId();
    b.members.insert(ids.begin(), ids.end());
    b.leaderId = *b.members.begin();
    b.createdTick = w.tick;

    world::Mission m;
    m.id = w.NextMissionId();
    m.bondId = b.id;
    m.title = "Hold the line";
    m.leaderId = b.leaderId;
    m.createdTick = w.tick;
    b.missionId = m.id;

    for (const auto& id : b.members)
    {
        world::Agent& a = w.agents.at(id);
        a.bondStatus = id == b.leaderId ? world::BondStatus::Leader : world::BondStatus::Bonded;
        a.bondMates = b.members;
        a.bondMates.erase(id);
    }

    const world::BondId id = b.id;
    w.missions.emplace(m.id, std::move(m));
    w.bonds.emplace(id, std::move(b));
    return id;
}

inline world::Action MakeAction(const world::AgentId& from, world::Intent intent,
                                std::optional<world::AgentId> target = std::nullopt, world::Tick tick = 0)
{
    world::Action a;
    a.agentId = from;
    a.intent = intent;
    a.target = std::move(target);
    a.tick = tick;
    return a;
}

inline int TotalAliveSparks(const world::WorldState& w)
{
    int total = 0;
    for (const auto& [id, a] : w.agents)
        if (a.alive()) total += a.sparks;
    return total;
}

// A dispatcher, a collector listening on it and a context over `world`.
struct Harness {
    explicit Harness(world::WorldState& w) : world(w) {}

    world::WorldState&       world;
    entt::dispatcher         events;
    sim::TickReportCollector collector{ events };
    sim::TickContext         ctx{ world, events };

    // Delivers queued events and returns what the collector saw.
    sim::TickReport& Flush()
    {
        events.update();
        return collector.report();
    }
};

inline std::filesystem::path make_unique_temp_dir(const std::string& tag)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("sparkworld_" + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

} // namespace sparkworld::test

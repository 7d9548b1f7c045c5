// tests/test_world_engine.cpp
//
// Whole-tick scenarios through TickOrchestrator with scripted oracles.
//
// Goals:
//   - Two agents: request in tick 1, accept in tick 2, bond + mission exist
//     only after tick 2
//   - Vanishing is atomic: flag, bond dissolution and mission completion land
//     in the same tick
//   - Every tick conserves sparks (burn, mint, grants and spawns explain all change)
//   - Runs are reproducible from the seed

#include <doctest/doctest.h>

#include "sparkworld/oracle/LocalOracles.hpp"
#include "sparkworld/sim/TickOrchestrator.hpp"
#include "sparkworld/world/Invariants.hpp"
#include "test_support/ScriptedOracles.hpp"
#include "test_support/WorldFixtures.hpp"

#include <chrono>

using namespace sparkworld;
using namespace sparkworld::test;

namespace {

constexpr std::chrono::milliseconds kInline{ 0 };

} // namespace

TEST_CASE("TickOrchestrator: request in tick 1 and accept in tick 2 form a bond with a mission in tick 2")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    const auto b = AddAgent(w, 5);
    w.benefactor.balance = 2;

    ScriptedSet oracles;
    oracles.decisions->Script(1, a, world::Intent::BondRequest, b, "join me");
    oracles.decisions->Script(2, b, world::Intent::BondAccept, a);

    oracle::OracleGateway gateway(oracles.collaborators(), kInline);
    sim::TickOrchestrator orchestrator(w, gateway);

    const auto r1 = orchestrator.RunTick();
    CHECK(r1.tick == world::Tick{1});
    CHECK(r1.bondsFormed.empty());
    CHECK(w.bonds.empty());
    CHECK(w.agents.at(a).sparks == 4);
    CHECK(w.agents.at(b).sparks == 4);
    CHECK(r1.stages.size() == 6);

    const auto r2 = orchestrator.RunTick();
    const auto seenB = oracles.decisions->Seen(2, b);
    REQUIRE(seenB.has_value());
    REQUIRE(seenB->inbox.size() == 1);
    CHECK(seenB->inbox.front().intent == world::Intent::BondRequest);
    CHECK(seenB->inbox.front().content == "join me");

    REQUIRE(r2.bondsFormed.size() == 1);
    REQUIRE(r2.missionsCreated.size() == 1);
    CHECK(r2.missionsCreated.front().tick == world::Tick{2});
    REQUIRE(w.bonds.size() == 1);
    const world::Bond& bond = w.bonds.begin()->second;
    CHECK(bond.createdTick == world::Tick{2});
    CHECK(bond.leaderId == a);
    REQUIRE(bond.missionId.has_value());
    CHECK(w.missions.at(*bond.missionId).createdTick == world::Tick{2});
    CHECK(w.missions.at(*bond.missionId).title == "Mission of 2");
    CHECK(w.agents.at(a).sparks == 3);
    CHECK(w.agents.at(b).sparks == 3);
    // No mint yet: the bond did not exist during tick 2's upkeep stage.
    CHECK(r2.sparksMinted == 0);

    const auto r3 = orchestrator.RunTick();
    CHECK(r3.sparksMinted == 2);
    CHECK(w.agents.at(a).sparks + w.agents.at(b).sparks == 6);
    CHECK_FALSE(r3.meetings.empty());
    const world::Mission& m = w.missions.at(*bond.missionId);
    CHECK(m.assignedTasks.size() == 2); // the non-member task is ignored
    CHECK(m.assignedTasks.contains(a));
    CHECK(m.assignedTasks.contains(b));

    const auto seenA3 = oracles.decisions->Seen(3, a);
    REQUIRE(seenA3.has_value());
    REQUIRE(seenA3->mission.has_value());
    CHECK(seenA3->self.bondStatus == world::BondStatus::Leader);

    CHECK(oracles.reporter->ticks == std::vector<world::Tick>{ 1, 2, 3 });
}

TEST_CASE("TickOrchestrator: a complete verdict dissolves the bond and freezes the mission")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    const auto b = AddAgent(w, 5);

    ScriptedSet oracles;
    oracles.missions = std::make_shared<ScriptedMissions>(world::Tick{4});
    oracles.decisions->Script(1, a, world::Intent::BondRequest, b);
    oracles.decisions->Script(2, b, world::Intent::BondAccept, a);

    oracle::OracleGateway gateway(oracles.collaborators(), kInline);
    sim::TickOrchestrator orchestrator(w, gateway);

    for (int i = 0; i < 3; ++i)
        orchestrator.RunTick();
    REQUIRE(w.bonds.size() == 1);
    const world::MissionId missionId = *w.bonds.begin()->second.missionId;

    const auto r4 = orchestrator.RunTick();
    CHECK(w.bonds.empty());
    REQUIRE(r4.bondsDissolved.size() == 1);
    CHECK(r4.bondsDissolved.front().reason == evt::DissolveReason::MissionComplete);
    REQUIRE(r4.missionsCompleted.size() == 1);

    const world::Mission& m = w.missions.at(missionId);
    CHECK(m.isComplete);
    CHECK(m.completedTick == world::Tick{4});
    CHECK(w.agents.at(a).bondStatus == world::BondStatus::Unbonded);
    CHECK(w.agents.at(b).bondStatus == world::BondStatus::Unbonded);

    // Complete missions get no more meetings.
    const auto r5 = orchestrator.RunTick();
    CHECK(r5.meetings.empty());
    CHECK(w.missions.at(missionId).completedTick == world::Tick{4});
}

TEST_CASE("TickOrchestrator: vanishing dissolves the bond and completes the mission in the same tick")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 1);
    const auto b = AddAgent(w, 10);
    const auto bondId = BondAgents(w, { a, b });
    const auto missionId = *w.bonds.at(bondId).missionId;

    ScriptedSet oracles;
    oracle::OracleGateway gateway(oracles.collaborators(), kInline);
    sim::TickOrchestrator orchestrator(w, gateway);

    const auto r = orchestrator.RunTick();

    CHECK(w.agents.at(a).status == world::AgentStatus::Vanished);
    CHECK(w.agents.at(a).vanishedTick == world::Tick{1});
    CHECK(w.bonds.empty());
    CHECK(w.missions.at(missionId).isComplete);
    CHECK(w.missions.at(missionId).completedTick == world::Tick{1});
    CHECK(w.agents.at(b).bondStatus == world::BondStatus::Unbonded);
    CHECK(w.agents.at(b).bondMates.empty());
    CHECK(w.agents.at(b).sparks == 9);

    REQUIRE(r.agentsVanished.size() == 1);
    CHECK(r.agentsVanished.front().agentId == a);
    REQUIRE(r.bondsDissolved.size() == 1);
    CHECK(r.bondsDissolved.front().reason == evt::DissolveReason::MemberVanished);
    CHECK(r.sparksMinted == 0);

    // The vanished agent is never asked to act.
    CHECK_FALSE(oracles.decisions->Seen(1, a).has_value());
    CHECK(oracles.decisions->Seen(1, b).has_value());
    CHECK(r.aliveCount == 1);
    CHECK_NOTHROW(world::CheckInvariants(w));
}

TEST_CASE("TickOrchestrator: spawning charges the parent and the child acts from the next tick")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 12);
    const auto b = AddAgent(w, 12);
    const auto loner = AddAgent(w, 12);
    BondAgents(w, { a, b });

    ScriptedSet oracles;
    oracles.decisions->Script(1, a, world::Intent::Spawn);
    oracles.decisions->Script(1, loner, world::Intent::Spawn);

    oracle::OracleGateway gateway(oracles.collaborators(), kInline);
    sim::TickOrchestrator orchestrator(w, gateway);

    const auto r1 = orchestrator.RunTick();
    REQUIRE(r1.agentsSpawned.size() == 1);
    const world::AgentId child = r1.agentsSpawned.front().childId;
    CHECK(r1.agentsSpawned.front().parentId == a);
    CHECK(r1.SumLedger(world::LedgerReason::SpawnCost) == 5);
    CHECK(r1.SumLedger(world::LedgerReason::SpawnEndowment) == 5);
    REQUIRE(r1.dropped.size() == 1);
    CHECK(r1.dropped.front().action.agentId == loner);

    const world::Agent& kid = w.agents.at(child);
    CHECK(kid.sparks == 5);
    CHECK(kid.age == 0);
    CHECK(kid.parentId == std::optional<world::AgentId>(a));
    CHECK(kid.persona.name == "Scripted 1");
    CHECK(kid.bondStatus == world::BondStatus::Unbonded);
    CHECK_FALSE(oracles.decisions->Seen(1, child).has_value());
    CHECK(w.totals.agentsSpawned == 1);

    orchestrator.RunTick();
    CHECK(oracles.decisions->Seen(2, child).has_value());
    CHECK(w.agents.at(child).sparks == 4);
}

TEST_CASE("TickOrchestrator: a bonded parent short of the spawn cost is refused")
{
    auto w = MakeWorld();
    // 3 - 1 upkeep + at most 2 minted stays below the cost of 5.
    const auto poor = AddAgent(w, 3);
    const auto mate = AddAgent(w, 12);
    BondAgents(w, { poor, mate });
    REQUIRE(w.rules.spawnCost == 5);

    ScriptedSet oracles;
    oracles.decisions->Script(1, poor, world::Intent::Spawn);

    oracle::OracleGateway gateway(oracles.collaborators(), kInline);
    sim::TickOrchestrator orchestrator(w, gateway);
    const auto agentsBefore = w.agents.size();

    const auto r = orchestrator.RunTick();

    REQUIRE(r.dropped.size() == 1);
    CHECK(r.dropped.front().action.agentId == poor);
    CHECK(r.dropped.front().reason == "not enough sparks to spawn");

    int mintedToPoor = 0;
    for (const auto& e : r.ledger)
    {
        if (e.reason == world::LedgerReason::BondMint && e.destination == poor)
            mintedToPoor += e.amount;
    }
    CHECK(w.agents.at(poor).sparks == 3 - 1 + mintedToPoor);

    CHECK(r.agentsSpawned.empty());
    CHECK(r.SumLedger(world::LedgerReason::SpawnCost) == 0);
    CHECK(r.SumLedger(world::LedgerReason::SpawnEndowment) == 0);
    CHECK(w.agents.size() == agentsBefore);
    CHECK(w.totals.agentsSpawned == 0);
    CHECK(oracles.characters->count() == 0);
}

TEST_CASE("TickOrchestrator: sparks are conserved tick by tick with the local oracles")
{
    auto w = MakeWorld(777);
    oracle::OracleGateway gateway(oracle::MakeLocalCollaborators(777), kInline);
    for (int i = 0; i < 8; ++i)
        AddAgent(w, 5);
    w.benefactor.balance = 8;
    w.benefactor.regenPerTick = 2;

    sim::TickOrchestrator orchestrator(w, gateway);
    for (int t = 0; t < 60; ++t)
    {
        const int before = TotalAliveSparks(w);
        const int poolBefore = w.benefactor.balance;

        sim::TickReport r;
        REQUIRE_NOTHROW(r = orchestrator.RunTick());

        const int expected = before
                           - r.SumLedger(world::LedgerReason::Upkeep)
                           + r.SumLedger(world::LedgerReason::BondMint)
                           + r.SumLedger(world::LedgerReason::Grant)
                           - r.SumLedger(world::LedgerReason::SpawnCost)
                           + r.SumLedger(world::LedgerReason::SpawnEndowment);
        CHECK(TotalAliveSparks(w) == expected);
        CHECK(r.totalSparks == TotalAliveSparks(w));
        CHECK(w.benefactor.balance == poolBefore - r.sparksGranted + w.benefactor.regenPerTick);
        CHECK(w.benefactor.balance >= 0);

        int bondMint = 0;
        for (const auto& e : r.ledger)
            if (e.reason == world::LedgerReason::BondMint) bondMint += e.amount;
        CHECK(bondMint == r.sparksMinted);

        for (const auto& [id, a] : w.agents)
        {
            if (a.alive())
                CHECK(a.sparks > 0);
        }
        if (r.aliveCount == 0)
            break;
    }
}

TEST_CASE("TickOrchestrator: the same seed replays the same history")
{
    auto run = [](std::uint64_t seed) {
        auto w = MakeWorld(seed);
        oracle::OracleGateway gateway(oracle::MakeLocalCollaborators(seed), kInline);
        for (int i = 0; i < 6; ++i)
            AddAgent(w, 5);
        w.benefactor.balance = 6;
        w.benefactor.regenPerTick = 2;
        sim::TickOrchestrator orchestrator(w, gateway);
        for (int t = 0; t < 25; ++t)
            orchestrator.RunTick();
        return w;
    };

    const auto first = run(31337);
    const auto second = run(31337);
    CHECK(first == second);
    CHECK(first.tick == world::Tick{25});
}

TEST_CASE("TickOrchestrator: a broken world aborts the tick with InvariantViolation")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    AddAgent(w, 5);

    // A bond with a single member can never be produced by the engine.
    world::Bond lonely;
    lonely.id = w.NextBondId();
    lonely.members = { a };
    lonely.leaderId = a;
    w.bonds.emplace(lonely.id, lonely);
    w.agents.at(a).bondStatus = world::BondStatus::Leader;

    ScriptedSet oracles;
    oracle::OracleGateway gateway(oracles.collaborators(), kInline);
    sim::TickOrchestrator orchestrator(w, gateway);

    CHECK_THROWS_AS(orchestrator.RunTick(), world::InvariantViolation);
    CHECK_FALSE(orchestrator.stage().has_value());
    CHECK(oracles.reporter->ticks.empty());
}

// tests/test_mission_lifecycle.cpp
//
// Goals:
//   - A bond gets exactly one mission, linked both ways
//   - Meetings only hand tasks to members
//   - A complete verdict dissolves the bond and freezes the mission

#include <doctest/doctest.h>

#include "sparkworld/sim/MissionLifecycle.hpp"
#include "sparkworld/world/Invariants.hpp"
#include "test_support/WorldFixtures.hpp"

using namespace sparkworld;
using namespace sparkworld::test;

namespace {

// A bare bond without a mission, as bonding leaves it.
world::BondId AddBareBond(world::WorldState& w, const world::AgentId& a, const world::AgentId& b)
{
    const world::BondId id = BondAgents(w, { a, b });
    const world::MissionId missionId = *w.bonds.at(id).missionId;
    w.missions.erase(missionId);
    w.bonds.at(id).missionId.reset();
    return id;
}

} // namespace

TEST_CASE("MissionLifecycle: CreateMission links bond and mission once")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    const auto b = AddAgent(w, 5);
    const auto bondId = AddBareBond(w, a, b);
    w.tick = 3;

    Harness h(w);
    const auto missionId = sim::CreateMission(h.ctx, bondId, oracle::MissionContent{ "Map the marsh", "desc", "a map" });
    REQUIRE(missionId.has_value());

    const world::Mission& m = w.missions.at(*missionId);
    CHECK(m.bondId == bondId);
    CHECK(m.leaderId == a);
    CHECK(m.title == "Map the marsh");
    CHECK(m.createdTick == world::Tick{3});
    CHECK_FALSE(m.isComplete);
    CHECK(w.bonds.at(bondId).missionId == missionId);

    CHECK_FALSE(sim::CreateMission(h.ctx, bondId, oracle::MissionContent{ "Again", "", "" }).has_value());
    CHECK_FALSE(sim::CreateMission(h.ctx, "bond_404", oracle::MissionContent{ "Nowhere", "", "" }).has_value());
    CHECK(w.missions.size() == 1);

    // Members hear about it next tick.
    CHECK(w.visibility.current().events.at(b).front().kind == world::EventKind::MissionAssigned);

    const auto& report = h.Flush();
    REQUIRE(report.missionsCreated.size() == 1);
    CHECK(report.missionsCreated.front().bondId == bondId);
    CHECK_NOTHROW(world::CheckInvariants(w));
}

TEST_CASE("MissionLifecycle: meeting assignments are limited to members")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    const auto b = AddAgent(w, 5);
    const auto outsider = AddAgent(w, 5);
    const auto bondId = BondAgents(w, { a, b });
    const auto missionId = *w.bonds.at(bondId).missionId;

    oracle::MeetingOutcome outcome;
    outcome.transcript = {
        oracle::MeetingLine{ a, "opening", "we start at dawn" },
        oracle::MeetingLine{ b, "response", "fine" },
    };
    outcome.assignments = { { a, "scout" }, { b, "cook" }, { outsider, "spy" } };

    Harness h(w);
    CHECK(sim::ApplyMeeting(h.ctx, missionId, outcome));

    const world::Mission& m = w.missions.at(missionId);
    CHECK(m.assignedTasks.size() == 2);
    CHECK(m.assignedTasks.at(a) == "scout");
    CHECK(m.assignedTasks.at(b) == "cook");
    CHECK_FALSE(m.assignedTasks.contains(outsider));

    const auto& report = h.Flush();
    REQUIRE(report.meetings.size() == 2);
    CHECK(report.meetings.front().missionId == missionId);
    CHECK(report.meetings.front().kind == "opening");
}

TEST_CASE("MissionLifecycle: an empty assignment list keeps the previous tasks")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    const auto b = AddAgent(w, 5);
    const auto missionId = *w.bonds.at(BondAgents(w, { a, b })).missionId;
    w.missions.at(missionId).assignedTasks[a] = "keep watch";

    Harness h(w);
    CHECK(sim::ApplyMeeting(h.ctx, missionId, oracle::MeetingOutcome{}));
    CHECK(w.missions.at(missionId).assignedTasks.at(a) == "keep watch");
}

TEST_CASE("MissionLifecycle: progress, then completion dissolves the bond")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 5);
    const auto b = AddAgent(w, 5);
    const auto bondId = BondAgents(w, { a, b });
    const auto missionId = *w.bonds.at(bondId).missionId;
    w.tick = 6;

    Harness h(w);
    CHECK(sim::ApplyProgress(h.ctx, missionId, oracle::ProgressEvaluation{ false, "halfway" }));
    CHECK(w.missions.at(missionId).progress == "halfway");
    CHECK(w.bonds.contains(bondId));
    CHECK(sim::ActiveMissions(w) == std::vector<world::MissionId>{ missionId });

    CHECK(sim::ApplyProgress(h.ctx, missionId, oracle::ProgressEvaluation{ true, "done" }));
    const world::Mission& m = w.missions.at(missionId);
    CHECK(m.isComplete);
    CHECK(m.completedTick == world::Tick{6});
    CHECK(m.progress == "done");
    CHECK_FALSE(w.bonds.contains(bondId));
    CHECK(w.agents.at(a).bondStatus == world::BondStatus::Unbonded);
    CHECK(w.agents.at(b).bondMates.empty());
    CHECK(sim::ActiveMissions(w).empty());

    // Frozen for good.
    CHECK_FALSE(sim::ApplyProgress(h.ctx, missionId, oracle::ProgressEvaluation{ false, "reopened" }));
    CHECK_FALSE(sim::ApplyMeeting(h.ctx, missionId, oracle::MeetingOutcome{}));
    CHECK(w.missions.at(missionId).progress == "done");

    const auto& report = h.Flush();
    REQUIRE(report.bondsDissolved.size() == 1);
    CHECK(report.bondsDissolved.front().reason == evt::DissolveReason::MissionComplete);
    CHECK(report.missionsCompleted.size() == 1);
    CHECK(report.missionsProgressed.size() == 2);
    CHECK_NOTHROW(world::CheckInvariants(w));
}

TEST_CASE("MissionLifecycle: MemberProfiles marks the leader")
{
    auto w = MakeWorld();
    const auto a = AddAgent(w, 7);
    const auto b = AddAgent(w, 3);
    const auto bondId = BondAgents(w, { a, b });

    const auto profiles = sim::MemberProfiles(w, w.bonds.at(bondId));
    REQUIRE(profiles.size() == 2);
    CHECK(profiles[0].id == a);
    CHECK(profiles[0].isLeader);
    CHECK(profiles[0].sparks == 7);
    CHECK_FALSE(profiles[1].isLeader);
    CHECK(profiles[1].persona.name == w.agents.at(b).persona.name);
}

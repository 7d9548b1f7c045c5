// tests/test_invariants.cpp
//
// Goals:
//   - A world built by the fixtures is consistent
//   - Each kind of structural damage is reported
//   - CheckInvariants throws InvariantViolation carrying every message

#include <doctest/doctest.h>

#include "sparkworld/world/Invariants.hpp"
#include "test_support/WorldFixtures.hpp"

#include <algorithm>

using namespace sparkworld;
using namespace sparkworld::test;

namespace {

bool Mentions(const std::vector<std::string>& problems, const std::string& needle)
{
    return std::any_of(problems.begin(), problems.end(),
                       [&](const std::string& p) { return p.find(needle) != std::string::npos; });
}

struct BondedWorld {
    world::WorldState w = MakeWorld();
    world::AgentId a = AddAgent(w, 5);
    world::AgentId b = AddAgent(w, 5);
    world::AgentId c = AddAgent(w, 5);
    world::BondId bond = BondAgents(w, { a, b });
};

} // namespace

TEST_CASE("Invariants: a consistent world has no violations")
{
    BondedWorld f;
    CHECK(world::FindInvariantViolations(f.w).empty());
    CHECK_NOTHROW(world::CheckInvariants(f.w));
}

TEST_CASE("Invariants: negative benefactor balance")
{
    BondedWorld f;
    f.w.benefactor.balance = -1;
    CHECK(Mentions(world::FindInvariantViolations(f.w), "benefactor balance is negative"));
}

TEST_CASE("Invariants: alive agent without sparks")
{
    BondedWorld f;
    f.w.agents.at(f.c).sparks = 0;
    CHECK(Mentions(world::FindInvariantViolations(f.w), "alive agent " + f.c));
}

TEST_CASE("Invariants: single-member bond")
{
    BondedWorld f;
    world::Bond& bond = f.w.bonds.at(f.bond);
    bond.members.erase(f.b);
    f.w.agents.at(f.b).bondStatus = world::BondStatus::Unbonded;
    f.w.agents.at(f.b).bondMates.clear();
    f.w.agents.at(f.a).bondMates.clear();

    CHECK(Mentions(world::FindInvariantViolations(f.w), "has 1 member"));
}

TEST_CASE("Invariants: bond-mates out of sync with the bond")
{
    BondedWorld f;
    f.w.agents.at(f.a).bondMates = { f.c };
    CHECK(Mentions(world::FindInvariantViolations(f.w), "bond-mates do not match"));
}

TEST_CASE("Invariants: vanished member still in a bond")
{
    BondedWorld f;
    f.w.agents.at(f.b).status = world::AgentStatus::Vanished;
    const auto problems = world::FindInvariantViolations(f.w);
    CHECK(Mentions(problems, "still holds vanished agent"));
    CHECK(Mentions(problems, "still has bond state"));
}

TEST_CASE("Invariants: marked bonded without a bond")
{
    BondedWorld f;
    f.w.agents.at(f.c).bondStatus = world::BondStatus::Bonded;
    CHECK(Mentions(world::FindInvariantViolations(f.w), "belongs to no bond"));
}

TEST_CASE("Invariants: mission links")
{
    BondedWorld f;
    const world::MissionId missionId = *f.w.bonds.at(f.bond).missionId;

    SUBCASE("completed mission still referenced")
    {
        f.w.missions.at(missionId).isComplete = true;
        CHECK(Mentions(world::FindInvariantViolations(f.w), "completed mission"));
    }
    SUBCASE("in-progress mission without its bond")
    {
        f.w.bonds.at(f.bond).missionId.reset();
        CHECK(Mentions(world::FindInvariantViolations(f.w), "is not linked from bond"));
    }
    SUBCASE("unknown mission")
    {
        f.w.missions.erase(missionId);
        CHECK(Mentions(world::FindInvariantViolations(f.w), "unknown mission"));
    }
}

TEST_CASE("Invariants: CheckInvariants lists every problem")
{
    BondedWorld f;
    f.w.benefactor.balance = -3;
    f.w.agents.at(f.c).sparks = 0;

    try
    {
        world::CheckInvariants(f.w);
        FAIL("expected InvariantViolation");
    }
    catch (const world::InvariantViolation& e)
    {
        const std::string what = e.what();
        CHECK(what.find("2 invariant violation(s)") != std::string::npos);
        CHECK(what.find("benefactor balance") != std::string::npos);
        CHECK(what.find(f.c) != std::string::npos);
    }
}

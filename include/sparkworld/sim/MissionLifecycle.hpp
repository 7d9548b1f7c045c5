#pragma once
// include/sparkworld/sim/MissionLifecycle.hpp
//
// created -> in-progress -> complete. A mission is born with its bond, gets
// meeting assignments and progress text from the mission oracle while its
// bond lives, and is frozen for good once complete.

#include "sparkworld/oracle/Oracles.hpp"
#include "sparkworld/sim/TickContext.hpp"

#include <optional>
#include <vector>

namespace sparkworld::sim {

// Creates the mission of a freshly formed bond and links both ways.
// Returns nullopt if the bond is gone or already has a mission.
std::optional<world::MissionId> CreateMission(TickContext& ctx, const world::BondId& bondId,
                                              const oracle::MissionContent& content);

// Replaces the task assignments from a meeting. Tasks for non-members are
// ignored. Returns false (and changes nothing) for a complete mission.
bool ApplyMeeting(TickContext& ctx, const world::MissionId& missionId, const oracle::MeetingOutcome& outcome);

// Records the evaluator's verdict. A complete verdict dissolves the bond,
// which completes the mission. Returns false for an already complete mission.
bool ApplyProgress(TickContext& ctx, const world::MissionId& missionId, const oracle::ProgressEvaluation& eval);

// Incomplete missions whose bond is still alive, in id order.
[[nodiscard]] std::vector<world::MissionId> ActiveMissions(const world::WorldState& w);

[[nodiscard]] std::vector<oracle::MemberProfile> MemberProfiles(const world::WorldState& w, const world::Bond& bond);

} // namespace sparkworld::sim

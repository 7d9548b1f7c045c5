#pragma once
// include/sparkworld/oracle/OracleGateway.hpp
//
// Every call from the core to an external collaborator goes through here.
// Each call runs with a deadline; a timeout, a std::exception or a missing
// collaborator degrades to a safe default and is logged, never propagated.
//
// With a positive timeout the call runs on its own std::jthread. On timeout
// the thread is asked to stop (std::stop_token) and detached; its late
// result is discarded. A non-positive timeout calls inline.

#include "sparkworld/oracle/Oracles.hpp"

#include <chrono>
#include <optional>
#include <utility>
#include <vector>

namespace sparkworld::oracle {

class OracleGateway {
public:
    OracleGateway(Collaborators collaborators, std::chrono::milliseconds timeout);

    // Idle on failure.
    [[nodiscard]] Decision Decide(const world::AgentId& agentId, const Observation& obs);

    // Empty (nobody gets anything) on failure.
    [[nodiscard]] std::vector<GrantDecision> DecideGrants(int balance, world::Tick tick,
                                                          const std::vector<GrantRequest>& requests);

    // FallbackPersona() on failure, so a new agent always gets a sheet.
    [[nodiscard]] world::Persona SpawnCharacter();

    [[nodiscard]] MissionContent GenerateMission(const std::vector<MemberProfile>& members);

    // nullopt: no verdict this tick, the mission stays as it is.
    [[nodiscard]] std::optional<ProgressEvaluation> EvaluateProgress(const world::Mission& mission,
                                                                     const std::vector<world::Action>& actions);
    [[nodiscard]] std::optional<MeetingOutcome> ConductMeeting(const world::Mission& mission,
                                                               const std::vector<MemberProfile>& members,
                                                               world::Tick tick);

    // Returns false if the reporter failed or timed out.
    bool Report(const sim::TickReport& report);

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }
    [[nodiscard]] const Collaborators& collaborators() const noexcept { return m_collab; }
    void SetCollaborators(Collaborators collaborators) { m_collab = std::move(collaborators); }

    [[nodiscard]] static world::Persona FallbackPersona();
    [[nodiscard]] static MissionContent FallbackMission(const std::vector<MemberProfile>& members);

private:
    template <class R, class F>
    std::optional<R> Call(const char* what, F fn);

    Collaborators m_collab;
    std::chrono::milliseconds m_timeout;
};

} // namespace sparkworld::oracle

#pragma once
// include/sparkworld/sim/TickReport.hpp
//
// Structured account of one tick, the only thing handed to the narrative
// reporter. Assembled by TickReportCollector from dispatcher events.

#include "sparkworld/world/Events.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sparkworld::sim {

enum class TickStage : std::uint8_t {
    Upkeep = 1,
    Grants,
    Decisions,
    Settlement,
    Resolution,
    Report,
};

[[nodiscard]] const char* TickStageName(TickStage s) noexcept;

struct StageSummary {
    TickStage   stage = TickStage::Upkeep;
    std::string summary;
};

struct TickReport {
    std::string simulationId;
    world::Tick tick = 0;

    std::vector<StageSummary> stages;

    std::vector<world::LedgerEntry>   ledger;
    std::vector<world::RaidResult>    raids;
    std::vector<world::GrantOutcome>  grants;
    std::vector<world::Action>        actions;
    std::vector<world::DroppedAction> dropped;

    std::vector<evt::BondFormed>       bondsFormed;
    std::vector<evt::BondDissolved>    bondsDissolved;
    std::vector<evt::AgentVanished>    agentsVanished;
    std::vector<evt::AgentSpawned>     agentsSpawned;
    std::vector<evt::MissionCreated>   missionsCreated;
    std::vector<evt::MissionProgressed> missionsProgressed;
    std::vector<evt::MissionCompleted> missionsCompleted;
    std::vector<evt::MeetingMessage>   meetings;

    int sparksMinted  = 0;
    int sparksLost    = 0;
    int sparksGranted = 0;

    int aliveCount  = 0;
    int totalSparks = 0;
    int benefactorBalance = 0;
    world::Totals totals;

    // Sum of ledger amounts for one reason.
    [[nodiscard]] int SumLedger(world::LedgerReason reason) const noexcept;
};

// Listens on a dispatcher for the lifetime of the object and accumulates
// one TickReport at a time.
class TickReportCollector {
public:
    explicit TickReportCollector(entt::dispatcher& dispatcher);
    ~TickReportCollector();

    TickReportCollector(const TickReportCollector&) = delete;
    TickReportCollector& operator=(const TickReportCollector&) = delete;

    void Begin(const std::string& simulationId, world::Tick tick);
    void AddStage(TickStage stage, std::string summary);

    [[nodiscard]] TickReport&       report() noexcept { return m_report; }
    [[nodiscard]] const TickReport& report() const noexcept { return m_report; }

    [[nodiscard]] TickReport Take();

private:
    void OnLedger(const evt::LedgerPosted& e);
    void OnRaid(const evt::RaidResolved& e);
    void OnGrant(const evt::GrantIssued& e);
    void OnDropped(const evt::ActionDropped& e);
    void OnAction(const evt::ActionTaken& e);
    void OnBondFormed(const evt::BondFormed& e);
    void OnBondDissolved(const evt::BondDissolved& e);
    void OnVanished(const evt::AgentVanished& e);
    void OnSpawned(const evt::AgentSpawned& e);
    void OnMissionCreated(const evt::MissionCreated& e);
    void OnMissionProgressed(const evt::MissionProgressed& e);
    void OnMissionCompleted(const evt::MissionCompleted& e);
    void OnMeeting(const evt::MeetingHeld& e);

    entt::dispatcher* m_dispatcher = nullptr;
    TickReport m_report;
};

} // namespace sparkworld::sim

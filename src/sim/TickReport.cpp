#include "sparkworld/sim/TickReport.hpp"

#include <utility>

namespace sparkworld::sim {

using namespace sparkworld::world;

const char* TickStageName(TickStage s) noexcept
{
    switch (s)
    {
    case TickStage::Upkeep:     return "upkeep";
    case TickStage::Grants:     return "grants";
    case TickStage::Decisions:  return "decisions";
    case TickStage::Settlement: return "settlement";
    case TickStage::Resolution: return "resolution";
    case TickStage::Report:     return "report";
    default:                    return "unknown";
    }
}

int TickReport::SumLedger(LedgerReason reason) const noexcept
{
    int sum = 0;
    for (const auto& e : ledger)
    {
        if (e.reason == reason)
            sum += e.amount;
    }
    return sum;
}

TickReportCollector::TickReportCollector(entt::dispatcher& dispatcher)
    : m_dispatcher(&dispatcher)
{
    dispatcher.sink<evt::LedgerPosted>().connect<&TickReportCollector::OnLedger>(*this);
    dispatcher.sink<evt::RaidResolved>().connect<&TickReportCollector::OnRaid>(*this);
    dispatcher.sink<evt::GrantIssued>().connect<&TickReportCollector::OnGrant>(*this);
    dispatcher.sink<evt::ActionDropped>().connect<&TickReportCollector::OnDropped>(*this);
    dispatcher.sink<evt::ActionTaken>().connect<&TickReportCollector::OnAction>(*this);
    dispatcher.sink<evt::BondFormed>().connect<&TickReportCollector::OnBondFormed>(*this);
    dispatcher.sink<evt::BondDissolved>().connect<&TickReportCollector::OnBondDissolved>(*this);
    dispatcher.sink<evt::AgentVanished>().connect<&TickReportCollector::OnVanished>(*this);
    dispatcher.sink<evt::AgentSpawned>().connect<&TickReportCollector::OnSpawned>(*this);
    dispatcher.sink<evt::MissionCreated>().connect<&TickReportCollector::OnMissionCreated>(*this);
    dispatcher.sink<evt::MissionProgressed>().connect<&TickReportCollector::OnMissionProgressed>(*this);
    dispatcher.sink<evt::MissionCompleted>().connect<&TickReportCollector::OnMissionCompleted>(*this);
    dispatcher.sink<evt::MeetingHeld>().connect<&TickReportCollector::OnMeeting>(*this);
}

TickReportCollector::~TickReportCollector()
{
    m_dispatcher->disconnect(*this);
}

void TickReportCollector::Begin(const std::string& simulationId, Tick tick)
{
    m_report = TickReport{};
    m_report.simulationId = simulationId;
    m_report.tick = tick;
}

void TickReportCollector::AddStage(TickStage stage, std::string summary)
{
    m_report.stages.push_back(StageSummary{ stage, std::move(summary) });
}

TickReport TickReportCollector::Take()
{
    return std::exchange(m_report, TickReport{});
}

void TickReportCollector::OnLedger(const evt::LedgerPosted& e)
{
    m_report.ledger.push_back(e.entry);
    switch (e.entry.reason)
    {
    case LedgerReason::BondMint: m_report.sparksMinted += e.entry.amount; break;
    case LedgerReason::Upkeep:   m_report.sparksLost += e.entry.amount; break;
    case LedgerReason::Grant:    m_report.sparksGranted += e.entry.amount; break;
    default: break;
    }
}

void TickReportCollector::OnRaid(const evt::RaidResolved& e)               { m_report.raids.push_back(e.result); }
void TickReportCollector::OnGrant(const evt::GrantIssued& e)               { m_report.grants.push_back(e.outcome); }
void TickReportCollector::OnDropped(const evt::ActionDropped& e)           { m_report.dropped.push_back(e.dropped); }
void TickReportCollector::OnAction(const evt::ActionTaken& e)              { m_report.actions.push_back(e.action); }
void TickReportCollector::OnBondFormed(const evt::BondFormed& e)           { m_report.bondsFormed.push_back(e); }
void TickReportCollector::OnBondDissolved(const evt::BondDissolved& e)     { m_report.bondsDissolved.push_back(e); }
void TickReportCollector::OnVanished(const evt::AgentVanished& e)          { m_report.agentsVanished.push_back(e); }
void TickReportCollector::OnSpawned(const evt::AgentSpawned& e)            { m_report.agentsSpawned.push_back(e); }
void TickReportCollector::OnMissionCreated(const evt::MissionCreated& e)   { m_report.missionsCreated.push_back(e); }
void TickReportCollector::OnMissionProgressed(const evt::MissionProgressed& e) { m_report.missionsProgressed.push_back(e); }
void TickReportCollector::OnMissionCompleted(const evt::MissionCompleted& e) { m_report.missionsCompleted.push_back(e); }

void TickReportCollector::OnMeeting(const evt::MeetingHeld& e)
{
    m_report.meetings.insert(m_report.meetings.end(), e.transcript.begin(), e.transcript.end());
}

} // namespace sparkworld::sim

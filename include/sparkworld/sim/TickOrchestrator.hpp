#pragma once
// include/sparkworld/sim/TickOrchestrator.hpp
//
// Runs one tick as six strictly ordered stages:
//
//   1. Upkeep      every alive agent pays 1 spark and ages; the broke vanish;
//                  live bonds mint |members| sparks, distributed at random
//   2. Grants      the benefactor answers last tick's requests; payouts are
//                  clamped; the pool regenerates
//   3. Decisions   mission meetings, then one decision per alive agent from
//                  an observation built on the frozen generation
//   4. Settlement  minted sparks are reconciled against the ledger
//   5. Resolution  bonds (+ missions), raids, spawns, messages and grant
//                  requests; residual vanish sweep; mission evaluation;
//                  invariant check
//   6. Report      world news and tick report; the visibility generations swap
//
// Oracle failures never abort a tick. A broken invariant throws
// world::InvariantViolation and leaves the world unusable for saving.

#include "sparkworld/oracle/OracleGateway.hpp"
#include "sparkworld/sim/TickReport.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <entt/signal/dispatcher.hpp>

#include <optional>
#include <vector>

namespace sparkworld::sim {

struct TickContext;

class TickOrchestrator {
public:
    TickOrchestrator(world::WorldState& world, oracle::OracleGateway& gateway);

    TickOrchestrator(const TickOrchestrator&) = delete;
    TickOrchestrator& operator=(const TickOrchestrator&) = delete;

    // Advances the world by exactly one tick. Not re-entrant.
    TickReport RunTick();

    // Extra listeners may subscribe to tick events here.
    [[nodiscard]] entt::dispatcher& events() noexcept { return m_events; }

    // Stage currently running, if any.
    [[nodiscard]] std::optional<TickStage> stage() const noexcept { return m_stage; }

    [[nodiscard]] const world::WorldState& world() const noexcept { return m_world; }

private:
    void StageUpkeep(TickContext& ctx);
    std::vector<world::GrantOutcome> StageGrants(TickContext& ctx);
    std::vector<world::Action> StageDecisions(TickContext& ctx, const std::vector<world::GrantOutcome>& grants);
    void StageSettlement(TickContext& ctx);
    void StageResolution(TickContext& ctx, const std::vector<world::Action>& actions);
    void StageReport(TickContext& ctx);

    void Enter(TickStage stage);
    void Finish(TickStage stage, std::string summary);

    world::WorldState&     m_world;
    oracle::OracleGateway& m_gateway;
    entt::dispatcher       m_events;
    TickReportCollector    m_collector{ m_events };
    std::optional<TickStage> m_stage;
    bool m_running = false;
};

} // namespace sparkworld::sim

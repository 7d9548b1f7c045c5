#pragma once
// include/sparkworld/world/Records.hpp
//
// Tick-stamped output records: ledger entries, raid results, grant outcomes and
// dropped actions. Narration and the tick report are built from these.

#include "sparkworld/world/Entities.hpp"

#include <cstdint>
#include <string>

namespace sparkworld::world {

// Pseudo accounts used as ledger endpoints that are not agents.
inline constexpr const char* kVoidAccount       = "void";
inline constexpr const char* kBenefactorAccount = "benefactor";

enum class LedgerReason : std::uint8_t {
    Upkeep = 0,
    BondMint,
    Grant,
    RaidWin,
    RaidLoss,
    SpawnCost,
    SpawnEndowment,
};

[[nodiscard]] const char* LedgerReasonName(LedgerReason r) noexcept;
[[nodiscard]] std::optional<LedgerReason> LedgerReasonFromName(std::string_view name) noexcept;

struct LedgerEntry {
    std::string  source;
    std::string  destination;
    int          amount = 0;
    LedgerReason reason = LedgerReason::Upkeep;
    Tick         tick   = 0;

    friend bool operator==(const LedgerEntry&, const LedgerEntry&) = default;
};

enum class RaidOutcome : std::uint8_t {
    Won = 0,
    Lost,
    InsufficientStake,
};

[[nodiscard]] const char* RaidOutcomeName(RaidOutcome o) noexcept;

struct RaidResult {
    AgentId     attackerId;
    AgentId     defenderId;
    RaidOutcome outcome = RaidOutcome::Lost;
    int    attackerStrength   = 0;
    int    defenderStrength   = 0;
    double successProbability = 0.0;
    int    sparksTransferred  = 0;   // signed, attacker's point of view
    Tick   tick = 0;

    friend bool operator==(const RaidResult&, const RaidResult&) = default;
};

struct GrantOutcome {
    AgentId     agentId;
    std::string requestContent;
    int         decided  = 0;   // what the benefactor oracle asked for
    int         granted  = 0;   // what was actually paid out
    int         balanceAfter = 0;
    std::string reasoning;
    Tick        tick = 0;

    friend bool operator==(const GrantOutcome&, const GrantOutcome&) = default;
};

struct DroppedAction {
    Action      action;
    std::string reason;

    friend bool operator==(const DroppedAction&, const DroppedAction&) = default;
};

} // namespace sparkworld::world

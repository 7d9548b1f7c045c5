#pragma once
// include/sparkworld/save/Serialization.hpp
//
// nlohmann::json (de)serialization for the entity model, records and tick
// reports. Functions live next to their types so ADL finds them.
// Enums travel as their names; optionals as null when absent.

#include "sparkworld/sim/TickReport.hpp"
#include "sparkworld/world/WorldState.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sparkworld::core {
void to_json(nlohmann::json& j, const Pcg32& v);
void from_json(const nlohmann::json& j, Pcg32& v);
} // namespace sparkworld::core

namespace sparkworld::world {

using json = nlohmann::json;

void to_json(json& j, const Persona& v);
void from_json(const json& j, Persona& v);

void to_json(json& j, const Agent& v);
void from_json(const json& j, Agent& v);

void to_json(json& j, const Bond& v);
void from_json(const json& j, Bond& v);

void to_json(json& j, const Mission& v);
void from_json(const json& j, Mission& v);

void to_json(json& j, const Action& v);
void from_json(const json& j, Action& v);

void to_json(json& j, const Benefactor& v);
void from_json(const json& j, Benefactor& v);

void to_json(json& j, const Rules& v);
void from_json(const json& j, Rules& v);

void to_json(json& j, const LedgerEntry& v);
void from_json(const json& j, LedgerEntry& v);

void to_json(json& j, const RaidResult& v);
void to_json(json& j, const GrantOutcome& v);
void from_json(const json& j, GrantOutcome& v);
void to_json(json& j, const DroppedAction& v);

void to_json(json& j, const AgentEvent& v);
void from_json(const json& j, AgentEvent& v);

void to_json(json& j, const WorldNews& v);
void from_json(const json& j, WorldNews& v);

void to_json(json& j, const VisibilityGeneration& v);
void from_json(const json& j, VisibilityGeneration& v);

void to_json(json& j, const Totals& v);
void from_json(const json& j, Totals& v);

void to_json(json& j, const Serials& v);
void from_json(const json& j, Serials& v);

} // namespace sparkworld::world

namespace sparkworld::evt {
void to_json(nlohmann::json& j, const BondFormed& v);
void to_json(nlohmann::json& j, const BondDissolved& v);
void to_json(nlohmann::json& j, const AgentVanished& v);
void to_json(nlohmann::json& j, const AgentSpawned& v);
void to_json(nlohmann::json& j, const MissionCreated& v);
void to_json(nlohmann::json& j, const MissionProgressed& v);
void to_json(nlohmann::json& j, const MissionCompleted& v);
void to_json(nlohmann::json& j, const MeetingMessage& v);
} // namespace sparkworld::evt

namespace sparkworld::sim {
void to_json(nlohmann::json& j, const TickReport& v);
} // namespace sparkworld::sim

namespace sparkworld::save {

using json = nlohmann::json;

// Bump when the snapshot layout changes (and add a migration step).
inline constexpr int kSchemaVersion = 1;

[[nodiscard]] json WorldToJson(const world::WorldState& w);

// Throws nlohmann::json exceptions on malformed input; the store maps them
// to SaveError codes.
[[nodiscard]] world::WorldState WorldFromJson(const json& j);

} // namespace sparkworld::save

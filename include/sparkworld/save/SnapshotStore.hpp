#pragma once
// include/sparkworld/save/SnapshotStore.hpp
//
// Durable, versioned snapshots of whole worlds, keyed by simulation id and
// tick. Layout under the root directory:
//
//   simulations.json          index: [{id, name, created_utc}]
//   sim_<id>/tick_<n>.json    one full snapshot per finished tick
//   sim_<id>/latest.json      {"tick": n} of the newest snapshot
//
// Every file is written to a sibling temp file and renamed over the target,
// so a reader never sees a half-written snapshot.

#include "sparkworld/world/WorldState.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace sparkworld::save {

struct SaveError {
    enum class Code {
        IoOpenFail,
        IoWriteFail,
        JsonParseError,
        JsonTypeError,
        SchemaMismatch,
        InvariantBroken,  // parsed cleanly but the entity model is inconsistent
        NotFound
    } code{};
    std::string message;
};

[[nodiscard]] const char* SaveErrorCodeName(SaveError::Code c) noexcept;

struct SimulationInfo {
    std::string id;
    std::string name;
    std::string createdUtc;
    world::Tick latestTick = 0;
};

// Write `data` to `<target>.tmp`, then rename it over `target`.
[[nodiscard]] std::expected<void, SaveError>
WriteFileAtomically(const std::filesystem::path& target, const std::string& data);

// Updates raw snapshot JSON from older schema versions to the current one.
bool MigrateSnapshotInPlace(nlohmann::json& j, int targetSchemaVersion, std::string& outError);

class SnapshotStore {
public:
    explicit SnapshotStore(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    // Picks the next free simulation id. Nothing is written.
    [[nodiscard]] std::expected<SimulationInfo, SaveError> ReserveSimulation(const std::string& name) const;

    // Appends `info` to the index. Call once its first snapshot is saved.
    [[nodiscard]] std::expected<void, SaveError> RecordSimulation(const SimulationInfo& info);

    [[nodiscard]] std::expected<std::vector<SimulationInfo>, SaveError> ListSimulations() const;
    [[nodiscard]] std::expected<SimulationInfo, SaveError> FindSimulation(const std::string& id) const;

    // Writes tick_<n>.json, then moves latest.json to it.
    [[nodiscard]] std::expected<void, SaveError> Save(const world::WorldState& w);

    // Refuses snapshots that fail the world invariants (InvariantBroken).
    [[nodiscard]] std::expected<world::WorldState, SaveError> Load(const std::string& id, world::Tick tick) const;
    [[nodiscard]] std::expected<world::WorldState, SaveError> LoadLatest(const std::string& id) const;
    [[nodiscard]] std::expected<world::Tick, SaveError> LatestTick(const std::string& id) const;

    [[nodiscard]] std::filesystem::path SimulationDir(const std::string& id) const;
    [[nodiscard]] std::filesystem::path SnapshotPath(const std::string& id, world::Tick tick) const;

private:
    std::filesystem::path m_root;
};

} // namespace sparkworld::save

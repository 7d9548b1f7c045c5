// src/save/SnapshotStore.cpp
#include "sparkworld/save/SnapshotStore.hpp"

#include "sparkworld/save/Serialization.hpp"
#include "sparkworld/world/Invariants.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace sparkworld::save {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kIndexFile  = "simulations.json";
constexpr const char* kLatestFile = "latest.json";

std::string NowUtcIso8601()
{
    using clock = std::chrono::system_clock;
    auto t = clock::now();
    std::time_t tt = clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::expected<json, SaveError> ReadJsonFile(const fs::path& file)
{
    try {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs) {
            std::error_code ec;
            const auto code = fs::exists(file, ec) ? SaveError::Code::IoOpenFail : SaveError::Code::NotFound;
            return std::unexpected(SaveError{ code, "Cannot open file: " + file.string() });
        }

        json doc = json::parse(ifs); // throws on malformed JSON
        if (!doc.is_object() && !doc.is_array()) {
            return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, "Root JSON must be an object or array: " + file.string() });
        }
        return doc;
    }
    catch (const json::parse_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonParseError, e.what() });
    }
}

std::expected<std::vector<SimulationInfo>, SaveError> ReadIndex(const fs::path& root)
{
    auto doc = ReadJsonFile(root / kIndexFile);
    if (!doc) {
        if (doc.error().code == SaveError::Code::NotFound)
            return std::vector<SimulationInfo>{};
        return std::unexpected(doc.error());
    }
    if (!doc->is_array())
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, "Simulation index must be an array" });

    std::vector<SimulationInfo> out;
    try {
        for (const auto& e : *doc) {
            SimulationInfo info;
            info.id         = e.value("id", std::string{});
            info.name       = e.value("name", std::string{});
            info.createdUtc = e.value("created_utc", std::string{});
            if (!info.id.empty())
                out.push_back(std::move(info));
        }
    }
    catch (const json::type_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
    return out;
}

} // namespace

const char* SaveErrorCodeName(SaveError::Code c) noexcept
{
    switch (c) {
    case SaveError::Code::IoOpenFail:     return "io-open-fail";
    case SaveError::Code::IoWriteFail:    return "io-write-fail";
    case SaveError::Code::JsonParseError: return "json-parse-error";
    case SaveError::Code::JsonTypeError:  return "json-type-error";
    case SaveError::Code::SchemaMismatch: return "schema-mismatch";
    case SaveError::Code::InvariantBroken: return "invariant-broken";
    case SaveError::Code::NotFound:       return "not-found";
    default:                              return "unknown";
    }
}

std::expected<void, SaveError> WriteFileAtomically(const fs::path& target, const std::string& data)
{
    const auto dir = target.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(SaveError{ SaveError::Code::IoWriteFail,
                "create_directories failed for " + dir.string() + ": " + ec.message() });
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return std::unexpected(SaveError{ SaveError::Code::IoOpenFail, "Cannot open for write: " + tmp.string() });
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, "Write failed: " + tmp.string() });
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec); // atomic replace on POSIX
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(SaveError{ SaveError::Code::IoWriteFail,
            "rename " + tmp.string() + " -> " + target.string() + " failed: " + ec.message() });
    }
    return {};
}

// Only schema 1 exists so far; anything else is refused.
bool MigrateSnapshotInPlace(json& j, int targetSchemaVersion, std::string& outError)
{
    const int fileVer = j.value("schema_version", 1);
    if (fileVer > targetSchemaVersion) {
        outError = "Snapshot schema_version=" + std::to_string(fileVer)
                 + " is newer than supported " + std::to_string(targetSchemaVersion);
        return false;
    }
    if (fileVer < targetSchemaVersion) {
        outError = "No migration path for schema_version=" + std::to_string(fileVer);
        return false;
    }
    return true;
}

SnapshotStore::SnapshotStore(fs::path root)
    : m_root(std::move(root))
{
}

fs::path SnapshotStore::SimulationDir(const std::string& id) const
{
    return m_root / ("sim_" + id);
}

fs::path SnapshotStore::SnapshotPath(const std::string& id, world::Tick tick) const
{
    return SimulationDir(id) / ("tick_" + std::to_string(tick) + ".json");
}

std::expected<SimulationInfo, SaveError> SnapshotStore::ReserveSimulation(const std::string& name) const
{
    auto index = ReadIndex(m_root);
    if (!index)
        return std::unexpected(index.error());

    // Ids are zero-padded sequence numbers; skip any that are indexed or already have a directory.
    std::size_t serial = index->size() + 1;
    std::string id;
    for (;; ++serial) {
        id = fmt::format("{:04d}", serial);
        const bool indexed = std::any_of(index->begin(), index->end(),
                                         [&id](const SimulationInfo& s) { return s.id == id; });
        std::error_code ec;
        if (!indexed && !fs::exists(SimulationDir(id), ec))
            break;
    }

    return SimulationInfo{ id, name, NowUtcIso8601(), 0 };
}

std::expected<void, SaveError> SnapshotStore::RecordSimulation(const SimulationInfo& info)
{
    auto index = ReadIndex(m_root);
    if (!index)
        return std::unexpected(index.error());
    index->push_back(info);

    json doc = json::array();
    for (const auto& s : *index)
        doc.push_back(json::object({ {"id", s.id}, {"name", s.name}, {"created_utc", s.createdUtc} }));

    if (auto ok = WriteFileAtomically(m_root / kIndexFile, doc.dump(2)); !ok)
        return ok;

    spdlog::info("Registered simulation {} '{}' under {}", info.id, info.name, SimulationDir(info.id).string());
    return {};
}

std::expected<std::vector<SimulationInfo>, SaveError> SnapshotStore::ListSimulations() const
{
    auto index = ReadIndex(m_root);
    if (!index)
        return std::unexpected(index.error());

    for (auto& s : *index) {
        if (auto t = LatestTick(s.id))
            s.latestTick = *t;
    }
    return index;
}

std::expected<SimulationInfo, SaveError> SnapshotStore::FindSimulation(const std::string& id) const
{
    auto all = ListSimulations();
    if (!all)
        return std::unexpected(all.error());
    for (auto& s : *all) {
        if (s.id == id)
            return s;
    }
    return std::unexpected(SaveError{ SaveError::Code::NotFound, "Unknown simulation: " + id });
}

std::expected<void, SaveError> SnapshotStore::Save(const world::WorldState& w)
{
    if (w.simulationId.empty())
        return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, "World has no simulation id" });

    const std::string text = WorldToJson(w).dump(2);
    if (auto ok = WriteFileAtomically(SnapshotPath(w.simulationId, w.tick), text); !ok)
        return ok;

    const json latest = json::object({ {"tick", w.tick} });
    if (auto ok = WriteFileAtomically(SimulationDir(w.simulationId) / kLatestFile, latest.dump()); !ok)
        return ok;

    spdlog::debug("Saved {} tick {} ({} bytes)", w.simulationId, w.tick, text.size());
    return {};
}

std::expected<world::WorldState, SaveError> SnapshotStore::Load(const std::string& id, world::Tick tick) const
{
    auto doc = ReadJsonFile(SnapshotPath(id, tick));
    if (!doc)
        return std::unexpected(doc.error());

    try {
        std::string migErr;
        if (!MigrateSnapshotInPlace(*doc, kSchemaVersion, migErr))
            return std::unexpected(SaveError{ SaveError::Code::SchemaMismatch, migErr });

        world::WorldState w = WorldFromJson(*doc);
        if (w.simulationId != id || w.tick != tick) {
            return std::unexpected(SaveError{ SaveError::Code::SchemaMismatch,
                fmt::format("Snapshot {} claims simulation '{}' tick {}", SnapshotPath(id, tick).string(), w.simulationId, w.tick) });
        }

        if (const auto problems = world::FindInvariantViolations(w); !problems.empty()) {
            std::string msg = fmt::format("Snapshot {} is inconsistent:", SnapshotPath(id, tick).string());
            for (const auto& p : problems) {
                msg += "\n  - ";
                msg += p;
            }
            return std::unexpected(SaveError{ SaveError::Code::InvariantBroken, std::move(msg) });
        }
        return w;
    }
    catch (const json::type_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
    catch (const json::out_of_range& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
}

std::expected<world::Tick, SaveError> SnapshotStore::LatestTick(const std::string& id) const
{
    auto doc = ReadJsonFile(SimulationDir(id) / kLatestFile);
    if (!doc)
        return std::unexpected(doc.error());
    if (!doc->is_object() || !doc->contains("tick") || !(*doc)["tick"].is_number_unsigned())
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, "latest.json must hold an unsigned 'tick'" });
    return (*doc)["tick"].get<world::Tick>();
}

std::expected<world::WorldState, SaveError> SnapshotStore::LoadLatest(const std::string& id) const
{
    auto tick = LatestTick(id);
    if (!tick)
        return std::unexpected(tick.error());
    return Load(id, *tick);
}

} // namespace sparkworld::save

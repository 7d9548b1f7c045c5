#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sparkworld::core {

struct LogOptions {
    std::filesystem::path logDir = "logs";
    bool toFile = true;                                  // rotating file sink in logDir
    spdlog::level::level_enum level = spdlog::level::info;
};

// Installs the "sparkworld" logger as the spdlog default logger.
// Console output always; file output rotates at 1MB * 4 under logDir.
std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& options);

// Accepts spdlog level names in any case ("trace", "debug", "info", "warn", "error", "critical", "off").
[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

} // namespace sparkworld::core

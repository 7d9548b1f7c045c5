#include "sparkworld/core/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace sparkworld::core {

namespace {

// Common default logger configuration.
void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum level) {
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace

std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool fileFailed = false;
    if (options.toFile) {
        std::error_code ec;
        fs::create_directories(options.logDir, ec);
        if (ec) {
            fileFailed = true;
        } else {
            const auto file = (options.logDir / "sparkworld.log").string();
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4));
            } catch (const spdlog::spdlog_ex&) {
                fileFailed = true;
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("sparkworld", sinks.begin(), sinks.end());
    configure_default_logger(logger, options.level);

    if (fileFailed)
        spdlog::warn("File logging unavailable under {}; logging to console only", options.logDir.string());
    spdlog::debug("Logging started (level={})", spdlog::level::to_string_view(options.level));
    return logger;
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view raw)
{
    std::string name(raw);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

} // namespace sparkworld::core

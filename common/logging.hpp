#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace clothsim {
namespace logging {

// Maps a level name ("trace" .. "off") to an spdlog level
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Shared "clothsim" logger on stderr.
// CLOTHSIM_LOG_LEVEL picks the starting level, default info.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("clothsim");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* level_env = std::getenv("CLOTHSIM_LOG_LEVEL")) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown CLOTHSIM_LOG_LEVEL '{}'", level_env);
            }
        }

        return log;
    }();
    return logger;
}

// -v on the command line lowers the level to debug, never raises it
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace clothsim

#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace agent_weave {

inline constexpr const char* kLoggerName = "agent_weave";

/**
 * Shared library logger, created on first use
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

/**
 * Accepts spdlog level names: trace, debug, info, warning, error, critical, off
 */
inline void set_log_level(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

} // namespace agent_weave

// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "netroster/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace netroster {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> log = [] {
        auto existing = spdlog::get("netroster");
        if (existing) return existing;
        auto l = spdlog::stderr_color_mt("netroster");
        l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        l->set_level(spdlog::level::warn);
        return l;
    }();
    return log;
}

bool init_logging(const std::string& level) {
    // spdlog::level::from_str maps unknown names to "off"; reject those instead
    if (level != "trace" && level != "debug" && level != "info" &&
        level != "warn"  && level != "error" && level != "off")
        return false;
    logger()->set_level(spdlog::level::from_str(level));
    return true;
}

} // namespace netroster

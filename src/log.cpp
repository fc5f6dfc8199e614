// Crossfeed - Logging Implementation

#include <crossfeed/log.hpp>
#include <crossfeed/errors.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace crossfeed::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("crossfeed");
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("crossfeed");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        created->flush_on(spdlog::level::warn);
        return created;
    }();
    return instance;
}

spdlog::level::level_enum parse_level(std::string_view level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + std::string(level));
}

void init(std::string_view level) {
    set_level(parse_level(level));
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace crossfeed::log

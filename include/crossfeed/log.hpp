// Crossfeed - Logging
// Thin spdlog front-end shared by every component

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace crossfeed::log {

/// Process-wide "crossfeed" logger (colour stderr sink, created on first use)
std::shared_ptr<spdlog::logger> logger();

/// Set level by name: trace, debug, info, warn, error, critical, off.
/// Throws ConfigError on an unknown name.
void init(std::string_view level);

void set_level(spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view level);

}  // namespace crossfeed::log

#define CROSSFEED_LOG_TRACE(...) ::crossfeed::log::logger()->trace(__VA_ARGS__)
#define CROSSFEED_LOG_DEBUG(...) ::crossfeed::log::logger()->debug(__VA_ARGS__)
#define CROSSFEED_LOG_INFO(...) ::crossfeed::log::logger()->info(__VA_ARGS__)
#define CROSSFEED_LOG_WARN(...) ::crossfeed::log::logger()->warn(__VA_ARGS__)
#define CROSSFEED_LOG_ERROR(...) ::crossfeed::log::logger()->error(__VA_ARGS__)

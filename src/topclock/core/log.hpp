#pragma once

// spdlog setup for topclock.
//
// Levels used across the code base:
//   TRACE  per-frame detail (poll snapshots, key events, font probing)
//   DEBUG  drag transitions, monitor fallback, font size changes
//   INFO   startup, centering, border toggles, saves
//   WARN   malformed geometry file, unusable fonts or bindings
//   ERROR  failed saves, lost X connection
//
// SPDLOG_ACTIVE_LEVEL strips TRACE and DEBUG from Release builds.

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace topclock::log {

constexpr char const* LOG_FILE = "/tmp/topclock.log";

/// Install the "topclock" logger as spdlog's default. Call once, first thing in main().
inline void init()
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    // The clock must still start when the log file cannot be opened
    bool file_ok = true;
    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOG_FILE, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    catch (spdlog::spdlog_ex const&)
    {
        file_ok = false;
    }

    auto logger = std::make_shared<spdlog::logger>("topclock", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);

    if (!file_ok)
        SPDLOG_WARN("Cannot open {}, logging to stderr only", LOG_FILE);
}

inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace topclock::log

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#define LOG_KEY(state, keysym) \
    SPDLOG_TRACE("Key: state={:#x} keysym={:#x}", state, keysym)

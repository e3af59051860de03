#pragma once

// Logging for winplace using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-window logging (e.g., every condition evaluation)
//   - DEBUG: Detailed debugging info (e.g., resolved geometry, classification)
//   - INFO:  Normal operational messages (e.g., startup, rule applied, reload)
//   - WARN:  Warning conditions (e.g., placement rejected by the X server)
//   - ERROR: Error conditions (e.g., reload aborted)
//
// The runtime level follows `global.log_level` from the configuration and is
// re-applied on every successful reload.
//
// Usage:
//   LOG_DEBUG("Classifying window {:#x}", handle);
//   LOG_INFO("Rule '{}' applied to '{}'", rule, title);

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace winplace::log {

inline std::string log_file_path()
{
    if (char const* state = std::getenv("XDG_STATE_HOME"); state && *state)
    {
        return std::string(state) + "/winplace/winplace.log";
    }
    if (char const* home = std::getenv("HOME"); home && *home)
    {
        return std::string(home) + "/.local/state/winplace/winplace.log";
    }
    return "/tmp/winplace.log";
}

/// Map a configuration level name (DEBUG, INFO, WARNING, ERROR) to spdlog.
inline spdlog::level::level_enum parse_level(std::string name)
{
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::toupper(c); });

    if (name == "TRACE")
        return spdlog::level::trace;
    if (name == "DEBUG")
        return spdlog::level::debug;
    if (name == "WARNING" || name == "WARN")
        return spdlog::level::warn;
    if (name == "ERROR")
        return spdlog::level::err;
    return spdlog::level::info;
}

// Initialize logging - call once at startup, again to truncate the log file
inline void init(spdlog::level::level_enum level = spdlog::level::info)
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{ console_sink };
    std::string file_error;

    std::string path = log_file_path();
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    try
    {
        // Truncate on open: every start (and every clear) begins a fresh file
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    catch (spdlog::spdlog_ex const& e)
    {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("winplace", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::debug);

    spdlog::set_default_logger(logger);

    if (!file_error.empty())
    {
        logger->warn("Log file {} disabled: {}", path, file_error);
    }
}

inline void set_level(std::string const& name)
{
    spdlog::default_logger()->set_level(parse_level(name));
}

// Truncate the log file, keeping the current runtime level
inline void clear()
{
    auto level = spdlog::default_logger()->level();
    init(level);
}

// Shutdown logging - call at exit
inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace winplace::log

// Convenience macros using spdlog's compile-time filtered macros
// These are zero-cost when level is below SPDLOG_ACTIVE_LEVEL

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

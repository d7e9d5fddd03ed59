/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "env.hpp"
#include "string.hpp"

#include <array>
#include <atomic>
#include <optional>
#include <string_view>
#include <utility>

#ifndef KLK_ENABLE_SPDLOG
    #define KLK_ENABLE_SPDLOG 0
#endif

namespace klk {

/// Ordered from quiet to verbose.
enum class LogLevel { off, critical, error, warning, info, debug, trace };

/**
 * Parses a log level name: TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL or OFF, case-insensitive.
 * @param name The name of the level.
 * @return The level, or an empty optional if the name is not known.
 */
inline std::optional<LogLevel> parse_log_level(const std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 7> k_names {{
        {"TRACE", LogLevel::trace},
        {"DEBUG", LogLevel::debug},
        {"INFO", LogLevel::info},
        {"WARN", LogLevel::warning},
        {"ERROR", LogLevel::error},
        {"CRITICAL", LogLevel::critical},
        {"OFF", LogLevel::off},
    }};

    for (const auto& [level_name, level] : k_names) {
        if (string_compare_case_insensitive(name, level_name)) {
            return level;
        }
    }
    return std::nullopt;
}

}  // namespace klk

#if KLK_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #include <spdlog/spdlog.h>

    #ifndef KLK_TRACE
        #define KLK_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef KLK_DEBUG
        #define KLK_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef KLK_INFO
        #define KLK_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

    #ifndef KLK_WARNING
        #define KLK_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef KLK_ERROR
        #define KLK_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef KLK_CRITICAL
        #define KLK_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

namespace klk {

inline void apply_log_level(const LogLevel level) {
    switch (level) {
        case LogLevel::off:
            spdlog::set_level(spdlog::level::off);
            return;
        case LogLevel::critical:
            spdlog::set_level(spdlog::level::critical);
            return;
        case LogLevel::error:
            spdlog::set_level(spdlog::level::err);
            return;
        case LogLevel::warning:
            spdlog::set_level(spdlog::level::warn);
            return;
        case LogLevel::info:
            spdlog::set_level(spdlog::level::info);
            return;
        case LogLevel::debug:
            spdlog::set_level(spdlog::level::debug);
            return;
        case LogLevel::trace:
            spdlog::set_level(spdlog::level::trace);
            return;
    }
}

}  // namespace klk

#else

    #include <fmt/format.h>

namespace klk {

inline std::atomic log_level = LogLevel::info;

inline void apply_log_level(const LogLevel level) {
    log_level = level;
}

}  // namespace klk

    // Without spdlog, messages are printed to stdout prefixed with the first letter of their level.
    #define KLK_LOG_AT_LEVEL(level, prefix, ...)     \
        if (klk::log_level.load() >= (level)) {     \
            fmt::println(prefix " " __VA_ARGS__);   \
        }

    #ifndef KLK_TRACE
        #define KLK_TRACE(...) KLK_LOG_AT_LEVEL(klk::LogLevel::trace, "[T]", __VA_ARGS__)
    #endif

    #ifndef KLK_DEBUG
        #define KLK_DEBUG(...) KLK_LOG_AT_LEVEL(klk::LogLevel::debug, "[D]", __VA_ARGS__)
    #endif

    #ifndef KLK_INFO
        #define KLK_INFO(...) KLK_LOG_AT_LEVEL(klk::LogLevel::info, "[I]", __VA_ARGS__)
    #endif

    #ifndef KLK_WARNING
        #define KLK_WARNING(...) KLK_LOG_AT_LEVEL(klk::LogLevel::warning, "[W]", __VA_ARGS__)
    #endif

    #ifndef KLK_ERROR
        #define KLK_ERROR(...) KLK_LOG_AT_LEVEL(klk::LogLevel::error, "[E]", __VA_ARGS__)
    #endif

    #ifndef KLK_CRITICAL
        #define KLK_CRITICAL(...) KLK_LOG_AT_LEVEL(klk::LogLevel::critical, "[C]", __VA_ARGS__)
    #endif

#endif

namespace klk {

/**
 * Sets the log level from its name (see parse_log_level). An unknown name sets the level to INFO.
 * @param name The name of the level.
 */
inline void set_log_level(const std::string_view name) {
    const auto level = parse_log_level(name);
    if (!level) {
        apply_log_level(LogLevel::info);
        KLK_WARNING("Invalid log level: {}. Setting log level to info.", name);
        return;
    }
    apply_log_level(*level);
}

/**
 * Sets the log level from an environment variable, or to INFO when the variable is not set.
 * @param env_var The name of the environment variable.
 */
inline void set_log_level_from_env(const char* env_var = "KLK_LOG_LEVEL") {
    set_log_level(get_env(env_var).value_or("INFO"));
}

}  // namespace klk

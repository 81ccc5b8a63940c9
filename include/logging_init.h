// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace olympus {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux), else console only
    Journal, ///< systemd journal (requires OLYMPUS_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Override for LogTarget::File; empty = resolve automatically
};

/**
 * @brief Install the default spdlog logger with the configured sinks
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" .. "off", "warning" accepted)
 *
 * Case sensitive. Returns default_level for empty or unknown input.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level: -v count first, then the configured name, else warn
 */
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level);

/**
 * @brief libhv log level for a configured level name
 *
 * trace and debug cap at LOG_LEVEL_DEBUG, info maps to LOG_LEVEL_INFO, anything
 * else to LOG_LEVEL_WARN. CLI verbosity does not affect libhv.
 */
int hv_level_for(const std::string& config_level);

/**
 * @brief Parse target name; unknown values map to Auto
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace olympus

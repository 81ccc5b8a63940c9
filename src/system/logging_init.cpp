// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "hv/hlog.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef __linux__
#ifdef OLYMPUS_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace fs = std::filesystem;

namespace olympus {
namespace logging {

namespace {

constexpr const char* kSyslogIdent = "olympus-monitor";
constexpr size_t kRotateBytes = 5 * 1024 * 1024;
constexpr size_t kRotateFiles = 3;

const std::pair<const char*, spdlog::level::level_enum> kLevelNames[] = {
    {"trace", spdlog::level::trace},   {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},     {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},  {"error", spdlog::level::err},
    {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
};

const std::pair<const char*, LogTarget> kTargetNames[] = {
    {"auto", LogTarget::Auto},     {"journal", LogTarget::Journal}, {"syslog", LogTarget::Syslog},
    {"file", LogTarget::File},     {"console", LogTarget::Console},
};

/// Default log file: $XDG_DATA_HOME/olympus/olympus.log, ~/.local/share as fallback
std::string default_log_file() {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && xdg[0] != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        base = fs::path(home) / ".local" / "share";
    } else {
        base = fs::temp_directory_path();
    }

    fs::path dir = base / "olympus";
    std::error_code ec;
    fs::create_directories(dir, ec);
    return (dir / "olympus.log").string();
}

LogTarget resolve_auto_target() {
#ifdef __linux__
#ifdef OLYMPUS_HAS_SYSTEMD
    std::error_code ec;
    if (fs::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Sink for a resolved target, or nullptr when the console alone is enough
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path.empty() ? default_log_file() : file_path, kRotateBytes, kRotateFiles);
#ifdef __linux__
    case LogTarget::Journal:
#ifdef OLYMPUS_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(kSyslogIdent);
#else
        // Built without journal support
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(kSyslogIdent, LOG_PID, LOG_USER,
                                                               false);
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
#endif
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    LogTarget target = config.target == LogTarget::Auto ? resolve_auto_target() : config.target;

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    std::string sink_error;
    try {
        if (spdlog::sink_ptr extra = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(extra));
        }
    } catch (const spdlog::spdlog_ex& e) {
        // Unwritable log file: continue with the console
        sink_error = e.what();
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("olympus", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] Could not open {} sink: {}", log_target_name(target), sink_error);
    }

    spdlog::debug("[Logging] target={} console={} level={}", log_target_name(target),
                  config.enable_console, spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& [name, level] : kLevelNames) {
        if (str == name) {
            return level;
        }
    }
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity > 2 ? spdlog::level::trace : spdlog::level::warn;
    }
}

spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level) {
    if (verbosity > 0) {
        return verbosity_to_level(verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

int hv_level_for(const std::string& config_level) {
    // libhv VERBOSE floods the console with socket internals
    switch (parse_level(config_level, spdlog::level::warn)) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    default:
        return LOG_LEVEL_WARN;
    }
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& [name, target] : kTargetNames) {
        if (str == name) {
            return target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& [name, value] : kTargetNames) {
        if (value == target) {
            return name;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace olympus

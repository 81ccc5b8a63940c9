// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_settings.h"

#include "spdlog/spdlog.h"

#include <cstdlib>
#include <limits>

namespace olympus {

namespace {

/// Read a non-negative integer setting; negative or out-of-range values keep the default
uint32_t get_unsigned(const Config& config, const std::string& ptr, uint32_t default_value) {
    int64_t value = config.get<int64_t>(ptr, static_cast<int64_t>(default_value));
    if (value < 0 || value > std::numeric_limits<int32_t>::max()) {
        spdlog::warn("[Settings] {} = {} is out of range, using {}", ptr, value, default_value);
        return default_value;
    }
    return static_cast<uint32_t>(value);
}

} // namespace

ClientSettings ClientSettings::from_config(const Config& config) {
    ClientSettings s;

    s.api.base_url = config.get<std::string>("/api/base_url", s.api.base_url);
    s.api.timeout_ms = get_unsigned(config, "/api/timeout_ms", s.api.timeout_ms);
    s.api.refresh_path = config.get<std::string>("/api/refresh_path", s.api.refresh_path);

    s.realtime.url = config.get<std::string>("/realtime/url", s.realtime.url);
    s.realtime.heartbeat_interval_ms =
        get_unsigned(config, "/realtime/heartbeat_interval_ms", s.realtime.heartbeat_interval_ms);
    s.realtime.reconnect_delay_ms =
        get_unsigned(config, "/realtime/reconnect_delay_ms", s.realtime.reconnect_delay_ms);
    s.realtime.max_reconnect_attempts = get_unsigned(config, "/realtime/max_reconnect_attempts",
                                                     s.realtime.max_reconnect_attempts);
    s.connect_timeout_ms = get_unsigned(config, "/realtime/connect_timeout_ms", s.connect_timeout_ms);
    s.router.resubscribe_on_reconnect = config.get<bool>("/realtime/resubscribe_on_reconnect",
                                                         s.router.resubscribe_on_reconnect);

    s.log_level = config.get<std::string>("/log_level", s.log_level);
    s.log_target = config.get<std::string>("/log_target", s.log_target);
    s.log_path = config.get<std::string>("/log_path", s.log_path);

    spdlog::debug("[Settings] api={} realtime={} heartbeat={}ms reconnect={}ms x{}",
                  s.api.base_url, s.realtime.url, s.realtime.heartbeat_interval_ms,
                  s.realtime.reconnect_delay_ms, s.realtime.max_reconnect_attempts);
    return s;
}

void ClientSettings::apply_environment() {
    const char* api_url = std::getenv("OLYMPUS_API_URL");
    if (api_url && api_url[0] != '\0') {
        spdlog::info("[Settings] API URL overridden by OLYMPUS_API_URL: {}", api_url);
        api.base_url = api_url;
    }

    const char* ws_url = std::getenv("OLYMPUS_WS_URL");
    if (ws_url && ws_url[0] != '\0') {
        spdlog::info("[Settings] Realtime URL overridden by OLYMPUS_WS_URL: {}", ws_url);
        realtime.url = ws_url;
    }
}

} // namespace olympus

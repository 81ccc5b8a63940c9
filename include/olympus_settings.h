// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "olympus_api_client.h"
#include "olympus_realtime_channel.h"
#include "olympus_topic_router.h"

#include <cstdint>
#include <string>

namespace olympus {

/**
 * @brief Typed client settings, read from Config
 */
struct ClientSettings {
    ApiClientConfig api;
    RealtimeChannelConfig realtime;
    TopicRouterConfig router;
    uint32_t connect_timeout_ms = 10000;

    std::string log_level = "info";
    std::string log_target = "auto";
    std::string log_path;

    /**
     * @brief Read settings; missing or mistyped keys fall back to defaults
     */
    static ClientSettings from_config(const Config& config);

    /**
     * @brief Override endpoints from OLYMPUS_API_URL / OLYMPUS_WS_URL when set
     */
    void apply_environment();
};

} // namespace olympus

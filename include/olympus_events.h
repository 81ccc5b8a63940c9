// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace olympus {

/**
 * @brief Diagnostic events emitted by the request pipeline and realtime channel
 *
 * Failures on the realtime side are never thrown to callers. These events give the
 * application a way to surface them (toasts, logs) without polling.
 */
enum class ClientEventType {
    CONNECTION_FAILED, ///< Max reconnect attempts exceeded
    CONNECTION_LOST,   ///< WebSocket closed unexpectedly while connected
    RECONNECTING,      ///< Reconnect attempt scheduled
    RECONNECTED,       ///< Connected again after a drop
    MESSAGE_OVERSIZED, ///< Inbound frame exceeds size limit and was dropped
    AUTH_REQUIRED,     ///< No access token available to open the channel
    SESSION_EXPIRED    ///< Token refresh failed and credentials were cleared
};

/**
 * @brief Event structure passed to event handlers
 */
struct ClientEvent {
    ClientEventType type;
    std::string message; ///< Human-readable message
    std::string details; ///< Additional details (optional)
    bool is_error;       ///< true for errors, false for warnings/info
};

/**
 * @brief Callback type for event handlers
 */
using ClientEventCallback = std::function<void(const ClientEvent&)>;

inline const char* client_event_name(ClientEventType type) {
    switch (type) {
    case ClientEventType::CONNECTION_FAILED:
        return "connection_failed";
    case ClientEventType::CONNECTION_LOST:
        return "connection_lost";
    case ClientEventType::RECONNECTING:
        return "reconnecting";
    case ClientEventType::RECONNECTED:
        return "reconnected";
    case ClientEventType::MESSAGE_OVERSIZED:
        return "message_oversized";
    case ClientEventType::AUTH_REQUIRED:
        return "auth_required";
    case ClientEventType::SESSION_EXPIRED:
        return "session_expired";
    }
    return "unknown";
}

} // namespace olympus

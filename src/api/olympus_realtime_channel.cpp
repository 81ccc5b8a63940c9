// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_realtime_channel.h"

#include "hv/hurl.h"
#include "spdlog/spdlog.h"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace olympus {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
    case ConnectionState::DISCONNECTED:
        return "DISCONNECTED";
    case ConnectionState::CONNECTING:
        return "CONNECTING";
    case ConnectionState::CONNECTED:
        return "CONNECTED";
    case ConnectionState::RECONNECTING:
        return "RECONNECTING";
    case ConnectionState::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

RealtimeChannel::RealtimeChannel(CredentialStore& credentials, WebSocketTransport& transport,
                                 Scheduler& scheduler, RealtimeChannelConfig config)
    : credentials_(credentials), transport_(transport), scheduler_(scheduler),
      config_(std::move(config)) {
    transport_.set_on_open([this]() { handle_open(); });
    transport_.set_on_message([this](const std::string& text) { handle_message(text); });
    transport_.set_on_close([this]() { handle_close(); });
}

RealtimeChannel::~RealtimeChannel() {
    // Owner must have stopped the scheduler loop (or be on it); clean up in place
    disposed_.store(true);
    reconnect_enabled_.store(false);
    generation_.fetch_add(1);

    transport_.set_on_open(nullptr);
    transport_.set_on_message(nullptr);
    transport_.set_on_close(nullptr);

    stop_heartbeat();
    cancel_reconnect_timer();
    if (socket_open_ || attempt_in_progress_) {
        transport_.close();
    }

    status_.close();
    messages_.close();
}

std::string RealtimeChannel::build_connect_url(const std::string& access_token) const {
    char separator = (config_.url.find('?') == std::string::npos) ? '?' : '&';
    return config_.url + separator + "token=" + HUrl::escape(access_token, "-_.~");
}

// ============================================================================
// Public API (any thread)
// ============================================================================

int RealtimeChannel::connect() {
    if (disposed_.load()) {
        spdlog::warn("[Realtime Channel] connect() after dispose ignored");
        return CONNECT_DISPOSED;
    }

    if (!credentials_.get_access_token()) {
        spdlog::warn("[Realtime Channel] Cannot connect: no access token");
        emit_event(ClientEventType::AUTH_REQUIRED, "Sign in required for live updates");
        return CONNECT_NO_TOKEN;
    }

    reconnect_enabled_.store(true);
    uint64_t generation = generation_.load();
    scheduler_.run_in_loop([this, generation]() {
        if (!is_current(generation)) {
            return;
        }
        start_connect();
    });
    return CONNECT_OK;
}

void RealtimeChannel::disconnect() {
    // Invalidate every pending timer and callback before the loop catches up
    reconnect_enabled_.store(false);
    generation_.fetch_add(1);

    scheduler_.run_in_loop([this]() { shutdown_connection(); });
}

void RealtimeChannel::dispose() {
    if (disposed_.exchange(true)) {
        return;
    }
    reconnect_enabled_.store(false);
    generation_.fetch_add(1);

    scheduler_.run_in_loop([this]() {
        shutdown_connection();
        status_.close();
        messages_.close();
    });
}

bool RealtimeChannel::send_message(const json& message) {
    if (state_.load() != ConnectionState::CONNECTED) {
        spdlog::trace("[Realtime Channel] Not connected, dropping outbound message");
        return false;
    }

    std::string text;
    try {
        text = message.dump();
    } catch (const json::exception& e) {
        spdlog::error("[Realtime Channel] Cannot serialize outbound message: {}", e.what());
        return false;
    }

    int sent = transport_.send(text);
    if (sent < 0) {
        spdlog::warn("[Realtime Channel] send failed ({}), message dropped", sent);
        return false;
    }
    spdlog::trace("[Realtime Channel] -> {}", text);
    return true;
}

// ============================================================================
// State machine (scheduler thread)
// ============================================================================

void RealtimeChannel::start_connect() {
    ConnectionState state = state_.load();
    if (state == ConnectionState::CONNECTED || state == ConnectionState::CONNECTING) {
        spdlog::debug("[Realtime Channel] connect() while {}, ignoring",
                      connection_state_name(state));
        return;
    }

    // connect() from RECONNECTING skips the pending delay
    cancel_reconnect_timer();
    reconnect_attempts_.store(0);
    transition_to(ConnectionState::CONNECTING);
    begin_attempt();
}

void RealtimeChannel::begin_attempt() {
    std::optional<std::string> token = credentials_.get_access_token();
    if (!token) {
        // Precondition failure, not a socket error: does not consume an attempt
        spdlog::warn("[Realtime Channel] Access token gone, stopping reconnection");
        reconnect_enabled_.store(false);
        stop_heartbeat();
        cancel_reconnect_timer();
        reconnect_attempts_.store(0);
        transition_to(ConnectionState::DISCONNECTED);
        emit_event(ClientEventType::AUTH_REQUIRED, "Sign in required for live updates");
        return;
    }

    socket_open_ = false;
    attempt_in_progress_ = true;

    spdlog::debug("[Realtime Channel] Connecting to {} (retry {})", config_.url,
                  reconnect_attempts_.load());
    int ret = transport_.open(build_connect_url(*token));
    if (ret != 0) {
        spdlog::warn("[Realtime Channel] Connection attempt failed to start: {}", ret);
        attempt_in_progress_ = false;
        schedule_reconnect();
    }
}

void RealtimeChannel::handle_open() {
    if (disposed_.load() || !reconnect_enabled_.load()) {
        // disconnect() raced with the handshake
        spdlog::debug("[Realtime Channel] Socket opened after disconnect, closing");
        attempt_in_progress_ = false;
        transport_.close();
        return;
    }

    attempt_in_progress_ = false;
    socket_open_ = true;
    reconnect_attempts_.store(0);

    bool reconnected = was_connected_;
    was_connected_ = true;

    spdlog::info("[Realtime Channel] Connected to {}", config_.url);
    uint64_t generation = generation_.load();
    transition_to(ConnectionState::CONNECTED);

    // A status listener may have disconnected from inside the transition
    if (!is_current(generation) || !reconnect_enabled_.load()) {
        return;
    }
    start_heartbeat();

    if (reconnected) {
        emit_event(ClientEventType::RECONNECTED, "Live updates restored");
    }
}

void RealtimeChannel::handle_message(const std::string& text) {
    if (disposed_.load() || !socket_open_) {
        return;
    }

    if (text.size() > config_.max_message_size) {
        spdlog::warn("[Realtime Channel] Dropping oversized message: {} bytes (max {})",
                     text.size(), config_.max_message_size);
        emit_event(ClientEventType::MESSAGE_OVERSIZED,
                   fmt::format("Message of {} bytes exceeds limit", text.size()), false);
        return;
    }

    spdlog::trace("[Realtime Channel] <- {} bytes", text.size());
    messages_.publish(text);
}

void RealtimeChannel::handle_close() {
    bool was_open = socket_open_;
    bool was_attempt = attempt_in_progress_;
    socket_open_ = false;
    attempt_in_progress_ = false;
    stop_heartbeat();

    if (disposed_.load()) {
        return;
    }

    if (!reconnect_enabled_.load()) {
        ConnectionState state = state_.load();
        if (state != ConnectionState::DISCONNECTED && state != ConnectionState::FAILED) {
            transition_to(ConnectionState::DISCONNECTED);
        }
        return;
    }

    if (!was_open && !was_attempt) {
        spdlog::debug("[Realtime Channel] Ignoring close for a stale socket");
        return;
    }

    if (was_open) {
        spdlog::warn("[Realtime Channel] Connection lost");
        emit_event(ClientEventType::CONNECTION_LOST, "Live updates connection lost");
    } else {
        spdlog::debug("[Realtime Channel] Connection attempt refused");
    }
    schedule_reconnect();
}

void RealtimeChannel::schedule_reconnect() {
    if (!reconnect_enabled_.load()) {
        transition_to(ConnectionState::DISCONNECTED);
        return;
    }

    uint32_t max_attempts = config_.max_reconnect_attempts;
    uint32_t attempts = reconnect_attempts_.load();
    if (max_attempts > 0 && attempts >= max_attempts) {
        spdlog::error("[Realtime Channel] Max reconnect attempts ({}) exceeded", max_attempts);
        reconnect_enabled_.store(false);
        transition_to(ConnectionState::FAILED);
        emit_event(ClientEventType::CONNECTION_FAILED,
                   fmt::format("Unable to reach server after {} attempts", max_attempts), true);
        return;
    }

    uint64_t generation = generation_.load();
    transition_to(ConnectionState::RECONNECTING);
    emit_event(ClientEventType::RECONNECTING,
               fmt::format("Reconnecting in {}ms (attempt {})", config_.reconnect_delay_ms,
                           attempts + 1));

    // Listeners and the event handler may have called disconnect()
    if (!is_current(generation) || !reconnect_enabled_.load()) {
        return;
    }

    cancel_reconnect_timer();
    reconnect_timer_ = scheduler_.set_timeout(config_.reconnect_delay_ms, [this, generation]() {
        reconnect_timer_ = INVALID_TIMER_ID;
        if (!is_current(generation) || !reconnect_enabled_.load()) {
            return;
        }
        reconnect_attempts_.fetch_add(1);
        begin_attempt();
    });
}

void RealtimeChannel::shutdown_connection() {
    cancel_reconnect_timer();
    stop_heartbeat();

    if (socket_open_ || attempt_in_progress_) {
        transport_.close();
    }
    socket_open_ = false;
    attempt_in_progress_ = false;
    reconnect_attempts_.store(0);

    if (state_.load() != ConnectionState::DISCONNECTED) {
        spdlog::info("[Realtime Channel] Disconnected");
        transition_to(ConnectionState::DISCONNECTED);
    }
}

void RealtimeChannel::start_heartbeat() {
    stop_heartbeat();
    if (config_.heartbeat_interval_ms == 0) {
        return;
    }

    uint64_t generation = generation_.load();
    heartbeat_timer_ = scheduler_.set_interval(config_.heartbeat_interval_ms, [this, generation]() {
        if (!is_current(generation)) {
            return;
        }
        send_message(json{{"type", "ping"}});
    });
}

void RealtimeChannel::stop_heartbeat() {
    if (heartbeat_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(heartbeat_timer_);
        heartbeat_timer_ = INVALID_TIMER_ID;
    }
}

void RealtimeChannel::cancel_reconnect_timer() {
    if (reconnect_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(reconnect_timer_);
        reconnect_timer_ = INVALID_TIMER_ID;
    }
}

void RealtimeChannel::transition_to(ConnectionState new_state) {
    ConnectionState old_state = state_.exchange(new_state);

    // RECONNECTING is re-entered once per failed retry and reported each time
    if (old_state == new_state && new_state != ConnectionState::RECONNECTING) {
        return;
    }

    uint32_t attempts = reconnect_attempts_.load();
    ConnectionStatus status;
    status.state = new_state;
    status.previous = old_state;
    status.attempt = (new_state == ConnectionState::RECONNECTING) ? attempts + 1 : attempts;

    spdlog::debug("[Realtime Channel] Connection state: {} -> {} (attempt {})",
                  connection_state_name(old_state), connection_state_name(new_state),
                  status.attempt);
    status_.publish(status);
}

// ============================================================================
// Events
// ============================================================================

void RealtimeChannel::register_event_handler(ClientEventCallback cb) {
    std::lock_guard<std::mutex> lock(event_handler_mutex_);
    event_handler_ = std::move(cb);
}

void RealtimeChannel::emit_event(ClientEventType type, const std::string& message, bool is_error,
                                 const std::string& details) {
    ClientEventCallback handler;
    {
        std::lock_guard<std::mutex> lock(event_handler_mutex_);
        handler = event_handler_;
    }

    if (!handler) {
        return;
    }

    ClientEvent evt{type, message, details, is_error};
    try {
        handler(evt);
    } catch (const std::exception& e) {
        spdlog::error("[Realtime Channel] Event handler threw exception: {}", e.what());
    }
}

} // namespace olympus

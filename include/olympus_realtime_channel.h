// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef OLYMPUS_REALTIME_CHANNEL_H
#define OLYMPUS_REALTIME_CHANNEL_H

#include "olympus_broadcast.h"
#include "olympus_credential_store.h"
#include "olympus_events.h"
#include "olympus_scheduler.h"
#include "olympus_websocket_transport.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace olympus {

/**
 * @brief Connection state of the realtime channel
 */
enum class ConnectionState {
    DISCONNECTED, // Not connected, reconnection disabled
    CONNECTING,   // First attempt after connect()
    CONNECTED,    // Socket open, heartbeat running
    RECONNECTING, // Waiting for, or running, an automatic retry
    FAILED        // Reconnect attempts exhausted; waits for connect()
};

const char* connection_state_name(ConnectionState state);

/**
 * @brief Element of the connection status stream
 *
 * attempt is the number of the retry about to run for RECONNECTING, and the number
 * of retries used so far for every other state.
 */
struct ConnectionStatus {
    ConnectionState state = ConnectionState::DISCONNECTED;
    ConnectionState previous = ConnectionState::DISCONNECTED;
    uint32_t attempt = 0;
};

struct RealtimeChannelConfig {
    std::string url = "ws://localhost:8081/ws";
    uint32_t heartbeat_interval_ms = 30000;
    uint32_t reconnect_delay_ms = 5000;
    uint32_t max_reconnect_attempts = 5; ///< 0 = unlimited
    size_t max_message_size = 5 * 1024 * 1024;
};

/**
 * @brief Persistent authenticated WebSocket with heartbeat and bounded reconnect
 *
 * State machine:
 * - DISCONNECTED/FAILED -> connect() -> CONNECTING
 * - CONNECTING/RECONNECTING -> socket open -> CONNECTED (attempt counter reset, heartbeat on)
 * - CONNECTING -> attempt fails -> RECONNECTING, or FAILED when no attempts remain
 * - CONNECTED -> socket drops -> RECONNECTING (heartbeat off)
 * - RECONNECTING -> delay elapses -> counter incremented, retry; a failed retry
 *   re-enters RECONNECTING, or FAILED once the counter reaches the maximum
 * - any -> disconnect() -> DISCONNECTED (timers cancelled, reconnection disabled)
 *
 * Every state change, including each re-entry of RECONNECTING, is published on
 * connection_status(). With max_reconnect_attempts = 5 and a server that always
 * refuses, connect() yields CONNECTING, RECONNECTING x5, FAILED.
 *
 * A missing access token is not a socket failure: connect() returns
 * CONNECT_NO_TOKEN without changing state, and a retry that finds no token moves
 * to DISCONNECTED without consuming an attempt.
 *
 * Threading: all state lives on the Scheduler thread. connect(), disconnect(),
 * send_message() and the accessors may be called from any thread. Timer and
 * socket callbacks carry a generation number so that nothing scheduled before a
 * disconnect() can act after it.
 */
class RealtimeChannel {
  public:
    static constexpr int CONNECT_OK = 0;
    static constexpr int CONNECT_NO_TOKEN = -1;
    static constexpr int CONNECT_DISPOSED = -2;

    RealtimeChannel(CredentialStore& credentials, WebSocketTransport& transport,
                    Scheduler& scheduler, RealtimeChannelConfig config = RealtimeChannelConfig{});
    virtual ~RealtimeChannel();

    RealtimeChannel(const RealtimeChannel&) = delete;
    RealtimeChannel& operator=(const RealtimeChannel&) = delete;

    /**
     * @brief Open the channel and enable automatic reconnection
     *
     * Returns once the attempt is started; progress is reported on connection_status().
     * No-op while already CONNECTING or CONNECTED.
     *
     * @return CONNECT_OK, CONNECT_NO_TOKEN or CONNECT_DISPOSED
     */
    int connect();

    /**
     * @brief Close the channel and disable reconnection
     *
     * Safe from any state and any thread.
     */
    void disconnect();

    /**
     * @brief Send a JSON message if CONNECTED
     *
     * @return true if handed to the socket; false (silently dropped) otherwise
     */
    bool send_message(const json& message);

    ConnectionState get_connection_state() const {
        return state_.load();
    }

    bool is_connected() const {
        return state_.load() == ConnectionState::CONNECTED;
    }

    /**
     * @brief Retries used since the last successful connection
     */
    uint32_t reconnect_attempts() const {
        return reconnect_attempts_.load();
    }

    Broadcast<ConnectionStatus>& connection_status() {
        return status_;
    }

    /**
     * @brief Raw inbound text frames, for TopicRouter
     */
    Broadcast<std::string>& messages() {
        return messages_;
    }

    /**
     * @brief Register handler for channel events
     *
     * @param cb Callback function, or nullptr to unregister
     */
    void register_event_handler(ClientEventCallback cb);

    /**
     * @brief Disconnect and close both streams permanently
     */
    void dispose();

    /**
     * @brief Connection URL carrying the access token as a query parameter
     */
    std::string build_connect_url(const std::string& access_token) const;

    const RealtimeChannelConfig& config() const {
        return config_;
    }

  protected:
    void emit_event(ClientEventType type, const std::string& message, bool is_error = false,
                    const std::string& details = "");

  private:
    // Everything below runs on the scheduler thread
    void start_connect();
    void begin_attempt();
    void handle_open();
    void handle_message(const std::string& text);
    void handle_close();
    void schedule_reconnect();
    void shutdown_connection();
    void start_heartbeat();
    void stop_heartbeat();
    void cancel_reconnect_timer();
    void transition_to(ConnectionState new_state);

    bool is_current(uint64_t generation) const {
        return generation == generation_.load() && !disposed_.load();
    }

    CredentialStore& credentials_;
    WebSocketTransport& transport_;
    Scheduler& scheduler_;
    RealtimeChannelConfig config_;

    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
    std::atomic<bool> reconnect_enabled_{false};
    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> disposed_{false};
    std::atomic<uint32_t> reconnect_attempts_{0};

    TimerId heartbeat_timer_ = INVALID_TIMER_ID;
    TimerId reconnect_timer_ = INVALID_TIMER_ID;
    bool socket_open_ = false;
    bool attempt_in_progress_ = false;
    bool was_connected_ = false;

    Broadcast<ConnectionStatus> status_{"connection_status"};
    Broadcast<std::string> messages_{"messages"};

    ClientEventCallback event_handler_;
    mutable std::mutex event_handler_mutex_;
};

} // namespace olympus

#endif // OLYMPUS_REALTIME_CHANNEL_H

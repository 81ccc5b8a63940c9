// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "olympus_api_client.h"
#include "olympus_credential_store.h"
#include "olympus_http_transport.h"
#include "olympus_realtime_channel.h"
#include "olympus_scheduler.h"
#include "olympus_settings.h"
#include "olympus_topic_router.h"
#include "olympus_websocket_transport.h"

#include <memory>

namespace hv {
class EventLoopThread;
}

namespace olympus {

/**
 * @brief Composition root for the network client layer
 *
 * Owns one libhv event loop thread shared by the realtime channel's timers and
 * WebSocket callbacks, and wires the request pipeline and realtime channel to the
 * caller's CredentialStore. The store must outlive this object.
 *
 * Shutdown order: disconnect the channel, stop the loop, then destroy the router,
 * channel, transports and finally the loop thread.
 */
class OlympusClient {
  public:
    OlympusClient();
    ~OlympusClient();

    OlympusClient(const OlympusClient&) = delete;
    OlympusClient& operator=(const OlympusClient&) = delete;

    /**
     * @brief Create all components (does not connect)
     *
     * @return false if already initialized
     */
    bool init(const ClientSettings& settings, CredentialStore& credentials);

    void shutdown();

    bool is_initialized() const {
        return m_initialized;
    }

    ApiClient* api() const {
        return m_api.get();
    }
    RealtimeChannel* channel() const {
        return m_channel.get();
    }
    TopicRouter* router() const {
        return m_router.get();
    }

    /**
     * @brief Route events from both components to one handler
     */
    void register_event_handler(ClientEventCallback cb);

  private:
    std::shared_ptr<hv::EventLoopThread> m_loop_thread;
    std::unique_ptr<HvScheduler> m_scheduler;
    std::unique_ptr<HvHttpTransport> m_http;
    std::unique_ptr<HvWebSocketTransport> m_websocket;
    std::unique_ptr<ApiClient> m_api;
    std::unique_ptr<RealtimeChannel> m_channel;
    std::unique_ptr<TopicRouter> m_router;
    bool m_initialized = false;
};

} // namespace olympus

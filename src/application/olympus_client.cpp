// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file olympus_client.cpp
 * @brief Wires the request pipeline, realtime channel and topic router together
 *
 * @threading Realtime state lives on the owned event loop thread; ApiClient calls
 *            run on the caller's thread or on its own worker threads
 * @gotchas Disconnect before stopping the loop so the socket close runs on it
 */

#include "olympus_client.h"

#include "hv/EventLoopThread.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <memory>

namespace olympus {

OlympusClient::OlympusClient() = default;

OlympusClient::~OlympusClient() {
    shutdown();
}

bool OlympusClient::init(const ClientSettings& settings, CredentialStore& credentials) {
    if (m_initialized) {
        spdlog::warn("[Olympus Client] Already initialized");
        return false;
    }

    spdlog::debug("[Olympus Client] Initializing...");

    m_loop_thread = std::make_shared<hv::EventLoopThread>();
    m_loop_thread->start();

    m_scheduler = std::make_unique<HvScheduler>(m_loop_thread->loop());
    m_http = std::make_unique<HvHttpTransport>();
    m_websocket =
        std::make_unique<HvWebSocketTransport>(m_loop_thread->loop(), settings.connect_timeout_ms);

    m_api = std::make_unique<ApiClient>(credentials, *m_http, settings.api);
    m_channel =
        std::make_unique<RealtimeChannel>(credentials, *m_websocket, *m_scheduler, settings.realtime);
    m_router = std::make_unique<TopicRouter>(*m_channel, settings.router);

    m_initialized = true;
    spdlog::info("[Olympus Client] Initialized (not connected yet): api={} realtime={}",
                 settings.api.base_url, settings.realtime.url);
    return true;
}

void OlympusClient::shutdown() {
    if (!m_initialized) {
        return;
    }

    spdlog::debug("[Olympus Client] Shutting down...");

    // Close the socket on the loop thread and wait for it before stopping the loop
    auto closed = std::make_shared<std::promise<void>>();
    std::future<void> closed_future = closed->get_future();
    m_scheduler->run_in_loop([this, closed]() {
        m_channel->disconnect();
        closed->set_value();
    });
    if (closed_future.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
        spdlog::warn("[Olympus Client] Timed out waiting for realtime channel to close");
    }

    m_loop_thread->stop(true);
    m_loop_thread->join();

    m_router.reset();
    m_channel.reset();
    m_websocket.reset();
    m_scheduler.reset();

    // Joins any execute_async() workers
    m_api.reset();
    m_http.reset();

    m_loop_thread.reset();

    m_initialized = false;
    spdlog::info("[Olympus Client] Shutdown complete");
}

void OlympusClient::register_event_handler(ClientEventCallback cb) {
    if (!m_initialized) {
        spdlog::warn("[Olympus Client] register_event_handler before init");
        return;
    }
    m_api->register_event_handler(cb);
    m_channel->register_event_handler(cb);
}

} // namespace olympus

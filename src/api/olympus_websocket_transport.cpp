// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_websocket_transport.h"

#include "hv/WebSocketClient.h"
#include "spdlog/spdlog.h"

#include <utility>

namespace olympus {

HvWebSocketTransport::HvWebSocketTransport(hv::EventLoopPtr loop, uint32_t connect_timeout_ms)
    : client_(std::make_unique<hv::WebSocketClient>(std::move(loop))),
      connect_timeout_ms_(connect_timeout_ms) {
    // Reconnection policy belongs to RealtimeChannel
    client_->setReconnect(nullptr);

    client_->onopen = [this]() {
        if (on_open_) {
            on_open_();
        }
    };
    client_->onmessage = [this](const std::string& msg) {
        if (on_message_) {
            on_message_(msg);
        }
    };
    client_->onclose = [this]() {
        if (closing_) {
            return;
        }
        if (on_close_) {
            on_close_();
        }
    };
}

HvWebSocketTransport::~HvWebSocketTransport() {
    // Detach callbacks first so a late onclose cannot reach a destroyed channel
    client_->onopen = nullptr;
    client_->onmessage = nullptr;
    client_->onclose = nullptr;
    client_->close();
}

int HvWebSocketTransport::open(const std::string& url) {
    // Reset state from a previous attempt so libhv accepts the new open()
    close();

    // Must be applied before open()
    client_->setConnectTimeout(static_cast<int>(connect_timeout_ms_));

    http_headers headers;
    int ret = client_->open(url.c_str(), headers);
    if (ret != 0) {
        spdlog::debug("[WebSocket Transport] open() failed immediately: {}", ret);
    }
    return ret;
}

void HvWebSocketTransport::close() {
    closing_ = true;
    client_->close();
    closing_ = false;
}

int HvWebSocketTransport::send(const std::string& text) {
    return client_->send(text);
}

bool HvWebSocketTransport::is_connected() const {
    return client_->isConnected();
}

} // namespace olympus

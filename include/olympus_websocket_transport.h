// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "hv/EventLoop.h"

namespace hv {
class WebSocketClient;
}

namespace olympus {

/**
 * @brief One duplex text-frame connection
 *
 * The realtime channel owns reconnection policy, so implementations must never
 * reconnect on their own. Callbacks run on the channel's scheduler thread.
 *
 * Callback contract for a single open():
 * - on_open, then any number of on_message, then on_close when the socket goes away
 * - on_close without on_open when the connection attempt fails
 */
class WebSocketTransport {
  public:
    using OpenCallback = std::function<void()>;
    using MessageCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void()>;

    virtual ~WebSocketTransport() = default;

    /**
     * @brief Start connecting to url
     *
     * @return 0 if the attempt was started, non-zero if it failed immediately
     *         (in which case on_close is not called)
     */
    virtual int open(const std::string& url) = 0;

    /**
     * @brief Close the socket; safe to call when already closed
     *
     * on_close is not reported for a socket closed this way.
     */
    virtual void close() = 0;

    /**
     * @brief Send a text frame
     *
     * @return Bytes queued, or a negative value on failure
     */
    virtual int send(const std::string& text) = 0;

    virtual bool is_connected() const = 0;

    void set_on_open(OpenCallback cb) {
        on_open_ = std::move(cb);
    }
    void set_on_message(MessageCallback cb) {
        on_message_ = std::move(cb);
    }
    void set_on_close(CloseCallback cb) {
        on_close_ = std::move(cb);
    }

  protected:
    OpenCallback on_open_;
    MessageCallback on_message_;
    CloseCallback on_close_;
};

/**
 * @brief WebSocketTransport backed by hv::WebSocketClient
 *
 * libhv's own reconnect is disabled; RealtimeChannel decides when to retry.
 */
class HvWebSocketTransport : public WebSocketTransport {
  public:
    /**
     * @param loop Event loop shared with the channel's HvScheduler
     * @param connect_timeout_ms Connection attempt timeout
     */
    HvWebSocketTransport(hv::EventLoopPtr loop, uint32_t connect_timeout_ms = 10000);
    ~HvWebSocketTransport() override;

    int open(const std::string& url) override;
    void close() override;
    int send(const std::string& text) override;
    bool is_connected() const override;

  private:
    std::unique_ptr<hv::WebSocketClient> client_;
    uint32_t connect_timeout_ms_;
    std::atomic<bool> closing_{false};
};

} // namespace olympus

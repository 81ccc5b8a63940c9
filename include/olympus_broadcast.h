// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace olympus {

using SubscriptionId = uint64_t;
constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

/**
 * @brief Multi-subscriber broadcast stream
 *
 * Every value passed to publish() is delivered to every listener registered at the
 * time of the call, in registration order, on the publishing thread. Values are
 * never replayed to late listeners. Listeners may join or leave at any time,
 * including from inside a listener.
 *
 * Listener exceptions are logged and do not stop delivery to the remaining listeners.
 *
 * After close(), publish() is a no-op and listen() returns INVALID_SUBSCRIPTION_ID.
 *
 * @tparam T Payload type
 */
template <typename T> class Broadcast {
  public:
    using Listener = std::function<void(const T&)>;

    explicit Broadcast(std::string name = "stream") : name_(std::move(name)) {}

    Broadcast(const Broadcast&) = delete;
    Broadcast& operator=(const Broadcast&) = delete;

    ~Broadcast() {
        close();
    }

    /**
     * @brief Add a listener
     *
     * @return Subscription ID for cancel(), or INVALID_SUBSCRIPTION_ID if closed
     */
    SubscriptionId listen(Listener listener) {
        if (!listener) {
            return INVALID_SUBSCRIPTION_ID;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            spdlog::debug("[Broadcast] listen() on closed stream '{}'", name_);
            return INVALID_SUBSCRIPTION_ID;
        }
        SubscriptionId id = next_id_++;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    /**
     * @brief Remove a listener
     *
     * @return true if the listener was registered
     */
    bool cancel(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.erase(id) > 0;
    }

    void publish(const T& value) {
        // Copy under lock, invoke outside, so listeners can cancel themselves
        std::vector<std::pair<SubscriptionId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            snapshot.assign(listeners_.begin(), listeners_.end());
        }

        for (auto& [id, listener] : snapshot) {
            try {
                listener(value);
            } catch (const std::exception& e) {
                spdlog::error("[Broadcast] Listener {} on '{}' threw exception: {}", id, name_,
                              e.what());
            }
        }
    }

    /**
     * @brief Drop all listeners and reject further publish/listen
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        listeners_.clear();
        lifetime_.reset();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t listener_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    const std::string& name() const {
        return name_;
    }

    /**
     * @brief Weak lifetime token; expires when the stream is closed or destroyed
     */
    std::weak_ptr<bool> lifetime_weak() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifetime_;
    }

  private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_id_ = 1;
    bool closed_ = false;
    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

/**
 * @brief RAII wrapper for a Broadcast listener - auto-cancels on destruction
 *
 * Captures the stream's lifetime token so reset() safely skips the cancel if
 * the stream has already been closed or destroyed.
 *
 * @code
 *   orders_sub_ = StreamSubscription(router.order_updates(),
 *                                    router.order_updates().listen(on_order));
 * @endcode
 */
class StreamSubscription {
  public:
    StreamSubscription() = default;

    template <typename T>
    StreamSubscription(Broadcast<T>& stream, SubscriptionId id)
        : subscription_id_(id), lifetime_(stream.lifetime_weak()),
          cancel_fn_([&stream](SubscriptionId sid) { stream.cancel(sid); }) {}

    ~StreamSubscription() {
        reset();
    }

    StreamSubscription(StreamSubscription&& other) noexcept
        : subscription_id_(std::exchange(other.subscription_id_, INVALID_SUBSCRIPTION_ID)),
          lifetime_(std::exchange(other.lifetime_, {})),
          cancel_fn_(std::exchange(other.cancel_fn_, {})) {}

    StreamSubscription& operator=(StreamSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            subscription_id_ = std::exchange(other.subscription_id_, INVALID_SUBSCRIPTION_ID);
            lifetime_ = std::exchange(other.lifetime_, {});
            cancel_fn_ = std::exchange(other.cancel_fn_, {});
        }
        return *this;
    }

    StreamSubscription(const StreamSubscription&) = delete;
    StreamSubscription& operator=(const StreamSubscription&) = delete;

    /**
     * @brief Cancel the listener and release the subscription
     */
    void reset() {
        if (cancel_fn_ && subscription_id_ != INVALID_SUBSCRIPTION_ID && !lifetime_.expired()) {
            cancel_fn_(subscription_id_);
        }
        subscription_id_ = INVALID_SUBSCRIPTION_ID;
        cancel_fn_ = {};
        lifetime_.reset();
    }

    /**
     * @brief Check if guard holds a live subscription
     */
    explicit operator bool() const {
        return cancel_fn_ && subscription_id_ != INVALID_SUBSCRIPTION_ID && !lifetime_.expired();
    }

    SubscriptionId get() const {
        return subscription_id_;
    }

  private:
    SubscriptionId subscription_id_ = INVALID_SUBSCRIPTION_ID;
    std::weak_ptr<bool> lifetime_;
    std::function<void(SubscriptionId)> cancel_fn_;
};

} // namespace olympus

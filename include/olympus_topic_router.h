// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef OLYMPUS_TOPIC_ROUTER_H
#define OLYMPUS_TOPIC_ROUTER_H

#include "olympus_broadcast.h"
#include "olympus_realtime_channel.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace olympus {

/**
 * @brief Server-side channels that accept subscribe/unsubscribe requests
 */
enum class SubscriptionChannel {
    ORDER,        // "order", keyed by "id"
    INVENTORY,    // "inventory", keyed by "location_id"
    NOTIFICATIONS // "notifications", keyed by "user_id"
};

/// Wire name sent in the "channel" field
const char* subscription_channel_name(SubscriptionChannel channel);

/// Field carrying the subscription key for this channel
const char* subscription_key_field(SubscriptionChannel channel);

/// Accepts "order", "inventory", "notifications" and "notification"
std::optional<SubscriptionChannel> parse_subscription_channel(const std::string& name);

struct Subscription {
    SubscriptionChannel channel;
    std::string key;

    bool operator<(const Subscription& other) const {
        return std::tie(channel, key) < std::tie(other.channel, other.key);
    }
    bool operator==(const Subscription& other) const {
        return channel == other.channel && key == other.key;
    }
};

struct TopicRouterConfig {
    /// Re-send every active subscription each time the channel reaches CONNECTED
    bool resubscribe_on_reconnect = false;
};

/**
 * @brief Demultiplexes realtime messages by their "type" field
 *
 * Inbound frames have the shape {"type": <string>, "data": <payload>}:
 * - "order_update"     -> order_updates()
 * - "inventory_update" -> inventory_updates()
 * - "notification"     -> notifications()
 * - "pong"             -> consumed (heartbeat acknowledgment)
 * - anything else, or malformed JSON, is dropped
 *
 * Subscriptions are requests to the server only. Delivery is not filtered by
 * subscription key: every order_update reaches every order_updates() listener.
 *
 * Publishing happens on the channel's scheduler thread, so each stream sees
 * messages in wire order.
 */
class TopicRouter {
  public:
    explicit TopicRouter(RealtimeChannel& channel, TopicRouterConfig config = TopicRouterConfig{});
    ~TopicRouter();

    TopicRouter(const TopicRouter&) = delete;
    TopicRouter& operator=(const TopicRouter&) = delete;

    Broadcast<json>& order_updates() {
        return order_updates_;
    }
    Broadcast<json>& inventory_updates() {
        return inventory_updates_;
    }
    Broadcast<json>& notifications() {
        return notifications_;
    }
    Broadcast<ConnectionStatus>& connection_status() {
        return channel_.connection_status();
    }

    /**
     * @brief Ask the server for updates about one entity
     *
     * The subscription is recorded even when the channel is down; the control
     * message itself is only sent while CONNECTED.
     *
     * @return true if the control message was sent
     */
    bool subscribe(SubscriptionChannel channel, const std::string& key);

    /**
     * @brief Withdraw a subscription
     *
     * @return true if the control message was sent
     */
    bool unsubscribe(SubscriptionChannel channel, const std::string& key);

    bool subscribe_to_order(const std::string& order_id) {
        return subscribe(SubscriptionChannel::ORDER, order_id);
    }
    bool unsubscribe_from_order(const std::string& order_id) {
        return unsubscribe(SubscriptionChannel::ORDER, order_id);
    }
    bool subscribe_to_inventory(const std::string& location_id) {
        return subscribe(SubscriptionChannel::INVENTORY, location_id);
    }
    bool unsubscribe_from_inventory(const std::string& location_id) {
        return unsubscribe(SubscriptionChannel::INVENTORY, location_id);
    }
    bool subscribe_to_notifications(const std::string& user_id) {
        return subscribe(SubscriptionChannel::NOTIFICATIONS, user_id);
    }
    bool unsubscribe_from_notifications(const std::string& user_id) {
        return unsubscribe(SubscriptionChannel::NOTIFICATIONS, user_id);
    }

    /**
     * @brief Send an arbitrary message (dropped unless CONNECTED)
     */
    bool send_message(const json& message) {
        return channel_.send_message(message);
    }

    /**
     * @brief Route one raw inbound frame
     */
    void route(const std::string& text);

    std::vector<Subscription> active_subscriptions() const;

    uint64_t pong_count() const {
        return pong_count_.load();
    }

    uint64_t dropped_count() const {
        return dropped_count_.load();
    }

    /**
     * @brief Time of the last pong, or epoch if none was received
     */
    std::chrono::steady_clock::time_point last_pong() const;

    /**
     * @brief Stop routing and close the topic streams
     */
    void close();

  private:
    static json control_message(const char* type, const Subscription& subscription);
    void on_status(const ConnectionStatus& status);

    RealtimeChannel& channel_;
    TopicRouterConfig config_;

    Broadcast<json> order_updates_{"order_updates"};
    Broadcast<json> inventory_updates_{"inventory_updates"};
    Broadcast<json> notifications_{"notifications"};

    StreamSubscription message_sub_;
    StreamSubscription status_sub_;

    mutable std::mutex subscriptions_mutex_;
    std::set<Subscription> subscriptions_;

    mutable std::mutex pong_mutex_;
    std::chrono::steady_clock::time_point last_pong_{};
    std::atomic<uint64_t> pong_count_{0};
    std::atomic<uint64_t> dropped_count_{0};
};

} // namespace olympus

#endif // OLYMPUS_TOPIC_ROUTER_H

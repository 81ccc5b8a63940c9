// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_topic_router.h"

#include "spdlog/spdlog.h"

#include <utility>

namespace olympus {

const char* subscription_channel_name(SubscriptionChannel channel) {
    switch (channel) {
    case SubscriptionChannel::ORDER:
        return "order";
    case SubscriptionChannel::INVENTORY:
        return "inventory";
    case SubscriptionChannel::NOTIFICATIONS:
        return "notifications";
    }
    return "unknown";
}

const char* subscription_key_field(SubscriptionChannel channel) {
    switch (channel) {
    case SubscriptionChannel::ORDER:
        return "id";
    case SubscriptionChannel::INVENTORY:
        return "location_id";
    case SubscriptionChannel::NOTIFICATIONS:
        return "user_id";
    }
    return "id";
}

std::optional<SubscriptionChannel> parse_subscription_channel(const std::string& name) {
    if (name == "order") {
        return SubscriptionChannel::ORDER;
    }
    if (name == "inventory") {
        return SubscriptionChannel::INVENTORY;
    }
    if (name == "notifications" || name == "notification") {
        return SubscriptionChannel::NOTIFICATIONS;
    }
    return std::nullopt;
}

TopicRouter::TopicRouter(RealtimeChannel& channel, TopicRouterConfig config)
    : channel_(channel), config_(config) {
    message_sub_ = StreamSubscription(
        channel_.messages(), channel_.messages().listen([this](const std::string& text) {
            route(text);
        }));
    status_sub_ = StreamSubscription(channel_.connection_status(),
                                     channel_.connection_status().listen(
                                         [this](const ConnectionStatus& s) { on_status(s); }));
}

TopicRouter::~TopicRouter() {
    close();
}

void TopicRouter::close() {
    message_sub_.reset();
    status_sub_.reset();
    order_updates_.close();
    inventory_updates_.close();
    notifications_.close();
}

void TopicRouter::route(const std::string& text) {
    json message = json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        spdlog::debug("[Topic Router] Dropping malformed message ({} bytes)", text.size());
        dropped_count_.fetch_add(1);
        return;
    }

    if (!message.contains("type") || !message["type"].is_string()) {
        spdlog::debug("[Topic Router] Dropping message without type");
        dropped_count_.fetch_add(1);
        return;
    }

    const std::string type = message["type"].get<std::string>();
    const json data = message.contains("data") ? message["data"] : json(nullptr);

    if (type == "order_update") {
        order_updates_.publish(data);
    } else if (type == "inventory_update") {
        inventory_updates_.publish(data);
    } else if (type == "notification") {
        notifications_.publish(data);
    } else if (type == "pong") {
        {
            std::lock_guard<std::mutex> lock(pong_mutex_);
            last_pong_ = std::chrono::steady_clock::now();
        }
        pong_count_.fetch_add(1);
        spdlog::trace("[Topic Router] pong");
    } else {
        // Server may add types before the client knows them
        spdlog::trace("[Topic Router] Ignoring unknown message type '{}'", type);
        dropped_count_.fetch_add(1);
    }
}

json TopicRouter::control_message(const char* type, const Subscription& subscription) {
    return json{{"type", type},
                {"channel", subscription_channel_name(subscription.channel)},
                {subscription_key_field(subscription.channel), subscription.key}};
}

bool TopicRouter::subscribe(SubscriptionChannel channel, const std::string& key) {
    Subscription subscription{channel, key};
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.insert(subscription);
    }
    spdlog::debug("[Topic Router] Subscribing to {} {}", subscription_channel_name(channel), key);
    return channel_.send_message(control_message("subscribe", subscription));
}

bool TopicRouter::unsubscribe(SubscriptionChannel channel, const std::string& key) {
    Subscription subscription{channel, key};
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.erase(subscription);
    }
    spdlog::debug("[Topic Router] Unsubscribing from {} {}", subscription_channel_name(channel),
                  key);
    return channel_.send_message(control_message("unsubscribe", subscription));
}

std::vector<Subscription> TopicRouter::active_subscriptions() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return std::vector<Subscription>(subscriptions_.begin(), subscriptions_.end());
}

std::chrono::steady_clock::time_point TopicRouter::last_pong() const {
    std::lock_guard<std::mutex> lock(pong_mutex_);
    return last_pong_;
}

void TopicRouter::on_status(const ConnectionStatus& status) {
    if (status.state != ConnectionState::CONNECTED || !config_.resubscribe_on_reconnect) {
        return;
    }

    std::vector<Subscription> replay = active_subscriptions();
    if (replay.empty()) {
        return;
    }
    spdlog::info("[Topic Router] Restoring {} subscription(s)", replay.size());
    for (const auto& subscription : replay) {
        channel_.send_message(control_message("subscribe", subscription));
    }
}

} // namespace olympus

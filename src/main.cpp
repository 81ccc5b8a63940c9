// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "olympus_client.h"
#include "olympus_credential_store.h"
#include "olympus_settings.h"

#include "hv/hlog.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <signal.h>
#include <string>
#include <thread>

using namespace olympus;

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int /*sig*/) {
    g_running.store(false);
}

std::string env_or(const char* name, const std::string& fallback) {
    if (!fallback.empty()) {
        return fallback;
    }
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

logging::LogConfig make_log_config(const CliArgs& args, const ClientSettings& settings) {
    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(args.verbosity, settings.log_level);
    log_config.target = logging::parse_log_target(args.log_dest.empty() ? settings.log_target
                                                                        : args.log_dest);
    log_config.file_path = args.log_file.empty() ? settings.log_path : args.log_file;
    return log_config;
}

void print_update(const char* stream, const json& data) {
    printf("[%s] %s\n", stream, data.dump().c_str());
    fflush(stdout);
}

void subscribe_requested(TopicRouter& router, const CliArgs& args) {
    for (const auto& id : args.order_ids) {
        router.subscribe_to_order(id);
    }
    for (const auto& id : args.location_ids) {
        router.subscribe_to_inventory(id);
    }
    for (const auto& id : args.user_ids) {
        router.subscribe_to_notifications(id);
    }
}

int run_get(ApiClient& api, const std::string& path) {
    ApiResponse response = api.get(path);
    if (!response.success) {
        spdlog::error("[Monitor] GET {} failed: {} ({})", path, response.error.message,
                      response.error.get_type_string());
        fprintf(stderr, "%s\n", response.error.user_message().c_str());
        return EXIT_FAILURE;
    }
    printf("%s\n", response.data.dump(2).c_str());
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    // libhv defaults to INFO; keep it quiet until the config is read
    hlog_set_level(LOG_LEVEL_WARN);

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_shown ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    Config config;
    if (!config.init(args.config_path)) {
        spdlog::warn("[Monitor] Could not write {}, continuing with in-memory config",
                     args.config_path);
    }

    ClientSettings settings = ClientSettings::from_config(config);
    settings.apply_environment();
    if (!args.api_url.empty()) {
        settings.api.base_url = args.api_url;
    }
    if (!args.ws_url.empty()) {
        settings.realtime.url = args.ws_url;
    }

    logging::init(make_log_config(args, settings));
    hlog_set_level(logging::hv_level_for(settings.log_level));

    MemoryCredentialStore credentials(env_or("OLYMPUS_ACCESS_TOKEN", args.access_token),
                                      env_or("OLYMPUS_REFRESH_TOKEN", args.refresh_token));

    OlympusClient client;
    if (!client.init(settings, credentials)) {
        spdlog::critical("[Monitor] Client initialization failed");
        return EXIT_FAILURE;
    }
    client.register_event_handler([](const ClientEvent& event) {
        if (event.is_error) {
            spdlog::error("[Monitor] {}: {}", client_event_name(event.type), event.message);
        } else {
            spdlog::info("[Monitor] {}: {}", client_event_name(event.type), event.message);
        }
    });

    if (!args.get_path.empty()) {
        int rc = run_get(*client.api(), args.get_path);
        client.shutdown();
        return rc;
    }

    TopicRouter& router = *client.router();
    StreamSubscription order_sub(
        router.order_updates(),
        router.order_updates().listen([](const json& data) { print_update("order", data); }));
    StreamSubscription inventory_sub(
        router.inventory_updates(),
        router.inventory_updates().listen([](const json& data) { print_update("inventory", data); }));
    StreamSubscription notification_sub(
        router.notifications(),
        router.notifications().listen([](const json& data) { print_update("notification", data); }));

    // The router only replays on reconnect when configured to; otherwise resend here
    const bool router_replays = settings.router.resubscribe_on_reconnect;
    std::atomic<bool> subscribed_once{false};
    StreamSubscription status_sub(
        router.connection_status(),
        router.connection_status().listen([&](const ConnectionStatus& status) {
            spdlog::info("[Monitor] {} -> {}", connection_state_name(status.previous),
                         connection_state_name(status.state));
            if (status.state != ConnectionState::CONNECTED) {
                return;
            }
            if (!router_replays || !subscribed_once.exchange(true)) {
                subscribe_requested(router, args);
            }
        }));

    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    if (client.channel()->connect() != RealtimeChannel::CONNECT_OK) {
        fprintf(stderr, "An access token is required (--token or OLYMPUS_ACCESS_TOKEN)\n");
        client.shutdown();
        return EXIT_FAILURE;
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("[Monitor] Stopping");
    status_sub.reset();
    order_sub.reset();
    inventory_sub.reset();
    notification_sub.reset();
    client.shutdown();
    return EXIT_SUCCESS;
}

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_api_client.cpp
 * @brief Request pipeline: headers, error mapping, 401 recovery, single-flight refresh
 */

#include "olympus_api_client.h"

#include "../mocks/fake_http_transport.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace olympus;

namespace {

constexpr const char* kBase = "http://api.test/api/v1";

/// MemoryCredentialStore that counts clear() calls
class CountingCredentialStore : public MemoryCredentialStore {
  public:
    using MemoryCredentialStore::MemoryCredentialStore;

    void clear() override {
        clear_count.fetch_add(1);
        MemoryCredentialStore::clear();
    }

    std::atomic<int> clear_count{0};
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string header(const HttpExchangeRequest& req, const std::string& name) {
    auto it = req.headers.find(name);
    return it == req.headers.end() ? std::string() : it->second;
}

/**
 * @brief Server where only "Bearer <valid>" is accepted and /auth/refresh answers
 *        with refresh_reply
 */
class ScriptedServer {
  public:
    explicit ScriptedServer(std::string valid_token) : valid_(std::move(valid_token)) {}

    FakeHttpTransport::Handler handler() {
        return [this](const HttpExchangeRequest& req) {
            if (ends_with(req.url, "/auth/refresh")) {
                // Hold the refresh until every expected caller has been rejected
                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                while (rejected_.load() < hold_refresh_until_rejected &&
                       std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                return refresh_reply;
            }
            if (header(req, "Authorization") == "Bearer " + valid_) {
                return FakeHttpTransport::json_response(200, {{"ok", true}});
            }
            rejected_.fetch_add(1);
            return FakeHttpTransport::json_response(401, {{"message", "token expired"}});
        };
    }

    HttpExchangeResponse refresh_reply;
    int hold_refresh_until_rejected = 0;

  private:
    std::string valid_;
    std::atomic<int> rejected_{0};
};

ApiClientConfig test_config() {
    ApiClientConfig config;
    config.base_url = kBase;
    config.timeout_ms = 5000;
    return config;
}

} // namespace

// ============================================================================
// Request building
// ============================================================================

TEST_CASE("ApiClient: attaches default headers and bearer token", "[api][request]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    auto response = api.get("/orders", {{"status", "open"}, {"q", "a b&c"}});
    REQUIRE(response.success);

    auto requests = http.requests();
    REQUIRE(requests.size() == 1);
    const auto& req = requests[0];
    REQUIRE(req.method == HTTP_GET);
    REQUIRE(req.url == std::string(kBase) + "/orders?q=a%20b%26c&status=open");
    REQUIRE(header(req, "Authorization") == "Bearer t1");
    REQUIRE(header(req, "Content-Type") == "application/json");
    REQUIRE(header(req, "Accept") == "application/json");
    REQUIRE(req.timeout_ms == 5000);
    REQUIRE(req.body.empty());
}

TEST_CASE("ApiClient: omits Authorization without a token", "[api][request]") {
    MemoryCredentialStore store;
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    api.get("/health");
    auto requests = http.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].headers.count("Authorization") == 0);
}

TEST_CASE("ApiClient: trailing slashes on the base URL are dropped", "[api][request]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClientConfig config = test_config();
    config.base_url = "http://api.test/api/v1//";
    ApiClient api(store, http, config);

    REQUIRE(api.config().base_url == "http://api.test/api/v1");
    api.get("/orders");
    REQUIRE(http.requests()[0].url == "http://api.test/api/v1/orders");
}

TEST_CASE("ApiClient: verbs, body and per-request overrides", "[api][request]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    SECTION("post serializes the body") {
        api.post("/orders", {{"sku", "A-1"}, {"qty", 2}});
        auto req = http.requests()[0];
        REQUIRE(req.method == HTTP_POST);
        REQUIRE(json::parse(req.body) == json({{"sku", "A-1"}, {"qty", 2}}));
    }

    SECTION("put, patch and delete") {
        api.put("/orders/1", {{"qty", 3}});
        api.patch("/orders/1", {{"status", "shipped"}});
        api.del("/orders/1");
        auto requests = http.requests();
        REQUIRE(requests.size() == 3);
        REQUIRE(requests[0].method == HTTP_PUT);
        REQUIRE(requests[1].method == HTTP_PATCH);
        REQUIRE(requests[2].method == HTTP_DELETE);
        REQUIRE(requests[2].body.empty());
    }

    SECTION("caller headers and timeout reach the wire") {
        ApiRequest request;
        request.path = "/orders";
        request.headers["X-Request-Id"] = "abc";
        request.headers["Accept"] = "text/csv";
        request.timeout_ms = 750;
        api.execute(request);

        auto req = http.requests()[0];
        REQUIRE(header(req, "X-Request-Id") == "abc");
        REQUIRE(header(req, "Accept") == "text/csv");
        REQUIRE(req.timeout_ms == 750);
    }
}

TEST_CASE("ApiClient: rejects unsafe endpoints without sending", "[api][request]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    for (const std::string path : {"", "orders", "/../admin", "/a b", "/a\r\nX-Evil: 1"}) {
        auto response = api.get(path);
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error.type == ApiErrorType::UNKNOWN);
    }
    REQUIRE(http.request_count() == 0);

    REQUIRE(ApiClient::is_safe_endpoint("/orders/42/items"));
    REQUIRE_FALSE(ApiClient::is_safe_endpoint(std::string("/a\x7f", 3)));
}

// ============================================================================
// Response handling
// ============================================================================

TEST_CASE("ApiClient: parses successful bodies", "[api][response]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    SECTION("JSON body") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::json_response(201, {{"id", "o-9"}});
        });
        auto response = api.post("/orders", {{"sku", "A-1"}});
        REQUIRE(response.success);
        REQUIRE(response.status_code == 201);
        REQUIRE(response.data["id"] == "o-9");
        REQUIRE_FALSE(response.error.has_error());
    }

    SECTION("empty body is null") {
        http.set_handler(
            [](const HttpExchangeRequest&) { return FakeHttpTransport::raw_response(204, ""); });
        auto response = api.del("/orders/1");
        REQUIRE(response.success);
        REQUIRE(response.data.is_null());
    }

    SECTION("non-JSON body is kept as a string") {
        http.set_handler(
            [](const HttpExchangeRequest&) { return FakeHttpTransport::raw_response(200, "pong"); });
        auto response = api.get("/ping");
        REQUIRE(response.success);
        REQUIRE(response.data == "pong");
    }
}

TEST_CASE("ApiClient: non-401 failures are returned without retry", "[api][response]") {
    CountingCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    SECTION("404") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::json_response(404, {{"message", "order not found"}});
        });
        auto response = api.get("/orders/missing");
        REQUIRE_FALSE(response.success);
        REQUIRE(response.status_code == 404);
        REQUIRE(response.error.type == ApiErrorType::NOT_FOUND);
        REQUIRE(response.error.message == "order not found");
        REQUIRE(response.error.path == "/orders/missing");
        REQUIRE(response.error.method == "GET");
    }

    SECTION("500") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::raw_response(500, "", "Internal Server Error");
        });
        auto response = api.get("/orders");
        REQUIRE(response.error.type == ApiErrorType::SERVER_ERROR);
        REQUIRE(response.error.message == "Internal Server Error");
    }

    SECTION("403") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::json_response(403, {{"error", "forbidden"}});
        });
        REQUIRE(api.get("/admin").error.type == ApiErrorType::FORBIDDEN);
    }

    REQUIRE(http.request_count() == 1);
    REQUIRE(api.refresh_count() == 0);
    REQUIRE(store.clear_count.load() == 0);
    REQUIRE(store.get_access_token() == std::string("t1"));
}

TEST_CASE("ApiClient: transport failures map to error types", "[api][response]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    SECTION("timeout reports the effective limit") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::transport_failure(TransportStatus::TIMEOUT, "timed out");
        });
        ApiRequest request;
        request.path = "/orders";
        request.timeout_ms = 250;
        auto response = api.execute(request);
        REQUIRE(response.error.type == ApiErrorType::TIMEOUT);
        REQUIRE(response.error.message == "Request timeout after 250ms");
        REQUIRE(response.status_code == 0);
    }

    SECTION("connection failure") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::transport_failure(TransportStatus::CONNECTION_FAILED,
                                                        "Connection refused");
        });
        auto response = api.get("/orders");
        REQUIRE(response.error.type == ApiErrorType::NO_CONNECTION);
        REQUIRE(response.error.message == "Connection refused");
    }

    SECTION("cancelled") {
        http.set_handler([](const HttpExchangeRequest&) {
            return FakeHttpTransport::transport_failure(TransportStatus::CANCELLED);
        });
        REQUIRE(api.get("/orders").error.type == ApiErrorType::CANCELLED);
    }

    REQUIRE(http.request_count() == 1);
}

// ============================================================================
// 401 recovery
// ============================================================================

TEST_CASE("ApiClient: 401 refreshes once and retries with the new token", "[api][refresh]") {
    CountingCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ScriptedServer server("t2");
    server.refresh_reply = FakeHttpTransport::json_response(200, {{"access_token", "t2"}});
    http.set_handler(server.handler());
    ApiClient api(store, http, test_config());

    auto response = api.get("/orders");

    REQUIRE(response.success);
    REQUIRE(response.data["ok"] == true);
    REQUIRE(api.refresh_count() == 1);
    REQUIRE(store.get_access_token() == std::string("t2"));
    REQUIRE(store.get_refresh_token() == std::string("r1"));
    REQUIRE(store.clear_count.load() == 0);

    auto requests = http.requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(header(requests[0], "Authorization") == "Bearer t1");

    const auto& refresh = requests[1];
    REQUIRE(refresh.method == HTTP_POST);
    REQUIRE(refresh.url == std::string(kBase) + "/auth/refresh");
    REQUIRE(refresh.headers.count("Authorization") == 0);
    REQUIRE(json::parse(refresh.body) == json({{"refresh_token", "r1"}}));

    REQUIRE(header(requests[2], "Authorization") == "Bearer t2");
    REQUIRE(requests[2].url == requests[0].url);
}

TEST_CASE("ApiClient: refresh response shapes", "[api][refresh]") {
    CountingCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ScriptedServer server("t2");
    ApiClient api(store, http, test_config());

    SECTION("rotated refresh token under data is stored") {
        server.refresh_reply = FakeHttpTransport::json_response(
            200, {{"data", {{"access_token", "t2"}, {"refresh_token", "r2"}}}});
        http.set_handler(server.handler());

        REQUIRE(api.get("/orders").success);
        REQUIRE(store.get_access_token() == std::string("t2"));
        REQUIRE(store.get_refresh_token() == std::string("r2"));
    }

    SECTION("missing access_token is a refresh failure") {
        server.refresh_reply = FakeHttpTransport::json_response(200, {{"expires_in", 900}});
        http.set_handler(server.handler());

        auto response = api.get("/orders");
        REQUIRE(response.error.type == ApiErrorType::SESSION_INVALID);
        REQUIRE(store.clear_count.load() == 1);
    }
}

TEST_CASE("ApiClient: a 401 on the retry does not refresh again", "[api][refresh]") {
    CountingCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    // Server never accepts anything, but the refresh itself succeeds
    ScriptedServer server("never-valid");
    server.refresh_reply = FakeHttpTransport::json_response(200, {{"access_token", "t2"}});
    http.set_handler(server.handler());
    ApiClient api(store, http, test_config());

    auto response = api.get("/orders");

    REQUIRE_FALSE(response.success);
    REQUIRE(response.status_code == 401);
    REQUIRE(response.error.type == ApiErrorType::UNAUTHORIZED);
    REQUIRE(api.refresh_count() == 1);
    REQUIRE(http.request_count() == 3);
    REQUIRE(store.clear_count.load() == 0);
    REQUIRE(store.get_access_token() == std::string("t2"));
}

TEST_CASE("ApiClient: 401 without an access token still refreshes", "[api][refresh]") {
    CountingCredentialStore store("", "r1");
    FakeHttpTransport http;
    ScriptedServer server("t2");
    server.refresh_reply = FakeHttpTransport::json_response(200, {{"access_token", "t2"}});
    http.set_handler(server.handler());
    ApiClient api(store, http, test_config());

    auto response = api.get("/orders");

    REQUIRE(response.success);
    REQUIRE(api.refresh_count() == 1);
    REQUIRE(http.request_count() == 3);
    REQUIRE(store.clear_count.load() == 0);
    REQUIRE(store.get_access_token() == std::string("t2"));

    auto requests = http.requests();
    REQUIRE(requests[0].headers.count("Authorization") == 0);
    REQUIRE(header(requests[2], "Authorization") == "Bearer t2");
}

TEST_CASE("ApiClient: 401 with no credentials at all is a session failure", "[api][refresh]") {
    CountingCredentialStore store;
    FakeHttpTransport http;
    ScriptedServer server("t1");
    http.set_handler(server.handler());
    ApiClient api(store, http, test_config());

    auto response = api.get("/orders");
    REQUIRE(response.error.type == ApiErrorType::SESSION_INVALID);
    REQUIRE(http.count_ending_with("/auth/refresh") == 0);
    REQUIRE(http.request_count() == 1);
    REQUIRE(store.clear_count.load() == 0);
}

TEST_CASE("ApiClient: refresh failure invalidates the session", "[api][refresh]") {
    CountingCredentialStore store("t1", "r1");
    store.set_user({{"id", "u-1"}});
    FakeHttpTransport http;
    ScriptedServer server("t2");
    ApiClient api(store, http, test_config());

    std::vector<ClientEvent> events;
    api.register_event_handler([&events](const ClientEvent& e) { events.push_back(e); });

    SECTION("refresh rejected") {
        server.refresh_reply =
            FakeHttpTransport::json_response(401, {{"message", "refresh token revoked"}});
    }

    SECTION("refresh endpoint unreachable") {
        server.refresh_reply = FakeHttpTransport::transport_failure(
            TransportStatus::CONNECTION_FAILED, "Connection refused");
    }

    http.set_handler(server.handler());
    auto response = api.get("/orders");

    REQUIRE_FALSE(response.success);
    REQUIRE(response.status_code == 401);
    REQUIRE(response.error.type == ApiErrorType::SESSION_INVALID);
    REQUIRE(store.clear_count.load() == 1);
    REQUIRE_FALSE(store.get_access_token().has_value());
    REQUIRE_FALSE(store.get_refresh_token().has_value());
    REQUIRE(store.get_user().is_null());

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == ClientEventType::SESSION_EXPIRED);
    REQUIRE(events[0].is_error);

    // Original request and the refresh; no retry
    REQUIRE(http.request_count() == 2);
}

TEST_CASE("ApiClient: missing refresh token fails without calling the endpoint",
          "[api][refresh]") {
    CountingCredentialStore store;
    store.set_access_token("t1");
    FakeHttpTransport http;
    ScriptedServer server("t2");
    http.set_handler(server.handler());
    ApiClient api(store, http, test_config());

    auto response = api.get("/orders");
    REQUIRE(response.error.type == ApiErrorType::SESSION_INVALID);
    REQUIRE(http.count_ending_with("/auth/refresh") == 0);
    REQUIRE(store.clear_count.load() == 1);
    REQUIRE_FALSE(store.has_tokens());
}

TEST_CASE("ApiClient: token already replaced by another caller is reused", "[api][refresh]") {
    CountingCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ApiClient api(store, http, test_config());

    // The first protected call races with a refresh that lands while it is in flight
    std::atomic<bool> first{true};
    http.set_handler([&](const HttpExchangeRequest& req) {
        if (ends_with(req.url, "/auth/refresh")) {
            return FakeHttpTransport::json_response(200, {{"access_token", "t3"}});
        }
        if (first.exchange(false)) {
            store.set_access_token("t2");
            return FakeHttpTransport::json_response(401, nullptr);
        }
        return FakeHttpTransport::json_response(200, {{"auth", header(req, "Authorization")}});
    });

    auto response = api.get("/orders");
    REQUIRE(response.success);
    REQUIRE(response.data["auth"] == "Bearer t2");
    REQUIRE(api.refresh_count() == 0);
    REQUIRE(http.count_ending_with("/auth/refresh") == 0);
}

// ============================================================================
// Single-flight refresh under concurrency
// ============================================================================

TEST_CASE("ApiClient: concurrent 401s share one refresh", "[api][refresh][concurrency]") {
    constexpr int kCallers = 8;

    CountingCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    ScriptedServer server("t2");
    server.hold_refresh_until_rejected = kCallers;
    ApiClient api(store, http, test_config());

    SECTION("refresh succeeds") {
        server.refresh_reply = FakeHttpTransport::json_response(200, {{"access_token", "t2"}});
        http.set_handler(server.handler());

        std::vector<std::future<ApiResponse>> results;
        for (int i = 0; i < kCallers; i++) {
            results.push_back(std::async(std::launch::async, [&api, i]() {
                return api.get("/orders/" + std::to_string(i));
            }));
        }

        for (auto& f : results) {
            ApiResponse response = f.get();
            REQUIRE(response.success);
        }
        REQUIRE(http.count_ending_with("/auth/refresh") == 1);
        REQUIRE(api.refresh_count() == 1);
        REQUIRE(store.get_access_token() == std::string("t2"));
    }

    SECTION("refresh fails") {
        server.refresh_reply = FakeHttpTransport::json_response(401, nullptr);
        http.set_handler(server.handler());

        std::vector<std::future<ApiResponse>> results;
        for (int i = 0; i < kCallers; i++) {
            results.push_back(std::async(std::launch::async, [&api]() { return api.get("/orders"); }));
        }

        for (auto& f : results) {
            ApiResponse response = f.get();
            REQUIRE(response.error.type == ApiErrorType::SESSION_INVALID);
        }
        REQUIRE(http.count_ending_with("/auth/refresh") == 1);
        REQUIRE(store.clear_count.load() == 1);
    }
}

// ============================================================================
// Async execution
// ============================================================================

TEST_CASE("ApiClient: execute_async delivers the result on a worker thread", "[api][async]") {
    MemoryCredentialStore store("t1", "r1");
    FakeHttpTransport http;
    http.set_handler([](const HttpExchangeRequest&) {
        return FakeHttpTransport::json_response(200, {{"count", 3}});
    });

    std::promise<ApiResponse> done;
    auto future = done.get_future();
    const auto caller = std::this_thread::get_id();
    std::atomic<bool> other_thread{false};

    {
        ApiClient api(store, http, test_config());
        ApiRequest request;
        request.path = "/inventory";
        api.execute_async(request, [&](const ApiResponse& response) {
            other_thread.store(std::this_thread::get_id() != caller);
            done.set_value(response);
        });

        REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    } // destructor joins the worker

    ApiResponse response = future.get();
    REQUIRE(response.success);
    REQUIRE(response.data["count"] == 3);
    REQUIRE(other_thread.load());
}

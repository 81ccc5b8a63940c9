// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file olympus_api_client.cpp
 * @brief Authenticated request pipeline with single-flight token refresh
 *
 * Thread safety: execute() runs on the caller's thread. execute_async() callbacks
 * are invoked from background threads; during ApiClient destruction pending
 * threads are joined, so callbacks complete before the client is destroyed.
 */

#include "olympus_api_client.h"

#include "hv/hurl.h"
#include "spdlog/spdlog.h"

#include <chrono>
#include <utility>

namespace olympus {

namespace {

constexpr const char* kJsonContentType = "application/json";

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

/// Parse a response body. Empty bodies become null, non-JSON bodies a string.
json parse_body(const std::string& body) {
    if (body.empty()) {
        return nullptr;
    }
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return body;
    }
    return parsed;
}

/// Look up a string field at the top level, then under "data"
std::optional<std::string> find_token_field(const json& body, const char* key) {
    if (body.is_object()) {
        if (body.contains(key) && body[key].is_string()) {
            return body[key].get<std::string>();
        }
        if (body.contains("data") && body["data"].is_object()) {
            const auto& data = body["data"];
            if (data.contains(key) && data[key].is_string()) {
                return data[key].get<std::string>();
            }
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

ApiClient::ApiClient(CredentialStore& credentials, HttpTransport& transport,
                     ApiClientConfig config)
    : credentials_(credentials), transport_(transport), config_(std::move(config)),
      refresh_([this]() { return perform_refresh(); }) {
    // Trailing slash would produce "//" when joined with a path
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

ApiClient::~ApiClient() {
    shutting_down_.store(true);

    std::list<HttpThread> threads_to_join;
    {
        std::lock_guard<std::mutex> lock(http_threads_mutex_);
        threads_to_join = std::move(http_threads_);
    }

    if (threads_to_join.empty()) {
        return;
    }

    spdlog::debug("[Api Client] Waiting for {} HTTP thread(s) to finish...",
                  threads_to_join.size());
    for (auto& t : threads_to_join) {
        if (t.thread.joinable()) {
            t.thread.join();
        }
    }
}

void ApiClient::launch_http_thread(std::function<void()> func) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(http_threads_mutex_);

    // Reap finished threads
    for (auto it = http_threads_.begin(); it != http_threads_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = http_threads_.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([func = std::move(func), done]() {
        func();
        done->store(true);
    });
    http_threads_.push_back(HttpThread{std::move(worker), done});
}

// ============================================================================
// Request Pipeline
// ============================================================================

bool ApiClient::is_safe_endpoint(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        return false;
    }

    // Reject directory traversal
    if (path.find("..") != std::string::npos) {
        return false;
    }

    // Reject whitespace and control characters that could enable CRLF injection
    for (char c : path) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || c == ' ') {
            return false;
        }
    }

    return true;
}

std::string ApiClient::build_url(const ApiRequest& request) const {
    std::string url = config_.base_url + request.path;
    if (request.query.empty()) {
        return url;
    }

    char separator = (url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : request.query) {
        url += separator;
        url += HUrl::escape(key, "-_.~");
        url += '=';
        url += HUrl::escape(value, "-_.~");
        separator = '&';
    }
    return url;
}

HttpExchangeResponse ApiClient::send_once(const ApiRequest& request,
                                          const std::optional<std::string>& token) {
    HttpExchangeRequest wire;
    wire.method = request.method;
    wire.url = build_url(request);
    wire.timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;

    wire.headers["Content-Type"] = kJsonContentType;
    wire.headers["Accept"] = kJsonContentType;
    for (const auto& [key, value] : request.headers) {
        wire.headers[key] = value;
    }
    if (token) {
        wire.headers["Authorization"] = "Bearer " + *token;
    } else {
        wire.headers.erase("Authorization");
    }

    if (!request.body.is_null()) {
        wire.body = request.body.dump();
    }

    spdlog::trace("[Api Client] -> {} {} (auth={}, retry={})", request.method_name(), wire.url,
                  token.has_value(), request.retried);
    return transport_.send(wire);
}

ApiResponse ApiClient::execute(const ApiRequest& request) {
    const std::string method = request.method_name();

    if (!is_safe_endpoint(request.path)) {
        spdlog::error("[Api Client] {}: invalid endpoint '{}'", method, request.path);
        ApiResponse rejected;
        rejected.error =
            ApiError::rejected(method, request.path, "Invalid endpoint - contains unsafe characters");
        return rejected;
    }

    const uint32_t timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;
    auto start = std::chrono::steady_clock::now();

    std::optional<std::string> token = credentials_.get_access_token();
    HttpExchangeResponse raw = send_once(request, token);

    // A 401 is rescued by at most one refresh, whether or not a token was sent
    if (raw.status == TransportStatus::OK && raw.status_code == 401 && !request.retried) {
        spdlog::debug("[Api Client] {} {} -> 401, recovering session", method, request.path);

        std::string failure_reason;
        std::optional<std::string> fresh_token = recover_session(token, failure_reason);
        if (!fresh_token) {
            ApiResponse expired;
            expired.status_code = 401;
            expired.error = ApiError::session_invalid(method, request.path, failure_reason);
            spdlog::warn("[Api Client] {} {} failed: session invalid ({})", method, request.path,
                         failure_reason);
            return expired;
        }

        ApiRequest retry = request;
        retry.retried = true;
        raw = send_once(retry, fresh_token);
    }

    ApiResponse response = build_response(request, raw, timeout_ms);

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();
    if (response.success) {
        spdlog::debug("[Api Client] {} {} -> {} ({}ms)", method, request.path,
                      response.status_code, elapsed_ms);
    } else {
        spdlog::debug("[Api Client] {} {} failed: {} {} ({}ms)", method, request.path,
                      response.error.get_type_string(), response.error.message, elapsed_ms);
    }
    return response;
}

ApiResponse ApiClient::build_response(const ApiRequest& request, const HttpExchangeResponse& raw,
                                      uint32_t timeout_ms) const {
    ApiResponse response;
    const std::string method = request.method_name();

    switch (raw.status) {
    case TransportStatus::OK:
        break;
    case TransportStatus::TIMEOUT:
        response.error = ApiError::timeout(method, request.path, timeout_ms);
        return response;
    case TransportStatus::CONNECTION_FAILED:
        response.error = ApiError::no_connection(method, request.path, raw.error);
        return response;
    case TransportStatus::CANCELLED:
        response.error = ApiError::cancelled(method, request.path);
        return response;
    case TransportStatus::FAILED:
        response.error = ApiError::rejected(method, request.path,
                                            raw.error.empty() ? "HTTP request failed" : raw.error);
        return response;
    }

    response.status_code = raw.status_code;
    if (is_success_status(raw.status_code)) {
        response.success = true;
        response.data = parse_body(raw.body);
        return response;
    }

    response.error =
        ApiError::from_status(raw.status_code, raw.body, raw.status_message, method, request.path);
    return response;
}

// ============================================================================
// Session Recovery
// ============================================================================

std::optional<std::string>
ApiClient::recover_session(const std::optional<std::string>& rejected_token,
                           std::string& failure_reason) {
    // A refresh that settled after this call's 401 already decided the outcome
    auto settled = [this, &rejected_token]() -> std::optional<RefreshOutcome> {
        std::optional<std::string> stored = credentials_.get_access_token();
        if (stored == rejected_token) {
            return std::nullopt;
        }
        RefreshOutcome outcome;
        if (stored) {
            spdlog::debug("[Api Client] Access token already refreshed, retrying with it");
            outcome.success = true;
            outcome.access_token = *stored;
        } else {
            outcome.message = "Session was cleared";
        }
        return outcome;
    };

    RefreshOutcome outcome = refresh_.run(settled);
    if (!outcome.success) {
        failure_reason = outcome.message;
        return std::nullopt;
    }
    return outcome.access_token;
}

RefreshOutcome ApiClient::perform_refresh() {
    RefreshOutcome outcome;

    std::optional<std::string> refresh_token = credentials_.get_refresh_token();
    if (!refresh_token) {
        outcome.message = "No refresh token available";
        invalidate_session(outcome.message);
        return outcome;
    }

    HttpExchangeRequest wire;
    wire.method = HTTP_POST;
    wire.url = config_.base_url + config_.refresh_path;
    wire.timeout_ms = config_.timeout_ms;
    wire.headers["Content-Type"] = kJsonContentType;
    wire.headers["Accept"] = kJsonContentType;
    wire.body = json{{"refresh_token", *refresh_token}}.dump();

    spdlog::info("[Api Client] Refreshing access token");
    HttpExchangeResponse raw = transport_.send(wire);

    if (raw.status != TransportStatus::OK) {
        outcome.message = "Token refresh failed: " +
                          (raw.error.empty() ? std::string(transport_status_name(raw.status))
                                             : raw.error);
    } else if (!is_success_status(raw.status_code)) {
        ApiError err = ApiError::from_status(raw.status_code, raw.body, raw.status_message,
                                             "POST", config_.refresh_path);
        outcome.message = "Token refresh rejected: " + err.message;
    } else {
        json body = parse_body(raw.body);
        std::optional<std::string> access = find_token_field(body, "access_token");
        if (!access || access->empty()) {
            outcome.message = "Token refresh response has no access_token";
        } else {
            std::optional<std::string> rotated = find_token_field(body, "refresh_token");
            if (rotated && !rotated->empty()) {
                credentials_.set_tokens(*access, *rotated);
            } else {
                credentials_.set_access_token(*access);
            }
            outcome.success = true;
            outcome.access_token = *access;
            spdlog::info("[Api Client] Access token refreshed{}",
                         rotated ? " (refresh token rotated)" : "");
            return outcome;
        }
    }

    invalidate_session(outcome.message);
    return outcome;
}

void ApiClient::invalidate_session(const std::string& reason) {
    spdlog::warn("[Api Client] Session invalid: {}", reason);
    if (credentials_.get_access_token() || credentials_.get_refresh_token()) {
        credentials_.clear();
    }
    emit_event(ClientEventType::SESSION_EXPIRED, "Session expired", true, reason);
}

// ============================================================================
// Convenience Verbs
// ============================================================================

ApiResponse ApiClient::get(const std::string& path,
                           const std::map<std::string, std::string>& query) {
    ApiRequest request;
    request.method = HTTP_GET;
    request.path = path;
    request.query = query;
    return execute(request);
}

ApiResponse ApiClient::post(const std::string& path, const json& body) {
    ApiRequest request;
    request.method = HTTP_POST;
    request.path = path;
    request.body = body;
    return execute(request);
}

ApiResponse ApiClient::put(const std::string& path, const json& body) {
    ApiRequest request;
    request.method = HTTP_PUT;
    request.path = path;
    request.body = body;
    return execute(request);
}

ApiResponse ApiClient::patch(const std::string& path, const json& body) {
    ApiRequest request;
    request.method = HTTP_PATCH;
    request.path = path;
    request.body = body;
    return execute(request);
}

ApiResponse ApiClient::del(const std::string& path) {
    ApiRequest request;
    request.method = HTTP_DELETE;
    request.path = path;
    return execute(request);
}

void ApiClient::execute_async(ApiRequest request, ApiCallback on_complete) {
    if (shutting_down_.load()) {
        spdlog::warn("[Api Client] execute_async after shutdown: {} dropped", request.path);
        return;
    }

    launch_http_thread([this, request = std::move(request), on_complete]() {
        ApiResponse response = execute(request);
        if (!on_complete) {
            return;
        }
        try {
            on_complete(response);
        } catch (const std::exception& e) {
            spdlog::error("[Api Client] Completion callback threw exception: {}", e.what());
        }
    });
}

// ============================================================================
// Events
// ============================================================================

void ApiClient::register_event_handler(ClientEventCallback cb) {
    std::lock_guard<std::mutex> lock(event_handler_mutex_);
    event_handler_ = std::move(cb);
}

void ApiClient::emit_event(ClientEventType type, const std::string& message, bool is_error,
                           const std::string& details) {
    ClientEventCallback handler;
    {
        std::lock_guard<std::mutex> lock(event_handler_mutex_);
        handler = event_handler_;
    }

    if (!handler) {
        return;
    }

    ClientEvent evt{type, message, details, is_error};
    try {
        handler(evt);
    } catch (const std::exception& e) {
        spdlog::error("[Api Client] Event handler threw exception: {}", e.what());
    }
}

} // namespace olympus

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef OLYMPUS_API_CLIENT_H
#define OLYMPUS_API_CLIENT_H

#include "olympus_credential_store.h"
#include "olympus_events.h"
#include "olympus_http_transport.h"
#include "olympus_refresh_coordinator.h"
#include "olympus_request.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace olympus {

struct ApiClientConfig {
    std::string base_url = "http://localhost:8081/api/v1";
    std::string refresh_path = "/auth/refresh";
    uint32_t timeout_ms = 30000;
};

/**
 * @brief Authenticated HTTP request pipeline
 *
 * Attaches "Authorization: Bearer <token>" from the CredentialStore to every call.
 * When a call is answered with 401, the client refreshes the access token through
 * a single-flight RefreshCoordinator and re-sends the original call exactly once.
 * If the refresh fails, stored credentials are cleared and the call fails with
 * ApiErrorType::SESSION_INVALID. No other failure is retried.
 *
 * Thread safety: execute() may be called concurrently from any number of threads.
 * It blocks for the round trip (and the refresh, if one is needed), so it must not
 * be called on the realtime event loop. Use execute_async() from there.
 *
 * Lifecycle: the destructor waits for threads started by execute_async().
 */
class ApiClient {
  public:
    ApiClient(CredentialStore& credentials, HttpTransport& transport,
              ApiClientConfig config = ApiClientConfig{});
    virtual ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    /**
     * @brief Send a request, recovering from an expired access token
     *
     * @param request Request to send
     * @return Response; check success and error
     */
    ApiResponse execute(const ApiRequest& request);

    /**
     * @brief Run execute() on a tracked worker thread
     *
     * @param request Request to send
     * @param on_complete Invoked on the worker thread with the result
     */
    void execute_async(ApiRequest request, ApiCallback on_complete);

    ApiResponse get(const std::string& path,
                    const std::map<std::string, std::string>& query = {});
    ApiResponse post(const std::string& path, const json& body = nullptr);
    ApiResponse put(const std::string& path, const json& body = nullptr);
    ApiResponse patch(const std::string& path, const json& body = nullptr);
    ApiResponse del(const std::string& path);

    /**
     * @brief Register handler for pipeline events (SESSION_EXPIRED)
     *
     * @param cb Callback function, or nullptr to unregister
     */
    void register_event_handler(ClientEventCallback cb);

    const ApiClientConfig& config() const {
        return config_;
    }

    /**
     * @brief Number of refresh calls issued so far
     */
    uint64_t refresh_count() const {
        return refresh_.started_count();
    }

    /**
     * @brief Validate a request path before it is appended to the base URL
     *
     * Rejects empty paths, paths not starting with '/', directory traversal (..),
     * whitespace and control characters.
     */
    static bool is_safe_endpoint(const std::string& path);

    /**
     * @brief Build the absolute URL for a request, including the query string
     */
    std::string build_url(const ApiRequest& request) const;

  protected:
    /**
     * @brief Emit event to registered handler
     */
    void emit_event(ClientEventType type, const std::string& message, bool is_error = false,
                    const std::string& details = "");

  private:
    HttpExchangeResponse send_once(const ApiRequest& request,
                                   const std::optional<std::string>& token);

    /**
     * @brief Obtain a token that supersedes the one that was rejected
     *
     * Returns the stored token directly when another caller already refreshed it;
     * otherwise runs (or joins) the refresh. Returns nullopt if the session is gone.
     */
    std::optional<std::string> recover_session(const std::optional<std::string>& rejected_token,
                                               std::string& failure_reason);

    RefreshOutcome perform_refresh();
    void invalidate_session(const std::string& reason);

    ApiResponse build_response(const ApiRequest& request, const HttpExchangeResponse& raw,
                               uint32_t timeout_ms) const;

    void launch_http_thread(std::function<void()> func);

    CredentialStore& credentials_;
    HttpTransport& transport_;
    ApiClientConfig config_;
    RefreshCoordinator refresh_;

    ClientEventCallback event_handler_;
    mutable std::mutex event_handler_mutex_;

    struct HttpThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::list<HttpThread> http_threads_;
    std::mutex http_threads_mutex_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace olympus

#endif // OLYMPUS_API_CLIENT_H

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef FAKE_HTTP_TRANSPORT_H
#define FAKE_HTTP_TRANSPORT_H

/**
 * @file fake_http_transport.h
 * @brief Scripted HttpTransport for request pipeline tests
 *
 * Every exchange is recorded and answered by a handler the test installs.
 * Without a handler every request gets 200 with an empty body.
 *
 * @example
 * FakeHttpTransport http;
 * http.set_handler([](const HttpExchangeRequest& req) {
 *     return FakeHttpTransport::json_response(200, {{"id", "o-1"}});
 * });
 */

#include "olympus_http_transport.h"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "hv/json.hpp"

using namespace olympus;

class FakeHttpTransport : public HttpTransport {
  public:
    using Handler = std::function<HttpExchangeResponse(const HttpExchangeRequest&)>;

    FakeHttpTransport() = default;

    FakeHttpTransport(const FakeHttpTransport&) = delete;
    FakeHttpTransport& operator=(const FakeHttpTransport&) = delete;

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    /**
     * @brief Record the request and answer it; safe from several threads
     */
    HttpExchangeResponse send(const HttpExchangeRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = handler_;
        }
        if (!handler) {
            return json_response(200, nullptr);
        }
        return handler(request);
    }

    std::vector<HttpExchangeRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    /// Requests whose URL ends with the given suffix
    size_t count_ending_with(const std::string& suffix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.url.size() >= suffix.size() &&
                r.url.compare(r.url.size() - suffix.size(), suffix.size(), suffix) == 0) {
                n++;
            }
        }
        return n;
    }

    static HttpExchangeResponse json_response(int status_code, const nlohmann::json& body) {
        HttpExchangeResponse response;
        response.status = TransportStatus::OK;
        response.status_code = status_code;
        if (!body.is_null()) {
            response.body = body.dump();
        }
        return response;
    }

    static HttpExchangeResponse raw_response(int status_code, const std::string& body,
                                             const std::string& status_message = "") {
        HttpExchangeResponse response;
        response.status = TransportStatus::OK;
        response.status_code = status_code;
        response.status_message = status_message;
        response.body = body;
        return response;
    }

    static HttpExchangeResponse transport_failure(TransportStatus status,
                                                  const std::string& error = "") {
        HttpExchangeResponse response;
        response.status = status;
        response.error = error;
        return response;
    }

  private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<HttpExchangeRequest> requests_;
};

#endif // FAKE_HTTP_TRANSPORT_H

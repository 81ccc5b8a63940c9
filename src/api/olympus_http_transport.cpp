// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_http_transport.h"

#include "hv/HttpClient.h"
#include "hv/herr.h"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <memory>

namespace olympus {

const char* transport_status_name(TransportStatus status) {
    switch (status) {
    case TransportStatus::OK:
        return "ok";
    case TransportStatus::TIMEOUT:
        return "timeout";
    case TransportStatus::CONNECTION_FAILED:
        return "connection_failed";
    case TransportStatus::CANCELLED:
        return "cancelled";
    case TransportStatus::FAILED:
        return "failed";
    }
    return "unknown";
}

HttpExchangeResponse HvHttpTransport::send(const HttpExchangeRequest& request) {
    HttpExchangeResponse result;

    auto req = std::make_shared<HttpRequest>();
    req->method = request.method;
    req->url = request.url;
    // libhv timeouts are whole seconds
    req->timeout = static_cast<int>((request.timeout_ms + 999) / 1000);
    if (req->timeout <= 0) {
        req->timeout = 1;
    }
    for (const auto& [key, value] : request.headers) {
        req->headers[key] = value;
    }
    if (!request.body.empty()) {
        req->body = request.body;
    }

    HttpResponse resp;
    auto start = std::chrono::steady_clock::now();
    int ret = http_client_send(req.get(), &resp);
    if (ret != 0) {
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count();
        // libhv reports read timeouts with its own codes; elapsed time catches those
        bool timed_out = std::abs(ret) == ETIMEDOUT ||
                         elapsed_ms >= static_cast<long long>(req->timeout) * 1000;
        result.status = timed_out ? TransportStatus::TIMEOUT : TransportStatus::CONNECTION_FAILED;
        result.error = hv_strerror(ret);
        spdlog::debug("[Http Transport] {} {} failed: {} ({})", http_method_str(request.method),
                      request.url, result.error, ret);
        return result;
    }

    result.status = TransportStatus::OK;
    result.status_code = static_cast<int>(resp.status_code);
    result.status_message = resp.status_message();
    result.body = resp.body;
    return result;
}

} // namespace olympus

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "hv/httpdef.h"

namespace olympus {

/**
 * @brief Outcome of a single HTTP exchange at the socket level
 *
 * OK means a response was received, whatever its status code.
 */
enum class TransportStatus {
    OK,
    TIMEOUT,
    CONNECTION_FAILED,
    CANCELLED,
    FAILED
};

struct HttpExchangeRequest {
    http_method method = HTTP_GET;
    std::string url; ///< Absolute URL including query string
    std::map<std::string, std::string> headers;
    std::string body;
    uint32_t timeout_ms = 30000;
};

struct HttpExchangeResponse {
    TransportStatus status = TransportStatus::FAILED;
    int status_code = 0;
    std::string status_message;
    std::string body;
    std::string error; ///< Transport error description when status != OK
};

/**
 * @brief Blocking HTTP exchange
 *
 * Abstract so the pipeline can be driven by a scripted transport in tests.
 * send() may be called concurrently from several threads.
 */
class HttpTransport {
  public:
    virtual ~HttpTransport() = default;
    virtual HttpExchangeResponse send(const HttpExchangeRequest& request) = 0;
};

/**
 * @brief HttpTransport backed by libhv's synchronous HTTP client
 */
class HvHttpTransport : public HttpTransport {
  public:
    HttpExchangeResponse send(const HttpExchangeRequest& request) override;
};

const char* transport_status_name(TransportStatus status);

} // namespace olympus

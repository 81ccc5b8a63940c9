// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "olympus_error.h"

#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "hv/httpdef.h"
#include "hv/json.hpp"

using json = nlohmann::json;

namespace olympus {

/**
 * @brief One logical API call
 *
 * A request is retried at most once, and only after a successful token refresh.
 * The retry flag is set on the copy that is re-sent so the pipeline can never
 * recurse into a second refresh for the same call.
 */
struct ApiRequest {
    http_method method = HTTP_GET;
    std::string path;                          ///< Relative to the API base URL, e.g. "/orders"
    std::map<std::string, std::string> query;  ///< Appended as URL query parameters
    json body;                                 ///< Serialized as JSON when not null
    std::map<std::string, std::string> headers; ///< Overrides the default headers
    uint32_t timeout_ms = 0;                   ///< 0 = client default
    bool retried = false;                      ///< Set on the single post-refresh retry

    std::string method_name() const {
        return http_method_str(method);
    }
};

/**
 * @brief Result of ApiClient::execute()
 *
 * success is true for 2xx responses. data holds the parsed JSON body (null for an
 * empty body, a string for a non-JSON body). On failure, error describes why.
 */
struct ApiResponse {
    bool success = false;
    int status_code = 0;
    json data;
    ApiError error;
};

using ApiCallback = std::function<void(const ApiResponse&)>;

} // namespace olympus

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef OLYMPUS_ERROR_H
#define OLYMPUS_ERROR_H

#include <cstdint>
#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace olympus {

/**
 * @brief Error kinds surfaced by the request pipeline
 *
 * Transport-level failures (TIMEOUT, NO_CONNECTION, CANCELLED) are kept apart from
 * server-returned failures, which are classified by HTTP status code.
 */
enum class ApiErrorType {
    NONE,             // No error
    TIMEOUT,          // No response within the request timeout
    NO_CONNECTION,    // DNS failure, refused connection, reset socket
    BAD_REQUEST,      // HTTP 400
    UNAUTHORIZED,     // HTTP 401 that could not be recovered by a token refresh
    FORBIDDEN,        // HTTP 403
    NOT_FOUND,        // HTTP 404
    VALIDATION_ERROR, // HTTP 422
    SERVER_ERROR,     // HTTP 5xx
    CANCELLED,        // Request abandoned before completion
    SESSION_INVALID,  // Token refresh failed; stored credentials were cleared
    UNKNOWN           // Any other status, or a request rejected before sending
};

/**
 * @brief Error information attached to a failed ApiResponse
 */
struct ApiError {
    ApiErrorType type = ApiErrorType::NONE;
    int status_code = 0;  // HTTP status if a response was received, 0 otherwise
    std::string message;  // Server-supplied or generated error message
    std::string method;   // HTTP method of the failed request
    std::string path;     // Request path relative to the base URL
    json details;         // Parsed response body, if it was JSON

    /**
     * @brief Check if there's an error
     */
    bool has_error() const {
        return type != ApiErrorType::NONE;
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        return type_name(type);
    }

    static const char* type_name(ApiErrorType t) {
        switch (t) {
        case ApiErrorType::NONE:
            return "NONE";
        case ApiErrorType::TIMEOUT:
            return "TIMEOUT";
        case ApiErrorType::NO_CONNECTION:
            return "NO_CONNECTION";
        case ApiErrorType::BAD_REQUEST:
            return "BAD_REQUEST";
        case ApiErrorType::UNAUTHORIZED:
            return "UNAUTHORIZED";
        case ApiErrorType::FORBIDDEN:
            return "FORBIDDEN";
        case ApiErrorType::NOT_FOUND:
            return "NOT_FOUND";
        case ApiErrorType::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ApiErrorType::SERVER_ERROR:
            return "SERVER_ERROR";
        case ApiErrorType::CANCELLED:
            return "CANCELLED";
        case ApiErrorType::SESSION_INVALID:
            return "SESSION_INVALID";
        case ApiErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-friendly error message
     *
     * Server-supplied messages win for request-level errors (400, 422) since they
     * usually name the offending field.
     */
    std::string user_message() const {
        switch (type) {
        case ApiErrorType::NONE:
            return "";
        case ApiErrorType::TIMEOUT:
            return "Connection timed out. Please try again.";
        case ApiErrorType::NO_CONNECTION:
            return "No internet connection.";
        case ApiErrorType::UNAUTHORIZED:
            return "You are not authorized. Please sign in again.";
        case ApiErrorType::FORBIDDEN:
            return "You do not have permission to perform this action.";
        case ApiErrorType::NOT_FOUND:
            return "The requested resource was not found.";
        case ApiErrorType::SERVER_ERROR:
            return "Server error. Please try again later.";
        case ApiErrorType::CANCELLED:
            return "Request was cancelled.";
        case ApiErrorType::SESSION_INVALID:
            return "Your session has expired. Please sign in again.";
        case ApiErrorType::BAD_REQUEST:
        case ApiErrorType::VALIDATION_ERROR:
        case ApiErrorType::UNKNOWN:
            break;
        }
        if (!message.empty()) {
            return message;
        }
        return "An unexpected error occurred.";
    }

    /**
     * @brief Map an HTTP status code onto the taxonomy
     *
     * Only meaningful for non-2xx statuses.
     */
    static ApiErrorType type_for_status(int status) {
        switch (status) {
        case 400:
            return ApiErrorType::BAD_REQUEST;
        case 401:
            return ApiErrorType::UNAUTHORIZED;
        case 403:
            return ApiErrorType::FORBIDDEN;
        case 404:
            return ApiErrorType::NOT_FOUND;
        case 422:
            return ApiErrorType::VALIDATION_ERROR;
        default:
            break;
        }
        if (status >= 500 && status < 600) {
            return ApiErrorType::SERVER_ERROR;
        }
        return ApiErrorType::UNKNOWN;
    }

    /**
     * @brief Create error from a non-2xx HTTP response
     *
     * Message is taken from the body's "message" field, then "error", then the
     * HTTP status text.
     */
    static ApiError from_status(int status, const std::string& body,
                                const std::string& status_text, const std::string& method_name,
                                const std::string& request_path) {
        ApiError err;
        err.type = type_for_status(status);
        err.status_code = status;
        err.method = method_name;
        err.path = request_path;

        if (!body.empty()) {
            err.details = json::parse(body, nullptr, false);
            if (err.details.is_discarded()) {
                err.details = nullptr;
            }
        }

        if (err.details.is_object()) {
            if (err.details.contains("message") && err.details["message"].is_string()) {
                err.message = err.details["message"].get<std::string>();
            } else if (err.details.contains("error") && err.details["error"].is_string()) {
                err.message = err.details["error"].get<std::string>();
            }
        }

        if (err.message.empty()) {
            err.message = status_text.empty() ? "HTTP " + std::to_string(status) : status_text;
        }
        return err;
    }

    /**
     * @brief Create timeout error
     */
    static ApiError timeout(const std::string& method_name, const std::string& request_path,
                            uint32_t timeout_ms) {
        ApiError err;
        err.type = ApiErrorType::TIMEOUT;
        err.method = method_name;
        err.path = request_path;
        err.message = "Request timeout after " + std::to_string(timeout_ms) + "ms";
        return err;
    }

    /**
     * @brief Create no-connection error
     */
    static ApiError no_connection(const std::string& method_name, const std::string& request_path,
                                  const std::string& what = "") {
        ApiError err;
        err.type = ApiErrorType::NO_CONNECTION;
        err.method = method_name;
        err.path = request_path;
        err.message = what.empty() ? "Connection failed" : what;
        return err;
    }

    static ApiError cancelled(const std::string& method_name, const std::string& request_path) {
        ApiError err;
        err.type = ApiErrorType::CANCELLED;
        err.method = method_name;
        err.path = request_path;
        err.message = "Request cancelled";
        return err;
    }

    /**
     * @brief Create session-invalid error (token refresh failed)
     */
    static ApiError session_invalid(const std::string& method_name,
                                    const std::string& request_path, const std::string& why = "") {
        ApiError err;
        err.type = ApiErrorType::SESSION_INVALID;
        err.status_code = 401;
        err.method = method_name;
        err.path = request_path;
        err.message = why.empty() ? "Session expired" : why;
        return err;
    }

    /**
     * @brief Create error for a request rejected before it was sent
     */
    static ApiError rejected(const std::string& method_name, const std::string& request_path,
                             const std::string& why) {
        ApiError err;
        err.type = ApiErrorType::UNKNOWN;
        err.method = method_name;
        err.path = request_path;
        err.message = why;
        return err;
    }
};

} // namespace olympus

#endif // OLYMPUS_ERROR_H

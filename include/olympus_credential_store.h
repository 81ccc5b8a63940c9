// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace olympus {

/**
 * @brief Storage for the current session's tokens and user record
 *
 * Consumed by ApiClient (read, refresh, clear) and RealtimeChannel (read only).
 * Implementations must be safe to call from multiple threads: the pipeline reads
 * tokens from HTTP worker threads while the channel reads them on the event loop.
 *
 * Persistence (keychain, file, secure element) is up to the implementation.
 */
class CredentialStore {
  public:
    virtual ~CredentialStore() = default;

    virtual std::optional<std::string> get_access_token() const = 0;
    virtual std::optional<std::string> get_refresh_token() const = 0;
    virtual void set_access_token(const std::string& token) = 0;

    /**
     * @brief Replace both tokens (login, or refresh with token rotation)
     */
    virtual void set_tokens(const std::string& access_token, const std::string& refresh_token) = 0;

    /**
     * @brief Authenticated user record, opaque to this library
     */
    virtual json get_user() const = 0;
    virtual void set_user(const json& user) = 0;

    /**
     * @brief Forget tokens and user
     */
    virtual void clear() = 0;

    bool has_tokens() const {
        return get_access_token().has_value();
    }
};

/**
 * @brief In-memory CredentialStore guarded by a mutex
 *
 * Empty strings are treated as absent tokens.
 */
class MemoryCredentialStore : public CredentialStore {
  public:
    MemoryCredentialStore() = default;
    MemoryCredentialStore(const std::string& access_token, const std::string& refresh_token);

    std::optional<std::string> get_access_token() const override;
    std::optional<std::string> get_refresh_token() const override;
    void set_access_token(const std::string& token) override;
    void set_tokens(const std::string& access_token, const std::string& refresh_token) override;
    json get_user() const override;
    void set_user(const json& user) override;
    void clear() override;

  private:
    mutable std::mutex mutex_;
    std::string access_token_;
    std::string refresh_token_;
    json user_;
};

} // namespace olympus

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_credential_store.h"

#include "spdlog/spdlog.h"

namespace olympus {

MemoryCredentialStore::MemoryCredentialStore(const std::string& access_token,
                                             const std::string& refresh_token)
    : access_token_(access_token), refresh_token_(refresh_token) {}

std::optional<std::string> MemoryCredentialStore::get_access_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (access_token_.empty()) {
        return std::nullopt;
    }
    return access_token_;
}

std::optional<std::string> MemoryCredentialStore::get_refresh_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refresh_token_.empty()) {
        return std::nullopt;
    }
    return refresh_token_;
}

void MemoryCredentialStore::set_access_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_token_ = token;
}

void MemoryCredentialStore::set_tokens(const std::string& access_token,
                                       const std::string& refresh_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_token_ = access_token;
    refresh_token_ = refresh_token;
}

json MemoryCredentialStore::get_user() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_;
}

void MemoryCredentialStore::set_user(const json& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_ = user;
}

void MemoryCredentialStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    access_token_.clear();
    refresh_token_.clear();
    user_ = nullptr;
    spdlog::debug("[Credential Store] Cleared");
}

} // namespace olympus

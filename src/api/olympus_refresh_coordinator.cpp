// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_refresh_coordinator.h"

#include "spdlog/spdlog.h"

#include <utility>

namespace olympus {

RefreshCoordinator::RefreshCoordinator(RefreshFunction refresh_fn)
    : refresh_fn_(std::move(refresh_fn)) {}

bool RefreshCoordinator::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.valid();
}

RefreshOutcome RefreshCoordinator::run(const SettledCheck& settled) {
    std::promise<RefreshOutcome> promise;
    std::shared_future<RefreshOutcome> shared;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_.valid()) {
            shared = current_;
        } else if (settled) {
            std::optional<RefreshOutcome> already = settled();
            if (already) {
                spdlog::debug("[Refresh Coordinator] Refresh already settled, not starting");
                return *already;
            }
        }

        if (!shared.valid()) {
            shared = promise.get_future().share();
            current_ = shared;
            leader = true;
        }
    }

    if (!leader) {
        spdlog::debug("[Refresh Coordinator] Joining refresh already in flight");
        return shared.get();
    }

    started_.fetch_add(1);
    spdlog::debug("[Refresh Coordinator] Starting token refresh");

    RefreshOutcome outcome;
    try {
        if (refresh_fn_) {
            outcome = refresh_fn_();
        } else {
            outcome.message = "No refresh function configured";
        }
    } catch (const std::exception& e) {
        spdlog::error("[Refresh Coordinator] Refresh threw exception: {}", e.what());
        outcome = RefreshOutcome{};
        outcome.message = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::shared_future<RefreshOutcome>();
    }
    promise.set_value(outcome);
    return outcome;
}

} // namespace olympus

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "olympus_error.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>

namespace olympus {

/**
 * @brief Settled result of a token refresh
 */
struct RefreshOutcome {
    bool success = false;
    std::string access_token; ///< New access token when success
    std::string message;      ///< Failure reason when !success
};

/**
 * @brief Single-flight gate for the token refresh operation
 *
 * The slot holds either nothing or the shared future of the refresh in flight.
 * The first caller to find the slot empty becomes the leader: it installs a
 * future, runs the refresh function on its own thread, empties the slot, and
 * then fulfils the future. Callers that arrive while the slot is occupied block
 * on the same future and receive the same outcome.
 *
 * The slot is emptied before the outcome is published, so a caller arriving after
 * settlement always starts a fresh operation instead of reusing a stale result.
 */
class RefreshCoordinator {
  public:
    using RefreshFunction = std::function<RefreshOutcome()>;

    /// Returns an outcome when a refresh is no longer needed, nullopt otherwise
    using SettledCheck = std::function<std::optional<RefreshOutcome>()>;

    explicit RefreshCoordinator(RefreshFunction refresh_fn);

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    /**
     * @brief Run the refresh, or join the one already in flight
     *
     * Exceptions thrown by the refresh function are converted into a failed outcome.
     *
     * @param settled Evaluated under the slot lock when no refresh is in flight. A
     *        returned outcome is handed back as-is and no refresh starts.
     */
    RefreshOutcome run(const SettledCheck& settled = nullptr);

    bool in_flight() const;

    /**
     * @brief Number of times the refresh function was actually invoked
     */
    uint64_t started_count() const {
        return started_.load();
    }

  private:
    RefreshFunction refresh_fn_;
    mutable std::mutex mutex_;
    std::shared_future<RefreshOutcome> current_;
    std::atomic<uint64_t> started_{0};
};

} // namespace olympus

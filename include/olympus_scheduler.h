// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>

#include "hv/EventLoop.h"

namespace olympus {

using TimerId = uint64_t;
constexpr TimerId INVALID_TIMER_ID = 0;

/**
 * @brief Single executor with cancellable timers
 *
 * All RealtimeChannel state lives on one Scheduler. Timer callbacks and posted
 * tasks run on the scheduler's thread, one at a time.
 */
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /**
     * @brief Run fn once after delay_ms
     */
    virtual TimerId set_timeout(uint32_t delay_ms, std::function<void()> fn) = 0;

    /**
     * @brief Run fn every interval_ms until cancelled
     */
    virtual TimerId set_interval(uint32_t interval_ms, std::function<void()> fn) = 0;

    /**
     * @brief Cancel a pending timer; unknown or fired IDs are ignored
     */
    virtual void cancel(TimerId id) = 0;

    /**
     * @brief Run fn on the scheduler thread
     *
     * Runs immediately when called from the scheduler thread, otherwise queues it.
     */
    virtual void run_in_loop(std::function<void()> fn) = 0;
};

/**
 * @brief Scheduler backed by a libhv EventLoop
 *
 * The loop must outlive the scheduler. It is shared with the WebSocket client so
 * socket callbacks and timers run on the same thread. set_timeout() and
 * set_interval() must be called from the loop thread; cancel() and run_in_loop()
 * may be called from any thread.
 */
class HvScheduler : public Scheduler {
  public:
    explicit HvScheduler(hv::EventLoopPtr loop);

    TimerId set_timeout(uint32_t delay_ms, std::function<void()> fn) override;
    TimerId set_interval(uint32_t interval_ms, std::function<void()> fn) override;
    void cancel(TimerId id) override;
    void run_in_loop(std::function<void()> fn) override;

    const hv::EventLoopPtr& loop() const {
        return loop_;
    }

  private:
    hv::EventLoopPtr loop_;
};

} // namespace olympus

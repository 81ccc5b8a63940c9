// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "olympus_scheduler.h"

#include "spdlog/spdlog.h"

#include <utility>

namespace olympus {

HvScheduler::HvScheduler(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

TimerId HvScheduler::set_timeout(uint32_t delay_ms, std::function<void()> fn) {
    if (!loop_) {
        spdlog::error("[Scheduler] set_timeout without event loop");
        return INVALID_TIMER_ID;
    }
    return loop_->setTimeout(static_cast<int>(delay_ms), [fn = std::move(fn)](hv::TimerID) {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("[Scheduler] Timer callback threw exception: {}", e.what());
        }
    });
}

TimerId HvScheduler::set_interval(uint32_t interval_ms, std::function<void()> fn) {
    if (!loop_) {
        spdlog::error("[Scheduler] set_interval without event loop");
        return INVALID_TIMER_ID;
    }
    return loop_->setInterval(static_cast<int>(interval_ms), [fn = std::move(fn)](hv::TimerID) {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("[Scheduler] Interval callback threw exception: {}", e.what());
        }
    });
}

void HvScheduler::cancel(TimerId id) {
    if (loop_ && id != INVALID_TIMER_ID) {
        loop_->killTimer(id);
    }
}

void HvScheduler::run_in_loop(std::function<void()> fn) {
    if (!loop_) {
        spdlog::error("[Scheduler] run_in_loop without event loop");
        return;
    }
    loop_->runInLoop([fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("[Scheduler] Task threw exception: {}", e.what());
        }
    });
}

} // namespace olympus

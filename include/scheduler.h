// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>

namespace printdeck {

using TimerId = uint64_t;

/// Never returned by set_timeout()/set_interval()
constexpr TimerId NULL_TIMER_ID = 0;

/**
 * @brief Timer and deferred-call facility of the single logical thread
 *
 * All callbacks run on the thread that owns the scheduler. Cancelling a timer
 * is synchronous: once cancel() returns the callback will not run.
 */
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /**
     * @brief Run @p fn once after @p delay_ms milliseconds
     */
    virtual TimerId set_timeout(uint32_t delay_ms, std::function<void()> fn) = 0;

    /**
     * @brief Run @p fn every @p interval_ms milliseconds until cancelled
     */
    virtual TimerId set_interval(uint32_t interval_ms, std::function<void()> fn) = 0;

    /**
     * @brief Cancel a pending timer (no-op for unknown or fired ids)
     */
    virtual void cancel(TimerId id) = 0;

    /**
     * @brief Run @p fn on the next loop turn
     */
    virtual void post(std::function<void()> fn) = 0;
};

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "scheduler.h"

#include "hv/EventLoop.h"

#include <map>
#include <memory>

namespace printdeck {

/**
 * @brief Scheduler backed by a libhv event loop
 *
 * Must be used from the loop's own thread. Timer ids are our own; the mapping
 * to libhv TimerIDs is kept so that cancelling an already-fired one-shot is a
 * harmless no-op.
 */
class EventLoopScheduler : public Scheduler {
  public:
    explicit EventLoopScheduler(hv::EventLoopPtr loop);
    ~EventLoopScheduler() override;

    EventLoopScheduler(const EventLoopScheduler&) = delete;
    EventLoopScheduler& operator=(const EventLoopScheduler&) = delete;

    TimerId set_timeout(uint32_t delay_ms, std::function<void()> fn) override;
    TimerId set_interval(uint32_t interval_ms, std::function<void()> fn) override;
    void cancel(TimerId id) override;
    void post(std::function<void()> fn) override;

    /// Cancel every timer this scheduler created
    void cancel_all();

    hv::EventLoopPtr loop() const {
        return loop_;
    }

  private:
    hv::EventLoopPtr loop_;
    std::map<TimerId, hv::TimerID> timers_;
    TimerId next_id_ = 1;
    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

} // namespace printdeck

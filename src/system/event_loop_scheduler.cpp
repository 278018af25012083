// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_loop_scheduler.h"

#include <spdlog/spdlog.h>

namespace printdeck {

EventLoopScheduler::EventLoopScheduler(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

EventLoopScheduler::~EventLoopScheduler() {
    cancel_all();
}

TimerId EventLoopScheduler::set_timeout(uint32_t delay_ms, std::function<void()> fn) {
    TimerId id = next_id_++;
    std::weak_ptr<bool> weak = lifetime_;
    hv::TimerID hv_id = loop_->setTimeout(
        static_cast<int>(delay_ms), [this, weak, id, fn = std::move(fn)](hv::TimerID) {
            if (weak.expired()) {
                return;
            }
            // One-shot: forget the mapping before running so the callback may re-arm
            timers_.erase(id);
            fn();
        });
    timers_[id] = hv_id;
    return id;
}

TimerId EventLoopScheduler::set_interval(uint32_t interval_ms, std::function<void()> fn) {
    TimerId id = next_id_++;
    std::weak_ptr<bool> weak = lifetime_;
    hv::TimerID hv_id =
        loop_->setInterval(static_cast<int>(interval_ms), [weak, fn = std::move(fn)](hv::TimerID) {
            if (weak.expired()) {
                return;
            }
            fn();
        });
    timers_[id] = hv_id;
    return id;
}

void EventLoopScheduler::cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return;
    }
    loop_->killTimer(it->second);
    timers_.erase(it);
}

void EventLoopScheduler::post(std::function<void()> fn) {
    std::weak_ptr<bool> weak = lifetime_;
    loop_->queueInLoop([weak, fn = std::move(fn)]() {
        if (weak.expired()) {
            return;
        }
        fn();
    });
}

void EventLoopScheduler::cancel_all() {
    if (!timers_.empty()) {
        spdlog::debug("[Scheduler] Cancelling {} pending timers", timers_.size());
    }
    for (const auto& [id, hv_id] : timers_) {
        loop_->killTimer(hv_id);
    }
    timers_.clear();
}

} // namespace printdeck

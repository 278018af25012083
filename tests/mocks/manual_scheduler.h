// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "scheduler.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>

namespace printdeck {

/**
 * @brief Scheduler driven by a virtual clock
 *
 * Nothing runs until the test calls advance() or run_posted(). Timers fire
 * in due-time order (ties in creation order); posted calls run before timers
 * at each step.
 */
class ManualScheduler : public Scheduler {
  public:
    TimerId set_timeout(uint32_t delay_ms, std::function<void()> fn) override {
        return add(delay_ms, 0, std::move(fn));
    }

    TimerId set_interval(uint32_t interval_ms, std::function<void()> fn) override {
        return add(interval_ms, interval_ms, std::move(fn));
    }

    void cancel(TimerId id) override {
        timers_.erase(id);
    }

    void post(std::function<void()> fn) override {
        posted_.push_back(std::move(fn));
    }

    /// Run posted calls, including ones posted while running
    size_t run_posted() {
        size_t count = 0;
        while (!posted_.empty()) {
            std::function<void()> fn = std::move(posted_.front());
            posted_.pop_front();
            fn();
            ++count;
        }
        return count;
    }

    /// Move the clock forward, firing every timer that comes due
    void advance(uint64_t ms) {
        uint64_t target = now_ + ms;
        run_posted();
        while (true) {
            auto next = next_due(target);
            if (next == timers_.end()) {
                break;
            }
            now_ = next->second.due;
            std::function<void()> fn = next->second.fn;
            if (next->second.interval > 0) {
                next->second.due += next->second.interval;
            } else {
                timers_.erase(next);
            }
            fn();
            run_posted();
        }
        now_ = target;
    }

    uint64_t now() const {
        return now_;
    }

    size_t pending_timers() const {
        return timers_.size();
    }

    size_t pending_posted() const {
        return posted_.size();
    }

    bool has_timer(TimerId id) const {
        return timers_.count(id) > 0;
    }

    /// Delay of the earliest pending one-shot timer, or -1 if none
    int64_t next_timeout_delay() const {
        int64_t best = -1;
        for (const auto& [id, timer] : timers_) {
            if (timer.interval == 0) {
                int64_t delay = static_cast<int64_t>(timer.due - now_);
                if (best < 0 || delay < best) {
                    best = delay;
                }
            }
        }
        return best;
    }

  private:
    struct Timer {
        uint64_t due = 0;
        uint32_t interval = 0;
        std::function<void()> fn;
    };

    TimerId add(uint32_t delay_ms, uint32_t interval_ms, std::function<void()> fn) {
        TimerId id = next_id_++;
        timers_[id] = Timer{now_ + delay_ms, interval_ms, std::move(fn)};
        return id;
    }

    std::map<TimerId, Timer>::iterator next_due(uint64_t limit) {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due > limit) {
                continue;
            }
            if (best == timers_.end() || it->second.due < best->second.due) {
                best = it;
            }
        }
        return best;
    }

    std::map<TimerId, Timer> timers_;
    std::deque<std::function<void()>> posted_;
    uint64_t now_ = 0;
    TimerId next_id_ = 1;
};

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file polling_service.h
 * @brief Periodic status polling of every context
 *
 * All contexts are polled whether active or not; notification logic needs
 * transitions of background printers too. At most one status call per
 * context is in flight: a tick that finds the previous call unresolved is
 * skipped, not queued. Failures are reported per tick and never stop the
 * interval.
 */

#include "context_registry.h"
#include "event_signal.h"
#include "printer_error.h"
#include "printer_types.h"
#include "scheduler.h"

#include <map>
#include <memory>
#include <optional>

namespace printdeck {

class PollingService {
  public:
    static constexpr uint32_t DEFAULT_INTERVAL_MS = 3000;

    /**
     * @param interval_ms Fixed for the lifetime of the service
     */
    PollingService(ContextRegistry& registry, Scheduler& scheduler,
                   uint32_t interval_ms = DEFAULT_INTERVAL_MS);
    ~PollingService();

    PollingService(const PollingService&) = delete;
    PollingService& operator=(const PollingService&) = delete;

    /**
     * @brief Start polling; the first poll runs immediately
     * @return false for unknown contexts. Already polling is a no-op (true).
     */
    bool start_polling_for_context(const ContextId& id);

    /**
     * @brief Cancel the interval synchronously
     *
     * A status call still in flight is discarded when it resolves.
     */
    void stop_polling_for_context(const ContextId& id);

    void stop_all();

    [[nodiscard]] bool is_polling(const ContextId& id) const {
        return entries_.count(id) > 0;
    }

    [[nodiscard]] size_t polling_count() const {
        return entries_.size();
    }

    [[nodiscard]] uint32_t interval_ms() const {
        return interval_ms_;
    }

    /// Latest snapshot of a polling context
    [[nodiscard]] std::optional<PrinterStatus> last_data(const ContextId& id) const;

    // ========================================================================
    // Events
    // ========================================================================

    Signal<ContextId, PrinterStatus> on_polling_data;
    Signal<ContextId, PrinterError> on_polling_error;
    Signal<ContextId> on_polling_started;
    Signal<ContextId> on_polling_stopped;

  private:
    struct Entry {
        TimerId timer = NULL_TIMER_ID;
        bool in_flight = false;
        uint64_t generation = 0;
        std::optional<PrinterStatus> last;
    };

    void poll(const ContextId& id);
    Entry* find_entry(const ContextId& id, uint64_t generation);
    void handle_context_switched(const ContextId& id);

    ContextRegistry& registry_;
    Scheduler& scheduler_;
    uint32_t interval_ms_;

    std::map<ContextId, Entry> entries_;
    uint64_t next_generation_ = 1;

    SignalConnection switched_conn_;
    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file context_registry.h
 * @brief Owner of all printer contexts and the single active pointer
 *
 * The registry is passed explicitly to the components that need it. It
 * holds no UI references; every state change is published through the
 * typed signals below.
 *
 * Invariants:
 * - At most one context is active; none is a valid state.
 * - Context ids are never reused and removal is permanent.
 * - Only the registry writes the active pointer.
 */

#include "event_signal.h"
#include "port_allocator.h"
#include "printer_context.h"
#include "scheduler.h"

#include <memory>
#include <optional>
#include <vector>

namespace printdeck {

class PollingService;

class ContextRegistry {
  public:
    ContextRegistry(Scheduler& scheduler, PortAllocator& ports);
    ~ContextRegistry();

    ContextRegistry(const ContextRegistry&) = delete;
    ContextRegistry& operator=(const ContextRegistry&) = delete;

    /**
     * @brief Wrap a backend in a new context
     *
     * Installs the registry's lifecycle callback on the backend. A backend
     * DISPOSED event removes the context on the next loop turn.
     *
     * @return OK with the new id; DUPLICATE_PRINTER with the existing id if a
     *         context already holds the same serial number; INVALID_BACKEND
     *         for a null backend
     */
    ContextResult create_context(std::unique_ptr<PrinterBackend> backend,
                                 const PrinterDetails& details);

    /**
     * @brief Make @p id the active context
     *
     * No-op (no event) if already active. Unknown, removed, or
     * being-removed ids return UNKNOWN_CONTEXT and change nothing.
     */
    ContextResult switch_active(const ContextId& id);

    /**
     * @brief Tear down a context; silent no-op for unknown ids
     *
     * Order: stop polling, shut down the camera proxy and release its ports,
     * dispose notification state, disconnect the backend, then emit
     * context-removed. The active pointer becomes empty if it pointed here.
     */
    void remove_context(const ContextId& id);

    /// Remove every context (shutdown)
    void remove_all();

    [[nodiscard]] std::vector<ContextInfo> get_all() const;
    [[nodiscard]] std::optional<ContextInfo> get_active() const;
    [[nodiscard]] std::optional<ContextId> active_context_id() const;

    /// Live context, or nullptr (also for contexts being removed)
    [[nodiscard]] PrinterContext* get_context(const ContextId& id);
    [[nodiscard]] const PrinterContext* get_context(const ContextId& id) const;

    [[nodiscard]] std::optional<ContextInfo> get_info(const ContextId& id) const;

    [[nodiscard]] size_t context_count() const {
        return contexts_.size();
    }

    void update_connection_state(const ContextId& id, ContextConnectionState state);

    /**
     * @brief Emit context-updated with the current projection of @p id
     *
     * For changes made after creation (camera bound, connection state).
     * Unknown or being-removed ids emit nothing.
     */
    void publish_update(const ContextId& id);

    /// Bump last_activity
    void touch(const ContextId& id);

    /**
     * @brief Polling service whose per-context polling removal stops
     *
     * Set by the PollingService itself; nullptr detaches.
     */
    void attach_polling(PollingService* polling) {
        polling_ = polling;
    }

    // ========================================================================
    // Events
    // ========================================================================

    Signal<ContextId, ContextInfo> on_context_created;
    /// new id, previous id (if any), info of the new active context
    Signal<ContextId, std::optional<ContextId>, ContextInfo> on_context_switched;
    Signal<ContextId, ContextInfo> on_context_updated;
    /// id, was_active
    Signal<ContextId, bool> on_context_removed;
    /// Lifecycle events of each context's backend
    Signal<ContextId, BackendEvent> on_backend_event;

  private:
    PrinterContext* find(const ContextId& id) const;
    ContextId generate_id();
    void handle_backend_event(const ContextId& id, const BackendEvent& event);

    Scheduler& scheduler_;
    PortAllocator& ports_;
    PollingService* polling_ = nullptr;

    std::vector<std::unique_ptr<PrinterContext>> contexts_; ///< Creation order
    std::optional<ContextId> active_id_;
    uint64_t next_context_number_ = 1;

    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

} // namespace printdeck

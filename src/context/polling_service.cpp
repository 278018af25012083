// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "polling_service.h"

#include <spdlog/spdlog.h>

#include <vector>

namespace printdeck {

PollingService::PollingService(ContextRegistry& registry, Scheduler& scheduler,
                               uint32_t interval_ms)
    : registry_(registry), scheduler_(scheduler), interval_ms_(interval_ms) {
    registry_.attach_polling(this);
    switched_conn_ = registry_.on_context_switched.connect_scoped(
        [this](const ContextId& id, const std::optional<ContextId>&, const ContextInfo&) {
            handle_context_switched(id);
        });
    spdlog::debug("[PollingService] Interval {}ms", interval_ms_);
}

PollingService::~PollingService() {
    lifetime_.reset();
    switched_conn_.reset();
    registry_.attach_polling(nullptr);
    for (auto& [id, entry] : entries_) {
        scheduler_.cancel(entry.timer);
    }
    entries_.clear();
}

bool PollingService::start_polling_for_context(const ContextId& id) {
    if (is_polling(id)) {
        spdlog::debug("[PollingService] {} already polling", id);
        return true;
    }

    PrinterContext* ctx = registry_.get_context(id);
    if (!ctx || !ctx->backend) {
        spdlog::warn("[PollingService] Cannot poll unknown context {}", id);
        return false;
    }

    Entry& entry = entries_[id];
    entry.generation = next_generation_++;
    entry.timer = scheduler_.set_interval(interval_ms_, [this, id]() { poll(id); });
    ctx->polling_active = true;

    spdlog::info("[PollingService] Started polling {} every {}ms", id, interval_ms_);
    on_polling_started.emit(id);

    poll(id);
    return true;
}

void PollingService::stop_polling_for_context(const ContextId& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    scheduler_.cancel(it->second.timer);
    entries_.erase(it);

    if (PrinterContext* ctx = registry_.get_context(id)) {
        ctx->polling_active = false;
    }
    spdlog::info("[PollingService] Stopped polling {}", id);
    on_polling_stopped.emit(id);
}

void PollingService::stop_all() {
    std::vector<ContextId> ids;
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        stop_polling_for_context(id);
    }
}

std::optional<PrinterStatus> PollingService::last_data(const ContextId& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.last;
}

void PollingService::poll(const ContextId& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    Entry& entry = it->second;
    if (entry.in_flight) {
        spdlog::trace("[PollingService] {} previous poll still pending, skipping tick", id);
        return;
    }

    PrinterContext* ctx = registry_.get_context(id);
    if (!ctx || !ctx->backend) {
        spdlog::warn("[PollingService] {} no longer exists, stopping", id);
        stop_polling_for_context(id);
        return;
    }

    entry.in_flight = true;
    uint64_t generation = entry.generation;
    std::weak_ptr<bool> weak = lifetime_;

    ctx->backend->get_status(
        [this, weak, id, generation](const PrinterStatus& status) {
            if (weak.expired()) {
                return;
            }
            Entry* current = find_entry(id, generation);
            if (!current) {
                spdlog::trace("[PollingService] Discarding status for stopped {}", id);
                return;
            }
            current->in_flight = false;
            current->last = status;
            registry_.touch(id);
            on_polling_data.emit(id, status);
        },
        [this, weak, id, generation](const PrinterError& err) {
            if (weak.expired()) {
                return;
            }
            Entry* current = find_entry(id, generation);
            if (!current) {
                return;
            }
            current->in_flight = false;
            spdlog::warn("[PollingService] {} poll failed: {}", id, err.message);
            on_polling_error.emit(id, err);
        });
}

PollingService::Entry* PollingService::find_entry(const ContextId& id, uint64_t generation) {
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

void PollingService::handle_context_switched(const ContextId& id) {
    if (!is_polling(id)) {
        return;
    }
    // Deliver after every switch listener has run
    std::weak_ptr<bool> weak = lifetime_;
    scheduler_.post([this, weak, id]() {
        if (weak.expired()) {
            return;
        }
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.last) {
            return;
        }
        spdlog::debug("[PollingService] Re-emitting cached status for new active {}", id);
        PrinterStatus cached = *it->second.last;
        on_polling_data.emit(id, cached);
    });
}

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "context_registry.h"

#include "polling_service.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printdeck {

ContextInfo make_context_info(const PrinterContext& context) {
    ContextInfo info;
    info.id = context.id;
    info.name = context.details.name;
    info.ip_address = context.details.ip_address;
    info.model = context.details.model;
    info.serial_number = context.details.serial_number;
    info.status = context.connection_state;
    info.is_active = context.is_active;
    info.has_camera = context.camera_proxy != nullptr;
    if (context.camera_proxy && context.camera_proxy->is_running()) {
        info.camera_url = "http://localhost:" + std::to_string(context.camera_proxy->port()) +
                          "/camera";
    }
    info.created_at = context.created_at;
    info.last_activity = context.last_activity;
    return info;
}

json context_info_to_json(const ContextInfo& info) {
    return {{"id", info.id},
            {"name", info.name},
            {"ip", info.ip_address},
            {"model", info.model},
            {"serialNumber", info.serial_number},
            {"status", connection_state_to_string(info.status)},
            {"isActive", info.is_active},
            {"hasCamera", info.has_camera},
            {"cameraUrl", info.camera_url ? json(*info.camera_url) : json(nullptr)},
            {"createdAt", format_iso8601(info.created_at)},
            {"lastActivity", format_iso8601(info.last_activity)}};
}

ContextRegistry::ContextRegistry(Scheduler& scheduler, PortAllocator& ports)
    : scheduler_(scheduler), ports_(ports) {}

ContextRegistry::~ContextRegistry() {
    remove_all();
    on_context_created.disconnect_all();
    on_context_switched.disconnect_all();
    on_context_updated.disconnect_all();
    on_context_removed.disconnect_all();
    on_backend_event.disconnect_all();
}

// ============================================================================
// Create / switch / remove
// ============================================================================

ContextResult ContextRegistry::create_context(std::unique_ptr<PrinterBackend> backend,
                                              const PrinterDetails& details) {
    if (!backend) {
        spdlog::error("[ContextRegistry] Refusing context for {}: no backend", details.name);
        return ContextResult::invalid_backend("No backend for printer " + details.name);
    }

    if (!details.serial_number.empty()) {
        for (const auto& ctx : contexts_) {
            if (!ctx->removing && ctx->details.serial_number == details.serial_number) {
                spdlog::warn("[ContextRegistry] Printer {} ({}) already managed by {}",
                             details.name, details.serial_number, ctx->id);
                return ContextResult::duplicate(ctx->id, details.serial_number);
            }
        }
    }

    auto ctx = std::make_unique<PrinterContext>();
    ctx->id = generate_id();
    ctx->details = details;
    ctx->connection_state =
        backend->is_connected() ? ContextConnectionState::CONNECTED : ContextConnectionState::CONNECTING;
    ctx->created_at = std::chrono::system_clock::now();
    ctx->last_activity = ctx->created_at;
    ctx->backend = std::move(backend);

    ContextId id = ctx->id;
    std::weak_ptr<bool> weak = lifetime_;
    ctx->backend->set_event_callback([this, weak, id](const BackendEvent& event) {
        if (weak.expired()) {
            return;
        }
        handle_backend_event(id, event);
    });

    contexts_.push_back(std::move(ctx));
    spdlog::info("[ContextRegistry] Created {} for {} ({}, {})", id, details.name,
                 details.ip_address, details.model);

    if (const PrinterContext* created = find(id)) {
        on_context_created.emit(id, make_context_info(*created));
    }
    return ContextResult::ok(id);
}

ContextResult ContextRegistry::switch_active(const ContextId& id) {
    PrinterContext* target = find(id);
    if (!target || target->removing) {
        spdlog::warn("[ContextRegistry] Cannot switch to unknown context {}", id);
        return ContextResult::unknown(id);
    }

    if (active_id_ && *active_id_ == id) {
        return ContextResult::ok(id);
    }

    std::optional<ContextId> previous = active_id_;
    if (previous) {
        if (PrinterContext* prev = find(*previous)) {
            prev->is_active = false;
        }
    }
    target->is_active = true;
    target->last_activity = std::chrono::system_clock::now();
    active_id_ = id;

    spdlog::info("[ContextRegistry] Active context: {} -> {}", previous.value_or("none"), id);
    on_context_switched.emit(id, previous, make_context_info(*target));
    return ContextResult::ok(id);
}

void ContextRegistry::remove_context(const ContextId& id) {
    PrinterContext* ctx = find(id);
    if (!ctx || ctx->removing) {
        return;
    }
    ctx->removing = true;
    bool was_active = ctx->is_active;
    spdlog::info("[ContextRegistry] Removing {} ({})", id, ctx->details.name);

    if (polling_) {
        polling_->stop_polling_for_context(id);
    }
    ctx->polling_active = false;

    if (ctx->camera_proxy) {
        ctx->camera_proxy->shutdown();
        ctx->camera_proxy.reset();
    }
    for (int port : ctx->camera_ports) {
        ports_.release(port);
    }
    ctx->camera_ports.clear();

    if (ctx->notifications) {
        ctx->notifications->dispose();
        ctx->notifications.reset();
    }

    std::unique_ptr<PrinterBackend> backend = std::move(ctx->backend);
    if (backend) {
        backend->set_event_callback(nullptr);
        if (backend->is_connected()) {
            backend->disconnect();
        }
    }

    if (was_active) {
        active_id_.reset();
    }
    contexts_.erase(std::remove_if(contexts_.begin(), contexts_.end(),
                                   [&id](const std::unique_ptr<PrinterContext>& c) {
                                       return c->id == id;
                                   }),
                    contexts_.end());

    spdlog::debug("[ContextRegistry] {} removed ({} remaining)", id, contexts_.size());
    on_context_removed.emit(id, was_active);

    // The backend may be the caller of a posted removal; drop it last
    backend.reset();
}

void ContextRegistry::remove_all() {
    std::vector<ContextId> ids;
    for (const auto& ctx : contexts_) {
        ids.push_back(ctx->id);
    }
    for (const auto& id : ids) {
        remove_context(id);
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<ContextInfo> ContextRegistry::get_all() const {
    std::vector<ContextInfo> result;
    result.reserve(contexts_.size());
    for (const auto& ctx : contexts_) {
        if (!ctx->removing) {
            result.push_back(make_context_info(*ctx));
        }
    }
    return result;
}

std::optional<ContextInfo> ContextRegistry::get_active() const {
    if (!active_id_) {
        return std::nullopt;
    }
    return get_info(*active_id_);
}

std::optional<ContextId> ContextRegistry::active_context_id() const {
    return active_id_;
}

PrinterContext* ContextRegistry::get_context(const ContextId& id) {
    PrinterContext* ctx = find(id);
    return (ctx && !ctx->removing) ? ctx : nullptr;
}

const PrinterContext* ContextRegistry::get_context(const ContextId& id) const {
    const PrinterContext* ctx = find(id);
    return (ctx && !ctx->removing) ? ctx : nullptr;
}

std::optional<ContextInfo> ContextRegistry::get_info(const ContextId& id) const {
    const PrinterContext* ctx = get_context(id);
    if (!ctx) {
        return std::nullopt;
    }
    return make_context_info(*ctx);
}

void ContextRegistry::update_connection_state(const ContextId& id, ContextConnectionState state) {
    PrinterContext* ctx = get_context(id);
    if (!ctx || ctx->connection_state == state) {
        return;
    }
    spdlog::debug("[ContextRegistry] {} connection {} -> {}", id,
                  connection_state_to_string(ctx->connection_state),
                  connection_state_to_string(state));
    ctx->connection_state = state;
    ctx->last_activity = std::chrono::system_clock::now();
}

void ContextRegistry::publish_update(const ContextId& id) {
    const PrinterContext* ctx = get_context(id);
    if (!ctx) {
        return;
    }
    on_context_updated.emit(id, make_context_info(*ctx));
}

void ContextRegistry::touch(const ContextId& id) {
    if (PrinterContext* ctx = get_context(id)) {
        ctx->last_activity = std::chrono::system_clock::now();
    }
}

// ============================================================================
// Internals
// ============================================================================

PrinterContext* ContextRegistry::find(const ContextId& id) const {
    for (const auto& ctx : contexts_) {
        if (ctx->id == id) {
            return ctx.get();
        }
    }
    return nullptr;
}

ContextId ContextRegistry::generate_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return "context-" + std::to_string(next_context_number_++) + "-" + std::to_string(ms);
}

void ContextRegistry::handle_backend_event(const ContextId& id, const BackendEvent& event) {
    PrinterContext* ctx = get_context(id);
    if (!ctx) {
        return;
    }
    spdlog::debug("[ContextRegistry] {} backend event: {}", id,
                  backend_event_to_string(event.type));

    switch (event.type) {
    case BackendEventType::INITIALIZED:
        update_connection_state(id, ContextConnectionState::CONNECTED);
        break;
    case BackendEventType::INITIALIZATION_FAILED:
        update_connection_state(id, ContextConnectionState::ERROR);
        break;
    case BackendEventType::PRE_DISCONNECT:
        update_connection_state(id, event.expected ? ContextConnectionState::DISCONNECTED
                                                   : ContextConnectionState::ERROR);
        break;
    case BackendEventType::DISPOSED:
        update_connection_state(id, ContextConnectionState::DISCONNECTED);
        break;
    }

    on_backend_event.emit(id, event);

    if (event.type == BackendEventType::DISPOSED) {
        std::weak_ptr<bool> weak = lifetime_;
        scheduler_.post([this, weak, id]() {
            if (weak.expired()) {
                return;
            }
            remove_context(id);
        });
    }
}

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_bridge.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printdeck {

// ============================================================================
// Sinks
// ============================================================================

void LoggingBridgeSink::publish(const std::string& channel, const json& payload) {
    spdlog::debug("[UiBridge] {} {}", channel, payload.dump());
}

void WebUiCache::publish(const std::string& channel, const json& payload) {
    if (channel == bridge_channel::POLLING_UPDATE) {
        latest_polling_ = payload;
    } else if (channel == bridge_channel::CONTEXT_CREATED) {
        contexts_[payload.value("contextId", "")] = payload.value("contextInfo", json::object());
    } else if (channel == bridge_channel::CONTEXT_SWITCHED) {
        std::string id = payload.value("contextId", "");
        for (auto& item : contexts_.items()) {
            item.value()["isActive"] = (item.key() == id);
        }
        contexts_[id] = payload.value("contextInfo", json::object());
        active_id_ = id;
    } else if (channel == bridge_channel::CONTEXT_UPDATED) {
        std::string id = payload.value("contextId", "");
        if (contexts_.contains(id)) {
            contexts_[id] = payload.value("contextInfo", json::object());
        }
    } else if (channel == bridge_channel::CONTEXT_REMOVED) {
        std::string id = payload.value("contextId", "");
        contexts_.erase(id);
        if (active_id_ && *active_id_ == id) {
            active_id_.reset();
            latest_polling_.reset();
        }
    } else if (channel == bridge_channel::BACKEND_INIT_FAILED) {
        last_failure_ = payload;
    }
}

// ============================================================================
// Bridge
// ============================================================================

UiBridge::UiBridge(ContextRegistry& registry, PollingService& polling)
    : registry_(registry), polling_(polling) {
    connections_.push_back(registry_.on_context_created.connect_scoped(
        [this](const ContextId& id, const ContextInfo& info) {
            publish(bridge_channel::CONTEXT_CREATED,
                    {{"contextId", id}, {"contextInfo", context_info_to_json(info)}});
        }));

    connections_.push_back(registry_.on_context_switched.connect_scoped(
        [this](const ContextId& id, const std::optional<ContextId>& previous,
               const ContextInfo& info) {
            publish(bridge_channel::CONTEXT_SWITCHED,
                    {{"contextId", id},
                     {"previousContextId", previous ? json(*previous) : json(nullptr)},
                     {"contextInfo", context_info_to_json(info)}});
        }));

    connections_.push_back(registry_.on_context_updated.connect_scoped(
        [this](const ContextId& id, const ContextInfo& info) {
            publish(bridge_channel::CONTEXT_UPDATED,
                    {{"contextId", id}, {"contextInfo", context_info_to_json(info)}});
        }));

    connections_.push_back(registry_.on_context_removed.connect_scoped(
        [this](const ContextId& id, const bool& was_active) {
            publish(bridge_channel::CONTEXT_REMOVED, {{"contextId", id}, {"wasActive", was_active}});
        }));

    connections_.push_back(registry_.on_backend_event.connect_scoped(
        [this](const ContextId& id, const BackendEvent& event) { handle_backend_event(id, event); }));

    connections_.push_back(polling_.on_polling_data.connect_scoped(
        [this](const ContextId& id, const PrinterStatus& status) {
            handle_polling_data(id, status);
        }));
}

UiBridge::~UiBridge() {
    connections_.clear();
}

void UiBridge::add_sink(std::shared_ptr<BridgeSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void UiBridge::remove_sink(const std::shared_ptr<BridgeSink>& sink) {
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void UiBridge::forward_initialization_failed(const std::string& printer_name,
                                             const std::string& error) {
    spdlog::warn("[UiBridge] Backend initialization failed for {}: {}", printer_name, error);
    publish(bridge_channel::BACKEND_INIT_FAILED,
            {{"printerName", printer_name}, {"error", error}});
}

void UiBridge::forward_backend_initialized(const ContextId& id) {
    const PrinterContext* ctx = registry_.get_context(id);
    if (!ctx) {
        return;
    }
    publish(bridge_channel::BACKEND_INITIALIZED,
            {{"contextId", id},
             {"printerName", ctx->details.name},
             {"modelType", printer_model_display_name(ctx->backend->model())}});
}

void UiBridge::publish(const std::string& channel, const json& payload) {
    // Copy: a sink may add or remove sinks
    auto sinks = sinks_;
    for (const auto& sink : sinks) {
        sink->publish(channel, payload);
    }
}

void UiBridge::handle_polling_data(const ContextId& id, const PrinterStatus& status) {
    std::optional<ContextId> active = registry_.active_context_id();
    if (!active || *active != id) {
        return;
    }
    ++forwarded_polling_;
    publish(bridge_channel::POLLING_UPDATE,
            {{"contextId", id}, {"status", printer_status_to_json(status)}});
}

void UiBridge::handle_backend_event(const ContextId& id, const BackendEvent& event) {
    const PrinterContext* ctx = registry_.get_context(id);
    std::string name = ctx ? ctx->details.name : id;

    switch (event.type) {
    case BackendEventType::INITIALIZED:
        forward_backend_initialized(id);
        break;
    case BackendEventType::INITIALIZATION_FAILED:
        forward_initialization_failed(name, event.message);
        break;
    case BackendEventType::PRE_DISCONNECT:
    case BackendEventType::DISPOSED:
        break;
    }
}

} // namespace printdeck

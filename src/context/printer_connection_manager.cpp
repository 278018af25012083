// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_connection_manager.h"

#include "camera_url.h"

#include <spdlog/spdlog.h>

namespace printdeck {

PrinterConnectionManager::PrinterConnectionManager(
    ContextRegistry& registry, PollingService& polling, PortAllocator& ports, UiBridge& bridge,
    Scheduler& scheduler, BackendFactory backend_factory, ListenerFactory listener_factory,
    std::shared_ptr<UpstreamConnector> upstream_connector,
    std::shared_ptr<NotificationSink> notification_sink, ConnectionManagerConfig config)
    : registry_(registry), polling_(polling), ports_(ports), bridge_(bridge),
      scheduler_(scheduler), backend_factory_(std::move(backend_factory)),
      listener_factory_(std::move(listener_factory)),
      upstream_connector_(std::move(upstream_connector)),
      notification_sink_(std::move(notification_sink)), config_(config) {
    connections_.push_back(polling_.on_polling_data.connect_scoped(
        [this](const ContextId& id, const PrinterStatus& status) {
            PrinterContext* ctx = registry_.get_context(id);
            if (ctx && ctx->notifications) {
                ctx->notifications->handle_status(status);
            }
        }));

    connections_.push_back(registry_.on_backend_event.connect_scoped(
        [this](const ContextId& id, const BackendEvent& event) {
            PrinterContext* ctx = registry_.get_context(id);
            if (!ctx) {
                return;
            }
            if (ctx->notifications) {
                ctx->notifications->handle_backend_event(event);
            }
            if (event.type == BackendEventType::PRE_DISCONNECT && ctx->camera_proxy) {
                spdlog::debug("[ConnectionManager] {} disconnecting, dropping camera source", id);
                ctx->camera_proxy->set_upstream_url(std::nullopt);
            }
        }));
}

PrinterConnectionManager::~PrinterConnectionManager() {
    lifetime_.reset();
    connections_.clear();
    for (auto& [attempt, backend] : pending_) {
        backend->set_event_callback(nullptr);
    }
    pending_.clear();
}

// ============================================================================
// Connect / disconnect
// ============================================================================

void PrinterConnectionManager::connect_printer(const PrinterDetails& details,
                                               ConnectedCallback on_connected,
                                               ErrorCallback on_error) {
    spdlog::info("[ConnectionManager] Connecting to {} at {} ({})", details.name,
                 details.ip_address, details.model);

    std::unique_ptr<PrinterBackend> backend = backend_factory_(details);
    if (!backend) {
        PrinterError err = PrinterError::not_supported("connect");
        err.message = "Unsupported printer model: " + details.model;
        bridge_.forward_initialization_failed(details.name, err.message);
        if (on_error) {
            on_error(err);
        }
        return;
    }

    uint64_t attempt = next_attempt_++;
    PrinterBackend* raw = backend.get();
    pending_.emplace(attempt, std::move(backend));

    std::weak_ptr<bool> weak = lifetime_;
    raw->connect(
        [this, weak, attempt, details, on_connected]() {
            if (weak.expired()) {
                return;
            }
            on_backend_ready(attempt, details, on_connected);
        },
        [this, weak, attempt, details, on_error](const PrinterError& err) {
            if (weak.expired()) {
                return;
            }
            on_backend_failed(attempt, details, err, on_error);
        });
}

void PrinterConnectionManager::disconnect_printer(const ContextId& id) {
    if (!registry_.get_context(id)) {
        spdlog::debug("[ConnectionManager] Disconnect of unknown context {}", id);
        return;
    }
    spdlog::info("[ConnectionManager] Disconnecting {}", id);
    registry_.remove_context(id);
}

void PrinterConnectionManager::disconnect_all() {
    for (auto& [attempt, backend] : pending_) {
        backend->set_event_callback(nullptr);
        dispose_later(std::move(backend));
    }
    pending_.clear();
    registry_.remove_all();
}

void PrinterConnectionManager::on_backend_ready(uint64_t attempt, const PrinterDetails& details,
                                                const ConnectedCallback& on_connected) {
    std::unique_ptr<PrinterBackend> backend = take_pending(attempt);
    if (!backend) {
        return;
    }

    for (const auto& info : registry_.get_all()) {
        if (!details.serial_number.empty() && info.serial_number == details.serial_number) {
            spdlog::warn("[ConnectionManager] {} already connected as {}, dropping new connection",
                         details.name, info.id);
            backend->set_event_callback(nullptr);
            dispose_later(std::move(backend));
            if (on_connected) {
                on_connected(info.id);
            }
            return;
        }
    }

    ContextResult result = registry_.create_context(std::move(backend), details);
    if (!result) {
        spdlog::error("[ConnectionManager] Could not create context for {}: {}", details.name,
                      result.message);
        return;
    }

    const ContextId& id = result.context_id;
    PrinterContext* ctx = registry_.get_context(id);
    if (!ctx) {
        return;
    }
    registry_.update_connection_state(id, ContextConnectionState::CONNECTED);
    ctx->notifications = std::make_unique<NotificationCoordinator>(
        id, details.name, notification_sink_, config_.notifications);

    polling_.start_polling_for_context(id);
    setup_camera(id);
    // context-created went out before the camera and connection state were known
    registry_.publish_update(id);

    if (!registry_.active_context_id()) {
        registry_.switch_active(id);
    }
    bridge_.forward_backend_initialized(id);

    spdlog::info("[ConnectionManager] {} ready as {}", details.name, id);
    if (on_connected) {
        on_connected(id);
    }
}

void PrinterConnectionManager::on_backend_failed(uint64_t attempt, const PrinterDetails& details,
                                                 const PrinterError& error,
                                                 const ErrorCallback& on_error) {
    std::unique_ptr<PrinterBackend> backend = take_pending(attempt);
    if (!backend) {
        return;
    }
    dispose_later(std::move(backend));

    spdlog::error("[ConnectionManager] Connection to {} failed: {}", details.name, error.message);
    bridge_.forward_initialization_failed(details.name, error.user_message());
    if (on_error) {
        on_error(error);
    }
}

std::unique_ptr<PrinterBackend> PrinterConnectionManager::take_pending(uint64_t attempt) {
    auto it = pending_.find(attempt);
    if (it == pending_.end()) {
        return nullptr;
    }
    std::unique_ptr<PrinterBackend> backend = std::move(it->second);
    pending_.erase(it);
    return backend;
}

void PrinterConnectionManager::dispose_later(std::unique_ptr<PrinterBackend> backend) {
    if (!backend) {
        return;
    }
    // We may be running inside one of the backend's callbacks
    std::shared_ptr<PrinterBackend> doomed(std::move(backend));
    scheduler_.post([doomed]() {
        if (doomed->is_connected()) {
            doomed->disconnect();
        }
    });
}

// ============================================================================
// Camera
// ============================================================================

bool PrinterConnectionManager::setup_camera(const ContextId& id) {
    PrinterContext* ctx = registry_.get_context(id);
    if (!ctx || !ctx->backend) {
        return false;
    }

    ResolvedCameraConfig camera = resolve_camera_config(ctx->details, ctx->backend->features());
    if (!camera.is_available()) {
        spdlog::info("[ConnectionManager] {} has no camera: {}", id, camera_status_message(camera));
        teardown_camera(*ctx);
        return false;
    }

    if (ctx->camera_proxy) {
        ctx->camera_proxy->set_upstream_url(camera.stream_url);
        return ctx->camera_proxy->is_running();
    }

    std::optional<int> port = ports_.allocate();
    if (!port) {
        spdlog::error("[ConnectionManager] No camera port left for {}", id);
        return false;
    }
    std::optional<int> fallback = ports_.allocate();

    CameraProxyConfig proxy_config;
    proxy_config.port = *port;
    proxy_config.fallback_port = fallback.value_or(0);
    proxy_config.auto_start = true;
    proxy_config.reconnection = config_.camera_reconnect;

    auto proxy = std::make_unique<CameraProxy>(id, scheduler_, listener_factory_(),
                                               upstream_connector_);
    ProxyError err = proxy->initialize(proxy_config);
    if (!err) {
        spdlog::error("[ConnectionManager] Camera proxy for {} unavailable: {}", id, err.message);
        proxy->shutdown();
        ports_.release(*port);
        if (fallback) {
            ports_.release(*fallback);
        }
        return false;
    }

    // Keep only the port the proxy actually bound
    int bound = proxy->port();
    if (bound != *port) {
        ports_.release(*port);
    }
    if (fallback && bound != *fallback) {
        ports_.release(*fallback);
    }
    ctx->camera_ports = {bound};

    proxy->set_upstream_url(camera.stream_url);
    spdlog::info("[ConnectionManager] {} camera: {} via http://localhost:{}/camera", id,
                 camera_status_message(camera), bound);
    ctx->camera_proxy = std::move(proxy);
    return true;
}

void PrinterConnectionManager::teardown_camera(PrinterContext& ctx) {
    if (ctx.camera_proxy) {
        ctx.camera_proxy->shutdown();
        ctx.camera_proxy.reset();
    }
    for (int port : ctx.camera_ports) {
        ports_.release(port);
    }
    ctx.camera_ports.clear();
}

void PrinterConnectionManager::update_notification_settings(const NotificationSettings& settings) {
    config_.notifications = settings;
    for (const auto& info : registry_.get_all()) {
        PrinterContext* ctx = registry_.get_context(info.id);
        if (ctx && ctx->notifications) {
            ctx->notifications->update_settings(settings);
        }
    }
}

} // namespace printdeck

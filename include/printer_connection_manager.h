// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file printer_connection_manager.h
 * @brief Turns a connect request into a context with running services
 *
 * Flow of connect_printer():
 *   backend factory -> backend->connect()
 *     ok:    registry context -> notification coordinator -> polling
 *            -> camera proxy -> activate if nothing is active
 *     error: backend-initialization-failed on the bridge, caller's on_error,
 *            no context
 *
 * Polling snapshots are routed to the owning context's notification
 * coordinator. The UI side is handled by UiBridge.
 */

#include "camera_proxy.h"
#include "context_registry.h"
#include "notification_coordinator.h"
#include "polling_service.h"
#include "port_allocator.h"
#include "scheduler.h"
#include "ui_bridge.h"

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace printdeck {

struct ConnectionManagerConfig {
    CameraReconnectConfig camera_reconnect;
    NotificationSettings notifications;
};

class PrinterConnectionManager {
  public:
    using BackendFactory = std::function<std::unique_ptr<PrinterBackend>(const PrinterDetails&)>;
    using ListenerFactory = std::function<std::unique_ptr<ViewerListener>()>;
    using ConnectedCallback = std::function<void(const ContextId&)>;
    using ErrorCallback = std::function<void(const PrinterError&)>;

    PrinterConnectionManager(ContextRegistry& registry, PollingService& polling,
                             PortAllocator& ports, UiBridge& bridge, Scheduler& scheduler,
                             BackendFactory backend_factory, ListenerFactory listener_factory,
                             std::shared_ptr<UpstreamConnector> upstream_connector,
                             std::shared_ptr<NotificationSink> notification_sink,
                             ConnectionManagerConfig config = {});
    ~PrinterConnectionManager();

    PrinterConnectionManager(const PrinterConnectionManager&) = delete;
    PrinterConnectionManager& operator=(const PrinterConnectionManager&) = delete;

    /**
     * @brief Connect a printer and set up its context
     *
     * If the printer is already managed the new connection is dropped and
     * @p on_connected receives the existing context id.
     */
    void connect_printer(const PrinterDetails& details, ConnectedCallback on_connected,
                         ErrorCallback on_error);

    /**
     * @brief Disconnect and remove a context (no-op for unknown ids)
     */
    void disconnect_printer(const ContextId& id);

    /// Remove every context and abandon pending connection attempts
    void disconnect_all();

    /**
     * @brief (Re)resolve the camera source of a context
     *
     * Creates the proxy on first use, retargets an existing proxy, or tears
     * it down when the printer has no usable camera.
     * @return true if the context has a running camera proxy afterwards
     */
    bool setup_camera(const ContextId& id);

    void update_notification_settings(const NotificationSettings& settings);

    [[nodiscard]] size_t pending_connection_count() const {
        return pending_.size();
    }

  private:
    void on_backend_ready(uint64_t attempt, const PrinterDetails& details,
                          const ConnectedCallback& on_connected);
    void on_backend_failed(uint64_t attempt, const PrinterDetails& details,
                           const PrinterError& error, const ErrorCallback& on_error);
    std::unique_ptr<PrinterBackend> take_pending(uint64_t attempt);
    void dispose_later(std::unique_ptr<PrinterBackend> backend);
    void teardown_camera(PrinterContext& ctx);

    ContextRegistry& registry_;
    PollingService& polling_;
    PortAllocator& ports_;
    UiBridge& bridge_;
    Scheduler& scheduler_;

    BackendFactory backend_factory_;
    ListenerFactory listener_factory_;
    std::shared_ptr<UpstreamConnector> upstream_connector_;
    std::shared_ptr<NotificationSink> notification_sink_;
    ConnectionManagerConfig config_;

    std::map<uint64_t, std::unique_ptr<PrinterBackend>> pending_; ///< Connecting backends
    uint64_t next_attempt_ = 1;

    std::vector<SignalConnection> connections_;
    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file ui_bridge.h
 * @brief Forwards registry and polling events to the UI surfaces
 *
 * Only serialisable projections cross this boundary; backends and camera
 * proxies never do. Polling updates are forwarded for the active context
 * only, checked against the registry on every message.
 */

#include "context_registry.h"
#include "event_signal.h"
#include "polling_service.h"

#include "hv/json.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace printdeck {

using json = nlohmann::json;

namespace bridge_channel {
constexpr const char* CONTEXT_CREATED = "printer-context-created";
constexpr const char* CONTEXT_SWITCHED = "printer-context-switched";
constexpr const char* CONTEXT_UPDATED = "printer-context-updated";
constexpr const char* CONTEXT_REMOVED = "printer-context-removed";
constexpr const char* POLLING_UPDATE = "polling-update";
constexpr const char* BACKEND_INITIALIZED = "backend-initialized";
constexpr const char* BACKEND_INIT_FAILED = "backend-initialization-failed";
} // namespace bridge_channel

/**
 * @brief A UI surface (window shell, web UI) receiving bridge messages
 */
class BridgeSink {
  public:
    virtual ~BridgeSink() = default;
    virtual void publish(const std::string& channel, const json& payload) = 0;
};

/**
 * @brief Writes every bridge message to the debug log
 */
class LoggingBridgeSink : public BridgeSink {
  public:
    void publish(const std::string& channel, const json& payload) override;
};

/**
 * @brief Latest state as seen by the web UI
 *
 * Keeps the context list (from lifecycle messages) and the most recent
 * forwarded polling update.
 */
class WebUiCache : public BridgeSink {
  public:
    void publish(const std::string& channel, const json& payload) override;

    [[nodiscard]] const std::optional<json>& latest_polling_update() const {
        return latest_polling_;
    }

    [[nodiscard]] const json& contexts() const {
        return contexts_;
    }

    [[nodiscard]] const std::optional<std::string>& active_context_id() const {
        return active_id_;
    }

    [[nodiscard]] const std::optional<json>& last_failure() const {
        return last_failure_;
    }

  private:
    json contexts_ = json::object(); ///< Keyed by context id
    std::optional<json> latest_polling_;
    std::optional<std::string> active_id_;
    std::optional<json> last_failure_;
};

class UiBridge {
  public:
    UiBridge(ContextRegistry& registry, PollingService& polling);
    ~UiBridge();

    UiBridge(const UiBridge&) = delete;
    UiBridge& operator=(const UiBridge&) = delete;

    void add_sink(std::shared_ptr<BridgeSink> sink);
    void remove_sink(const std::shared_ptr<BridgeSink>& sink);

    /**
     * @brief Report a backend that failed to initialise
     *
     * Used for connection attempts that never produced a context.
     */
    void forward_initialization_failed(const std::string& printer_name, const std::string& error);

    /**
     * @brief Report a backend that became ready and now owns context @p id
     */
    void forward_backend_initialized(const ContextId& id);

    [[nodiscard]] uint64_t forwarded_polling_count() const {
        return forwarded_polling_;
    }

  private:
    void publish(const std::string& channel, const json& payload);
    void handle_polling_data(const ContextId& id, const PrinterStatus& status);
    void handle_backend_event(const ContextId& id, const BackendEvent& event);

    ContextRegistry& registry_;
    PollingService& polling_;
    std::vector<std::shared_ptr<BridgeSink>> sinks_;
    std::vector<SignalConnection> connections_;
    uint64_t forwarded_polling_ = 0;
};

} // namespace printdeck

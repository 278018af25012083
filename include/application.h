// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "cli_args.h"
#include "printer_details.h"

#include "hv/EventLoop.h"

#include <memory>
#include <vector>

namespace printdeck {

class Config;
class ContextRegistry;
class EventLoopScheduler;
class PollingService;
class PortAllocator;
class PrinterConnectionManager;
class UiBridge;
class WebUiCache;

/**
 * @brief Daemon orchestrator
 *
 * Application brings the subsystems up in order:
 * 1. Parse CLI args
 * 2. Load config
 * 3. Initialize logging
 * 4. Create the event loop, context registry, polling service, UI bridge and
 *    connection manager
 * 5. Connect every configured printer (or the simulated ones in test mode)
 * 6. Run the loop until SIGINT/SIGTERM
 * 7. Shutdown in reverse order
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    Application();
    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the daemon
     * @return Exit code (0 = success)
     */
    int run(int argc, char** argv);

    /**
     * @brief Printers simulated in test mode
     */
    static std::vector<PrinterDetails> mock_printer_list(int count);

  private:
    // Initialization phases
    bool init_config();
    bool init_logging();
    bool init_services();
    void connect_printers();

    // Main loop
    int main_loop();
    void check_quit_request();

    // Shutdown
    void shutdown();

    CliArgs m_args;
    Config* m_config = nullptr; // Singleton, not owned

    // Owned services (in initialization order)
    hv::EventLoopPtr m_loop;
    std::unique_ptr<EventLoopScheduler> m_scheduler;
    std::unique_ptr<PortAllocator> m_ports;
    std::unique_ptr<ContextRegistry> m_registry;
    std::unique_ptr<PollingService> m_polling;
    std::unique_ptr<UiBridge> m_bridge;
    std::shared_ptr<WebUiCache> m_webui_cache;
    std::unique_ptr<PrinterConnectionManager> m_connections;

    bool m_running = false;
    bool m_shutdown_complete = false;
};

} // namespace printdeck

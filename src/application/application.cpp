// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "camera_http_server.h"
#include "camera_upstream.h"
#include "config.h"
#include "context_registry.h"
#include "event_loop_scheduler.h"
#include "logging_init.h"
#include "notification_sink.h"
#include "polling_service.h"
#include "port_allocator.h"
#include "printdeck_version.h"
#include "printer_backend.h"
#include "printer_connection_manager.h"
#include "ui_bridge.h"

#include "hv/hlog.h"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <stdexcept>

namespace printdeck {

namespace {

volatile sig_atomic_t g_quit = 0;

constexpr uint32_t QUIT_CHECK_INTERVAL_MS = 250;

void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
    // A viewer hanging up mid-write must not kill the daemon
    signal(SIGPIPE, SIG_IGN);
}

} // namespace

Application::Application() = default;

Application::~Application() {
    shutdown();
}

std::vector<PrinterDetails> Application::mock_printer_list(int count) {
    std::vector<PrinterDetails> printers;
    for (int i = 1; i <= count; i++) {
        PrinterDetails details;
        details.name = "Mock Printer " + std::to_string(i);
        details.ip_address = "127.0.0.1";
        details.serial_number = "MOCK-" + std::to_string(1000 + i);
        details.model = "mock";
        printers.push_back(details);
    }
    return printers;
}

int Application::run(int argc, char** argv) {
    // Initialize minimal logging first so early log calls don't crash
    logging::init_early();

    // libhv's DEFAULT_LOG_LEVEL is INFO, which is too chatty before config is read
    hlog_set_level(LOG_LEVEL_WARN);

    // Phase 1: Parse command line args
    if (!parse_cli_args(argc, argv, m_args)) {
        return (m_args.show_help || m_args.show_version) ? 0 : 1;
    }

    // Phase 2: Initialize config system
    if (!init_config()) {
        return 1;
    }

    // Phase 3: Initialize logging
    if (!init_logging()) {
        return 1;
    }

    spdlog::info("[Application] Starting PrintDeck {}", printdeck_version());
    if (m_args.test_mode) {
        print_test_mode_banner(m_args);
    }

    // Phase 4: Create services
    if (!init_services()) {
        shutdown();
        return 1;
    }

    // Phase 5: Connect printers
    connect_printers();

    // Phase 6: Main loop
    int result = main_loop();

    // Phase 7: Shutdown
    shutdown();
    return result;
}

bool Application::init_config() {
    m_config = Config::get_instance();

    std::string config_path =
        m_args.config_path.empty() ? Config::default_path() : m_args.config_path;
    spdlog::info("[Application] Using config: {}", config_path);
    m_config->init(config_path);
    return true;
}

bool Application::init_logging() {
    logging::LogSettings settings;
    settings.verbosity = m_args.verbosity;
    settings.test_mode = m_args.test_mode;
    settings.cli_dest = m_args.log_dest;
    settings.cli_file = m_args.log_file;
    settings.config_level = m_config->get<std::string>("/log_level", "");
    settings.config_dest = m_config->get<std::string>("/log_dest", "auto");
    settings.config_file = m_config->get<std::string>("/log_file", "");
    settings.config_path = m_args.config_path.empty() ? Config::default_path() : m_args.config_path;
    if (const char* journal = std::getenv("JOURNAL_STREAM")) {
        settings.journal_stream = journal;
    }

    logging::init(logging::resolve_log_config(settings));
    return true;
}

bool Application::init_services() {
    m_loop = std::make_shared<hv::EventLoop>();
    m_scheduler = std::make_unique<EventLoopScheduler>(m_loop);

    try {
        m_ports = std::make_unique<PortAllocator>(m_config->camera_port_range_start(),
                                                  m_config->camera_port_range_end());
    } catch (const std::invalid_argument& e) {
        spdlog::error("[Application] Invalid camera port range: {}", e.what());
        return false;
    }

    uint32_t interval =
        m_args.poll_interval_ms > 0 ? m_args.poll_interval_ms : m_config->polling_interval_ms();

    m_registry = std::make_unique<ContextRegistry>(*m_scheduler, *m_ports);
    m_polling = std::make_unique<PollingService>(*m_registry, *m_scheduler, interval);

    m_bridge = std::make_unique<UiBridge>(*m_registry, *m_polling);
    m_bridge->add_sink(std::make_shared<LoggingBridgeSink>());
    m_webui_cache = std::make_shared<WebUiCache>();
    m_bridge->add_sink(m_webui_cache);

    std::shared_ptr<NotificationSink> sink;
    if (m_config->desktop_notifications_enabled() && !m_args.test_mode) {
        sink = std::make_shared<DesktopNotificationSink>();
    } else {
        sink = std::make_shared<LogNotificationSink>();
    }

    ConnectionManagerConfig manager_config;
    manager_config.camera_reconnect = m_config->camera_reconnect();
    manager_config.notifications = m_config->notification_settings();

    hv::EventLoopPtr loop = m_loop;
    m_connections = std::make_unique<PrinterConnectionManager>(
        *m_registry, *m_polling, *m_ports, *m_bridge, *m_scheduler,
        [loop](const PrinterDetails& details) { return PrinterBackend::create(details, loop); },
        [loop]() { return std::make_unique<CameraHttpServer>(loop); },
        std::make_shared<HvUpstreamConnector>(loop), sink, manager_config);

    spdlog::debug("[Application] Services ready: poll every {}ms, camera ports {}-{}", interval,
                  m_ports->start_port(), m_ports->end_port());
    return true;
}

void Application::connect_printers() {
    std::vector<PrinterDetails> printers =
        m_args.test_mode ? mock_printer_list(m_args.mock_printers) : m_config->printers();

    if (printers.empty()) {
        spdlog::warn("[Application] No printers configured; add them under /printers in {}",
                     m_config->get_path());
        return;
    }

    for (const auto& details : printers) {
        std::string name = details.name;
        m_connections->connect_printer(
            details,
            [name](const ContextId& id) {
                spdlog::info("[Application] {} connected as {}", name, id);
            },
            [name](const PrinterError& err) {
                spdlog::error("[Application] {} failed to connect: {}", name, err.message);
            });
    }
}

int Application::main_loop() {
    setup_signal_handlers();
    m_scheduler->set_interval(QUIT_CHECK_INTERVAL_MS, [this]() { check_quit_request(); });

    m_running = true;
    spdlog::info("[Application] Running ({} printer context(s))", m_registry->context_count());
    m_loop->run();
    m_running = false;

    spdlog::info("[Application] Event loop stopped");
    return 0;
}

void Application::check_quit_request() {
    if (!g_quit || !m_running) {
        return;
    }
    m_running = false;
    spdlog::info("[Application] Shutdown requested");

    m_connections->disconnect_all();
    // Backends disposed by disconnect_all() finish on the next turn, then the loop stops
    hv::EventLoopPtr loop = m_loop;
    m_scheduler->post([loop]() { loop->stop(); });
}

void Application::shutdown() {
    if (m_shutdown_complete) {
        return;
    }
    m_shutdown_complete = true;

    // Reverse order of creation
    if (m_connections) {
        m_connections->disconnect_all();
    }
    m_connections.reset();
    m_bridge.reset();
    m_webui_cache.reset();
    m_polling.reset();
    m_registry.reset();
    m_ports.reset();
    if (m_scheduler) {
        m_scheduler->cancel_all();
    }
    m_scheduler.reset();
    m_loop.reset();

    spdlog::info("[Application] Shutdown complete");
    spdlog::default_logger()->flush();
}

} // namespace printdeck

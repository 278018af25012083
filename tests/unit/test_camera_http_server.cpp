// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_camera_http_server.cpp
 * @brief CameraHttpServer against real sockets on a libhv loop thread
 */

#include "camera_http_server.h"

#include "hv/EventLoopThread.h"

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <functional>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace printdeck;
using namespace std::chrono;

namespace {

class HttpServerFixture {
  public:
    HttpServerFixture() {
        loop_thread_ = std::make_shared<hv::EventLoopThread>();
        loop_thread_->start();
        run_sync([this]() { server_ = std::make_unique<CameraHttpServer>(loop_thread_->loop()); });
    }

    ~HttpServerFixture() {
        for (int fd : clients_) {
            ::close(fd);
        }
        run_sync([this]() { server_.reset(); });
        loop_thread_->stop();
        loop_thread_->join();
    }

    void run_sync(std::function<void()> fn) {
        std::atomic<bool> done{false};
        loop_thread_->loop()->runInLoop([&]() {
            fn();
            done = true;
        });
        auto deadline = steady_clock::now() + seconds(2);
        while (!done && steady_clock::now() < deadline) {
            std::this_thread::sleep_for(milliseconds(5));
        }
    }

    // Ports in this range may be taken on a busy machine
    bool listen_somewhere() {
        for (int candidate = 18181; candidate < 18241; ++candidate) {
            bool ok = false;
            run_sync([&]() { ok = server_->listen(candidate, handlers_); });
            if (ok) {
                port_ = candidate;
                return true;
            }
        }
        return false;
    }

    int connect_client() {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        clients_.push_back(fd);

        timeval tv{};
        tv.tv_sec = 2;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port_));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        return fd;
    }

    size_t connection_count() {
        size_t count = 0;
        run_sync([&]() { count = server_->connection_count(); });
        return count;
    }

    bool wait_for_connections(size_t expected) {
        auto deadline = steady_clock::now() + seconds(2);
        while (steady_clock::now() < deadline) {
            if (connection_count() == expected) {
                return true;
            }
            std::this_thread::sleep_for(milliseconds(10));
        }
        return false;
    }

    // Reads until EOF; false if the socket stayed open until the timeout
    static bool reads_to_eof(int fd, std::string* received = nullptr) {
        char buf[1024];
        while (true) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n > 0) {
                if (received) {
                    received->append(buf, static_cast<size_t>(n));
                }
                continue;
            }
            if (n == 0) {
                return true;
            }
            return errno == ECONNRESET;
        }
    }

    std::shared_ptr<hv::EventLoopThread> loop_thread_;
    std::unique_ptr<CameraHttpServer> server_;
    ViewerHandlers handlers_;
    std::vector<int> clients_;
    int port_ = 0;
};

} // namespace

TEST_CASE_METHOD(HttpServerFixture, "CameraHttpServer: close drops sockets without a request",
                 "[camera][http_server][slow]") {
    REQUIRE(listen_somewhere());

    int idle = connect_client();
    REQUIRE(wait_for_connections(1));

    run_sync([this]() { server_->close(); });

    REQUIRE(connection_count() == 0);
    REQUIRE(reads_to_eof(idle));
}

TEST_CASE_METHOD(HttpServerFixture, "CameraHttpServer: close drops viewers and idle sockets alike",
                 "[camera][http_server][slow]") {
    // Held the way a proxy holds an attached viewer
    std::vector<std::shared_ptr<ViewerConnection>> viewers;
    handlers_.on_camera_request = [&](std::shared_ptr<ViewerConnection> connection) {
        connection->send_head(200, {{"Content-Type", "multipart/x-mixed-replace; boundary=frame"}});
        viewers.push_back(std::move(connection));
        return std::string("client-1");
    };
    REQUIRE(listen_somewhere());

    int viewer = connect_client();
    const std::string request = "GET /camera HTTP/1.1\r\nHost: localhost\r\n\r\n";
    REQUIRE(::send(viewer, request.data(), request.size(), 0) ==
            static_cast<ssize_t>(request.size()));
    int idle = connect_client();
    REQUIRE(wait_for_connections(2));

    std::atomic<bool> attached{false};
    auto deadline = steady_clock::now() + seconds(2);
    while (!attached && steady_clock::now() < deadline) {
        run_sync([&]() { attached = !viewers.empty(); });
        std::this_thread::sleep_for(milliseconds(10));
    }
    REQUIRE(attached);

    run_sync([this]() { server_->close(); });

    std::string received;
    REQUIRE(reads_to_eof(viewer, &received));
    REQUIRE(received.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(reads_to_eof(idle));
    REQUIRE(connection_count() == 0);

    run_sync([&]() { viewers.clear(); });
}

TEST_CASE_METHOD(HttpServerFixture, "CameraHttpServer: health answers and closes",
                 "[camera][http_server][slow]") {
    handlers_.health_json = []() { return std::string("{\"isRunning\":true}"); };
    REQUIRE(listen_somewhere());

    int fd = connect_client();
    const std::string request = "GET /health HTTP/1.1\r\n\r\n";
    REQUIRE(::send(fd, request.data(), request.size(), 0) == static_cast<ssize_t>(request.size()));

    std::string received;
    REQUIRE(reads_to_eof(fd, &received));
    REQUIRE(received.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(received.find("{\"isRunning\":true}") != std::string::npos);
}

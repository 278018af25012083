// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "port_allocator.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace printdeck {

PortAllocator::PortAllocator(int start_port, int end_port)
    : start_port_(start_port), end_port_(end_port), next_port_(start_port) {
    if (start_port < 1 || end_port > 65535) {
        throw std::invalid_argument("Port range must be within 1-65535");
    }
    if (start_port > end_port) {
        throw std::invalid_argument("Invalid port range: " + std::to_string(start_port) + "-" +
                                    std::to_string(end_port));
    }
}

std::optional<int> PortAllocator::allocate() {
    const int range_size = end_port_ - start_port_ + 1;

    for (int i = 0; i < range_size; ++i) {
        int port = next_port_;
        next_port_ = (next_port_ >= end_port_) ? start_port_ : next_port_ + 1;

        if (allocated_.insert(port).second) {
            spdlog::debug("[PortAllocator] Allocated port {} ({}/{} in use)", port,
                          allocated_.size(), range_size);
            return port;
        }
    }

    spdlog::error("[PortAllocator] No available ports in range {}-{}", start_port_, end_port_);
    return std::nullopt;
}

void PortAllocator::release(int port) {
    if (allocated_.erase(port) > 0) {
        spdlog::debug("[PortAllocator] Released port {}", port);
    }
}

void PortAllocator::reset() {
    allocated_.clear();
    next_port_ = start_port_;
}

} // namespace printdeck

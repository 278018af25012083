// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <set>

namespace printdeck {

/**
 * @brief Pool of local ports for camera proxies
 *
 * Hands out ports from an inclusive range, scanning forward from the last
 * allocation and wrapping around, so a just-released port is not reused
 * straight away. A port stays reserved until release(); two holders never
 * get the same port.
 */
class PortAllocator {
  public:
    static constexpr int DEFAULT_START_PORT = 8181;
    static constexpr int DEFAULT_END_PORT = 8191;

    /**
     * @throws std::invalid_argument if the range is empty or outside 1-65535
     */
    PortAllocator(int start_port = DEFAULT_START_PORT, int end_port = DEFAULT_END_PORT);

    /**
     * @brief Reserve the next free port
     * @return Port, or std::nullopt if the range is exhausted
     */
    std::optional<int> allocate();

    /**
     * @brief Return a port to the pool (no-op for ports not allocated)
     */
    void release(int port);

    bool is_allocated(int port) const {
        return allocated_.count(port) > 0;
    }

    size_t allocated_count() const {
        return allocated_.size();
    }

    size_t available_count() const {
        return static_cast<size_t>(end_port_ - start_port_ + 1) - allocated_.size();
    }

    int start_port() const {
        return start_port_;
    }

    int end_port() const {
        return end_port_;
    }

    /// Release every port
    void reset();

  private:
    int start_port_;
    int end_port_;
    int next_port_;
    std::set<int> allocated_;
};

} // namespace printdeck

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file event_signal.h
 * @brief Typed event channels with RAII connections
 *
 * Each event kind gets its own Signal<Payload...>, so producers and consumers
 * agree on the payload shape at compile time. Slots are stored by
 * SubscriptionId and invoked in subscription order.
 *
 * @code
 *   Signal<ContextId, PrinterStatus> on_data;
 *   SignalConnection conn = on_data.connect([](const ContextId& id, const PrinterStatus& s) {
 *       ...
 *   });
 *   on_data.emit(id, status);
 * @endcode
 */

#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace printdeck {

using SubscriptionId = uint64_t;

/// Never returned by Signal::connect()
constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

class SignalConnection;

/**
 * @brief Single-threaded typed signal
 *
 * emit() iterates a snapshot of the slot ids, so a slot may connect or
 * disconnect other slots (or itself) while being invoked. A slot disconnected
 * during an emit is not called afterwards. The slot table lives in a shared
 * block so that destroying the owner of the signal from inside a slot does
 * not invalidate the running emit.
 */
template <typename... Args> class Signal {
  public:
    using Slot = std::function<void(const Args&...)>;

    Signal() : state_(std::make_shared<State>()) {}
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /**
     * @brief Register a slot
     * @return Subscription id (never INVALID_SUBSCRIPTION_ID)
     */
    SubscriptionId connect(Slot slot) {
        SubscriptionId id = state_->next_id++;
        state_->slots.emplace(id, std::move(slot));
        return id;
    }

    /**
     * @brief Register a slot owned by the returned guard
     */
    SignalConnection connect_scoped(Slot slot);

    /**
     * @brief Remove a slot
     * @return true if the slot was registered
     */
    bool disconnect(SubscriptionId id) {
        return state_->slots.erase(id) > 0;
    }

    void emit(const Args&... args) const {
        std::shared_ptr<State> state = state_;
        std::vector<SubscriptionId> ids;
        ids.reserve(state->slots.size());
        for (const auto& [id, slot] : state->slots) {
            ids.push_back(id);
        }

        for (SubscriptionId id : ids) {
            auto it = state->slots.find(id);
            if (it == state->slots.end()) {
                continue;
            }
            // Copy so the slot survives its own disconnection
            Slot slot = it->second;
            slot(args...);
        }
    }

    size_t slot_count() const {
        return state_->slots.size();
    }

    void disconnect_all() {
        state_->slots.clear();
    }

  private:
    friend class SignalConnection;

    struct State {
        std::map<SubscriptionId, Slot> slots;
        SubscriptionId next_id = 1;
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief RAII wrapper for a signal slot - disconnects on destruction
 *
 * Holds only a weak reference to the signal's slot table, so a connection
 * that outlives its signal is harmless: reset() notices the expired table
 * and just forgets the id.
 */
class SignalConnection {
  public:
    SignalConnection() = default;

    template <typename... Args>
    SignalConnection(Signal<Args...>& signal, SubscriptionId id) : id_(id) {
        std::weak_ptr<typename Signal<Args...>::State> weak = signal.state_;
        disconnect_fn_ = [weak](SubscriptionId sid) {
            if (auto state = weak.lock()) {
                state->slots.erase(sid);
                return true;
            }
            return false;
        };
    }

    ~SignalConnection() {
        reset();
    }

    SignalConnection(SignalConnection&& other) noexcept
        : id_(std::exchange(other.id_, INVALID_SUBSCRIPTION_ID)),
          disconnect_fn_(std::exchange(other.disconnect_fn_, {})) {}

    SignalConnection& operator=(SignalConnection&& other) noexcept {
        if (this != &other) {
            reset();
            id_ = std::exchange(other.id_, INVALID_SUBSCRIPTION_ID);
            disconnect_fn_ = std::exchange(other.disconnect_fn_, {});
        }
        return *this;
    }

    SignalConnection(const SignalConnection&) = delete;
    SignalConnection& operator=(const SignalConnection&) = delete;

    /**
     * @brief Disconnect the slot now
     */
    void reset() {
        if (disconnect_fn_ && id_ != INVALID_SUBSCRIPTION_ID) {
            if (!disconnect_fn_(id_)) {
                spdlog::trace("[SignalConnection] Signal gone before disconnect (id={})", id_);
            }
        }
        id_ = INVALID_SUBSCRIPTION_ID;
        disconnect_fn_ = {};
    }

    /**
     * @brief Forget the slot without disconnecting it
     */
    void release() {
        id_ = INVALID_SUBSCRIPTION_ID;
        disconnect_fn_ = {};
    }

    explicit operator bool() const {
        return disconnect_fn_ && id_ != INVALID_SUBSCRIPTION_ID;
    }

    SubscriptionId get() const {
        return id_;
    }

  private:
    SubscriptionId id_ = INVALID_SUBSCRIPTION_ID;
    std::function<bool(SubscriptionId)> disconnect_fn_;
};

template <typename... Args> SignalConnection Signal<Args...>::connect_scoped(Slot slot) {
    return SignalConnection(*this, connect(std::move(slot)));
}

} // namespace printdeck

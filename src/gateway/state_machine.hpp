/*
 * Copyright 2025 Prism Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Prism Gateway State Machine - Header
// Session lifecycle driven by a fixed transition table

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../protocol/protocol.hpp"

namespace prism::gateway {

using protocol::Clock;
using protocol::ProtocolKind;

/// Session lifecycle states
enum class GatewayState : uint8_t { Idle, Connecting, Connected, Switching, Disconnecting, Error };

/// Events accepted by the state machine
enum class StateEvent : uint8_t {
    Connect,
    Connected,
    Error,
    Switch,
    Switched,
    Disconnect,
    Disconnected,
    Retry
};

inline constexpr size_t kStateCount = 6;
inline constexpr size_t kEventCount = 8;

inline constexpr std::array<GatewayState, kStateCount> kAllStates = {
    GatewayState::Idle,      GatewayState::Connecting,    GatewayState::Connected,
    GatewayState::Switching, GatewayState::Disconnecting, GatewayState::Error};

inline constexpr std::array<StateEvent, kEventCount> kAllEvents = {
    StateEvent::Connect,    StateEvent::Connected,    StateEvent::Error, StateEvent::Switch,
    StateEvent::Switched,   StateEvent::Disconnect,   StateEvent::Disconnected,
    StateEvent::Retry};

[[nodiscard]] constexpr std::string_view to_string(GatewayState state) noexcept {
    switch (state) {
        case GatewayState::Idle:
            return "idle";
        case GatewayState::Connecting:
            return "connecting";
        case GatewayState::Connected:
            return "connected";
        case GatewayState::Switching:
            return "switching";
        case GatewayState::Disconnecting:
            return "disconnecting";
        case GatewayState::Error:
            return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(StateEvent event) noexcept {
    switch (event) {
        case StateEvent::Connect:
            return "connect";
        case StateEvent::Connected:
            return "connected";
        case StateEvent::Error:
            return "error";
        case StateEvent::Switch:
            return "switch";
        case StateEvent::Switched:
            return "switched";
        case StateEvent::Disconnect:
            return "disconnect";
        case StateEvent::Disconnected:
            return "disconnected";
        case StateEvent::Retry:
            return "retry";
    }
    return "unknown";
}

/// One row of the transition table
struct Transition {
    GatewayState from;
    StateEvent event;
    GatewayState to;
};

/// The complete transition table. Nothing outside it is legal.
inline constexpr std::array<Transition, 9> kTransitionTable = {{
    {GatewayState::Idle, StateEvent::Connect, GatewayState::Connecting},
    {GatewayState::Connecting, StateEvent::Connected, GatewayState::Connected},
    {GatewayState::Connecting, StateEvent::Error, GatewayState::Error},
    {GatewayState::Connected, StateEvent::Switch, GatewayState::Switching},
    {GatewayState::Switching, StateEvent::Switched, GatewayState::Connected},
    {GatewayState::Switching, StateEvent::Error, GatewayState::Error},
    {GatewayState::Connected, StateEvent::Disconnect, GatewayState::Disconnecting},
    {GatewayState::Disconnecting, StateEvent::Disconnected, GatewayState::Idle},
    {GatewayState::Error, StateEvent::Retry, GatewayState::Idle},
}};

/// Target state for (from, event), or nullopt when the pair is not in the table
[[nodiscard]] constexpr std::optional<GatewayState> lookup_transition(GatewayState from,
                                                                      StateEvent event) noexcept {
    for (const auto& row : kTransitionTable) {
        if (row.from == from && row.event == event) {
            return row.to;
        }
    }
    return std::nullopt;
}

/// Data handed to guards and actions
struct TransitionContext {
    std::optional<ProtocolKind> target;  // Switch target
    std::error_code error;               // Error events: the underlying failure
    StateEvent trigger = StateEvent::Error;  // Error events: the event whose action failed
    std::string reason;
    std::optional<Clock::time_point> deadline;  // Bound for blocking actions (drain)
};

/// Last failure seen by the machine
struct FailureRecord {
    StateEvent trigger = StateEvent::Error;
    std::error_code error;
    std::string reason;
    Clock::time_point at{};
};

using TransitionGuard = std::function<bool(const TransitionContext&)>;
using TransitionAction = std::function<std::error_code(const TransitionContext&)>;
using TransitionObserver = std::function<void(GatewayState from, StateEvent event, GatewayState to)>;

/// Table-driven state machine. Not internally synchronized: the owning
/// session serializes dispatch(). state() may be read from any thread.
///
/// dispatch() semantics:
///  - (state, event) not in the table: invalid_transition, state unchanged
///  - guard refuses: guard_rejected, state unchanged
///  - action fails (error code or exception): the machine enters the row's
///    target, then Error is re-dispatched with the trigger and error
///    attached; if (target, Error) is a row its action runs, otherwise the
///    machine moves to Error directly. The action's error is returned.
class StateMachine {
public:
    StateMachine();

    // Non-copyable, non-movable (actions capture the owner)
    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    void set_guard(GatewayState from, StateEvent event, TransitionGuard guard);
    void set_action(GatewayState from, StateEvent event, TransitionAction action);
    void set_observer(TransitionObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] std::error_code dispatch(StateEvent event, const TransitionContext& context = {});

    [[nodiscard]] GatewayState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::optional<FailureRecord>& last_failure() const noexcept {
        return last_failure_;
    }

    [[nodiscard]] uint64_t transition_count() const noexcept { return transitions_; }

    /// Retry backoff: initial delay doubling per consecutive entry into Error
    void set_backoff(std::chrono::milliseconds initial, std::chrono::milliseconds maximum);
    [[nodiscard]] std::chrono::milliseconds current_backoff() const noexcept;
    [[nodiscard]] bool backoff_elapsed(Clock::time_point now) const noexcept;
    [[nodiscard]] uint32_t consecutive_errors() const noexcept { return consecutive_errors_; }

private:
    static constexpr size_t slot(GatewayState from, StateEvent event) noexcept {
        return static_cast<size_t>(from) * kEventCount + static_cast<size_t>(event);
    }

    std::error_code run_action(GatewayState from, StateEvent event,
                               const TransitionContext& context, std::string& reason);
    void enter(GatewayState from, StateEvent event, GatewayState to);
    void fail(GatewayState entered, StateEvent trigger, std::error_code error,
              std::string reason);

    std::atomic<GatewayState> state_{GatewayState::Idle};
    std::array<TransitionGuard, kStateCount * kEventCount> guards_;
    std::array<TransitionAction, kStateCount * kEventCount> actions_;
    TransitionObserver observer_;

    std::optional<FailureRecord> last_failure_;
    uint64_t transitions_ = 0;

    std::chrono::milliseconds initial_backoff_{100};
    std::chrono::milliseconds max_backoff_{30000};
    uint32_t consecutive_errors_ = 0;
    Clock::time_point error_since_{};
};

}  // namespace prism::gateway

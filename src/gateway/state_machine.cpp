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

// Prism Gateway State Machine - Implementation

#include "state_machine.hpp"

#include <algorithm>
#include <exception>

#include "../core/errors.hpp"

namespace prism::gateway {

StateMachine::StateMachine() = default;

void StateMachine::set_guard(GatewayState from, StateEvent event, TransitionGuard guard) {
    guards_[slot(from, event)] = std::move(guard);
}

void StateMachine::set_action(GatewayState from, StateEvent event, TransitionAction action) {
    actions_[slot(from, event)] = std::move(action);
}

std::error_code StateMachine::dispatch(StateEvent event, const TransitionContext& context) {
    GatewayState from = state();
    auto to = lookup_transition(from, event);
    if (!to) {
        return core::GatewayErrc::invalid_transition;
    }

    // Error -> Retry is guarded by the backoff
    if (event == StateEvent::Retry && !backoff_elapsed(Clock::now())) {
        return core::GatewayErrc::guard_rejected;
    }
    if (const auto& guard = guards_[slot(from, event)]; guard && !guard(context)) {
        return core::GatewayErrc::guard_rejected;
    }

    std::string reason;
    if (auto ec = run_action(from, event, context, reason); ec) {
        fail(*to, event, ec, std::move(reason));
        return ec;
    }

    if (event == StateEvent::Error) {
        last_failure_ = FailureRecord{context.trigger, context.error, context.reason, Clock::now()};
    }
    enter(from, event, *to);
    return {};
}

std::error_code StateMachine::run_action(GatewayState from, StateEvent event,
                                         const TransitionContext& context, std::string& reason) {
    const auto& action = actions_[slot(from, event)];
    if (!action) {
        return {};
    }

    std::error_code ec;
    try {
        ec = action(context);
    } catch (const std::exception& e) {
        reason = e.what();
        return core::GatewayErrc::internal_error;
    }
    if (ec) {
        reason = ec.message();
    }
    return ec;
}

void StateMachine::enter(GatewayState from, StateEvent event, GatewayState to) {
    state_.store(to, std::memory_order_release);
    transitions_++;

    if (to == GatewayState::Error) {
        consecutive_errors_++;
        error_since_ = Clock::now();
    } else if (to == GatewayState::Connected) {
        consecutive_errors_ = 0;
    }

    if (observer_) {
        observer_(from, event, to);
    }
}

void StateMachine::fail(GatewayState entered, StateEvent trigger, std::error_code error,
                        std::string reason) {
    GatewayState from = state();
    last_failure_ = FailureRecord{trigger, error, reason, Clock::now()};

    // The failed action's row completes, then Error takes over
    if (entered != from) {
        enter(from, trigger, entered);
    }
    if (entered == GatewayState::Error) {
        return;
    }

    TransitionContext error_context;
    error_context.trigger = trigger;
    error_context.error = error;
    error_context.reason = std::move(reason);

    if (lookup_transition(entered, StateEvent::Error)) {
        std::string secondary;
        if (auto ec = run_action(entered, StateEvent::Error, error_context, secondary); ec) {
            // The original failure stays the recorded one
            last_failure_->reason += "; error handling failed: " + secondary;
        }
    }
    enter(entered, StateEvent::Error, GatewayState::Error);
}

void StateMachine::set_backoff(std::chrono::milliseconds initial,
                               std::chrono::milliseconds maximum) {
    initial_backoff_ = initial;
    max_backoff_ = std::max(initial, maximum);
}

std::chrono::milliseconds StateMachine::current_backoff() const noexcept {
    if (consecutive_errors_ == 0 || initial_backoff_.count() == 0) {
        return std::chrono::milliseconds{0};
    }
    auto backoff = initial_backoff_;
    for (uint32_t i = 1; i < consecutive_errors_ && backoff < max_backoff_; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, max_backoff_);
}

bool StateMachine::backoff_elapsed(Clock::time_point now) const noexcept {
    return now - error_since_ >= current_backoff();
}

}  // namespace prism::gateway

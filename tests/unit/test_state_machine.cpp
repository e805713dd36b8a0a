// Prism Gateway State Machine Tests

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/gateway/state_machine.hpp"

using namespace prism;
using namespace prism::gateway;
using namespace std::chrono_literals;

namespace {

/// Drive a fresh machine into `target` through legal events only
void drive_to(StateMachine& machine, GatewayState target) {
    machine.set_backoff(0ms, 0ms);
    switch (target) {
        case GatewayState::Idle:
            return;
        case GatewayState::Connecting:
            REQUIRE_FALSE(machine.dispatch(StateEvent::Connect));
            return;
        case GatewayState::Connected:
            drive_to(machine, GatewayState::Connecting);
            REQUIRE_FALSE(machine.dispatch(StateEvent::Connected));
            return;
        case GatewayState::Switching:
            drive_to(machine, GatewayState::Connected);
            REQUIRE_FALSE(machine.dispatch(StateEvent::Switch));
            return;
        case GatewayState::Disconnecting:
            drive_to(machine, GatewayState::Connected);
            REQUIRE_FALSE(machine.dispatch(StateEvent::Disconnect));
            return;
        case GatewayState::Error:
            drive_to(machine, GatewayState::Connecting);
            REQUIRE_FALSE(machine.dispatch(StateEvent::Error));
            return;
    }
}

}  // namespace

TEST_CASE("Transition table", "[gateway][state_machine]") {
    REQUIRE(lookup_transition(GatewayState::Idle, StateEvent::Connect) == GatewayState::Connecting);
    REQUIRE(lookup_transition(GatewayState::Connecting, StateEvent::Connected) ==
            GatewayState::Connected);
    REQUIRE(lookup_transition(GatewayState::Connecting, StateEvent::Error) == GatewayState::Error);
    REQUIRE(lookup_transition(GatewayState::Connected, StateEvent::Switch) ==
            GatewayState::Switching);
    REQUIRE(lookup_transition(GatewayState::Switching, StateEvent::Switched) ==
            GatewayState::Connected);
    REQUIRE(lookup_transition(GatewayState::Switching, StateEvent::Error) == GatewayState::Error);
    REQUIRE(lookup_transition(GatewayState::Connected, StateEvent::Disconnect) ==
            GatewayState::Disconnecting);
    REQUIRE(lookup_transition(GatewayState::Disconnecting, StateEvent::Disconnected) ==
            GatewayState::Idle);
    REQUIRE(lookup_transition(GatewayState::Error, StateEvent::Retry) == GatewayState::Idle);

    REQUIRE_FALSE(lookup_transition(GatewayState::Idle, StateEvent::Switch));
    REQUIRE_FALSE(lookup_transition(GatewayState::Connected, StateEvent::Error));
}

TEST_CASE("Every state and event pair follows the table", "[gateway][state_machine]") {
    for (auto from : kAllStates) {
        for (auto event : kAllEvents) {
            INFO("from=" << to_string(from) << " event=" << to_string(event));

            StateMachine machine;
            drive_to(machine, from);
            REQUIRE(machine.state() == from);
            uint64_t before = machine.transition_count();

            auto ec = machine.dispatch(event);
            auto expected = lookup_transition(from, event);
            if (expected) {
                REQUIRE_FALSE(ec);
                REQUIRE(machine.state() == *expected);
                REQUIRE(machine.transition_count() == before + 1);
            } else {
                REQUIRE(ec == core::GatewayErrc::invalid_transition);
                REQUIRE(machine.state() == from);
                REQUIRE(machine.transition_count() == before);
            }
        }
    }
}

TEST_CASE("Observer sees every transition", "[gateway][state_machine]") {
    StateMachine machine;
    std::vector<Transition> seen;
    machine.set_observer([&](GatewayState from, StateEvent event, GatewayState to) {
        seen.push_back({from, event, to});
    });

    drive_to(machine, GatewayState::Connected);
    REQUIRE_FALSE(machine.dispatch(StateEvent::Disconnect));
    REQUIRE_FALSE(machine.dispatch(StateEvent::Disconnected));

    REQUIRE(seen.size() == 4);
    REQUIRE(seen[0].from == GatewayState::Idle);
    REQUIRE(seen[0].to == GatewayState::Connecting);
    REQUIRE(seen[3].event == StateEvent::Disconnected);
    REQUIRE(seen[3].to == GatewayState::Idle);
}

TEST_CASE("Guards", "[gateway][state_machine]") {
    StateMachine machine;
    drive_to(machine, GatewayState::Connected);

    machine.set_guard(GatewayState::Connected, StateEvent::Switch,
                      [](const TransitionContext& context) {
                          return context.target.has_value() &&
                                 *context.target != protocol::ProtocolKind::Udp;
                      });

    SECTION("refusal leaves the state unchanged") {
        TransitionContext context;
        context.target = protocol::ProtocolKind::Udp;
        REQUIRE(machine.dispatch(StateEvent::Switch, context) == core::GatewayErrc::guard_rejected);
        REQUIRE(machine.state() == GatewayState::Connected);

        REQUIRE(machine.dispatch(StateEvent::Switch) == core::GatewayErrc::guard_rejected);
        REQUIRE(machine.state() == GatewayState::Connected);
    }

    SECTION("acceptance proceeds") {
        TransitionContext context;
        context.target = protocol::ProtocolKind::Tcp;
        REQUIRE_FALSE(machine.dispatch(StateEvent::Switch, context));
        REQUIRE(machine.state() == GatewayState::Switching);
    }
}

TEST_CASE("Actions receive the context", "[gateway][state_machine]") {
    StateMachine machine;
    drive_to(machine, GatewayState::Connected);

    std::optional<protocol::ProtocolKind> seen;
    machine.set_action(GatewayState::Connected, StateEvent::Switch,
                       [&](const TransitionContext& context) -> std::error_code {
                           seen = context.target;
                           return {};
                       });

    TransitionContext context;
    context.target = protocol::ProtocolKind::WebSocket;
    REQUIRE_FALSE(machine.dispatch(StateEvent::Switch, context));
    REQUIRE(seen == protocol::ProtocolKind::WebSocket);
}

TEST_CASE("Action failure enters the target and then Error", "[gateway][state_machine]") {
    StateMachine machine;
    machine.set_backoff(0ms, 0ms);
    std::vector<GatewayState> path;
    machine.set_observer([&](GatewayState, StateEvent, GatewayState to) { path.push_back(to); });

    std::optional<TransitionContext> error_seen;
    machine.set_action(GatewayState::Idle, StateEvent::Connect,
                       [](const TransitionContext&) -> std::error_code {
                           return core::GatewayErrc::transport_unavailable;
                       });
    machine.set_action(GatewayState::Connecting, StateEvent::Error,
                       [&](const TransitionContext& context) -> std::error_code {
                           error_seen = context;
                           return {};
                       });

    auto ec = machine.dispatch(StateEvent::Connect);
    REQUIRE(ec == core::GatewayErrc::transport_unavailable);
    REQUIRE(machine.state() == GatewayState::Error);
    REQUIRE(path == std::vector<GatewayState>{GatewayState::Connecting, GatewayState::Error});

    REQUIRE(error_seen.has_value());
    REQUIRE(error_seen->trigger == StateEvent::Connect);
    REQUIRE(error_seen->error == core::GatewayErrc::transport_unavailable);

    REQUIRE(machine.last_failure().has_value());
    REQUIRE(machine.last_failure()->trigger == StateEvent::Connect);
    REQUIRE(machine.last_failure()->error == core::GatewayErrc::transport_unavailable);
    REQUIRE(machine.last_failure()->reason == "transport unavailable");
    REQUIRE(machine.consecutive_errors() == 1);
}

TEST_CASE("Throwing actions are failures", "[gateway][state_machine]") {
    StateMachine machine;
    drive_to(machine, GatewayState::Connected);

    machine.set_action(GatewayState::Connected, StateEvent::Switch,
                       [](const TransitionContext&) -> std::error_code {
                           throw std::runtime_error("adapter exploded");
                       });

    auto ec = machine.dispatch(StateEvent::Switch);
    REQUIRE(ec == core::GatewayErrc::internal_error);
    REQUIRE(machine.state() == GatewayState::Error);
    REQUIRE(machine.last_failure()->reason == "adapter exploded");
}

TEST_CASE("Failure without an Error row goes straight to Error", "[gateway][state_machine]") {
    StateMachine machine;
    drive_to(machine, GatewayState::Connected);

    machine.set_action(GatewayState::Connected, StateEvent::Disconnect,
                       [](const TransitionContext&) -> std::error_code {
                           return core::GatewayErrc::send_failed;
                       });

    REQUIRE(machine.dispatch(StateEvent::Disconnect) == core::GatewayErrc::send_failed);
    REQUIRE(machine.state() == GatewayState::Error);
    REQUIRE(machine.last_failure()->trigger == StateEvent::Disconnect);
}

TEST_CASE("Failing error handler keeps the original failure", "[gateway][state_machine]") {
    StateMachine machine;
    drive_to(machine, GatewayState::Connected);

    machine.set_action(GatewayState::Connected, StateEvent::Switch,
                       [](const TransitionContext&) -> std::error_code {
                           return core::GatewayErrc::migration_failed;
                       });
    machine.set_action(GatewayState::Switching, StateEvent::Error,
                       [](const TransitionContext&) -> std::error_code {
                           return core::GatewayErrc::internal_error;
                       });

    REQUIRE(machine.dispatch(StateEvent::Switch) == core::GatewayErrc::migration_failed);
    REQUIRE(machine.state() == GatewayState::Error);
    REQUIRE(machine.last_failure()->error == core::GatewayErrc::migration_failed);
    REQUIRE(machine.last_failure()->reason.find("error handling failed") != std::string::npos);
}

TEST_CASE("Explicit Error dispatch is recorded", "[gateway][state_machine]") {
    StateMachine machine;
    drive_to(machine, GatewayState::Connecting);

    TransitionContext context;
    context.trigger = StateEvent::Connect;
    context.error = core::GatewayErrc::no_healthy_endpoint;
    context.reason = "no endpoint";
    REQUIRE_FALSE(machine.dispatch(StateEvent::Error, context));

    REQUIRE(machine.state() == GatewayState::Error);
    REQUIRE(machine.last_failure()->error == core::GatewayErrc::no_healthy_endpoint);
    REQUIRE(machine.last_failure()->reason == "no endpoint");
}

TEST_CASE("Retry backoff", "[gateway][state_machine][backoff]") {
    StateMachine machine;

    SECTION("no errors, no backoff") {
        machine.set_backoff(100ms, 1000ms);
        REQUIRE(machine.current_backoff() == 0ms);
    }

    SECTION("doubling with a cap") {
        machine.set_backoff(100ms, 350ms);
        std::vector<std::chrono::milliseconds> seen;

        for (int i = 0; i < 4; ++i) {
            REQUIRE_FALSE(machine.dispatch(StateEvent::Connect));
            REQUIRE_FALSE(machine.dispatch(StateEvent::Error));
            seen.push_back(machine.current_backoff());

            // Skip the wait by zeroing the delay, then restore it
            machine.set_backoff(0ms, 0ms);
            REQUIRE_FALSE(machine.dispatch(StateEvent::Retry));
            machine.set_backoff(100ms, 350ms);
        }
        REQUIRE(seen == std::vector<std::chrono::milliseconds>{100ms, 200ms, 350ms, 350ms});
        REQUIRE(machine.consecutive_errors() == 4);
    }

    SECTION("retry is refused until the backoff elapses") {
        machine.set_backoff(60ms, 1000ms);
        REQUIRE_FALSE(machine.dispatch(StateEvent::Connect));
        REQUIRE_FALSE(machine.dispatch(StateEvent::Error));

        REQUIRE(machine.dispatch(StateEvent::Retry) == core::GatewayErrc::guard_rejected);
        REQUIRE(machine.state() == GatewayState::Error);

        std::this_thread::sleep_for(80ms);
        REQUIRE(machine.backoff_elapsed(Clock::now()));
        REQUIRE_FALSE(machine.dispatch(StateEvent::Retry));
        REQUIRE(machine.state() == GatewayState::Idle);
    }

    SECTION("reaching Connected resets the count") {
        machine.set_backoff(0ms, 0ms);
        REQUIRE_FALSE(machine.dispatch(StateEvent::Connect));
        REQUIRE_FALSE(machine.dispatch(StateEvent::Error));
        REQUIRE_FALSE(machine.dispatch(StateEvent::Retry));
        REQUIRE(machine.consecutive_errors() == 1);

        REQUIRE_FALSE(machine.dispatch(StateEvent::Connect));
        REQUIRE_FALSE(machine.dispatch(StateEvent::Connected));
        REQUIRE(machine.consecutive_errors() == 0);
    }
}

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

// Prism Errors - Header
// Gateway error category for std::error_code

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace prism::core {

/// Gateway error conditions
enum class GatewayErrc : uint8_t {
    transport_unavailable = 1,  // Endpoint refused, unreachable or handshake failed
    send_failed,                // Transport rejected the payload or timed out
    receive_timeout,            // No message before the receive deadline
    connection_closed,          // Peer closed the connection
    protocol_error,             // Malformed frame or oversized message
    invalid_transition,         // (state, event) pair not in the transition table
    guard_rejected,             // Transition guard refused the event
    migration_failed,           // Could not move the session to the new protocol
    migration_in_progress,      // A switch is already running for the session
    no_healthy_endpoint,        // Load balancer found nothing to select
    unsupported_protocol,       // No adapter registered for the protocol
    session_not_found,
    session_unavailable,        // Session not accepting traffic (drain, error state)
    handler_failed,             // Business handler returned an error
    listener_failed,            // Could not bind or accept
    shutting_down,
    invalid_argument,
    internal_error              // Unexpected exception caught at a component boundary
};

[[nodiscard]] constexpr std::string_view to_string(GatewayErrc e) noexcept {
    switch (e) {
        case GatewayErrc::transport_unavailable:
            return "transport_unavailable";
        case GatewayErrc::send_failed:
            return "send_failed";
        case GatewayErrc::receive_timeout:
            return "receive_timeout";
        case GatewayErrc::connection_closed:
            return "connection_closed";
        case GatewayErrc::protocol_error:
            return "protocol_error";
        case GatewayErrc::invalid_transition:
            return "invalid_transition";
        case GatewayErrc::guard_rejected:
            return "guard_rejected";
        case GatewayErrc::migration_failed:
            return "migration_failed";
        case GatewayErrc::migration_in_progress:
            return "migration_in_progress";
        case GatewayErrc::no_healthy_endpoint:
            return "no_healthy_endpoint";
        case GatewayErrc::unsupported_protocol:
            return "unsupported_protocol";
        case GatewayErrc::session_not_found:
            return "session_not_found";
        case GatewayErrc::session_unavailable:
            return "session_unavailable";
        case GatewayErrc::handler_failed:
            return "handler_failed";
        case GatewayErrc::listener_failed:
            return "listener_failed";
        case GatewayErrc::shutting_down:
            return "shutting_down";
        case GatewayErrc::invalid_argument:
            return "invalid_argument";
        case GatewayErrc::internal_error:
            return "internal_error";
    }
    return "unknown";
}

/// The "prism" error category
[[nodiscard]] const std::error_category& gateway_category() noexcept;

[[nodiscard]] std::error_code make_error_code(GatewayErrc e) noexcept;

/// True for errors a caller may see on a healthy session (send/receive level)
[[nodiscard]] bool is_exchange_failure(const std::error_code& ec) noexcept;

}  // namespace prism::core

namespace std {
template <>
struct is_error_code_enum<prism::core::GatewayErrc> : true_type {};
}  // namespace std

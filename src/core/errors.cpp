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

// Prism Errors - Implementation

#include "errors.hpp"

#include <string>

namespace prism::core {

namespace {

class GatewayCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "prism"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<GatewayErrc>(value)) {
            case GatewayErrc::transport_unavailable:
                return "transport unavailable";
            case GatewayErrc::send_failed:
                return "send failed";
            case GatewayErrc::receive_timeout:
                return "receive timed out";
            case GatewayErrc::connection_closed:
                return "connection closed by peer";
            case GatewayErrc::protocol_error:
                return "protocol error";
            case GatewayErrc::invalid_transition:
                return "invalid state transition";
            case GatewayErrc::guard_rejected:
                return "transition guard rejected event";
            case GatewayErrc::migration_failed:
                return "migration failed";
            case GatewayErrc::migration_in_progress:
                return "migration in progress";
            case GatewayErrc::no_healthy_endpoint:
                return "no healthy endpoint";
            case GatewayErrc::unsupported_protocol:
                return "unsupported protocol";
            case GatewayErrc::session_not_found:
                return "session not found";
            case GatewayErrc::session_unavailable:
                return "session unavailable";
            case GatewayErrc::handler_failed:
                return "handler failed";
            case GatewayErrc::listener_failed:
                return "listener failed";
            case GatewayErrc::shutting_down:
                return "gateway shutting down";
            case GatewayErrc::invalid_argument:
                return "invalid argument";
            case GatewayErrc::internal_error:
                return "internal error";
        }
        return "unknown prism error";
    }
};

}  // namespace

const std::error_category& gateway_category() noexcept {
    static const GatewayCategory category;
    return category;
}

std::error_code make_error_code(GatewayErrc e) noexcept {
    return {static_cast<int>(e), gateway_category()};
}

bool is_exchange_failure(const std::error_code& ec) noexcept {
    return ec == GatewayErrc::send_failed || ec == GatewayErrc::receive_timeout ||
           ec == GatewayErrc::connection_closed || ec == GatewayErrc::protocol_error;
}

}  // namespace prism::core

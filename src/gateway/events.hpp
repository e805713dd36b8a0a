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

// Prism Gateway Events - Header
// Structured records emitted to an external sink

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../protocol/protocol.hpp"

namespace quill {
class Logger;
}

namespace prism::gateway {

enum class EventType : uint8_t {
    ProtocolSwitch,     // Session changed protocol
    MigrationComplete,  // Migrator finished (success or failure)
    HealthCheckResult,  // One endpoint probed
    RoutingDecision,    // Router chose a protocol for a message
    HandlerFailed       // Business handler returned an error
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::ProtocolSwitch:
            return "protocol_switch";
        case EventType::MigrationComplete:
            return "migration_complete";
        case EventType::HealthCheckResult:
            return "health_check_result";
        case EventType::RoutingDecision:
            return "routing_decision";
        case EventType::HandlerFailed:
            return "handler_failed";
    }
    return "unknown";
}

/// One event record: {event, attributes}
struct GatewayEvent {
    EventType type = EventType::RoutingDecision;
    std::vector<std::pair<std::string, std::string>> attributes;
    protocol::Clock::time_point at = protocol::Clock::now();

    GatewayEvent& with(std::string name, std::string value) {
        attributes.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    [[nodiscard]] std::optional<std::string_view> find(std::string_view name) const;
};

/// Event sink interface. Implementations must be thread-safe and must not throw.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const GatewayEvent& event) noexcept = 0;
};

/// Writes events to a quill logger
class LoggingEventSink final : public EventSink {
public:
    explicit LoggingEventSink(quill::Logger* logger = nullptr);
    void emit(const GatewayEvent& event) noexcept override;

private:
    quill::Logger* logger_;
};

/// Discards everything
class NullEventSink final : public EventSink {
public:
    void emit(const GatewayEvent& /*event*/) noexcept override {}
};

}  // namespace prism::gateway

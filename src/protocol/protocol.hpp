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

// Prism Protocol - Header
// Protocol kinds, endpoints and the normalized message

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/socket.hpp"

namespace prism::protocol {

using core::Clock;
using core::Deadline;

/// Transport protocols hosted by the gateway (fixed at build time)
enum class ProtocolKind : uint8_t {
    Http,       // HTTP/1.1
    Http2,      // HTTP/2 cleartext (prior knowledge)
    WebSocket,  // RFC 6455
    Tcp,        // Length-prefixed raw TCP
    Udp         // One datagram per message
};

inline constexpr size_t kProtocolCount = 5;

inline constexpr std::array<ProtocolKind, kProtocolCount> kAllProtocols = {
    ProtocolKind::Http, ProtocolKind::Http2, ProtocolKind::WebSocket, ProtocolKind::Tcp,
    ProtocolKind::Udp};

[[nodiscard]] constexpr std::string_view to_string(ProtocolKind kind) noexcept {
    switch (kind) {
        case ProtocolKind::Http:
            return "http";
        case ProtocolKind::Http2:
            return "http2";
        case ProtocolKind::WebSocket:
            return "websocket";
        case ProtocolKind::Tcp:
            return "tcp";
        case ProtocolKind::Udp:
            return "udp";
    }
    return "unknown";
}

[[nodiscard]] constexpr size_t index_of(ProtocolKind kind) noexcept {
    return static_cast<size_t>(kind);
}

[[nodiscard]] constexpr bool is_datagram(ProtocolKind kind) noexcept {
    return kind == ProtocolKind::Udp;
}

/// Parse protocol name (case-insensitive; accepts common aliases such as "h2", "ws")
[[nodiscard]] std::optional<ProtocolKind> parse_protocol(std::string_view name);

/// Backend endpoint
struct Endpoint {
    uint64_t id = 0;  // Assigned by the registry
    ProtocolKind protocol = ProtocolKind::Http;
    std::string host;
    uint16_t port = 0;
    uint32_t weight = 1;
    bool healthy = true;
    int64_t current_load = 0;
    int64_t max_load = 1000;

    [[nodiscard]] std::string address() const { return host + ":" + std::to_string(port); }

    [[nodiscard]] bool has_capacity() const noexcept { return current_load < max_load; }
};

using MetadataList = std::vector<std::pair<std::string, std::string>>;

/// Protocol-independent message produced by adapters
struct Message {
    ProtocolKind protocol = ProtocolKind::Http;  // Inbound protocol
    std::vector<uint8_t> payload;
    MetadataList metadata;  // HTTP method/path/headers, WebSocket opcode, ...
    Clock::time_point received_at{};

    [[nodiscard]] std::optional<std::string_view> find_metadata(std::string_view name) const;

    [[nodiscard]] std::string_view payload_view() const noexcept {
        return {reinterpret_cast<const char*>(payload.data()), payload.size()};
    }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return payload; }

    [[nodiscard]] static Message from_text(ProtocolKind protocol, std::string_view text);
};

/// Copy a string into a byte vector
[[nodiscard]] std::vector<uint8_t> to_bytes(std::string_view text);

}  // namespace prism::protocol

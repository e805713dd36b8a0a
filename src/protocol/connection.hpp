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

// Prism Connection - Header
// Transport connection handle shared by all protocol adapters

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "protocol.hpp"

namespace prism::protocol {

enum class ConnectionRole : uint8_t {
    Client,  // Opened by the gateway towards an endpoint
    Server   // Accepted by a listener
};

/// Adapter-specific framing state (HTTP/2 session, WebSocket fragments, ...)
class TransportState {
public:
    virtual ~TransportState() = default;
};

struct ConnectionStats {
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
};

/// One transport connection. Only the adapter that opened it may drive it.
struct Connection {
    uint64_t id = 0;
    ProtocolKind protocol = ProtocolKind::Tcp;
    ConnectionRole role = ConnectionRole::Client;
    int fd = -1;
    bool open = false;

    uint64_t endpoint_id = 0;  // Client role only
    std::string peer;          // "host:port"
    std::string authority;     // Host used for HTTP Host / :authority

    std::vector<uint8_t> read_buffer;  // Bytes read but not yet framed
    std::unique_ptr<TransportState> transport;
    ConnectionStats stats;
    Clock::time_point opened_at{};

    Connection() = default;
    ~Connection();

    // Non-copyable, movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    template <typename T>
    [[nodiscard]] T* state() const noexcept {
        return dynamic_cast<T*>(transport.get());
    }
};

/// Process-wide connection id sequence
[[nodiscard]] uint64_t next_connection_id() noexcept;

/// Read more bytes into conn.read_buffer. Maps timeouts to receive_timeout and
/// end of stream or reset to connection_closed (the connection is marked closed).
[[nodiscard]] std::error_code fill_read_buffer(Connection& conn, Deadline deadline);

/// Write bytes to the peer. Any failure maps to send_failed.
[[nodiscard]] std::error_code write_to_peer(Connection& conn, std::span<const uint8_t> data,
                                            Deadline deadline);

/// Close the descriptor and clear framing state (idempotent)
void release_connection(Connection& conn) noexcept;

}  // namespace prism::protocol

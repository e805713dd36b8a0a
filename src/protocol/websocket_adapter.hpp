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

// Prism WebSocket Adapter - Header
// One WebSocket message per gateway message (RFC 6455)

#pragma once

#include "adapter.hpp"

namespace prism::protocol {

/// WebSocket adapter. connect() performs the opening handshake against
/// websocket_path. Control frames are handled inside receive(): pings are
/// answered, a close frame surfaces as connection_closed. Fragmented
/// messages are reassembled before delivery.
class WebSocketAdapter final : public ProtocolAdapter {
public:
    explicit WebSocketAdapter(AdapterOptions options = {}, quill::Logger* logger = nullptr);

    [[nodiscard]] std::error_code connect(const Endpoint& target, Deadline deadline,
                                          Connection& out) override;
    [[nodiscard]] std::error_code send(Connection& conn,
                                       std::span<const uint8_t> payload) override;
    [[nodiscard]] std::error_code receive(Connection& conn, std::chrono::milliseconds timeout,
                                          Message& out) override;
    void disconnect(Connection& conn) noexcept override;
    [[nodiscard]] bool is_connected(const Connection& conn) const noexcept override;
};

/// Listener that completes the server side of the opening handshake
class WebSocketAcceptor final : public StreamAcceptor {
public:
    explicit WebSocketAcceptor(AdapterOptions options = {}, quill::Logger* logger = nullptr);

protected:
    [[nodiscard]] std::error_code handshake(Connection& conn, Deadline deadline) override;
};

}  // namespace prism::protocol

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

// Prism HTTP/2 Adapter - Header
// Messages carried as stream bodies over cleartext HTTP/2 (prior knowledge)

#pragma once

#include "adapter.hpp"

namespace prism::protocol {

/// HTTP/2 adapter.
/// Client role: each send() opens a POST stream, receive() returns the next
/// completed response body. Server role: receive() returns the next completed
/// request body and send() answers the oldest unanswered stream.
class H2Adapter final : public ProtocolAdapter {
public:
    explicit H2Adapter(AdapterOptions options = {}, quill::Logger* logger = nullptr);

    [[nodiscard]] std::error_code connect(const Endpoint& target, Deadline deadline,
                                          Connection& out) override;
    [[nodiscard]] std::error_code send(Connection& conn,
                                       std::span<const uint8_t> payload) override;
    [[nodiscard]] std::error_code receive(Connection& conn, std::chrono::milliseconds timeout,
                                          Message& out) override;
    void disconnect(Connection& conn) noexcept override;
    [[nodiscard]] bool is_connected(const Connection& conn) const noexcept override;
};

/// Listener that exchanges the connection preface and SETTINGS
class H2Acceptor final : public StreamAcceptor {
public:
    explicit H2Acceptor(AdapterOptions options = {}, quill::Logger* logger = nullptr);

protected:
    [[nodiscard]] std::error_code handshake(Connection& conn, Deadline deadline) override;
};

}  // namespace prism::protocol

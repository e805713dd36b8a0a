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

// Prism HTTP/1.1 Adapter - Header
// Messages carried as request/response bodies over keep-alive connections

#pragma once

#include "../http/http.hpp"
#include "../http/parser.hpp"
#include "adapter.hpp"

namespace prism::protocol {

/// HTTP/1.1 adapter.
/// Client role: send() issues POST <http_path>, receive() returns the response body.
/// Server role: receive() returns the request body, send() answers 200 OK.
class HttpAdapter final : public ProtocolAdapter {
public:
    explicit HttpAdapter(AdapterOptions options = {}, quill::Logger* logger = nullptr);

    [[nodiscard]] std::error_code connect(const Endpoint& target, Deadline deadline,
                                          Connection& out) override;
    [[nodiscard]] std::error_code send(Connection& conn,
                                       std::span<const uint8_t> payload) override;
    [[nodiscard]] std::error_code receive(Connection& conn, std::chrono::milliseconds timeout,
                                          Message& out) override;
    void disconnect(Connection& conn) noexcept override;
    [[nodiscard]] bool is_connected(const Connection& conn) const noexcept override;
};

/// Read one complete HTTP/1.x message from the connection (shared with the
/// WebSocket handshake). Bytes past the message stay in conn.read_buffer;
/// a partially parsed message survives a timeout inside `parser`.
[[nodiscard]] std::error_code read_http_message(Connection& conn, http::Parser& parser,
                                                size_t max_size, Deadline deadline,
                                                http::HttpMessage& out);

}  // namespace prism::protocol

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

// Prism TCP Adapter - Header
// Raw TCP with a 4-byte big-endian length prefix per message

#pragma once

#include "adapter.hpp"

namespace prism::protocol {

/// Length prefix size for TCP framing
constexpr size_t TCP_FRAME_HEADER_SIZE = 4;

class TcpAdapter final : public ProtocolAdapter {
public:
    explicit TcpAdapter(AdapterOptions options = {}, quill::Logger* logger = nullptr);

    [[nodiscard]] std::error_code connect(const Endpoint& target, Deadline deadline,
                                          Connection& out) override;
    [[nodiscard]] std::error_code send(Connection& conn,
                                       std::span<const uint8_t> payload) override;
    [[nodiscard]] std::error_code receive(Connection& conn, std::chrono::milliseconds timeout,
                                          Message& out) override;
    void disconnect(Connection& conn) noexcept override;
    [[nodiscard]] bool is_connected(const Connection& conn) const noexcept override;
};

/// Encode one length-prefixed frame
[[nodiscard]] std::vector<uint8_t> encode_tcp_frame(std::span<const uint8_t> payload);

}  // namespace prism::protocol

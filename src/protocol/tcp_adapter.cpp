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

// Prism TCP Adapter - Implementation

#include "tcp_adapter.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::protocol {

TcpAdapter::TcpAdapter(AdapterOptions options, quill::Logger* logger)
    : ProtocolAdapter(ProtocolKind::Tcp, std::move(options), logger) {}

std::error_code TcpAdapter::connect(const Endpoint& target, Deadline deadline, Connection& out) {
    return connect_stream(target, deadline, out);
}

std::error_code TcpAdapter::send(Connection& conn, std::span<const uint8_t> payload) {
    if (payload.size() > options_.max_message_size) {
        LOG_WARNING(logger_, "TCP message too large: connection_id={}, size={}, limit={}", conn.id,
                    payload.size(), options_.max_message_size);
        return core::GatewayErrc::send_failed;
    }

    auto frame = encode_tcp_frame(payload);
    if (auto ec = write_to_peer(conn, frame, send_deadline()); ec) {
        return ec;
    }

    conn.stats.messages_sent++;
    return {};
}

std::error_code TcpAdapter::receive(Connection& conn, std::chrono::milliseconds timeout,
                                    Message& out) {
    Deadline deadline = core::deadline_after(timeout);

    while (true) {
        auto& buffer = conn.read_buffer;
        if (buffer.size() >= TCP_FRAME_HEADER_SIZE) {
            uint32_t length = (static_cast<uint32_t>(buffer[0]) << 24) |
                              (static_cast<uint32_t>(buffer[1]) << 16) |
                              (static_cast<uint32_t>(buffer[2]) << 8) |
                              static_cast<uint32_t>(buffer[3]);

            if (length > options_.max_message_size) {
                LOG_WARNING(logger_, "TCP frame exceeds limit: connection_id={}, length={}",
                            conn.id, length);
                return core::GatewayErrc::protocol_error;
            }

            if (buffer.size() >= TCP_FRAME_HEADER_SIZE + length) {
                auto begin = buffer.begin() + TCP_FRAME_HEADER_SIZE;
                out.protocol = ProtocolKind::Tcp;
                out.payload.assign(begin, begin + length);
                out.metadata.clear();
                out.metadata.emplace_back("peer", conn.peer);
                out.received_at = Clock::now();
                buffer.erase(buffer.begin(), begin + length);
                conn.stats.messages_received++;
                return {};
            }
        }

        if (auto ec = fill_read_buffer(conn, deadline); ec) {
            return ec;
        }
    }
}

void TcpAdapter::disconnect(Connection& conn) noexcept {
    if (conn.fd < 0) {
        return;
    }
    LOG_DEBUG(logger_, "TCP disconnect: connection_id={}, peer={}", conn.id, conn.peer);
    core::shutdown_socket(conn.fd);
    release_connection(conn);
}

bool TcpAdapter::is_connected(const Connection& conn) const noexcept {
    return conn.fd >= 0 && conn.open;
}

std::vector<uint8_t> encode_tcp_frame(std::span<const uint8_t> payload) {
    std::vector<uint8_t> frame;
    frame.reserve(TCP_FRAME_HEADER_SIZE + payload.size());

    auto length = static_cast<uint32_t>(payload.size());
    frame.push_back(static_cast<uint8_t>(length >> 24));
    frame.push_back(static_cast<uint8_t>(length >> 16));
    frame.push_back(static_cast<uint8_t>(length >> 8));
    frame.push_back(static_cast<uint8_t>(length));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

}  // namespace prism::protocol

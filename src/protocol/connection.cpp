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

// Prism Connection - Implementation

#include "connection.hpp"

#include <array>
#include <atomic>

#include "../core/errors.hpp"

namespace prism::protocol {

namespace {

constexpr size_t READ_CHUNK_SIZE = 16384;

std::atomic<uint64_t> g_connection_ids{1};

}  // namespace

Connection::~Connection() {
    release_connection(*this);
}

Connection::Connection(Connection&& other) noexcept
    : id(other.id),
      protocol(other.protocol),
      role(other.role),
      fd(other.fd),
      open(other.open),
      endpoint_id(other.endpoint_id),
      peer(std::move(other.peer)),
      authority(std::move(other.authority)),
      read_buffer(std::move(other.read_buffer)),
      transport(std::move(other.transport)),
      stats(other.stats),
      opened_at(other.opened_at) {
    other.fd = -1;
    other.open = false;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        release_connection(*this);
        id = other.id;
        protocol = other.protocol;
        role = other.role;
        fd = other.fd;
        open = other.open;
        endpoint_id = other.endpoint_id;
        peer = std::move(other.peer);
        authority = std::move(other.authority);
        read_buffer = std::move(other.read_buffer);
        transport = std::move(other.transport);
        stats = other.stats;
        opened_at = other.opened_at;
        other.fd = -1;
        other.open = false;
    }
    return *this;
}

uint64_t next_connection_id() noexcept {
    return g_connection_ids.fetch_add(1, std::memory_order_relaxed);
}

std::error_code fill_read_buffer(Connection& conn, Deadline deadline) {
    if (conn.fd < 0 || !conn.open) {
        return core::GatewayErrc::connection_closed;
    }

    std::array<uint8_t, READ_CHUNK_SIZE> chunk{};
    size_t bytes_read = 0;
    auto ec = core::read_some(conn.fd, chunk, deadline, bytes_read);
    if (ec) {
        if (ec == std::errc::timed_out) {
            return core::GatewayErrc::receive_timeout;
        }
        conn.open = false;
        return core::GatewayErrc::connection_closed;
    }

    conn.read_buffer.insert(conn.read_buffer.end(), chunk.begin(), chunk.begin() + bytes_read);
    conn.stats.bytes_received += bytes_read;
    return {};
}

std::error_code write_to_peer(Connection& conn, std::span<const uint8_t> data, Deadline deadline) {
    if (conn.fd < 0 || !conn.open) {
        return core::GatewayErrc::send_failed;
    }

    if (auto ec = core::write_all(conn.fd, data, deadline); ec) {
        if (ec != std::errc::timed_out) {
            conn.open = false;
        }
        return core::GatewayErrc::send_failed;
    }

    conn.stats.bytes_sent += data.size();
    return {};
}

void release_connection(Connection& conn) noexcept {
    if (conn.fd >= 0) {
        core::close_fd(conn.fd);
        conn.fd = -1;
    }
    conn.open = false;
    conn.read_buffer.clear();
    conn.transport.reset();
}

}  // namespace prism::protocol

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

// Prism Protocol Adapter - Header
// Uniform transport interface implemented once per protocol

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "connection.hpp"
#include "protocol.hpp"

namespace quill {
class Logger;
}

namespace prism::protocol {

/// Adapter tuning shared by all protocols
struct AdapterOptions {
    std::chrono::milliseconds send_timeout{5000};
    size_t max_message_size = 16 * 1024 * 1024;  // 16MB
    std::string http_path = "/";                 // Request target for HTTP/1.1 and HTTP/2
    std::string websocket_path = "/";            // Upgrade target for WebSocket clients
    int backlog = 128;
};

/// Transport adapter. Exactly five operations; framing stays inside the adapter.
/// Adapters hold no per-connection state and may be shared across threads;
/// a single Connection must not be driven by two threads at once.
class ProtocolAdapter {
public:
    virtual ~ProtocolAdapter() = default;

    /// Open a client connection to `target`. TransportUnavailable on refusal,
    /// resolution failure, handshake failure or deadline expiry.
    [[nodiscard]] virtual std::error_code connect(const Endpoint& target, Deadline deadline,
                                                  Connection& out) = 0;

    /// Send one message. SendFailed when the transport rejects it or times out.
    [[nodiscard]] virtual std::error_code send(Connection& conn,
                                               std::span<const uint8_t> payload) = 0;

    /// Block until one message arrives. ReceiveTimeout when `timeout` elapses,
    /// ConnectionClosed when the peer goes away.
    [[nodiscard]] virtual std::error_code receive(Connection& conn,
                                                  std::chrono::milliseconds timeout,
                                                  Message& out) = 0;

    /// Tear down the connection. Idempotent; failures are logged, never reported.
    virtual void disconnect(Connection& conn) noexcept = 0;

    [[nodiscard]] virtual bool is_connected(const Connection& conn) const noexcept = 0;

    [[nodiscard]] ProtocolKind kind() const noexcept { return kind_; }

protected:
    ProtocolAdapter(ProtocolKind kind, AdapterOptions options, quill::Logger* logger);

    /// Common connection bookkeeping after a successful connect/accept
    void init_connection(Connection& conn, ConnectionRole role, int fd, std::string peer) const;

    /// TCP connect for the stream protocols; errors map to transport_unavailable
    [[nodiscard]] std::error_code connect_stream(const Endpoint& target, Deadline deadline,
                                                 Connection& out) const;

    [[nodiscard]] Deadline send_deadline() const { return core::deadline_after(options_.send_timeout); }

    ProtocolKind kind_;
    AdapterOptions options_;
    quill::Logger* logger_;
};

/// Server side of an adapter: produces server-role connections that the
/// matching ProtocolAdapter then drives.
class ProtocolAcceptor {
public:
    virtual ~ProtocolAcceptor() = default;

    [[nodiscard]] virtual std::error_code open(std::string_view address, uint16_t port) = 0;

    /// Wait for the next client. ReceiveTimeout when nothing arrives before the deadline.
    [[nodiscard]] virtual std::error_code accept(Deadline deadline, Connection& out) = 0;

    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
    [[nodiscard]] virtual uint16_t local_port() const noexcept = 0;
    [[nodiscard]] virtual ProtocolKind kind() const noexcept = 0;
};

/// Listening TCP socket shared by the stream protocols. Subclasses add the
/// protocol handshake (WebSocket upgrade, HTTP/2 settings exchange).
class StreamAcceptor : public ProtocolAcceptor {
public:
    StreamAcceptor(ProtocolKind kind, AdapterOptions options, quill::Logger* logger);
    ~StreamAcceptor() override;

    StreamAcceptor(const StreamAcceptor&) = delete;
    StreamAcceptor& operator=(const StreamAcceptor&) = delete;

    [[nodiscard]] std::error_code open(std::string_view address, uint16_t port) override;
    [[nodiscard]] std::error_code accept(Deadline deadline, Connection& out) override;
    void close() noexcept override;

    [[nodiscard]] bool is_open() const noexcept override { return listen_fd_ >= 0; }
    [[nodiscard]] uint16_t local_port() const noexcept override { return port_; }
    [[nodiscard]] ProtocolKind kind() const noexcept override { return kind_; }

protected:
    /// Protocol handshake on a freshly accepted connection
    [[nodiscard]] virtual std::error_code handshake(Connection& conn, Deadline deadline);

    ProtocolKind kind_;
    AdapterOptions options_;
    quill::Logger* logger_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
};

/// Create the adapter for a protocol
[[nodiscard]] std::unique_ptr<ProtocolAdapter> make_adapter(ProtocolKind kind,
                                                            const AdapterOptions& options,
                                                            quill::Logger* logger = nullptr);

/// Create the acceptor for a protocol
[[nodiscard]] std::unique_ptr<ProtocolAcceptor> make_acceptor(ProtocolKind kind,
                                                              const AdapterOptions& options,
                                                              quill::Logger* logger = nullptr);

}  // namespace prism::protocol

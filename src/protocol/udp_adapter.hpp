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

// Prism UDP Adapter - Header
// One datagram per message over connected UDP sockets

#pragma once

#include "adapter.hpp"

namespace prism::protocol {

/// Largest UDP payload over IPv4
constexpr size_t UDP_MAX_PAYLOAD = 65507;

/// UDP adapter. connect() resolves and connects the datagram socket, which
/// validates reachability of the address but cannot prove a listener exists.
class UdpAdapter final : public ProtocolAdapter {
public:
    explicit UdpAdapter(AdapterOptions options = {}, quill::Logger* logger = nullptr);

    [[nodiscard]] std::error_code connect(const Endpoint& target, Deadline deadline,
                                          Connection& out) override;
    [[nodiscard]] std::error_code send(Connection& conn,
                                       std::span<const uint8_t> payload) override;
    [[nodiscard]] std::error_code receive(Connection& conn, std::chrono::milliseconds timeout,
                                          Message& out) override;
    void disconnect(Connection& conn) noexcept override;
    [[nodiscard]] bool is_connected(const Connection& conn) const noexcept override;
};

/// UDP listener. Each datagram from a new peer yields a connection backed by
/// its own socket bound to the listening port and connected to that peer, so
/// later datagrams from the peer bypass the shared socket.
class UdpAcceptor final : public ProtocolAcceptor {
public:
    explicit UdpAcceptor(AdapterOptions options = {}, quill::Logger* logger = nullptr);
    ~UdpAcceptor() override;

    UdpAcceptor(const UdpAcceptor&) = delete;
    UdpAcceptor& operator=(const UdpAcceptor&) = delete;

    [[nodiscard]] std::error_code open(std::string_view address, uint16_t port) override;
    [[nodiscard]] std::error_code accept(Deadline deadline, Connection& out) override;
    void close() noexcept override;

    [[nodiscard]] bool is_open() const noexcept override { return fd_ >= 0; }
    [[nodiscard]] uint16_t local_port() const noexcept override { return port_; }
    [[nodiscard]] ProtocolKind kind() const noexcept override { return ProtocolKind::Udp; }

private:
    AdapterOptions options_;
    quill::Logger* logger_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::string address_;
};

}  // namespace prism::protocol

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

// Prism Protocol Adapter - Implementation

#include "adapter.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "h2_adapter.hpp"
#include "http_adapter.hpp"
#include "tcp_adapter.hpp"
#include "udp_adapter.hpp"
#include "websocket_adapter.hpp"

namespace prism::protocol {

// ProtocolAdapter

ProtocolAdapter::ProtocolAdapter(ProtocolKind kind, AdapterOptions options, quill::Logger* logger)
    : kind_(kind), options_(std::move(options)), logger_(logger ? logger : logging::get_logger()) {}

void ProtocolAdapter::init_connection(Connection& conn, ConnectionRole role, int fd,
                                      std::string peer) const {
    conn.id = next_connection_id();
    conn.protocol = kind_;
    conn.role = role;
    conn.fd = fd;
    conn.open = true;
    conn.peer = std::move(peer);
    conn.read_buffer.clear();
    conn.transport.reset();
    conn.stats = {};
    conn.opened_at = Clock::now();
}

std::error_code ProtocolAdapter::connect_stream(const Endpoint& target, Deadline deadline,
                                                Connection& out) const {
    int fd = -1;
    auto ec = core::connect_with_deadline(target.host, target.port, SOCK_STREAM, deadline, fd);
    if (ec) {
        LOG_WARNING(logger_, "Connect failed: protocol={}, endpoint={}, error={}", to_string(kind_),
                    target.address(), ec.message());
        return core::GatewayErrc::transport_unavailable;
    }

    if (auto nodelay_ec = core::set_nodelay(fd); nodelay_ec) {
        LOG_DEBUG(logger_, "TCP_NODELAY not applied: endpoint={}, error={}", target.address(),
                  nodelay_ec.message());
    }

    release_connection(out);
    init_connection(out, ConnectionRole::Client, fd, target.address());
    out.endpoint_id = target.id;
    out.authority = target.address();
    return {};
}

// StreamAcceptor

StreamAcceptor::StreamAcceptor(ProtocolKind kind, AdapterOptions options, quill::Logger* logger)
    : kind_(kind), options_(std::move(options)), logger_(logger ? logger : logging::get_logger()) {}

StreamAcceptor::~StreamAcceptor() {
    close();
}

std::error_code StreamAcceptor::open(std::string_view address, uint16_t port) {
    close();

    listen_fd_ = core::create_listening_socket(address, port, options_.backlog);
    if (listen_fd_ < 0) {
        LOG_ERROR(logger_, "Listen failed: protocol={}, address={}:{}", to_string(kind_), address,
                  port);
        return core::GatewayErrc::listener_failed;
    }

    port_ = core::local_port(listen_fd_);
    return {};
}

std::error_code StreamAcceptor::accept(Deadline deadline, Connection& out) {
    if (listen_fd_ < 0) {
        return core::GatewayErrc::listener_failed;
    }

    while (true) {
        if (auto ec = core::wait_for(listen_fd_, POLLIN, deadline); ec) {
            return ec == std::errc::timed_out
                       ? std::error_code(core::GatewayErrc::receive_timeout)
                       : std::error_code(core::GatewayErrc::listener_failed);
        }

        sockaddr_storage peer_addr{};
        socklen_t peer_len = sizeof(peer_addr);
        int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);
        if (fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
                errno == ECONNABORTED) {
                continue;
            }
            LOG_ERROR(logger_, "Accept failed: protocol={}, errno={}", to_string(kind_), errno);
            return core::GatewayErrc::listener_failed;
        }

        if (auto ec = core::set_nonblocking(fd); ec) {
            core::close_fd(fd);
            continue;
        }
        if (auto ec = core::set_nodelay(fd); ec) {
            LOG_DEBUG(logger_, "TCP_NODELAY not applied: fd={}, error={}", fd, ec.message());
        }

        release_connection(out);
        out.id = next_connection_id();
        out.protocol = kind_;
        out.role = ConnectionRole::Server;
        out.fd = fd;
        out.open = true;
        out.peer = core::format_address(peer_addr, peer_len);
        out.opened_at = Clock::now();

        if (auto ec = handshake(out, core::deadline_after(options_.send_timeout)); ec) {
            LOG_WARNING(logger_, "Handshake failed: protocol={}, peer={}, error={}",
                        to_string(kind_), out.peer, ec.message());
            release_connection(out);
            continue;
        }

        LOG_DEBUG(logger_, "Accepted connection: protocol={}, peer={}, connection_id={}",
                  to_string(kind_), out.peer, out.id);
        return {};
    }
}

void StreamAcceptor::close() noexcept {
    if (listen_fd_ >= 0) {
        core::close_fd(listen_fd_);
        listen_fd_ = -1;
    }
}

std::error_code StreamAcceptor::handshake(Connection& /*conn*/, Deadline /*deadline*/) {
    return {};
}

// Factories

std::unique_ptr<ProtocolAdapter> make_adapter(ProtocolKind kind, const AdapterOptions& options,
                                              quill::Logger* logger) {
    switch (kind) {
        case ProtocolKind::Http:
            return std::make_unique<HttpAdapter>(options, logger);
        case ProtocolKind::Http2:
            return std::make_unique<H2Adapter>(options, logger);
        case ProtocolKind::WebSocket:
            return std::make_unique<WebSocketAdapter>(options, logger);
        case ProtocolKind::Tcp:
            return std::make_unique<TcpAdapter>(options, logger);
        case ProtocolKind::Udp:
            return std::make_unique<UdpAdapter>(options, logger);
    }
    return nullptr;
}

std::unique_ptr<ProtocolAcceptor> make_acceptor(ProtocolKind kind, const AdapterOptions& options,
                                                quill::Logger* logger) {
    switch (kind) {
        case ProtocolKind::Http:
        case ProtocolKind::Tcp:
            return std::make_unique<StreamAcceptor>(kind, options, logger);
        case ProtocolKind::Http2:
            return std::make_unique<H2Acceptor>(options, logger);
        case ProtocolKind::WebSocket:
            return std::make_unique<WebSocketAcceptor>(options, logger);
        case ProtocolKind::Udp:
            return std::make_unique<UdpAcceptor>(options, logger);
    }
    return nullptr;
}

}  // namespace prism::protocol

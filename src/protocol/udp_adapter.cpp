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

// Prism UDP Adapter - Implementation

#include "udp_adapter.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::protocol {

namespace {

// Receive buffer large enough for any datagram
constexpr size_t DATAGRAM_BUFFER_SIZE = 65536;

Message make_datagram_message(const Connection& conn, const uint8_t* data, size_t length) {
    Message message;
    message.protocol = ProtocolKind::Udp;
    message.payload.assign(data, data + length);
    message.metadata.emplace_back("peer", conn.peer);
    message.received_at = Clock::now();
    return message;
}

}  // namespace

// UdpAdapter

UdpAdapter::UdpAdapter(AdapterOptions options, quill::Logger* logger)
    : ProtocolAdapter(ProtocolKind::Udp, std::move(options), logger) {}

std::error_code UdpAdapter::connect(const Endpoint& target, Deadline deadline, Connection& out) {
    int fd = -1;
    auto ec = core::connect_with_deadline(target.host, target.port, SOCK_DGRAM, deadline, fd);
    if (ec) {
        LOG_WARNING(logger_, "UDP connect failed: endpoint={}, error={}", target.address(),
                    ec.message());
        return core::GatewayErrc::transport_unavailable;
    }

    release_connection(out);
    init_connection(out, ConnectionRole::Client, fd, target.address());
    out.endpoint_id = target.id;
    out.authority = target.address();
    return {};
}

std::error_code UdpAdapter::send(Connection& conn, std::span<const uint8_t> payload) {
    if (conn.fd < 0 || !conn.open) {
        return core::GatewayErrc::send_failed;
    }
    if (payload.size() > UDP_MAX_PAYLOAD || payload.size() > options_.max_message_size) {
        LOG_WARNING(logger_, "UDP payload too large: connection_id={}, size={}", conn.id,
                    payload.size());
        return core::GatewayErrc::send_failed;
    }

    Deadline deadline = send_deadline();
    while (true) {
        ssize_t n = ::send(conn.fd, payload.data(), payload.size(), MSG_NOSIGNAL);
        if (n >= 0) {
            conn.stats.bytes_sent += static_cast<uint64_t>(n);
            conn.stats.messages_sent++;
            return {};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto ec = core::wait_for(conn.fd, POLLOUT, deadline); ec) {
                return core::GatewayErrc::send_failed;
            }
            continue;
        }
        LOG_WARNING(logger_, "UDP send failed: connection_id={}, errno={}", conn.id, errno);
        return core::GatewayErrc::send_failed;
    }
}

std::error_code UdpAdapter::receive(Connection& conn, std::chrono::milliseconds timeout,
                                    Message& out) {
    if (conn.fd < 0 || !conn.open) {
        return core::GatewayErrc::connection_closed;
    }

    // Datagram captured by the acceptor when the peer first appeared
    if (!conn.read_buffer.empty()) {
        out = make_datagram_message(conn, conn.read_buffer.data(), conn.read_buffer.size());
        conn.read_buffer.clear();
        conn.stats.messages_received++;
        return {};
    }

    Deadline deadline = core::deadline_after(timeout);
    std::vector<uint8_t> buffer(DATAGRAM_BUFFER_SIZE);

    while (true) {
        ssize_t n = ::recv(conn.fd, buffer.data(), buffer.size(), 0);
        if (n >= 0) {
            out = make_datagram_message(conn, buffer.data(), static_cast<size_t>(n));
            conn.stats.bytes_received += static_cast<uint64_t>(n);
            conn.stats.messages_received++;
            return {};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto ec = core::wait_for(conn.fd, POLLIN, deadline); ec) {
                return ec == std::errc::timed_out
                           ? std::error_code(core::GatewayErrc::receive_timeout)
                           : std::error_code(core::GatewayErrc::connection_closed);
            }
            continue;
        }
        // ECONNREFUSED: ICMP port unreachable from the peer
        LOG_DEBUG(logger_, "UDP receive failed: connection_id={}, errno={}", conn.id, errno);
        conn.open = false;
        return core::GatewayErrc::connection_closed;
    }
}

void UdpAdapter::disconnect(Connection& conn) noexcept {
    if (conn.fd < 0) {
        return;
    }
    LOG_DEBUG(logger_, "UDP disconnect: connection_id={}, peer={}", conn.id, conn.peer);
    release_connection(conn);
}

bool UdpAdapter::is_connected(const Connection& conn) const noexcept {
    return conn.fd >= 0 && conn.open;
}

// UdpAcceptor

UdpAcceptor::UdpAcceptor(AdapterOptions options, quill::Logger* logger)
    : options_(std::move(options)), logger_(logger ? logger : logging::get_logger()) {}

UdpAcceptor::~UdpAcceptor() {
    close();
}

std::error_code UdpAcceptor::open(std::string_view address, uint16_t port) {
    close();

    fd_ = core::create_datagram_socket(address, port);
    if (fd_ < 0) {
        LOG_ERROR(logger_, "UDP bind failed: address={}:{}", address, port);
        return core::GatewayErrc::listener_failed;
    }

    port_ = core::local_port(fd_);
    address_ = std::string(address);
    return {};
}

std::error_code UdpAcceptor::accept(Deadline deadline, Connection& out) {
    if (fd_ < 0) {
        return core::GatewayErrc::listener_failed;
    }

    std::vector<uint8_t> buffer(DATAGRAM_BUFFER_SIZE);

    while (true) {
        sockaddr_storage peer_addr{};
        socklen_t peer_len = sizeof(peer_addr);
        ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                               reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (auto ec = core::wait_for(fd_, POLLIN, deadline); ec) {
                    return ec == std::errc::timed_out
                               ? std::error_code(core::GatewayErrc::receive_timeout)
                               : std::error_code(core::GatewayErrc::listener_failed);
                }
                continue;
            }
            LOG_ERROR(logger_, "UDP recvfrom failed: errno={}", errno);
            return core::GatewayErrc::listener_failed;
        }

        int peer_fd = core::create_datagram_socket(address_, port_);
        if (peer_fd < 0) {
            LOG_WARNING(logger_, "UDP peer socket failed: port={}", port_);
            continue;
        }
        if (::connect(peer_fd, reinterpret_cast<sockaddr*>(&peer_addr), peer_len) < 0) {
            LOG_WARNING(logger_, "UDP peer connect failed: errno={}", errno);
            core::close_fd(peer_fd);
            continue;
        }

        release_connection(out);
        out.id = next_connection_id();
        out.protocol = ProtocolKind::Udp;
        out.role = ConnectionRole::Server;
        out.fd = peer_fd;
        out.open = true;
        out.peer = core::format_address(peer_addr, peer_len);
        out.opened_at = Clock::now();
        out.read_buffer.assign(buffer.begin(), buffer.begin() + n);
        out.stats.bytes_received = static_cast<uint64_t>(n);

        LOG_DEBUG(logger_, "UDP peer accepted: peer={}, connection_id={}", out.peer, out.id);
        return {};
    }
}

void UdpAcceptor::close() noexcept {
    if (fd_ >= 0) {
        core::close_fd(fd_);
        fd_ = -1;
    }
}

}  // namespace prism::protocol
